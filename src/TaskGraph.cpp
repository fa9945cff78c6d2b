#include "../include/TaskGraph.hpp"
#include "../include/Errors.hpp"
#include "../include/Log.hpp"

using namespace std;

namespace ergon {
    TaskGraph::TaskGraph(vector<Task> tasks) : all(std::move(tasks)) {
        by_name.reserve(all.size());
        for (size_t i = 0; i < all.size(); ++i) {
            if (all[i].name.empty()) throw InvalidTask(_("Task with empty name"));
            if (!by_name.emplace(all[i].name, i).second) {
                throw InvalidTask(string(_("Task names must be unique: ")) + "'" + all[i].name + "'");
            }
        }
        for (const auto &t: all) {
            for (const auto &dep: t.task_dep) {
                if (!by_name.contains(dep)) {
                    throw InvalidTask("'" + t.name + "' " + _("has a task_dep on") + " '" + dep + "' " +
                                      _("which is not a task."));
                }
            }
        }
    }

    const Task *TaskGraph::find(const string &name) const {
        const auto it = by_name.find(name);
        return it == by_name.end() ? nullptr : &all[it->second];
    }

    const Task &TaskGraph::at(const string &name) const {
        const Task *t = find(name);
        if (t == nullptr) throw InvalidCommand("'" + name + "' " + _("is not a task."));
        return *t;
    }

    size_t TaskGraph::index_of(const Task &task) const {
        return by_name.at(task.name);
    }
} // namespace ergon
