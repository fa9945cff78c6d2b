#include "../include/TaskSelector.hpp"
#include "../include/Errors.hpp"
#include "../include/Log.hpp"
#include <algorithm>
#include <deque>
#include <functional>
#include <unordered_set>

using namespace std;

namespace ergon {
    TaskSelector::TaskSelector(const TaskGraph &graph, vector<string> default_tasks)
        : graph(graph), defaults(std::move(default_tasks)) {
    }

    ExecutionPlan TaskSelector::process(const vector<string> &requested) const {
        vector<string> names = requested.empty() ? defaults : requested;
        if (names.empty()) {
            for (const auto &t: graph.tasks()) if (!t.is_subtask) names.push_back(t.name);
        }

        // roots in declaration order, each task emitted right after its own task_dep
        vector<size_t> roots;
        for (const auto &name: names) roots.push_back(graph.index_of(graph.at(name)));
        ranges::sort(roots);
        const auto [first, last] = ranges::unique(roots);
        roots.erase(first, last);

        enum class Mark { New, Visiting, Done };
        vector<Mark> marks(graph.size(), Mark::New);
        vector<size_t> path; // tasks being visited, outermost first
        ExecutionPlan plan;

        const function<void(size_t)> visit = [&](const size_t idx) {
            if (marks[idx] == Mark::Done) return;
            if (marks[idx] == Mark::Visiting) {
                string cycle;
                for (auto it = ranges::find(path, idx); it != path.end(); ++it) cycle += graph.tasks()[*it].name + " -> ";
                cycle += graph.tasks()[idx].name;
                throw SelectionError(string(_("Cyclic task dependency: ")) + cycle);
            }
            marks[idx] = Mark::Visiting;
            path.push_back(idx);
            for (const auto &dep: graph.tasks()[idx].task_dep) visit(graph.index_of(graph.at(dep)));
            path.pop_back();
            marks[idx] = Mark::Done;
            plan.push_back(&graph.tasks()[idx]);
        };
        for (const size_t idx: roots) visit(idx);

        log_debug("plan has ", plan.size(), " tasks");
        return plan;
    }

    vector<string> TaskSelector::group_members(const string &name) const {
        vector<string> out;
        unordered_set<string> visited;
        deque<string> queue{name};
        while (!queue.empty()) {
            string current = std::move(queue.front());
            queue.pop_front();
            if (!visited.insert(current).second) continue;
            const Task &task = graph.at(current);
            if (task.is_group()) {
                for (const auto &dep: task.task_dep) queue.push_back(dep);
            }
            out.push_back(std::move(current));
        }
        return out;
    }
} // namespace ergon
