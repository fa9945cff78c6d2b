#include "../include/Commands.hpp"
#include "../include/DependencyStore.hpp"
#include "../include/Log.hpp"
#include "../include/TaskSelector.hpp"
#include <functional>
#include <iostream>
#include <set>

using namespace std;

namespace ergon {
    ExecutionPlan check_run(const Project &project, const vector<string> &filter, const RunParams &params,
                            const ReporterRegistry &reporters) {
        ExecutionPlan plan = TaskSelector(project.tasks, project.default_tasks).process(filter);
        reporters.require(params.reporter);
        return plan;
    }

    int cmd_run(const Project &project, const vector<string> &filter, ostream &out, const RunParams &params,
                const ReporterRegistry &reporters) {
        const ExecutionPlan plan = check_run(project, filter, params, reporters);

        const int verbosity = params.options.verbosity.value_or(DEFAULT_VERBOSITY);
        const bool show_out = verbosity < 2;
        const auto reporter = reporters.create(params.reporter, out, show_out, true);

        DependencyStore store(project.dep_file);
        Runner runner(store, project.tasks, *reporter, params.options);
        const int rc = runner.run(plan);
        store.close();
        return rc;
    }

    int cmd_list(const Project &project, const vector<string> &filter, ostream &out, const ListParams &params) {
        static const char *status_map[] = {"I", "U", "R"};
        unique_ptr<DependencyStore> store;
        if (params.status) store = make_unique<DependencyStore>(project.dep_file);

        const function<void(const Task &)> print_task = [&](const Task &task) {
            string line = task.name;
            if (params.doc && !task.doc.empty()) line += "\t* " + task.doc;
            if (store) {
                const Status s = store->get_status(task, project.tasks);
                line = string(status_map[static_cast<int>(s)]) + " " + line;
            }
            out << line << '\n';
            if (params.subtasks) {
                const string prefix = task.name + SUBTASK_SEP;
                for (const auto &dep: task.task_dep) {
                    if (dep.starts_with(prefix)) print_task(project.tasks.at(dep));
                }
            }
        };

        vector<const Task *> to_print;
        if (filter.empty()) {
            for (const auto &t: project.tasks.tasks()) to_print.push_back(&t);
        } else {
            for (const auto &name: filter) to_print.push_back(&project.tasks.at(name));
        }
        for (const Task *t: to_print) {
            // a filter names tasks explicitly, nothing is hidden then
            if (filter.empty() && t->is_subtask && !params.all) continue;
            if (filter.empty() && t->is_private() && !params.private_tasks) continue;
            print_task(*t);
        }
        if (store) store->close();
        return 0;
    }

    int cmd_clean(const Project &project, const vector<string> &names, ostream &out, const bool dryrun) {
        vector<const Task *> to_clean;
        if (names.empty()) {
            for (const auto &t: project.tasks.tasks()) to_clean.push_back(&t);
        } else {
            for (const auto &name: names) to_clean.push_back(&project.tasks.at(name));
        }
        bool ok = true;
        for (const Task *t: to_clean) ok = t->clean(out, dryrun) && ok;
        return ok ? 0 : RUN_FAILURE;
    }

    int cmd_forget(const Project &project, const vector<string> &names, ostream &out) {
        const TaskSelector selector(project.tasks);
        // resolve every name first, an unknown one must not leave a half-done forget
        vector<vector<string> > groups;
        groups.reserve(names.size());
        for (const auto &name: names) groups.push_back(selector.group_members(name));

        DependencyStore store(project.dep_file);
        if (names.empty()) {
            store.remove_all();
            out << _("forgetting all tasks") << '\n';
        } else {
            for (const auto &group: groups) {
                for (const auto &name: group) {
                    store.remove(name);
                    out << _("forgetting") << " " << name << '\n';
                }
            }
        }
        store.close();
        return 0;
    }

    int cmd_ignore(const Project &project, const vector<string> &names, ostream &out) {
        if (names.empty()) {
            out << _("You cant ignore all tasks! Please select a task.") << '\n';
            return 0;
        }
        const TaskSelector selector(project.tasks);
        vector<vector<string> > groups;
        groups.reserve(names.size());
        for (const auto &name: names) groups.push_back(selector.group_members(name));

        DependencyStore store(project.dep_file);
        for (const auto &group: groups) {
            for (const auto &name: group) {
                store.ignore(project.tasks.at(name));
                out << _("ignoring") << " " << name << '\n';
            }
        }
        store.close();
        return 0;
    }

    int cmd_auto(const Project &project, const vector<string> &filter, ostream &out, const RunParams &params,
                 const ReporterRegistry &reporters, unique_ptr<EventSource> watcher_source,
                 const FileWatcher::StopHook &stop_hook) {
        const TaskSelector selector(project.tasks, project.default_tasks);
        vector<string> watch_files;
        for (const Task *t: selector.process(filter)) {
            watch_files.insert(watch_files.end(), t->file_dep.begin(), t->file_dep.end());
        }

        RunParams auto_params = params;
        auto_params.reporter = "executed-only";
        reporters.require(auto_params.reporter);

        FileWatcher watcher(watch_files, std::move(watcher_source));
        watcher.loop([&](const FileEvent &ev) {
            log_info("changed: ", ev.path);
            const int rc = cmd_run(project, filter, out, auto_params, reporters);
            if (rc != RUN_SUCCESS) log_warn("run finished with code ", rc);
        }, stop_hook);
        return 0;
    }
} // namespace ergon
