#pragma once
#include "FileWatcher.hpp"
#include "Reporter.hpp"
#include "Runner.hpp"
#include "TaskGraph.hpp"
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace ergon {
    // What every command needs to know about the project.
    struct Project {
        const TaskGraph &tasks;
        std::string dep_file;
        std::vector<std::string> default_tasks;
    };

    struct RunParams {
        RunOptions options;
        std::string reporter = "default";
    };

    struct ListParams {
        bool all = false; // include sub-tasks
        bool subtasks = false; // print sub-tasks below their parent
        bool doc = false;
        bool status = false;
        bool private_tasks = false;
    };

    /**
     * @brief Everything cmd_run checks before running: task names, cycles and the reporter name.
     * @return The plan cmd_run would execute.
     */
    ExecutionPlan check_run(const Project &project, const std::vector<std::string> &filter, const RunParams &params,
                            const ReporterRegistry &reporters);

    /**
     * @brief Select, then run the requested tasks.
     * @return Runner exit code.
     * @throws InvalidCommand for an unknown task or reporter, before anything runs.
     */
    int cmd_run(const Project &project, const std::vector<std::string> &filter, std::ostream &out,
                const RunParams &params, const ReporterRegistry &reporters);

    // One line per task: "[I|U|R ]name[\t* doc]".
    int cmd_list(const Project &project, const std::vector<std::string> &filter, std::ostream &out,
                 const ListParams &params);

    // Clean all tasks, or the named ones.
    int cmd_clean(const Project &project, const std::vector<std::string> &names, std::ostream &out, bool dryrun);

    // Remove saved fingerprints of the named tasks and their group members, or of every task.
    int cmd_forget(const Project &project, const std::vector<std::string> &names, std::ostream &out);

    // Flag the named tasks and their group members as ignored. Refuses an empty list.
    int cmd_ignore(const Project &project, const std::vector<std::string> &names, std::ostream &out);

    /**
     * @brief Watch the file dependencies of the selection and re-run it on each change.
     * @param watcher_source Event source for the watcher, inotify when null.
     * @param stop_hook Checked after each run; returning true leaves the loop.
     */
    int cmd_auto(const Project &project, const std::vector<std::string> &filter, std::ostream &out,
                 const RunParams &params, const ReporterRegistry &reporters,
                 std::unique_ptr<EventSource> watcher_source = nullptr,
                 const FileWatcher::StopHook &stop_hook = nullptr);
} // namespace ergon
