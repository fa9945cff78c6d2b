#pragma once
#include "DependencyStore.hpp"
#include "Reporter.hpp"
#include "TaskSelector.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace ergon {
    enum class TaskState {
        Pending,
        Checking,
        Executing,
        Succeeded,
        Failed,
        Skipped,
    };

    [[nodiscard]] const char *to_string(TaskState s);

    struct RunOptions {
        std::optional<int> verbosity; // overrides each task's own verbosity when set
        bool always_execute = false;
        bool continue_on_error = false;
        unsigned jobs = 1; // tasks allowed to run at the same time
    };

    // Exit codes of Runner::run
    constexpr int RUN_SUCCESS = 0;
    constexpr int RUN_FAILURE = 1; // an action reported failure
    constexpr int RUN_ERROR = 2; // an action could not run or raised

    /**
     * @brief Walks an execution plan, runs stale tasks and records their fingerprints.
     *
     * A task starts only when every task_dep present in the plan has succeeded
     * or was skipped. With jobs > 1, independent ready tasks run concurrently.
     * Store errors are not caught: they leave run() as StoreError.
     */
    class Runner {
    public:
        Runner(DependencyStore &store, const TaskGraph &graph, Reporter &reporter, RunOptions options = {});

        [[nodiscard]] int run(const ExecutionPlan &plan);

        // Final state of a task after run(), Pending when it was never reached.
        [[nodiscard]] TaskState state_of(const std::string &name) const;

    private:
        struct Outcome {
            TaskState state = TaskState::Pending;
            ActionResult::Kind kind = ActionResult::Kind::Success;
        };

        Outcome process_task(const Task &task);

        Outcome fail(const Task &task, TaskFailure failure);

        void set_state(const std::string &name, TaskState s);

        [[nodiscard]] int verbosity_for(const Task &task) const;

        template<typename Fn>
        void report(Fn &&fn) {
            std::lock_guard lock(report_mtx);
            fn(reporter);
        }

        DependencyStore &store;
        const TaskGraph &graph;
        Reporter &reporter;
        RunOptions options;

        std::unordered_map<std::string, TaskState> states;
        mutable std::mutex state_mtx;
        std::mutex report_mtx;
    };
} // namespace ergon
