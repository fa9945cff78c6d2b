#include "../include/Runner.hpp"
#include "../include/Log.hpp"
#include <filesystem>
#include <future>
#include <unordered_set>
#include <vector>

using namespace std;
namespace fs = std::filesystem;

namespace ergon {
    const char *to_string(const TaskState s) {
        switch (s) {
            case TaskState::Pending: return "pending";
            case TaskState::Checking: return "checking";
            case TaskState::Executing: return "executing";
            case TaskState::Succeeded: return "succeeded";
            case TaskState::Failed: return "failed";
            case TaskState::Skipped: return "skipped";
        }
        return "pending";
    }

    Runner::Runner(DependencyStore &store, const TaskGraph &graph, Reporter &reporter, RunOptions options)
        : store(store), graph(graph), reporter(reporter), options(std::move(options)) {
        if (this->options.jobs == 0) this->options.jobs = 1;
    }

    TaskState Runner::state_of(const string &name) const {
        lock_guard lock(state_mtx);
        const auto it = states.find(name);
        return it == states.end() ? TaskState::Pending : it->second;
    }

    void Runner::set_state(const string &name, const TaskState s) {
        lock_guard lock(state_mtx);
        states[name] = s;
    }

    int Runner::verbosity_for(const Task &task) const {
        if (options.verbosity) return *options.verbosity;
        return task.verbosity.value_or(DEFAULT_VERBOSITY);
    }

    Runner::Outcome Runner::fail(const Task &task, TaskFailure failure) {
        const auto kind = failure.kind;
        report([&](Reporter &r) { r.add_failure(task, failure); });
        return {TaskState::Failed, kind};
    }

    Runner::Outcome Runner::process_task(const Task &task) {
        report([&](Reporter &r) { r.start_task(task); });

        if (!options.always_execute) {
            set_state(task.name, TaskState::Checking);
            switch (store.get_status(task, graph)) {
                case Status::Ignore:
                    report([&](Reporter &r) { r.skip_ignore(task); });
                    return {TaskState::Skipped};
                case Status::UpToDate:
                    report([&](Reporter &r) { r.skip_uptodate(task); });
                    return {TaskState::Skipped};
                case Status::Run:
                    break;
            }
        }

        for (const auto &f: task.file_dep) {
            if (error_code ec; !fs::exists(f, ec)) {
                return fail(task, {ActionResult::Kind::Error,
                                   string(_("Dependent file")) + " '" + f + "' " + _("does not exist."), "", ""});
            }
        }

        set_state(task.name, TaskState::Executing);
        report([&](Reporter &r) { r.execute_task(task); });
        const int verbosity = verbosity_for(task);
        const ActionContext ctx{verbosity < 2, verbosity < 2};
        string out;
        string err;
        for (const auto &action: task.actions) {
            ActionResult res = action->execute(ctx);
            out += res.out;
            err += res.err;
            if (!res.ok()) {
                log_debug(task.name, ": ", res.message);
                // verbosity 0 hands over stderr only
                return fail(task, {res.kind, std::move(res.message), verbosity == 0 ? string() : out, err});
            }
        }

        Fingerprints fp;
        try {
            fp = store.compute_fingerprints(task);
        } catch (const fs::filesystem_error &e) {
            return fail(task, {ActionResult::Kind::Error, e.what(), "", ""});
        }
        store.commit(task.name, std::move(fp));
        report([&](Reporter &r) { r.add_success(task); });
        return {TaskState::Succeeded};
    }

    int Runner::run(const ExecutionPlan &plan) {
        {
            lock_guard lock(state_mtx);
            states.clear();
            for (const Task *t: plan) states[t->name] = TaskState::Pending;
        }
        unordered_set<string> in_plan;
        for (const Task *t: plan) in_plan.insert(t->name);

        bool failed = false;
        bool errored = false;
        bool stop = false;
        try {
            while (!stop) {
                vector<const Task *> batch;
                for (const Task *t: plan) {
                    if (state_of(t->name) != TaskState::Pending) continue;
                    bool ready = true;
                    string failed_dep;
                    for (const auto &dep: t->task_dep) {
                        if (!in_plan.contains(dep)) continue;
                        const TaskState ds = state_of(dep);
                        if (ds == TaskState::Failed) {
                            failed_dep = dep;
                            break;
                        }
                        if (ds != TaskState::Succeeded && ds != TaskState::Skipped) ready = false;
                    }
                    if (!failed_dep.empty()) {
                        // only reachable with continue_on_error, otherwise the loop stopped already
                        fail(*t, {ActionResult::Kind::Failure,
                                  string(_("Task not executed because dependency")) + " '" + failed_dep + "' " +
                                  _("failed."), "", ""});
                        set_state(t->name, TaskState::Failed);
                        failed = true;
                        continue;
                    }
                    if (!ready) continue;
                    batch.push_back(t);
                    if (batch.size() >= options.jobs) break;
                }
                if (batch.empty()) break;

                vector<Outcome> outcomes;
                if (batch.size() == 1) {
                    outcomes.push_back(process_task(*batch.front()));
                } else {
                    vector<future<Outcome> > futures;
                    futures.reserve(batch.size());
                    for (const Task *t: batch) {
                        futures.emplace_back(async(launch::async, [this, t] { return process_task(*t); }));
                    }
                    for (auto &f: futures) outcomes.push_back(f.get());
                }

                for (size_t i = 0; i < batch.size(); ++i) {
                    set_state(batch[i]->name, outcomes[i].state);
                    if (outcomes[i].state != TaskState::Failed) continue;
                    failed = true;
                    if (outcomes[i].kind == ActionResult::Kind::Error) errored = true;
                    if (!options.continue_on_error) stop = true;
                }
            }
        } catch (...) {
            // the reporter may be holding failures for the summary
            report([](Reporter &r) { r.complete_run(); });
            throw;
        }

        report([](Reporter &r) { r.complete_run(); });
        if (errored) return RUN_ERROR;
        return failed ? RUN_FAILURE : RUN_SUCCESS;
    }
} // namespace ergon
