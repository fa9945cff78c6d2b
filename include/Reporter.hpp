#pragma once
#include "Action.hpp"
#include "Task.hpp"
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ergon {
    // Everything the reporter gets to know about one failed task.
    struct TaskFailure {
        ActionResult::Kind kind = ActionResult::Kind::Failure;
        std::string message;
        std::string out; // captured stdout handed over by the runner
        std::string err; // captured stderr handed over by the runner
    };

    /**
     * @brief Sink for task lifecycle events.
     *
     * Calls arrive one at a time, the runner serializes them.
     */
    class Reporter {
    public:
        /**
         * @param out Stream to render to.
         * @param show_out Include captured task output in failure reports.
         * @param show_failures_on_close Hold failure details until complete_run().
         */
        Reporter(std::ostream &out, bool show_out, bool show_failures_on_close);

        virtual ~Reporter() = default;

        virtual void start_task(const Task &) {}

        virtual void execute_task(const Task &) {}

        virtual void skip_uptodate(const Task &task) = 0;

        virtual void skip_ignore(const Task &task) = 0;

        virtual void add_success(const Task &task) = 0;

        virtual void add_failure(const Task &task, const TaskFailure &failure) = 0;

        virtual void complete_run() = 0;

    protected:
        std::ostream &out;
        bool show_out;
        bool show_failures_on_close;
    };

    // Status line per task, failure details once, at the end by default.
    class ConsoleReporter : public Reporter {
    public:
        using Reporter::Reporter;

        void skip_uptodate(const Task &task) override;

        void skip_ignore(const Task &task) override;

        void add_success(const Task &task) override;

        void add_failure(const Task &task, const TaskFailure &failure) override;

        void complete_run() override;

    protected:
        void write_failure(const std::string &name, const TaskFailure &failure);

        std::vector<std::pair<std::string, TaskFailure> > failures;
    };

    // Same as ConsoleReporter but silent about skipped tasks; used by "auto".
    class ExecutedOnlyReporter final : public ConsoleReporter {
    public:
        using ConsoleReporter::ConsoleReporter;

        void skip_uptodate(const Task &) override {}

        void skip_ignore(const Task &) override {}
    };

    // One JSON document with the outcome of every task, written by complete_run().
    class JsonReporter final : public Reporter {
    public:
        using Reporter::Reporter;

        void skip_uptodate(const Task &task) override;

        void skip_ignore(const Task &task) override;

        void add_success(const Task &task) override;

        void add_failure(const Task &task, const TaskFailure &failure) override;

        void complete_run() override;

    private:
        struct Entry {
            std::string name;
            std::string result; // success, fail, error, up-to-date or ignore
            TaskFailure failure;
        };

        std::vector<Entry> entries;
    };

    /**
     * @brief Name to reporter factory table, built at startup and handed to the commands.
     */
    class ReporterRegistry {
    public:
        using Factory = std::function<std::unique_ptr<Reporter>(std::ostream &out, bool show_out,
                                                                bool show_failures_on_close)>;

        void add(const std::string &name, Factory factory);

        [[nodiscard]] bool contains(const std::string &name) const;

        // Throws InvalidCommand when no reporter has this name.
        void require(const std::string &name) const;

        // Throws InvalidCommand when no reporter has this name.
        [[nodiscard]] std::unique_ptr<Reporter> create(const std::string &name, std::ostream &out, bool show_out,
                                                       bool show_failures_on_close) const;

        [[nodiscard]] std::vector<std::string> names() const;

        // "default", "executed-only" and "json".
        static ReporterRegistry with_defaults();

    private:
        std::map<std::string, Factory> factories;
    };
} // namespace ergon
