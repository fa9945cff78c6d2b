#include "../include/Reporter.hpp"
#include "../include/Errors.hpp"
#include "../include/Log.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

using namespace std;

namespace ergon {
    Reporter::Reporter(ostream &out, const bool show_out, const bool show_failures_on_close)
        : out(out), show_out(show_out), show_failures_on_close(show_failures_on_close) {
    }

    void ConsoleReporter::skip_uptodate(const Task &task) {
        print_status(out, task.name, "--");
    }

    void ConsoleReporter::skip_ignore(const Task &task) {
        print_status(out, task.name, "ig");
    }

    void ConsoleReporter::add_success(const Task &task) {
        print_status(out, task.name, "ok");
    }

    void ConsoleReporter::add_failure(const Task &task, const TaskFailure &failure) {
        print_status(out, task.name, "!!", true);
        if (show_failures_on_close) failures.emplace_back(task.name, failure);
        else write_failure(task.name, failure);
    }

    void ConsoleReporter::write_failure(const string &name, const TaskFailure &failure) {
        out << string(40, '#') << '\n';
        out << (failure.kind == ActionResult::Kind::Error ? "TaskError" : "TaskFailed") << " - " << name << '\n';
        if (!failure.message.empty()) out << failure.message << '\n';
        if (show_out) {
            if (!failure.err.empty()) out << failure.err << (failure.err.back() == '\n' ? "" : "\n");
            if (!failure.out.empty()) out << failure.out << (failure.out.back() == '\n' ? "" : "\n");
        }
    }

    void ConsoleReporter::complete_run() {
        for (const auto &[name, failure]: failures) write_failure(name, failure);
        failures.clear();
        out.flush();
    }

    void JsonReporter::skip_uptodate(const Task &task) {
        entries.push_back({task.name, "up-to-date", {}});
    }

    void JsonReporter::skip_ignore(const Task &task) {
        entries.push_back({task.name, "ignore", {}});
    }

    void JsonReporter::add_success(const Task &task) {
        entries.push_back({task.name, "success", {}});
    }

    void JsonReporter::add_failure(const Task &task, const TaskFailure &failure) {
        entries.push_back({task.name, failure.kind == ActionResult::Kind::Error ? "error" : "fail", failure});
    }

    void JsonReporter::complete_run() {
        nlohmann::json tasks = nlohmann::json::array();
        for (const auto &e: entries) {
            nlohmann::json task = {{"name", e.name}, {"result", e.result}};
            if (e.result == "fail" || e.result == "error") {
                task["error"] = e.failure.message;
                if (show_out) {
                    task["out"] = e.failure.out;
                    task["err"] = e.failure.err;
                }
            }
            tasks.push_back(std::move(task));
        }
        entries.clear();
        out << nlohmann::json{{"tasks", std::move(tasks)}}.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
            << std::endl;
    }

    void ReporterRegistry::add(const string &name, Factory factory) {
        factories[name] = std::move(factory);
    }

    bool ReporterRegistry::contains(const string &name) const {
        return factories.contains(name);
    }

    void ReporterRegistry::require(const string &name) const {
        if (!contains(name)) {
            throw InvalidCommand(string(_("No reporter named")) + " '" + name + "'.\n" +
                                 _("Type 'ergon help' to see a list of available reporters."));
        }
    }

    unique_ptr<Reporter> ReporterRegistry::create(const string &name, ostream &out, const bool show_out,
                                                  const bool show_failures_on_close) const {
        require(name);
        return factories.at(name)(out, show_out, show_failures_on_close);
    }

    vector<string> ReporterRegistry::names() const {
        vector<string> out;
        out.reserve(factories.size());
        for (const auto &[name, factory]: factories) out.push_back(name);
        return out;
    }

    ReporterRegistry ReporterRegistry::with_defaults() {
        ReporterRegistry reg;
        reg.add("default", [](ostream &out, const bool show_out, const bool on_close) {
            return make_unique<ConsoleReporter>(out, show_out, on_close);
        });
        reg.add("executed-only", [](ostream &out, const bool show_out, const bool on_close) {
            return make_unique<ExecutedOnlyReporter>(out, show_out, on_close);
        });
        reg.add("json", [](ostream &out, const bool show_out, const bool on_close) {
            return make_unique<JsonReporter>(out, show_out, on_close);
        });
        return reg;
    }
} // namespace ergon
