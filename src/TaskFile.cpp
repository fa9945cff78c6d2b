#include "../include/TaskFile.hpp"
#include "../include/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

using namespace ergon;
namespace fs = std::filesystem;

// ------------ Helpers ------------
std::string TaskFileParser::trim(const std::string &x) {
    auto start = x.begin();
    while (start != x.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto rend = x.rbegin();
    while (rend != x.rend() && std::isspace(static_cast<unsigned char>(*rend))) {
        ++rend;
    }
    if (start >= rend.base()) return {};
    return std::string(start, rend.base());
}

std::vector<std::string> TaskFileParser::split_ws(const std::string &line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string tok;
    while (iss >> tok) tokens.push_back(std::move(tok));
    return tokens;
}

std::string TaskFileParser::strip_quotes(const std::string &x) {
    std::string t = trim(x);
    if (t.size() >= 2) {
        const char a = t.front(), b = t.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            return t.substr(1, t.size() - 2);
        }
    }
    return t;
}

// ------------ Core ------------

TaskFileParser::TaskFileParser() = default;

[[noreturn]] void TaskFileParser::bad(const std::string &msg) const {
    const std::string where = file_stack.empty() ? std::string("<input>") : file_stack.back().string();
    throw InvalidTask("[Ergonfile] " + where + " line " + std::to_string(currentLine) + ": " + msg);
}

void TaskFileParser::parse_file(const std::string &path) {
    const fs::path base = file_stack.empty() ? fs::current_path() : file_stack.back().parent_path();
    const fs::path p = fs::absolute(base / path).lexically_normal();
    if (include_depth >= include_depth_max) bad(_("Include depth exceeded"));
    std::error_code ec;
    if (!fs::exists(p, ec)) {
        if (ec) {
            if (file_stack.empty()) {
                throw InvalidTask(std::string(_("Cannot access task file ")) + p.string() + ": " + ec.message());
            }
            bad(std::string(_("Cannot access file ")) + p.string() + ": " + ec.message());
        }
        if (file_stack.empty()) throw InvalidTask(std::string(_("Task file not found: ")) + p.string());
        bad(std::string(_("Failed to open file: ")) + p.string());
    }

    std::string key = p.string();
    if (include_guard.contains(key)) {
        bad(std::string(_("Circular include detected: ")) + key);
    }

    std::ifstream in(p);
    if (!in.is_open()) bad(std::string(_("Failed to open file: ")) + p.string());

    // keeps the file stack, the guard set and the line counter right on every exit path
    struct IncludeGuardRAII {
        TaskFileParser *self;
        std::string key;
        int saved_line;

        IncludeGuardRAII(TaskFileParser *s, std::string k, const fs::path &pth)
            : self(s), key(std::move(k)), saved_line(s->currentLine) {
            self->include_guard.insert(key);
            self->file_stack.push_back(pth);
            self->include_depth++;
        }

        ~IncludeGuardRAII() {
            self->include_guard.erase(key);
            if (!self->file_stack.empty()) self->file_stack.pop_back();
            self->include_depth--;
            self->currentLine = saved_line;
        }
    } guard(this, key, p);

    std::string line;
    currentLine = 0;
    while (std::getline(in, line)) {
        ++currentLine;
        parse_line(line);
    }
}

void TaskFileParser::parse_line(const std::string &line) {
    const std::string s = trim(line);
    if (s.empty()) return;
    // whole-line comments only, shell commands may contain '#' and '//'
    if (s.starts_with("//") || s.starts_with("#")) return;
    if (s.front() != '@') bad(std::string(_("Expected a directive: ")) + s);

    const auto ws = std::find_if(s.begin(), s.end(), [](const char c) {
        return std::isspace(static_cast<unsigned char>(c));
    });
    const std::string directive(s.begin(), ws);
    const std::string rest = trim(std::string(ws, s.end()));

    // ----- task block -----
    if (current) {
        if (directive == "@end") {
            close_block();
            return;
        }
        if (directive == "@task") bad(_("@task inside another task, missing @end"));
        if (directive == "@foreach") {
            const auto toks = split_ws(rest);
            if (toks.size() < 3 || toks[1] != "in") bad(_("@foreach expects VAR in VALUE..."));
            if (!current->foreach_var.empty()) bad(_("only one @foreach per task"));
            current->foreach_var = toks[0];
            for (size_t i = 2; i < toks.size(); ++i) current->foreach_values.push_back(expand_vars(toks[i]));
            return;
        }
        static const std::unordered_set<std::string> block_directives = {
            "@doc", "@action", "@file_dep", "@task_dep", "@target", "@clean", "@clean_action", "@verbosity",
        };
        if (block_directives.contains(directive)) {
            if (rest.empty() && directive != "@clean") bad(directive + _(" expects a value"));
            current->directives.emplace_back(directive, rest);
            return;
        }
        if (directive != "@let") bad(std::string(_("Unknown directive in task block: ")) + directive);
    }

    if (directive == "@task") {
        if (rest.empty() || split_ws(rest).size() != 1) bad(_("@task expects a single name"));
        Block b;
        b.name = expand_vars(rest);
        b.line = currentLine;
        current = std::move(b);
        return;
    }
    if (directive == "@end") bad(_("@end outside of @task"));

    if (directive == "@include") {
        if (rest.empty()) bad(_("@include expects a path"));
        // quotes may come back with the expansion
        const std::string target = strip_quotes(expand_vars(strip_quotes(rest)));
        parse_file(target);
        return;
    }

    // ----- @let -----
    if (directive == "@let") {
        if (rest.empty()) bad(_("@let expects NAME=VALUE or NAME VALUE"));
        const auto eq = rest.find('=');
        std::string name, value;
        if (eq == std::string::npos) {
            if (const auto toks = split_ws(rest); toks.size() == 1) {
                name = toks[0];
                value = "1";
            } else {
                name = toks[0];
                value = trim(rest.substr(name.size()));
            }
        } else {
            name = trim(rest.substr(0, eq));
            value = trim(rest.substr(eq + 1));
        }
        static const std::regex nameRe(R"([A-Za-z_][A-Za-z0-9_]*)");
        if (!std::regex_match(name, nameRe)) bad(std::string(_("@let invalid name: ")) + name);
        vars[name] = expand_vars(strip_quotes(value));
        return;
    }

    if (directive == "@config") {
        parse_config(rest);
        return;
    }

    bad(std::string(_("Unknown directive: ")) + directive);
}

void TaskFileParser::parse_config(const std::string &rest) {
    const auto eq = rest.find('=');
    if (eq == std::string::npos) bad(_("@config expects KEY=VALUE"));
    const std::string key = trim(rest.substr(0, eq));
    const std::string value = expand_vars(strip_quotes(rest.substr(eq + 1)));

    const auto to_int = [&](const std::string &v) -> long long {
        long long n = 0;
        if (!str_to_int(v, n)) bad("@config " + key + _(" expects an integer"));
        return n;
    };

    if (key == "default_tasks") {
        config.default_tasks = split_ws(value);
    } else if (key == "verbosity") {
        const long long v = to_int(value);
        if (v < 0 || v > 2) bad(_("verbosity must be 0, 1 or 2"));
        config.verbosity = static_cast<int>(v);
    } else if (key == "continue") {
        config.continue_on_error = is_truthy(value);
    } else if (key == "always") {
        config.always_execute = is_truthy(value);
    } else if (key == "reporter") {
        config.reporter = value;
    } else if (key == "dep_file") {
        if (value.empty()) bad(_("dep_file must not be empty"));
        config.dep_file = value;
    } else if (key == "jobs") {
        const long long v = to_int(value);
        if (v <= 0) bad(_("jobs must be > 0"));
        config.jobs = static_cast<unsigned>(v);
    } else {
        bad(std::string(_("Unknown @config key: ")) + key);
    }
}

Task TaskFileParser::build_task(const Block &block, const std::string &name) const {
    Task t;
    t.name = name;
    for (const auto &[directive, raw]: block.directives) {
        const std::string value = expand_vars(raw);
        if (directive == "@doc") {
            t.doc = strip_quotes(value);
        } else if (directive == "@action") {
            t.actions.push_back(std::make_shared<CmdAction>(value));
        } else if (directive == "@clean_action") {
            t.clean_actions.push_back(std::make_shared<CmdAction>(value));
        } else if (directive == "@clean") {
            t.clean_targets = value.empty() || is_truthy(value);
        } else if (directive == "@verbosity") {
            long long v = 0;
            if (!str_to_int(value, v) || v < 0 || v > 2) bad(_("@verbosity must be 0, 1 or 2"));
            t.verbosity = static_cast<int>(v);
        } else {
            auto &list = directive == "@file_dep" ? t.file_dep : directive == "@task_dep" ? t.task_dep : t.targets;
            for (auto &tok: split_ws(value)) {
                if (std::ranges::find(list, tok) == list.end()) list.push_back(std::move(tok));
            }
        }
    }
    return t;
}

void TaskFileParser::close_block() {
    Block block = std::move(*current);
    current.reset();
    if (block.foreach_var.empty()) {
        tasks.push_back(build_task(block, block.name));
        return;
    }
    if (block.foreach_values.empty()) bad(_("@foreach without values"));

    // one sub-task per value, then the group task depending on all of them
    const auto previous = vars.find(block.foreach_var) == vars.end()
                              ? std::optional<std::string>()
                              : std::optional<std::string>(vars.at(block.foreach_var));
    Task group;
    group.name = block.name;
    for (const auto &value: block.foreach_values) {
        vars[block.foreach_var] = value;
        Task sub = build_task(block, block.name + SUBTASK_SEP + value);
        sub.is_subtask = true;
        group.task_dep.push_back(sub.name);
        tasks.push_back(std::move(sub));
    }
    if (previous) vars[block.foreach_var] = *previous;
    else vars.erase(block.foreach_var);
    for (const auto &[directive, raw]: block.directives) {
        if (directive == "@doc") group.doc = strip_quotes(expand_vars(raw));
    }
    tasks.push_back(std::move(group));
}

void TaskFileParser::finalize() {
    if (current) {
        currentLine = current->line;
        bad(std::string(_("@task without @end: ")) + current->name);
    }
}

std::string TaskFileParser::expand_vars(const std::string &in) const {
    static const std::regex re(R"(\$\{([A-Za-z_][A-Za-z0-9_]*)\})");
    std::string out;
    out.reserve(in.size());
    std::sregex_iterator it(in.begin(), in.end(), re);
    size_t last = 0;
    for (const std::sregex_iterator end; it != end; ++it) {
        const auto &m = *it;
        out.append(in, last, static_cast<size_t>(m.position()) - last);
        const std::string key = m[1].str();
        if (const auto itv = vars.find(key); itv != vars.end()) out += itv->second;
        else out += m.str();
        last = static_cast<size_t>(m.position() + m.length());
    }
    out.append(in, last, std::string::npos);
    return out;
}

// ---------- value helpers ----------
bool TaskFileParser::is_truthy(const std::string &v) {
    if (v.empty()) return false;
    std::string s;
    s.reserve(v.size());
    for (const char c: v) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return !(s == "0" || s == "false" || s == "no" || s == "off");
}

bool TaskFileParser::str_to_int(const std::string &s, long long &out) {
    char *end = nullptr;
    errno = 0;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    out = v;
    return true;
}

TaskFileParser ergon::load_task_file(const std::string &path) {
    TaskFileParser parser;
    parser.parse_file(path);
    parser.finalize();
    return parser;
}
