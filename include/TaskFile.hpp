#pragma once
#include "Task.hpp"
#include <libintl.h>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#ifndef I18N_GETTEXT_DEFINED
#define _(String) gettext(String)
#define I18N_GETTEXT_DEFINED
#endif

namespace ergon {
    constexpr const char *DEFAULT_TASK_FILE = "Ergonfile";
    constexpr const char *DEFAULT_DEP_FILE = ".ergon.db";

    // Settings a task file may provide through @config; command-line flags win.
    struct FileConfig {
        std::vector<std::string> default_tasks;
        std::optional<int> verbosity;
        std::optional<bool> continue_on_error;
        std::optional<bool> always_execute;
        std::optional<std::string> reporter;
        std::optional<std::string> dep_file;
        std::optional<unsigned> jobs;
    };

    /**
     * @brief Loader for the Ergonfile directive language.
     *
     * @task NAME ... @end blocks declare tasks; @let, @include and @config
     * work anywhere outside of a block. ${VAR} references inside a block
     * are expanded when the block closes, so @foreach variables are visible.
     */
    class TaskFileParser {
    public:
        TaskFileParser();

        // Parsing
        void parse_file(const std::string &path);

        void parse_line(const std::string &line);

        // Checks that no block is left open. Must be called after the last parse_*.
        void finalize();

        // Access
        [[nodiscard]] const std::vector<Task> &get_tasks() const { return tasks; }

        [[nodiscard]] std::vector<Task> take_tasks() { return std::move(tasks); }

        [[nodiscard]] const FileConfig &get_config() const { return config; }

        void set_var(const std::string &name, const std::string &value) { vars[name] = value; }

        std::string expand_vars(const std::string &in) const; // replaces ${VAR}

    private:
        struct Block {
            std::string name;
            int line = 0;
            std::vector<std::pair<std::string, std::string> > directives; // raw, expanded at @end
            std::string foreach_var;
            std::vector<std::string> foreach_values;
        };

        static std::string trim(const std::string &x);

        static std::vector<std::string> split_ws(const std::string &line);

        static bool is_truthy(const std::string &v);

        static bool str_to_int(const std::string &s, long long &out);

        static std::string strip_quotes(const std::string &x);

        [[noreturn]] void bad(const std::string &msg) const;

        void parse_config(const std::string &rest);

        void close_block();

        Task build_task(const Block &block, const std::string &name) const;

        std::unordered_map<std::string, std::string> vars; // @let
        std::vector<Task> tasks;
        FileConfig config;
        std::optional<Block> current;

        // parsing context
        int currentLine = 0;
        std::vector<std::filesystem::path> file_stack;
        std::unordered_set<std::string> include_guard; // absolute paths being parsed
        int include_depth = 0;
        const int include_depth_max = 32;
    };

    // Parses and finalizes `path`.
    [[nodiscard]] TaskFileParser load_task_file(const std::string &path);
} // namespace ergon
