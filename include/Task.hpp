#pragma once
#include "Action.hpp"
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ergon {
    constexpr int DEFAULT_VERBOSITY = 1;

    // Name separator of generated sub-tasks: "parent:child".
    constexpr char SUBTASK_SEP = ':';

    struct Task {
        std::string name;
        std::vector<std::shared_ptr<const Action> > actions; // empty for group tasks
        std::vector<std::string> file_dep;
        std::vector<std::string> task_dep;
        std::vector<std::string> targets;
        std::string doc;
        bool is_subtask = false;
        std::optional<int> verbosity; // 0 silent, 1 default, 2 stream output

        // Clean procedure
        bool clean_targets = false;
        std::vector<std::shared_ptr<const Action> > clean_actions;

        [[nodiscard]] bool is_group() const { return actions.empty(); }

        // Private tasks start with '_' and are hidden by "list" unless asked for.
        [[nodiscard]] bool is_private() const { return !name.empty() && name.front() == '_'; }

        /**
         * @brief Run the task's clean procedure.
         * @param out Stream receiving one line per action run and per path removed.
         * @param dryrun Only report what would be done.
         * @return false if a clean action failed.
         * @note Targets are removed files first, then directories, and a directory
         *       is only removed when empty.
         */
        bool clean(std::ostream &out, bool dryrun) const;
    };
} // namespace ergon
