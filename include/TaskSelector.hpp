#pragma once
#include "TaskGraph.hpp"
#include <string>
#include <vector>

namespace ergon {
    using ExecutionPlan = std::vector<const Task *>;

    class TaskSelector {
    public:
        /**
         * @param graph All known tasks.
         * @param default_tasks Names used when nothing is requested. When empty,
         *        every task that is not a sub-task is selected, in declaration order.
         */
        explicit TaskSelector(const TaskGraph &graph, std::vector<std::string> default_tasks = {});

        /**
         * @brief Build the execution plan for the requested names.
         *
         * The plan holds the requested tasks and the transitive closure of their
         * task_dep, each task once, every task after all of its dependencies.
         * Independent tasks keep declaration order.
         *
         * @throws InvalidCommand for an unknown name.
         * @throws SelectionError when task_dep edges form a cycle.
         */
        [[nodiscard]] ExecutionPlan process(const std::vector<std::string> &requested) const;

        /**
         * @brief Breadth-first expansion of a group used by forget and ignore.
         *
         * Starts with `name`; every visited task without actions adds its task_dep
         * members to the queue. Each name is returned once.
         *
         * @throws InvalidCommand for an unknown name.
         */
        [[nodiscard]] std::vector<std::string> group_members(const std::string &name) const;

    private:
        const TaskGraph &graph;
        std::vector<std::string> defaults;
    };
} // namespace ergon
