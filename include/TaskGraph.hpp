#pragma once
#include "Task.hpp"
#include <initializer_list>
#include <string>
#include <unordered_map>
#include <vector>

namespace ergon {
    /**
     * @brief Read-only set of tasks in declaration order, indexed by name.
     *
     * Construction validates the graph: names are unique and every task_dep
     * names an existing task. Cycles are left to the selector.
     */
    class TaskGraph {
    public:
        TaskGraph() = default;

        explicit TaskGraph(std::vector<Task> tasks);

        TaskGraph(std::initializer_list<Task> tasks) : TaskGraph(std::vector<Task>(tasks)) {}

        [[nodiscard]] const std::vector<Task> &tasks() const { return all; }

        [[nodiscard]] std::size_t size() const { return all.size(); }

        // nullptr when unknown
        [[nodiscard]] const Task *find(const std::string &name) const;

        // Throws InvalidCommand "'name' is not a task." when unknown.
        [[nodiscard]] const Task &at(const std::string &name) const;

        // Declaration position, used to break ordering ties.
        [[nodiscard]] std::size_t index_of(const Task &task) const;

    private:
        std::vector<Task> all;
        std::unordered_map<std::string, std::size_t> by_name;
    };
} // namespace ergon
