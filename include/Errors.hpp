#pragma once
#include <stdexcept>
#include <string>

namespace ergon {
    // User-facing error raised before anything runs: unknown task or reporter,
    // bad command-line usage.
    class InvalidCommand : public std::runtime_error {
    public:
        explicit InvalidCommand(const std::string &msg) : std::runtime_error(msg) {}
    };

    // Malformed task definition: duplicate names, dangling task_dep, task file syntax.
    class InvalidTask : public std::runtime_error {
    public:
        explicit InvalidTask(const std::string &msg) : std::runtime_error(msg) {}
    };

    // Dependency cycle found while expanding task_dep edges.
    class SelectionError : public std::runtime_error {
    public:
        explicit SelectionError(const std::string &msg) : std::runtime_error(msg) {}
    };

    // Dependency store could not be read or written. Fatal for the invocation.
    class StoreError : public std::runtime_error {
    public:
        explicit StoreError(const std::string &msg) : std::runtime_error(msg) {}
    };

    // File notification mechanism unavailable.
    class WatchError : public std::runtime_error {
    public:
        explicit WatchError(const std::string &msg) : std::runtime_error(msg) {}
    };
} // namespace ergon
