#pragma once
#include "TaskGraph.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ergon {
    enum class Status {
        Ignore,
        UpToDate,
        Run,
    };

    [[nodiscard]] const char *to_string(Status s);

    // Identity of one file dependency at commit time.
    struct FileSignature {
        std::int64_t mtime_ns = 0;
        std::uint64_t size = 0;
        std::uint64_t digest = 0; // XXH64 of the content

        bool operator==(const FileSignature &) const = default;
    };

    // What a successful execution of a task depended on.
    struct Fingerprints {
        std::map<std::string, FileSignature> files;
        std::map<std::string, std::uint64_t> tasks; // task_dep name -> its stamp
    };

    struct DependencyRecord {
        Fingerprints fingerprints;
        std::uint64_t stamp = 0; // store-wide commit counter, 0 when never committed
        bool ignored = false;
    };

    /**
     * @brief Persistent fingerprint store keyed by task name.
     *
     * The store is loaded on construction and written back by close(), which the
     * destructor calls. Writing goes through a temporary file renamed over the
     * store so the file on disk is always a complete snapshot. All public
     * operations are serialized on one mutex.
     */
    class DependencyStore {
    public:
        // Loads `path`; a missing file is an empty store. Throws StoreError on unreadable data.
        explicit DependencyStore(std::string path);

        ~DependencyStore();

        DependencyStore(const DependencyStore &) = delete;

        DependencyStore &operator=(const DependencyStore &) = delete;

        /**
         * @brief Compute the status of a task against its record.
         * @param task Task to check.
         * @param graph Graph used to resolve the task's task_dep entries.
         * @return Ignore if flagged, Run when stale or never run, UpToDate otherwise.
         * @throws SelectionError if task_dep edges loop back to a task being checked.
         */
        [[nodiscard]] Status get_status(const Task &task, const TaskGraph &graph);

        /**
         * @brief Fingerprint the task's current dependencies.
         * @throws std::filesystem::filesystem_error if a file_dep cannot be read.
         */
        [[nodiscard]] Fingerprints compute_fingerprints(const Task &task);

        // Replaces the fingerprints of one record and gives it a fresh stamp.
        void commit(const std::string &name, Fingerprints fingerprints);

        void remove(const std::string &name);

        void remove_all();

        // Flags the record, keeping its fingerprints. Creates an empty record when absent.
        void ignore(const Task &task);

        // Writes the store to disk. Further use after close() is a StoreError.
        void close();

        [[nodiscard]] std::optional<DependencyRecord> record(const std::string &name) const;

        [[nodiscard]] const std::string &path() const { return file; }

        static FileSignature signature_of(const std::string &path);

    private:
        void load();

        void check_open() const;

        Status status_locked(const Task &task, const TaskGraph &graph,
                             std::unordered_map<std::string, Status> &memo,
                             std::vector<std::string> &in_progress);

        bool file_changed(const std::string &path, const FileSignature &stored) const;

        std::string file;
        std::map<std::string, DependencyRecord> records;
        std::uint64_t next_stamp = 1;
        bool open = true;
        bool dirty = false;
        mutable std::mutex mtx;
    };
} // namespace ergon
