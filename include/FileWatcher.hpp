#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ergon {
    struct FileEvent {
        std::string path; // absolute
        std::uint32_t mask = 0;
    };

    // Source of "file closed after write" events for a set of directories.
    class EventSource {
    public:
        virtual ~EventSource() = default;

        virtual void add_directory(const std::string &dir) = 0;

        // Waits up to `timeout` and returns nullopt when nothing arrived.
        [[nodiscard]] virtual std::optional<FileEvent> next_event(std::chrono::milliseconds timeout) = 0;
    };

    // Linux inotify, IN_CLOSE_WRITE on each directory.
    class InotifySource final : public EventSource {
    public:
        // Throws WatchError when inotify is unavailable.
        InotifySource();

        ~InotifySource() override;

        InotifySource(const InotifySource &) = delete;

        InotifySource &operator=(const InotifySource &) = delete;

        void add_directory(const std::string &dir) override;

        [[nodiscard]] std::optional<FileEvent> next_event(std::chrono::milliseconds timeout) override;

    private:
        int fd = -1;
        std::vector<std::pair<int, std::string> > watches; // wd -> directory
        std::vector<FileEvent> queued;
    };

    /**
     * @brief Calls a handler each time one of the watched files is written.
     *
     * The watch set is fixed at construction. Watches are installed per parent
     * directory and events for other files in those directories are dropped.
     */
    class FileWatcher {
    public:
        using Handler = std::function<void(const FileEvent &)>;
        // Checked after each handled event; returning true ends the loop.
        using StopHook = std::function<bool()>;

        explicit FileWatcher(const std::vector<std::string> &files,
                             std::unique_ptr<EventSource> source = nullptr);

        /**
         * @brief Infinite event loop.
         * @param handler Run synchronously for every event on a watched file.
         * @param stop_hook Optional, lets tests end the loop after a bounded number of events.
         */
        void loop(const Handler &handler, const StopHook &stop_hook = nullptr);

        // Ends loop() from another thread, at the next poll timeout at the latest.
        void request_stop() { stop_flag = true; }

        [[nodiscard]] const std::set<std::string> &files() const { return watched_files; }

        [[nodiscard]] const std::set<std::string> &directories() const { return watched_dirs; }

    private:
        std::set<std::string> watched_files;
        std::set<std::string> watched_dirs;
        std::unique_ptr<EventSource> source;
        std::atomic<bool> stop_flag{false};
    };
} // namespace ergon
