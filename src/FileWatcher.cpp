#include "../include/FileWatcher.hpp"
#include "../include/Errors.hpp"
#include "../include/Log.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <poll.h>
#include <unistd.h>
#include <sys/inotify.h>

using namespace std;
namespace fs = std::filesystem;

namespace ergon {
    InotifySource::InotifySource() {
        fd = inotify_init1(IN_CLOEXEC | IN_NONBLOCK);
        if (fd < 0) throw WatchError(string(_("Cannot initialize inotify: ")) + strerror(errno));
    }

    InotifySource::~InotifySource() {
        if (fd >= 0) close(fd);
    }

    void InotifySource::add_directory(const string &dir) {
        const int wd = inotify_add_watch(fd, dir.c_str(), IN_CLOSE_WRITE);
        if (wd < 0) throw WatchError(string(_("Cannot watch directory")) + " '" + dir + "': " + strerror(errno));
        watches.emplace_back(wd, dir);
    }

    optional<FileEvent> InotifySource::next_event(const chrono::milliseconds timeout) {
        if (queued.empty()) {
            pollfd pfd{fd, POLLIN, 0};
            const int rc = poll(&pfd, 1, static_cast<int>(timeout.count()));
            if (rc < 0 && errno != EINTR) throw WatchError(string(_("inotify poll failed: ")) + strerror(errno));
            if (rc <= 0) return nullopt;

            alignas(inotify_event) char buf[4096];
            const ssize_t len = read(fd, buf, sizeof buf);
            if (len < 0) {
                if (errno == EAGAIN || errno == EINTR) return nullopt;
                throw WatchError(string(_("inotify read failed: ")) + strerror(errno));
            }
            for (ssize_t off = 0; off < len;) {
                const auto *ev = reinterpret_cast<const inotify_event *>(buf + off);
                off += static_cast<ssize_t>(sizeof(inotify_event) + ev->len);
                if (ev->len == 0) continue;
                for (const auto &[wd, dir]: watches) {
                    if (wd != ev->wd) continue;
                    queued.push_back({(fs::path(dir) / ev->name).string(), ev->mask});
                    break;
                }
            }
            if (queued.empty()) return nullopt;
        }
        FileEvent ev = std::move(queued.front());
        queued.erase(queued.begin());
        return ev;
    }

    FileWatcher::FileWatcher(const vector<string> &files, unique_ptr<EventSource> source)
        : source(std::move(source)) {
        for (const auto &f: files) {
            const fs::path abs = fs::absolute(f).lexically_normal();
            watched_files.insert(abs.string());
            watched_dirs.insert(abs.parent_path().string());
        }
    }

    void FileWatcher::loop(const Handler &handler, const StopHook &stop_hook) {
        if (!source) source = make_unique<InotifySource>();
        for (const auto &dir: watched_dirs) source->add_directory(dir);
        log_info("watching ", watched_files.size(), " files in ", watched_dirs.size(), " directories");

        while (!stop_flag) {
            const auto ev = source->next_event(chrono::milliseconds(200));
            if (!ev) continue;
            if (!watched_files.contains(fs::path(ev->path).lexically_normal().string())) continue;
            log_debug("modified: ", ev->path);
            handler(*ev);
            if (stop_hook && stop_hook()) break;
        }
    }
} // namespace ergon
