#include "../include/Action.hpp"
#include "../include/Log.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>

using namespace std;

namespace ergon {
    namespace {
        // Unlinked temporary file receiving one output stream of a child process.
        struct CaptureFile {
            int fd = -1;

            CaptureFile() {
                char path[] = "/tmp/ergon-capture-XXXXXX";
                fd = mkostemp(path, O_CLOEXEC);
                if (fd >= 0) unlink(path);
            }

            ~CaptureFile() {
                if (fd >= 0) close(fd);
            }

            CaptureFile(const CaptureFile &) = delete;

            CaptureFile &operator=(const CaptureFile &) = delete;

            [[nodiscard]] bool valid() const { return fd >= 0; }

            [[nodiscard]] string read_all() const {
                string data;
                if (lseek(fd, 0, SEEK_SET) < 0) return data;
                char buf[4096];
                for (;;) {
                    const ssize_t n = read(fd, buf, sizeof buf);
                    if (n < 0 && errno == EINTR) continue;
                    if (n <= 0) break;
                    data.append(buf, static_cast<size_t>(n));
                }
                return data;
            }
        };
    } // namespace

    CmdAction::CmdAction(string command) : cmd(std::move(command)) {
    }

    ActionResult CmdAction::execute(const ActionContext &ctx) const {
        ActionResult res;
        optional<CaptureFile> out_file;
        optional<CaptureFile> err_file;
        if (ctx.capture_out) out_file.emplace();
        if (ctx.capture_err) err_file.emplace();
        if ((out_file && !out_file->valid()) || (err_file && !err_file->valid())) {
            res.kind = ActionResult::Kind::Error;
            res.message = string(_("Cannot create capture file: ")) + strerror(errno);
            return res;
        }

        cout.flush();
        cerr.flush();
        log_debug("exec: ", cmd);
        const pid_t pid = fork();
        if (pid < 0) {
            res.kind = ActionResult::Kind::Error;
            res.message = string(_("Failed to fork command: ")) + strerror(errno);
            return res;
        }
        if (pid == 0) {
            if (out_file) dup2(out_file->fd, STDOUT_FILENO);
            if (err_file) dup2(err_file->fd, STDERR_FILENO);
            execl("/bin/sh", "sh", "-c", cmd.c_str(), static_cast<char *>(nullptr));
            _exit(127);
        }

        int status = 0;
        pid_t waited;
        do {
            waited = waitpid(pid, &status, 0);
        } while (waited < 0 && errno == EINTR);
        if (out_file) res.out = out_file->read_all();
        if (err_file) res.err = err_file->read_all();
        if (waited < 0) {
            res.kind = ActionResult::Kind::Error;
            res.message = string(_("Failed to wait for command: ")) + strerror(errno);
            return res;
        }

        int rc = -1;
        if (WIFEXITED(status)) rc = WEXITSTATUS(status);
        else if (WIFSIGNALED(status)) rc = 128 + WTERMSIG(status);
        if (rc != 0) {
            res.kind = ActionResult::Kind::Failure;
            res.message = string(_("Command failed: ")) + "'" + cmd + "' " + _("returned") + " " + std::to_string(rc);
        }
        return res;
    }

    CallableAction::CallableAction(string label, Fn fn) : label(std::move(label)), fn(std::move(fn)) {
    }

    ActionResult CallableAction::execute(const ActionContext &ctx) const {
        ActionResult res;
        ostringstream out_buf;
        ostringstream err_buf;
        ostream &out = ctx.capture_out ? static_cast<ostream &>(out_buf) : cout;
        ostream &err = ctx.capture_err ? static_cast<ostream &>(err_buf) : cerr;
        try {
            if (!fn(out, err)) {
                res.kind = ActionResult::Kind::Failure;
                res.message = string(_("Action failed: ")) + label;
            }
        } catch (const exception &e) {
            res.kind = ActionResult::Kind::Error;
            res.message = string(_("Action raised: ")) + label + ": " + e.what();
        }
        res.out = out_buf.str();
        res.err = err_buf.str();
        return res;
    }
} // namespace ergon
