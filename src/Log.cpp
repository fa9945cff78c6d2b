#include "../include/Log.hpp"
#include "../include/Errors.hpp"
#include <atomic>
#include <cstdlib>
#include <mutex>
#include <unistd.h>
#include <sys/ioctl.h>

using namespace std;

namespace ergon {
    namespace {
        atomic<LogLevel> g_level{LogLevel::Warn};
        mutex g_log_mutex;
    } // namespace

    void set_log_level(const LogLevel level) {
        g_level = level;
    }

    LogLevel log_level() {
        return g_level;
    }

    LogLevel parse_log_level(const string &name) {
        if (name == "debug") return LogLevel::Debug;
        if (name == "info") return LogLevel::Info;
        if (name == "warn") return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        if (name == "off") return LogLevel::Off;
        throw InvalidCommand(string(_("Unknown log level: ")) + name);
    }

    void init_log_level_from_env() {
        const char *env = getenv("ERGON_LOG");
        if (env == nullptr || *env == '\0') return;
        try {
            set_log_level(parse_log_level(env));
        } catch (const InvalidCommand &e) {
            log_warn(e.what(), " (ERGON_LOG ignored)");
        }
    }

    void print_status(ostream &out, const string &msg, const string &status, const bool error) {
        winsize w{};
        int term_width = 80;
        if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
            term_width = w.ws_col;
        }

        const string green_star = "\033[32m*\033[0m";
        const string white_bracket_open = "\033[37m[\033[0m";
        const string white_bracket_close = "\033[37m]\033[0m";
        const string status_text = error ? "\033[31;1m" + status + "\033[0m" : "\033[32;1m" + status + "\033[0m";
        const string status_block = " " + white_bracket_open + " " + status_text + " " + white_bracket_close;
        const int msg_display_len = 3 + static_cast<int>(msg.length());
        int padding = term_width - msg_display_len - 5 - static_cast<int>(status.length());
        if (padding < 1) padding = 1;

        out << " " << green_star << " " << msg << string(static_cast<size_t>(padding), ' ') << status_block << '\n';
        out.flush();
    }

    void detail::write_log(const LogLevel level, const string &line) {
        const char *prefix = "";
        switch (level) {
            case LogLevel::Debug: prefix = "[\033[96mDEBUG\033[0m] ";
                break;
            case LogLevel::Info: prefix = "[\033[94mINFO\033[0m] ";
                break;
            case LogLevel::Warn: prefix = "[\033[93mWARN\033[0m] ";
                break;
            case LogLevel::Error: prefix = "[\033[91mERROR\033[0m] ";
                break;
            case LogLevel::Off: return;
        }
        lock_guard lock(g_log_mutex);
        cerr << prefix << line << "\033[0m\n";
    }
} // namespace ergon
