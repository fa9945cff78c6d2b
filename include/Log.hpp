#pragma once
#include <libintl.h>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

#ifndef I18N_GETTEXT_DEFINED
#define _(String) gettext(String)
#define I18N_GETTEXT_DEFINED
#endif

namespace ergon {
    enum class LogLevel : std::uint32_t {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3,
        Off = 4,
    };

    void set_log_level(LogLevel level);

    [[nodiscard]] LogLevel log_level();

    // Parses "debug", "info", "warn", "error" or "off". Throws InvalidCommand otherwise.
    [[nodiscard]] LogLevel parse_log_level(const std::string &name);

    // Reads ERGON_LOG from the environment, keeps the current level if unset.
    void init_log_level_from_env();

    // OpenRC style status line: " * msg ....... [ status ]", padded to the terminal width.
    void print_status(std::ostream &out, const std::string &msg, const std::string &status, bool error = false);

    namespace detail {
        void write_log(LogLevel level, const std::string &line);

        template<class... Args>
        void log_at(const LogLevel level, Args &&... args) {
            if (static_cast<std::uint32_t>(level) < static_cast<std::uint32_t>(log_level())) return;
            std::ostringstream os;
            (os << ... << args);
            write_log(level, os.str());
        }
    } // namespace detail

    template<class... Args>
    void log_debug(Args &&... args) { detail::log_at(LogLevel::Debug, std::forward<Args>(args)...); }

    template<class... Args>
    void log_info(Args &&... args) { detail::log_at(LogLevel::Info, std::forward<Args>(args)...); }

    template<class... Args>
    void log_warn(Args &&... args) { detail::log_at(LogLevel::Warn, std::forward<Args>(args)...); }

    template<class... Args>
    void log_error(Args &&... args) { detail::log_at(LogLevel::Error, std::forward<Args>(args)...); }
} // namespace ergon
