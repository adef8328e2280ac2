#pragma once

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <cstdio>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace safe_io {
    enum class Level
    {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3,
        Off = 4,
    };

    namespace detail {
        void configure_console() noexcept;
        [[nodiscard]] std::string timestamp();
        void write_log_line(Level lvl, std::string_view message) noexcept;
    }

    inline std::ostream& out() noexcept {
        detail::configure_console();
        return std::cout;
    }

    // Format to string
    template <class... Args>
    [[nodiscard]] inline std::string sformat(fmt::format_string<Args...> fmt_str, Args&&... args) {
        return fmt::format(fmt_str, std::forward<Args>(args)...);
    }

    // Print to stdout
    template <class... Args>
    inline void print(fmt::format_string<Args...> fmt_str, Args&&... args) {
        detail::configure_console();
        fmt::print(stdout, fmt_str, std::forward<Args>(args)...);
        fmt::print(stdout, "\n");
        std::fflush(stdout);
    }

    // Print to stderr
    template <class... Args>
    inline void eprint(fmt::format_string<Args...> fmt_str, Args&&... args) {
        detail::configure_console();
        fmt::print(stderr, fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "\n");
        std::fflush(stderr);
    }

    // Print and terminate
    template <class... Args>
    [[noreturn]] inline void fatal(fmt::format_string<Args...> fmt_str, Args&&... args) {
        detail::configure_console();
        fmt::print(stderr, fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "\n");
        std::fflush(stderr);
        std::terminate();
    }

    // Process-wide log threshold (default Info).
    void set_level(Level lvl) noexcept;
    [[nodiscard]] Level level() noexcept;
    [[nodiscard]] std::string_view to_string(Level lvl) noexcept;
    // Accepts debug, info, warn/warning, error, off/none (case-insensitive).
    [[nodiscard]] std::optional<Level> parse_level(std::string_view text) noexcept;
    // Reads the named environment variable; returns true when it held a valid level.
    bool configure_level_from_env(const char* variable = "GESTUREFLOW_LOG_LEVEL") noexcept;

    [[nodiscard]] inline bool enabled(Level lvl) noexcept {
        return lvl != Level::Off && static_cast<int>(lvl) >= static_cast<int>(level());
    }

    template <class... Args>
    inline void log(Level lvl, fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (!enabled(lvl)) {
            return;
        }
        detail::write_log_line(lvl, fmt::format(fmt_str, std::forward<Args>(args)...));
    }

    template <class... Args>
    inline void debug(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(Level::Debug, fmt_str, std::forward<Args>(args)...);
    }

    template <class... Args>
    inline void info(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(Level::Info, fmt_str, std::forward<Args>(args)...);
    }

    template <class... Args>
    inline void warn(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(Level::Warn, fmt_str, std::forward<Args>(args)...);
    }

    template <class... Args>
    inline void error(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(Level::Error, fmt_str, std::forward<Args>(args)...);
    }

} // namespace safe_io
