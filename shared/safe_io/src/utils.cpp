#include "safe_io/utils.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>

#ifdef _WIN32
#    include <Windows.h>
#    include <fcntl.h>
#    include <io.h>
#endif

namespace safe_io
{
    namespace
    {
        std::atomic<int> g_level{static_cast<int>(Level::Info)};
        std::mutex g_write_mutex;
    } // namespace

    namespace detail
    {
        void configure_console() noexcept
        {
#ifdef _WIN32
            static const bool configured = [] {
                if (!_isatty(_fileno(stdout)))
                {
                    return true;
                }

                ::SetConsoleOutputCP(CP_UTF8);
                ::SetConsoleCP(CP_UTF8);

                const HANDLE handle = ::GetStdHandle(STD_OUTPUT_HANDLE);
                if (handle != INVALID_HANDLE_VALUE)
                {
                    DWORD mode = 0;
                    if (::GetConsoleMode(handle, &mode))
                    {
                        ::SetConsoleMode(handle, mode | ENABLE_PROCESSED_OUTPUT | ENABLE_VIRTUAL_TERMINAL_PROCESSING);
                    }
                }

                _setmode(_fileno(stdout), _O_U8TEXT);
                return true;
            }();
            (void)configured;
#endif
        }

        std::string timestamp()
        {
            using namespace std::chrono;
            const auto now = system_clock::now();
            const auto t = system_clock::to_time_t(now);
            const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

            std::tm local{};
#ifdef _WIN32
            localtime_s(&local, &t);
#else
            localtime_r(&t, &local);
#endif
            return fmt::format("{:02}:{:02}:{:02}.{:03}", local.tm_hour, local.tm_min, local.tm_sec, ms.count());
        }

        void write_log_line(Level lvl, std::string_view message) noexcept
        {
            try
            {
                configure_console();
                const auto line = fmt::format("{} [{}] {}\n", timestamp(), to_string(lvl), message);
                std::lock_guard<std::mutex> lock(g_write_mutex);
                std::fputs(line.c_str(), stderr);
                if (lvl >= Level::Warn)
                {
                    std::fflush(stderr);
                }
            }
            catch (const std::exception& e)
            {
                std::fputs("[safe_io] failed to format log line: ", stderr);
                std::fputs(e.what(), stderr);
                std::fputs("\n", stderr);
            }
        }
    } // namespace detail

    void set_level(Level lvl) noexcept
    {
        g_level.store(static_cast<int>(lvl));
    }

    Level level() noexcept
    {
        return static_cast<Level>(g_level.load());
    }

    std::string_view to_string(Level lvl) noexcept
    {
        switch (lvl)
        {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
        case Level::Off:
            return "OFF";
        }
        return "UNKNOWN";
    }

    std::optional<Level> parse_level(std::string_view text) noexcept
    {
        const auto is = [text](std::string_view name) {
            if (text.size() != name.size())
            {
                return false;
            }
            for (std::size_t i = 0; i < text.size(); ++i)
            {
                if (std::tolower(static_cast<unsigned char>(text[i])) != name[i])
                {
                    return false;
                }
            }
            return true;
        };

        if (is("debug")) return Level::Debug;
        if (is("info")) return Level::Info;
        if (is("warn") || is("warning")) return Level::Warn;
        if (is("error")) return Level::Error;
        if (is("off") || is("none")) return Level::Off;
        return std::nullopt;
    }

    bool configure_level_from_env(const char* variable) noexcept
    {
        if (variable == nullptr)
        {
            return false;
        }

        const char* value = std::getenv(variable);
        if (value == nullptr)
        {
            return false;
        }

        const auto parsed = parse_level(value);
        if (!parsed)
        {
            return false;
        }

        set_level(*parsed);
        return true;
    }
} // namespace safe_io
