#pragma once
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <functional>
#include <mutex>
#include <print>
#include <string_view>
#include <utility>

namespace morphcore {

// --- Log severity levels ---
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

[[nodiscard]] constexpr std::string_view log_level_name(LogLevel lvl) noexcept
{
    switch (lvl) {
        case LogLevel::trace: return "TRACE";
        case LogLevel::debug: return "DEBUG";
        case LogLevel::info:  return "INFO ";
        case LogLevel::warn:  return "WARN ";
        case LogLevel::error: return "ERROR";
        case LogLevel::fatal: return "FATAL";
        default:              return "?????";
    }
}

// --- Library-wide logger (all-static, no instances) ---
//
// The transforms report pass counts and convergence at debug level, so the
// default threshold is warn: a library should stay quiet unless asked.
class Logger final {
public:
    Logger() = delete;

    static void set_level(LogLevel level) noexcept
    {
        auto lock = std::lock_guard{mutex_()};
        level_() = level;
    }

    [[nodiscard]] static LogLevel level() noexcept
    {
        auto lock = std::lock_guard{mutex_()};
        return level_();
    }

    [[nodiscard]] static bool enabled(LogLevel lvl) noexcept
    {
        return static_cast<std::uint8_t>(lvl) >= static_cast<std::uint8_t>(level());
    }

    // Additional output file; nullptr disables file output.
    static void set_file(std::FILE* f) noexcept
    {
        auto lock = std::lock_guard{mutex_()};
        file_() = f;
    }

    // Custom sink, called with the fully formatted line.
    using Sink = std::function<void(LogLevel, std::string_view)>;
    static void set_sink(Sink sink)
    {
        auto lock = std::lock_guard{mutex_()};
        sink_() = std::move(sink);
    }

    // Mute stderr while keeping file and sink output (used by tests).
    static void set_stderr(bool on) noexcept
    {
        auto lock = std::lock_guard{mutex_()};
        stderr_on_() = on;
    }

    template <typename... Args>
    static void log(LogLevel lvl, std::format_string<Args...> fmt, Args&&... args)
    {
        if (!enabled(lvl)) {
            return;
        }

        auto msg = std::format(fmt, std::forward<Args>(args)...);

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::floor<std::chrono::milliseconds>(now);
        auto dp = std::chrono::floor<std::chrono::days>(time);
        auto tod = std::chrono::hh_mm_ss{time - dp};

        auto line = std::format("[{}] [{:%H:%M:%S}] [morphcore] {}\n",
                                log_level_name(lvl), tod, msg);

        auto lock = std::lock_guard{mutex_()};

        if (stderr_on_()) {
            std::print(stderr, "{}", line);
        }
        if (file_()) {
            std::print(file_(), "{}", line);
            std::fflush(file_());
        }
        if (sink_()) {
            sink_()(lvl, line);
        }
    }

    template <typename... Args>
    static void trace(std::format_string<Args...> fmt, Args&&... args)
    {
        log(LogLevel::trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(std::format_string<Args...> fmt, Args&&... args)
    {
        log(LogLevel::debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(std::format_string<Args...> fmt, Args&&... args)
    {
        log(LogLevel::info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(std::format_string<Args...> fmt, Args&&... args)
    {
        log(LogLevel::warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(std::format_string<Args...> fmt, Args&&... args)
    {
        log(LogLevel::error, fmt, std::forward<Args>(args)...);
    }

private:
    // Function-local statics avoid the static-init-order fiasco.
    static std::mutex& mutex_()
    {
        static std::mutex m;
        return m;
    }

    static LogLevel& level_()
    {
        static LogLevel lvl = LogLevel::warn;
        return lvl;
    }

    static std::FILE*& file_()
    {
        static std::FILE* f = nullptr;
        return f;
    }

    static Sink& sink_()
    {
        static Sink s;
        return s;
    }

    static bool& stderr_on_()
    {
        static bool on = true;
        return on;
    }
};

// --- RAII scoped log level override ---
class ScopedLogLevel final {
    LogLevel prev_;

public:
    explicit ScopedLogLevel(LogLevel level) noexcept
        : prev_{Logger::level()}
    {
        Logger::set_level(level);
    }

    ~ScopedLogLevel() noexcept { Logger::set_level(prev_); }

    ScopedLogLevel(const ScopedLogLevel&) = delete;
    ScopedLogLevel& operator=(const ScopedLogLevel&) = delete;
};

} // namespace morphcore
