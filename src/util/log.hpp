#pragma once

#include <atomic>
#include <cctype>
#include <cstddef>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string_view>

namespace util {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Fatal };

inline const char* level_name(LogLevel lvl) noexcept {
    switch (lvl) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Fatal: return "FATAL";
    }
    return "UNKNOWN";
}

// Case-insensitive; accepts the names produced by level_name().
inline std::optional<LogLevel> parse_log_level(std::string_view s) noexcept {
    char buf[8]{};
    if (s.empty() || s.size() >= sizeof(buf)) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < s.size(); ++i) {
        buf[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[i])));
    }
    const std::string_view up(buf, s.size());
    if (up == "TRACE") return LogLevel::Trace;
    if (up == "DEBUG") return LogLevel::Debug;
    if (up == "INFO") return LogLevel::Info;
    if (up == "WARN" || up == "WARNING") return LogLevel::Warn;
    if (up == "ERROR") return LogLevel::Error;
    if (up == "FATAL") return LogLevel::Fatal;
    return std::nullopt;
}

namespace detail {
inline std::mutex& slow_log_mutex() {
    static std::mutex mtx;
    return mtx;
}

// Library default is quiet: comparisons run inside grading workers.
inline std::atomic<LogLevel>& min_level() {
    static std::atomic<LogLevel> lvl{LogLevel::Warn};
    return lvl;
}

inline void slow_log_impl(LogLevel lvl, const char* fmt, va_list args) {
    std::lock_guard<std::mutex> lock(slow_log_mutex());
    std::fprintf(stderr, "%s: ", level_name(lvl));
    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
}
} // namespace detail

inline void set_log_level(LogLevel lvl) noexcept {
    detail::min_level().store(lvl, std::memory_order_relaxed);
}

inline LogLevel log_level() noexcept {
    return detail::min_level().load(std::memory_order_relaxed);
}

inline bool log_enabled(LogLevel lvl) noexcept {
    return lvl >= log_level();
}

class SyncLogger {
public:
    static void log(LogLevel lvl, const char* fmt, ...) {
        if (!log_enabled(lvl)) {
            return;
        }
        va_list args;
        va_start(args, fmt);
        detail::slow_log_impl(lvl, fmt, args);
        va_end(args);
    }
};

inline void log(LogLevel lvl, const char* fmt, ...) {
    if (!log_enabled(lvl)) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    detail::slow_log_impl(lvl, fmt, args);
    va_end(args);
}

} // namespace util

#define LOG_SLOW_TRACE(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Trace, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_DEBUG(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Debug, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_INFO(FMT, ...)  ::util::SyncLogger::log(::util::LogLevel::Info,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_WARN(FMT, ...)  ::util::SyncLogger::log(::util::LogLevel::Warn,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_ERROR(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Error, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_FATAL(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Fatal, (FMT) __VA_OPT__(, __VA_ARGS__))
