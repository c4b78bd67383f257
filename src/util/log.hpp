#pragma once

#include <cstdio>
#include <cstdarg>
#include <ctime>
#include <mutex>
#include <string>

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

namespace detail {

struct LogState {
    std::mutex mtx;
    LogLevel min_level{LogLevel::Info};
    FILE* file{nullptr};
    bool echo_stderr{true};
};

inline LogState& log_state() {
    static LogState state;
    return state;
}

inline void write_line(FILE* out, const char* stamp, LogLevel lvl, const char* fmt, va_list args) {
    std::fprintf(out, "%s - %s - ", stamp, level_name(lvl));
    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
}

inline void log_impl(LogLevel lvl, const char* fmt, va_list args) {
    LogState& st = log_state();
    std::lock_guard<std::mutex> lock(st.mtx);
    if (lvl < st.min_level) {
        return;
    }

    char stamp[32] = {};
    const std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

    if (st.echo_stderr) {
        va_list copy;
        va_copy(copy, args);
        write_line(stderr, stamp, lvl, fmt, copy);
        va_end(copy);
    }
    if (st.file) {
        write_line(st.file, stamp, lvl, fmt, args);
        std::fflush(st.file);
    }
}

} // namespace detail

inline void set_log_level(LogLevel lvl) {
    detail::LogState& st = detail::log_state();
    std::lock_guard<std::mutex> lock(st.mtx);
    st.min_level = lvl;
}

inline LogLevel log_level() {
    detail::LogState& st = detail::log_state();
    std::lock_guard<std::mutex> lock(st.mtx);
    return st.min_level;
}

inline void set_log_stderr(bool enabled) {
    detail::LogState& st = detail::log_state();
    std::lock_guard<std::mutex> lock(st.mtx);
    st.echo_stderr = enabled;
}

// Appends to path. Returns false (and keeps the previous target) when the file cannot be opened.
inline bool open_log_file(const std::string& path) {
    FILE* f = std::fopen(path.c_str(), "a");
    if (!f) {
        return false;
    }
    detail::LogState& st = detail::log_state();
    std::lock_guard<std::mutex> lock(st.mtx);
    if (st.file) {
        std::fclose(st.file);
    }
    st.file = f;
    return true;
}

inline void close_log_file() {
    detail::LogState& st = detail::log_state();
    std::lock_guard<std::mutex> lock(st.mtx);
    if (st.file) {
        std::fclose(st.file);
        st.file = nullptr;
    }
}

class SyncLogger {
public:
    static void log(LogLevel lvl, const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        detail::log_impl(lvl, fmt, args);
        va_end(args);
    }
};

} // namespace util

#define LOG_TRACE(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Trace, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_DEBUG(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Debug, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_INFO(FMT, ...)  ::util::SyncLogger::log(::util::LogLevel::Info,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_WARN(FMT, ...)  ::util::SyncLogger::log(::util::LogLevel::Warn,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_ERROR(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Error, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_FATAL(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Fatal, (FMT) __VA_OPT__(, __VA_ARGS__))
