#ifndef BUTTERFLY_LOG_HPP
#define BUTTERFLY_LOG_HPP

#include <cstdio>
#include <thread>
#include <sstream>
#include <cstdarg>
#include <atomic>

namespace butterfly {
namespace log {

enum class Level : int {
    Debug = 0,
    Info,
    Warn,
    Error
};

inline const char* level_tag(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
    }
    return "?";
}

// Callback for routing log output (to a file, a GUI panel, a test capture)
// The callback receives a formatted line without trailing newline
using LogCallback = void (*)(Level level, const char* message);

// When null, output goes to stdout (stderr for warnings and errors)
inline std::atomic<LogCallback> g_log_callback{nullptr};
inline std::atomic<int> g_min_level{static_cast<int>(Level::Info)};

inline void set_log_callback(LogCallback cb) {
    g_log_callback.store(cb, std::memory_order_release);
}

inline void clear_log_callback() {
    g_log_callback.store(nullptr, std::memory_order_release);
}

inline void set_min_level(Level level) {
    g_min_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

inline Level min_level() {
    return static_cast<Level>(g_min_level.load(std::memory_order_relaxed));
}

inline bool enabled(Level level) {
    return static_cast<int>(level) >= g_min_level.load(std::memory_order_relaxed);
}

// Internal: format and route one line
inline void output(Level level, const char* component, const char* fmt, ...) {
    if (!enabled(level)) return;

    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    std::ostringstream oss;
    oss << std::this_thread::get_id();

    char full_message[1200];
    snprintf(full_message, sizeof(full_message), "[%s][%s][T%s] %s",
             level_tag(level), component, oss.str().c_str(), buffer);

    LogCallback cb = g_log_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(level, full_message);
    } else {
        FILE* stream = level >= Level::Warn ? stderr : stdout;
        fprintf(stream, "%s\n", full_message);
        fflush(stream);
    }
}

} // namespace log
} // namespace butterfly

#define BUTTERFLY_LOG_INFO(component, fmt, ...) \
    ::butterfly::log::output(::butterfly::log::Level::Info, component, fmt, ##__VA_ARGS__)
#define BUTTERFLY_LOG_WARN(component, fmt, ...) \
    ::butterfly::log::output(::butterfly::log::Level::Warn, component, fmt, ##__VA_ARGS__)
#define BUTTERFLY_LOG_ERROR(component, fmt, ...) \
    ::butterfly::log::output(::butterfly::log::Level::Error, component, fmt, ##__VA_ARGS__)

// Per-generation / per-event tracing, compiled out unless requested
#ifdef BUTTERFLY_ENABLE_DEBUG_OUTPUT
    #define BUTTERFLY_LOG_DEBUG(component, fmt, ...) \
        ::butterfly::log::output(::butterfly::log::Level::Debug, component, fmt, ##__VA_ARGS__)
#else
    #define BUTTERFLY_LOG_DEBUG(component, fmt, ...) ((void)0)
#endif

#endif // BUTTERFLY_LOG_HPP
