#pragma once

#ifdef __cplusplus

#include <cstdio>
#include <atomic>

namespace localdoc {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Single global log level, defined in LocalDocCore/src/localdoc.cpp.
extern std::atomic<log_level> g_log_level;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

inline const char* log_level_label(log_level level) {
    switch (level) {
        case log_level::error: return "E";
        case log_level::warn:  return "W";
        case log_level::info:  return "I";
        case log_level::debug: return "D";
        default:               return "-";
    }
}

}  // namespace localdoc

#define LOCALDOC_LOG(level, tag, fmt, ...) \
    do { \
        if (static_cast<int>(level) <= static_cast<int>(localdoc::g_log_level.load(std::memory_order_relaxed))) { \
            std::fprintf(stderr, "localdoc %s/%s: " fmt "\n", localdoc::log_level_label(level), tag, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(tag, fmt, ...) LOCALDOC_LOG(localdoc::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  LOCALDOC_LOG(localdoc::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  LOCALDOC_LOG(localdoc::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define LOG_DEBUG(tag, fmt, ...) LOCALDOC_LOG(localdoc::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif

#endif // __cplusplus
