#pragma once

#include <cstdio>
#include <atomic>

namespace namewise {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Process-wide log level, off until configured.
inline std::atomic<log_level>& current_log_level() {
    static std::atomic<log_level> level{log_level::off};
    return level;
}

inline void set_log_level(log_level level) {
    current_log_level().store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return current_log_level().load(std::memory_order_relaxed);
}

}  // namespace namewise

#define NAMEWISE_LOG(level, tag, fmt, ...) \
    do { \
        if (static_cast<int>(level) <= static_cast<int>(namewise::current_log_level().load(std::memory_order_relaxed))) { \
            std::printf("[%s] " fmt "\n", tag, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(tag, fmt, ...) NAMEWISE_LOG(namewise::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  NAMEWISE_LOG(namewise::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  NAMEWISE_LOG(namewise::log_level::info, tag, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(tag, fmt, ...) NAMEWISE_LOG(namewise::log_level::debug, tag, fmt, ##__VA_ARGS__)
