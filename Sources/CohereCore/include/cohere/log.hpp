#pragma once

#ifdef __cplusplus

#include <cstdio>
#include <atomic>
#include <optional>
#include <string>

namespace cohere {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Process-wide log level, defined in CohereCore/src/engine.cpp.
extern std::atomic<log_level> g_log_level;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

inline const char* to_string(log_level level) {
    switch (level) {
        case log_level::off: return "off";
        case log_level::error: return "error";
        case log_level::warn: return "warn";
        case log_level::info: return "info";
        case log_level::debug: return "debug";
    }
    return "off";
}

/// Accepts the names produced by to_string(log_level).
inline std::optional<log_level> parse_log_level(const std::string& name) {
    if (name == "off") return log_level::off;
    if (name == "error") return log_level::error;
    if (name == "warn") return log_level::warn;
    if (name == "info") return log_level::info;
    if (name == "debug") return log_level::debug;
    return std::nullopt;
}

}  // namespace cohere

#define COHERE_LOG(level, tag, fmt, ...) \
    do { \
        if (static_cast<int>(level) <= static_cast<int>(cohere::g_log_level.load(std::memory_order_relaxed))) { \
            std::fprintf(stderr, "[cohere:%s] %s: " fmt "\n", tag, cohere::to_string(level), ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(tag, fmt, ...) COHERE_LOG(cohere::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  COHERE_LOG(cohere::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  COHERE_LOG(cohere::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define LOG_DEBUG(tag, fmt, ...) COHERE_LOG(cohere::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif

#endif // __cplusplus
