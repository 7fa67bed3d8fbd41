#pragma once

#include <mutex>
#include <sstream>
#include <string>

namespace linkerd_await {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

// Process-wide stderr logger. Diagnostics are the only user-visible output
// besides the exit code, so everything goes to stderr.
class Logger {
public:
    static void log(Level level, const char* file, int line, const std::string& message);
    static void set_level(Level level);

private:
    static Level threshold_;
    static std::mutex mutex_;
};

// Helper to convert Level to string for config parsing
Level string_to_level(const std::string& level_str);

} // namespace logging
} // namespace linkerd_await

// Macro macros to handle string building
#define LOG_INTERNAL(level, msg) \
    do { \
        std::stringstream ss; \
        ss << msg; \
        linkerd_await::logging::Logger::log(level, __FILE__, __LINE__, ss.str()); \
    } while(0)

#define LOG_DEBUG(msg) LOG_INTERNAL(linkerd_await::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg)  LOG_INTERNAL(linkerd_await::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg)  LOG_INTERNAL(linkerd_await::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(linkerd_await::logging::Level::LVL_ERROR, msg)
