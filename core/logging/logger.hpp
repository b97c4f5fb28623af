#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace hpipe {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

// Process-wide stderr logger. stdout is reserved for relayed data in client mode,
// so nothing here may ever write to it.
class Logger {
public:
    static void init(Level threshold);
    static void log(Level level, const char* file, int line, const std::string& message);
    static void set_level(Level level);
    static Level level();

    // Process role shown on every line ("server", "send", "receive"); empty for none
    static void set_tag(const std::string& tag);
    static bool enabled(Level level) { return level >= threshold_.load(); }

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
    static std::string tag_;  // Guarded by mutex_
};

// Helpers for config parsing ("debug", "info", "warn", "error")
Level string_to_level(const std::string& level_str);
std::string level_to_string(Level level);

} // namespace logging
} // namespace hpipe

// Build the message only when the level is enabled (data paths log at debug)
#define LOG_INTERNAL(level, msg) \
    do { \
        if (hpipe::logging::Logger::enabled(level)) { \
            std::stringstream ss; \
            ss << msg; \
            hpipe::logging::Logger::log(level, __FILE__, __LINE__, ss.str()); \
        } \
    } while(0)

#define LOG_DEBUG(msg) LOG_INTERNAL(hpipe::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg)  LOG_INTERNAL(hpipe::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg)  LOG_INTERNAL(hpipe::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(hpipe::logging::Level::LVL_ERROR, msg)
