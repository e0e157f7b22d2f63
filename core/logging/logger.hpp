#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace devscout {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

class Logger {
public:
    static void set_level(Level level);
    static Level level();
    static bool enabled(Level level) { return level >= threshold_.load(); }

    static void log(Level level, const std::string &message);

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
};

// Accepts debug/info/warn/error in any case; unknown strings map to INFO
Level string_to_level(const std::string &level_str);
const char *level_to_string(Level level);

}  // namespace logging
}  // namespace devscout

// Message is only built when the level passes the threshold
#define LOG_INTERNAL(level, msg)                                 \
    do {                                                         \
        if (devscout::logging::Logger::enabled(level)) {         \
            std::stringstream log_ss_;                           \
            log_ss_ << msg;                                      \
            devscout::logging::Logger::log(level, log_ss_.str()); \
        }                                                        \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(devscout::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(devscout::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(devscout::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(devscout::logging::Level::LVL_ERROR, msg)
