#pragma once

/**
 * @file logger.hpp
 * @brief Leveled, thread-aware logging to stderr
 */

#include <cstdint>
#include <string>

namespace tasklane {

enum class LogLevel : std::uint8_t {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
    Trace = 4
};

/**
 * @brief Process-wide log sink
 *
 * The threshold defaults to TASKLANE_LOG_LEVEL (error, warn, info, debug,
 * trace) and falls back to warn. Logging never throws.
 */
class Logger {
public:
    static void set_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::Error, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::Warn, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::Info, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::Debug, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::Trace, msg); }

    /**
     * @brief Parse a level name, case-insensitive
     * @return false if the name is not recognised
     */
    static bool parse_level(const std::string& name, LogLevel& out) noexcept;

    /**
     * @brief Name the calling thread in subsequent log lines
     */
    static void set_thread_name(const std::string& name);
    static void clear_thread_name();

private:
    static const char* level_to_string(LogLevel level) noexcept;
};

} // namespace tasklane

// Message expressions are only evaluated when the level is enabled
#define TASKLANE_LOG(level, msg)                         \
    do {                                                 \
        if (::tasklane::Logger::enabled(level)) {        \
            ::tasklane::Logger::log(level, (msg));       \
        }                                                \
    } while (0)

#define TASKLANE_LOG_ERROR(msg) TASKLANE_LOG(::tasklane::LogLevel::Error, msg)
#define TASKLANE_LOG_WARN(msg)  TASKLANE_LOG(::tasklane::LogLevel::Warn, msg)
#define TASKLANE_LOG_INFO(msg)  TASKLANE_LOG(::tasklane::LogLevel::Info, msg)
#define TASKLANE_LOG_DEBUG(msg) TASKLANE_LOG(::tasklane::LogLevel::Debug, msg)
#define TASKLANE_LOG_TRACE(msg) TASKLANE_LOG(::tasklane::LogLevel::Trace, msg)
