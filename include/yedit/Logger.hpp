/**
 * @file Logger.hpp
 * @brief Process-wide leveled logger writing to stderr
 */

#ifndef YEDIT_LOGGER_HPP
#define YEDIT_LOGGER_HPP

#include <string>
#include <cstdio>
#include <ctime>
#include <cstdarg>

namespace yedit {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log_impl(const char* level_str, const char* fmt, va_list args);

    LogLevel level_;
};

/**
 * @brief Parse a level name ("debug", "info", "warn", "error").
 * @return The level, or `fallback` for unknown names
 */
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::WARN);

// Convenience macros
#define YEDIT_LOG_DEBUG(...) yedit::Logger::instance().debug(__VA_ARGS__)
#define YEDIT_LOG_INFO(...)  yedit::Logger::instance().info(__VA_ARGS__)
#define YEDIT_LOG_WARN(...)  yedit::Logger::instance().warn(__VA_ARGS__)
#define YEDIT_LOG_ERROR(...) yedit::Logger::instance().error(__VA_ARGS__)

} // namespace yedit

#endif // YEDIT_LOGGER_HPP
