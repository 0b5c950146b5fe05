/**
 * @file logger.hpp
 * @brief Thread-safe native logging framework for ingestd.
 *
 * Zero external dependencies. Provides structured logging with
 * configurable levels, component tags, and timestamps.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#pragma once

#include "ingestd/utils/export.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace ingestd {
namespace utils {

/**
 * @enum LogLevel
 * @brief Logging severity levels.
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

/**
 * @brief Convert LogLevel to its padded column representation.
 */
inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF  ";
        default:              return "?????";
    }
}

/**
 * @brief Parse a level name as given on the command line.
 * @param name Level name, upper case (TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF).
 * @param fallback Returned when the name is not recognised.
 */
INGESTD_UTILS_API LogLevel parseLogLevel(const std::string& name,
                                         LogLevel fallback = LogLevel::INFO);

/**
 * @class Logger
 * @brief Thread-safe singleton logger with configurable output.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("StreamSlot", "Created stream for {} (generation {})", key, generation);
 * LOG_ERROR("Transport", "Open failed: {}", error_msg);
 * @endcode
 */
class INGESTD_UTILS_API Logger {
public:
    /**
     * @brief Get the singleton logger instance.
     */
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /**
     * @brief Level name without column padding.
     */
    static std::string levelName(LogLevel level) {
        std::string name = logLevelToString(level);
        while (!name.empty() && name.back() == ' ') {
            name.pop_back();
        }
        return name;
    }

    /**
     * @brief Set the minimum log level. Messages below this are ignored.
     */
    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool isEnabled(LogLevel level) const {
        return level != LogLevel::OFF &&
               static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Enable or disable colored output (ANSI terminals).
     */
    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Redirect output. Passing nullptr restores std::cerr.
     */
    void setOutput(std::ostream* out) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = out != nullptr ? out : &std::cerr;
    }

    /**
     * @brief Log a message with the given level and component.
     *
     * Each "{}" in @p format is replaced by the next argument.
     */
    template<typename... Args>
    void log(LogLevel level, const std::string& component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }

        write(level, component, formatMessage(format, std::forward<Args>(args)...));
    }

private:
    Logger()
        : level_(static_cast<int>(LogLevel::INFO))
        , colorEnabled_(true)
        , out_(&std::cerr)
    {}
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string formatMessage(const char* format) {
        return std::string(format);
    }

    template<typename T, typename... Args>
    std::string formatMessage(const char* format, T&& value, Args&&... args) {
        std::ostringstream oss;
        oss << std::boolalpha;

        while (*format) {
            if (*format == '{' && *(format + 1) == '}') {
                oss << value;
                return oss.str() + formatMessage(format + 2, std::forward<Args>(args)...);
            }
            oss << *format++;
        }

        // More arguments than placeholders: drop the rest
        return oss.str();
    }

    /**
     * @brief Emit one line: timestamp, level, component, message.
     *
     * Aborts the process after a FATAL line.
     */
    void write(LogLevel level, const std::string& component, const std::string& message);

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::mutex mutex_;
    std::ostream* out_;
};

}  // namespace utils
}  // namespace ingestd

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOG_TRACE(component, ...) \
    ::ingestd::utils::Logger::instance().log(::ingestd::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::ingestd::utils::Logger::instance().log(::ingestd::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::ingestd::utils::Logger::instance().log(::ingestd::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::ingestd::utils::Logger::instance().log(::ingestd::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::ingestd::utils::Logger::instance().log(::ingestd::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::ingestd::utils::Logger::instance().log(::ingestd::utils::LogLevel::FATAL, component, __VA_ARGS__)
