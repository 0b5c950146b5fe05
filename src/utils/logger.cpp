/**
 * @file logger.cpp
 * @brief Logger line formatting and level parsing.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#include "ingestd/utils/logger.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>

namespace ingestd {
namespace utils {

namespace {

const char* colorFor(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";    // Gray
        case LogLevel::DEBUG: return "\033[36m";    // Cyan
        case LogLevel::INFO:  return "\033[32m";    // Green
        case LogLevel::WARN:  return "\033[33m";    // Yellow
        case LogLevel::ERROR: return "\033[31m";    // Red
        case LogLevel::FATAL: return "\033[35;1m";  // Bold Magenta
        default:              return "";
    }
}

constexpr const char* kColorReset = "\033[0m";

}  // namespace

LogLevel parseLogLevel(const std::string& name, LogLevel fallback) {
    static const struct {
        const char* name;
        LogLevel level;
    } kLevels[] = {
        {"TRACE", LogLevel::TRACE},
        {"DEBUG", LogLevel::DEBUG},
        {"INFO", LogLevel::INFO},
        {"WARN", LogLevel::WARN},
        {"ERROR", LogLevel::ERROR},
        {"FATAL", LogLevel::FATAL},
        {"OFF", LogLevel::OFF},
    };

    for (const auto& entry : kLevels) {
        if (name == entry.name) {
            return entry.level;
        }
    }
    return fallback;
}

void Logger::write(LogLevel level, const std::string& component, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    // [YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] [Component] message
    std::ostringstream line;
    line << '[' << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
         << std::setfill('0') << std::setw(3) << millis << "] ";

    if (colorEnabled_.load(std::memory_order_relaxed)) {
        line << colorFor(level) << '[' << logLevelToString(level) << ']' << kColorReset;
    } else {
        line << '[' << logLevelToString(level) << ']';
    }
    line << " [" << component << "] " << message << '\n';

    {
        std::lock_guard<std::mutex> lock(mutex_);
        *out_ << line.str();
        out_->flush();
    }

    if (level == LogLevel::FATAL) {
        std::abort();
    }
}

}  // namespace utils
}  // namespace ingestd
