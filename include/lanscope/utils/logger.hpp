/**
 * @file logger.hpp
 * @brief Thread-safe logging for LanScope components.
 *
 * Structured log lines with a level, a component tag and a
 * millisecond timestamp. Messages use "{}" placeholders.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#include "lanscope/utils/export.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace lanscope {
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
 * @brief Fixed-width name of a level, as printed in log lines.
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
    }
    return "?????";
}

/**
 * @class Logger
 * @brief Process-wide logger with a configurable level and sink.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("Browser", "Found {} on {}", name, address);
 * @endcode
 *
 * Output goes to std::cerr unless redirected with setOutput().
 */
class LANSCOPE_UTILS_API Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool isEnabled(LogLevel level) const {
        return static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Enable or disable ANSI colour codes around the level tag.
     */
    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Redirect output. Passing nullptr restores std::cerr.
     *
     * The stream must outlive every log call made while it is installed.
     */
    void setOutput(std::ostream* out) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = out ? out : &std::cerr;
    }

    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }

        std::string message = formatMessage(format, std::forward<Args>(args)...);

        std::ostringstream oss;

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_buf);
#endif

        oss << "["
            << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count()
            << "] ";

        bool color = colorEnabled_.load(std::memory_order_relaxed);
        if (color) {
            oss << getColorCode(level);
        }
        oss << "[" << logLevelToString(level) << "]";
        if (color) {
            oss << "\033[0m";
        }

        oss << " [" << component << "] " << message;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            (*out_) << oss.str() << std::endl;
        }

        if (level == LogLevel::FATAL) {
            std::abort();
        }
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

    // Substitutes the first "{}" with value and recurses on the remainder.
    // Surplus arguments are ignored; surplus placeholders are printed as-is.
    template<typename T, typename... Args>
    std::string formatMessage(const char* format, T&& value, Args&&... args) {
        std::ostringstream oss;

        while (*format) {
            if (*format == '{' && *(format + 1) == '}') {
                oss << value;
                return oss.str() + formatMessage(format + 2, std::forward<Args>(args)...);
            }
            oss << *format++;
        }

        return oss.str();
    }

    const char* getColorCode(LogLevel level) const {
        switch (level) {
            case LogLevel::TRACE: return "\033[90m";
            case LogLevel::DEBUG: return "\033[36m";
            case LogLevel::INFO:  return "\033[32m";
            case LogLevel::WARN:  return "\033[33m";
            case LogLevel::ERROR: return "\033[31m";
            case LogLevel::FATAL: return "\033[35;1m";
            case LogLevel::OFF:   return "";
        }
        return "";
    }

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::mutex mutex_;
    std::ostream* out_;
};

}  // namespace utils
}  // namespace lanscope

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOG_TRACE(component, ...) \
    ::lanscope::utils::Logger::instance().log(::lanscope::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::lanscope::utils::Logger::instance().log(::lanscope::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::lanscope::utils::Logger::instance().log(::lanscope::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::lanscope::utils::Logger::instance().log(::lanscope::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::lanscope::utils::Logger::instance().log(::lanscope::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::lanscope::utils::Logger::instance().log(::lanscope::utils::LogLevel::FATAL, component, __VA_ARGS__)

// Skips argument evaluation when the level is disabled
#define LOG_IF(level, component, condition, ...) \
    do { \
        if ((condition) && ::lanscope::utils::Logger::instance().isEnabled(level)) { \
            ::lanscope::utils::Logger::instance().log(level, component, __VA_ARGS__); \
        } \
    } while(0)
