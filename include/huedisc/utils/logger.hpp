/**
 * @file logger.hpp
 * @brief Thread-safe logging for huedisc.
 *
 * Structured log lines with a level, a component tag and a timestamp.
 * Messages use `{}` placeholders that are substituted in order.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#pragma once

#include "huedisc/utils/export.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>

namespace huedisc {
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
 * @brief Receives every formatted line that passes the level filter.
 *
 * The line does not contain a trailing newline or colour codes.
 */
using LogSink = std::function<void(LogLevel level, const std::string& line)>;

/**
 * @brief Parse a level name (case-insensitive, "WARNING" accepted).
 * @param name Level name as given on the command line.
 * @param out Receives the parsed level on success.
 * @return False if the name is not a known level.
 */
HUEDISC_UTILS_API bool parseLogLevel(const std::string& name, LogLevel& out);

/**
 * @class Logger
 * @brief Thread-safe singleton logger.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("Cloud", "Found {} bridge(s)", bridges.size());
 * @endcode
 */
class HUEDISC_UTILS_API Logger {
public:
    static Logger& instance();

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
     * @brief Enable or disable ANSI colours on stderr output.
     */
    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Redirect output to a sink instead of stderr.
     * Pass an empty function to restore stderr output.
     */
    void setSink(LogSink sink);

    /**
     * @brief Printable name of a level ("INFO", "WARN", ...).
     */
    static std::string levelName(LogLevel level);

    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }
        std::ostringstream message;
        appendFormatted(message, format, std::forward<Args>(args)...);
        write(level, component, message.str());
    }

private:
    Logger();
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static void appendFormatted(std::ostringstream& out, const char* format) {
        out << format;
    }

    template<typename T, typename... Args>
    static void appendFormatted(std::ostringstream& out, const char* format,
                                T&& value, Args&&... args) {
        while (*format) {
            if (format[0] == '{' && format[1] == '}') {
                out << value;
                appendFormatted(out, format + 2, std::forward<Args>(args)...);
                return;
            }
            out << *format++;
        }
    }

    void write(LogLevel level, const char* component, const std::string& message);

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::mutex mutex_;
    LogSink sink_;
};

}  // namespace utils
}  // namespace huedisc

#define LOG_TRACE(component, ...) \
    ::huedisc::utils::Logger::instance().log(::huedisc::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::huedisc::utils::Logger::instance().log(::huedisc::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::huedisc::utils::Logger::instance().log(::huedisc::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::huedisc::utils::Logger::instance().log(::huedisc::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::huedisc::utils::Logger::instance().log(::huedisc::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::huedisc::utils::Logger::instance().log(::huedisc::utils::LogLevel::FATAL, component, __VA_ARGS__)
