/**
 * @file logger.cpp
 * @brief Logger output and level parsing.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#include "huedisc/utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace huedisc {
namespace utils {

namespace {

const char* colorCode(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35;1m";
        default:              return "";
    }
}

}  // namespace

bool parseLogLevel(const std::string& name, LogLevel& out) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") { out = LogLevel::TRACE; return true; }
    if (upper == "DEBUG") { out = LogLevel::DEBUG; return true; }
    if (upper == "INFO")  { out = LogLevel::INFO;  return true; }
    if (upper == "WARN" || upper == "WARNING") { out = LogLevel::WARN; return true; }
    if (upper == "ERROR") { out = LogLevel::ERROR; return true; }
    if (upper == "FATAL") { out = LogLevel::FATAL; return true; }
    if (upper == "OFF")   { out = LogLevel::OFF;   return true; }
    return false;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(static_cast<int>(LogLevel::INFO))
    , colorEnabled_(true)
{
}

void Logger::setSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

std::string Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
    }
    return "?";
}

void Logger::write(LogLevel level, const char* component, const std::string& message) {
    // Timestamp: [YYYY-MM-DD HH:MM:SS.mmm]
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t_now, &tm_buf);

    std::ostringstream stamp;
    stamp << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
          << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";

    std::string name = levelName(level);
    name.resize(5, ' ');

    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_(level, stamp.str() + "[" + name + "] [" + component + "] " + message);
        return;
    }

    std::cerr << stamp.str();
    if (colorEnabled_.load(std::memory_order_relaxed)) {
        std::cerr << colorCode(level) << "[" << name << "]" << "\033[0m";
    } else {
        std::cerr << "[" << name << "]";
    }
    std::cerr << " [" << component << "] " << message << std::endl;
}

}  // namespace utils
}  // namespace huedisc
