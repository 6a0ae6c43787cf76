/**
 * @file Debug.h
 * @brief Leveled console logging for the listener, sweep and controller
 *
 * Lines go to stderr as "[HH:MM:SS.mmm] [LEVEL] message". Messages below the
 * process-wide threshold (setLogLevel, default Info) are not even formatted.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace SmsBridge {

enum class LogLevel : int {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

// Serializes writes to std::cerr from listener, sweep and controller threads
inline std::mutex g_logMutex;
inline std::atomic<int> g_logThreshold{static_cast<int>(LogLevel::Info)};

inline void setLogLevel(LogLevel level) {
    g_logThreshold.store(static_cast<int>(level));
}

inline LogLevel logLevel() {
    return static_cast<LogLevel>(g_logThreshold.load());
}

inline bool isLogEnabled(LogLevel level) {
    return static_cast<int>(level) >= g_logThreshold.load();
}

inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "debug";
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error:   return "error";
        default:                return "info";
    }
}

/**
 * @brief Parse "debug", "info", "warning" or "error"
 */
inline bool logLevelFromString(const std::string& name, LogLevel& out) {
    for (LogLevel level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warning, LogLevel::Error}) {
        if (name == logLevelToString(level)) {
            out = level;
            return true;
        }
    }
    return false;
}

/**
 * @brief Local wall-clock time as [HH:MM:SS.mmm]
 */
inline std::string getTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&seconds, &tm);

    std::ostringstream oss;
    oss << std::setfill('0')
        << "[" << std::setw(2) << tm.tm_hour
        << ":" << std::setw(2) << tm.tm_min
        << ":" << std::setw(2) << tm.tm_sec
        << "." << std::setw(3) << ms.count() << "]";
    return oss.str();
}

#define SMSBRIDGE_LOG(level, tag, msg) \
    do { \
        if (SmsBridge::isLogEnabled(level)) { \
            std::ostringstream smsbridgeLogLine_; \
            smsbridgeLogLine_ << msg; \
            std::lock_guard<std::mutex> lock(SmsBridge::g_logMutex); \
            std::cerr << SmsBridge::getTimestamp() << " [" tag "] " << smsbridgeLogLine_.str() << std::endl; \
        } \
    } while (0)

#define LOG_DEBUG(msg)   SMSBRIDGE_LOG(SmsBridge::LogLevel::Debug, "DEBUG", msg)
#define LOG_INFO(msg)    SMSBRIDGE_LOG(SmsBridge::LogLevel::Info, "INFO", msg)
#define LOG_WARNING(msg) SMSBRIDGE_LOG(SmsBridge::LogLevel::Warning, "WARNING", msg)
#define LOG_ERROR(msg)   SMSBRIDGE_LOG(SmsBridge::LogLevel::Error, "ERROR", msg)

} // namespace SmsBridge
