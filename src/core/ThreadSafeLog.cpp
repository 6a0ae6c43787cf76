/**
 * @file ThreadSafeLog.cpp
 * @brief Thread-safe lifecycle trace file implementation
 */

#include "smsbridge/ThreadSafeLog.h"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace SmsBridge {

// Static member definitions
std::mutex ThreadSafeLog::s_mutex;
std::filesystem::path ThreadSafeLog::s_logPath;

void ThreadSafeLog::initialize(const std::filesystem::path& logPath) {
    std::lock_guard<std::mutex> lock(s_mutex);
    s_logPath = logPath;
}

bool ThreadSafeLog::isEnabled() {
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_logPath.empty();
}

void ThreadSafeLog::log(const std::string& message) {
    std::lock_guard<std::mutex> lock(s_mutex);

    if (s_logPath.empty()) {
        return;  // Not initialized - silently skip
    }

    auto now = std::chrono::system_clock::now();
    auto now_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&now_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << " - " << message << "\n";

    std::ofstream file(s_logPath, std::ios::app);
    if (file.is_open()) {
        file << oss.str();
        file.flush();
    }
}

void ThreadSafeLog::log(const char* message) {
    log(std::string(message ? message : ""));
}

} // namespace SmsBridge
