/**
 * @file TestHelpers.h
 * @brief Shared fixtures for the smsbridge tests.
 */

#pragma once

#include "smsbridge/DeviceIdentity.h"
#include "smsbridge/EnvelopeTransport.h"
#include "smsbridge/SmsRecord.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace SmsBridge {
namespace Test {

inline DeviceIdentity makeIdentity(const std::string& id,
                                   const std::string& ip = "127.0.0.1",
                                   uint16_t port = 8080) {
    return DeviceIdentity(id, "Device " + id, ip, port, "Linux 6.8.0", "1.0.0");
}

inline SmsRecordList makeRecords(size_t count) {
    SmsRecordList records;
    records.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        SmsRecord r;
        r.id = std::to_string(i + 1);
        r.address = "+1555000" + std::to_string(i % 10);
        r.body = "message " + std::to_string(i);
        r.dateMs = 1710408413589LL + static_cast<int64_t>(i) * 600000LL;
        r.isRead = (i % 2) == 0;
        r.isSent = (i % 3) == 0;
        r.messageType = r.isSent ? "Sent" : "Received";
        records.push_back(r);
    }
    return records;
}

inline std::filesystem::path scratchDir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / ("smsbridge_" + name);
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir);
    return dir;
}

/**
 * @brief Poll pred every 10 ms until it holds or timeoutMs passes.
 */
inline bool waitFor(const std::function<bool()>& pred, int timeoutMs = 5000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

/**
 * @brief Transport decorator that records requests and can fail chosen ones.
 *
 * failWhen sees (path, body) and returns true to fail that request without
 * sending it.
 */
class RecordingTransport : public EnvelopeTransport {
public:
    using FailPredicate = std::function<bool(const std::string& path, const std::string& body)>;

    explicit RecordingTransport(FailPredicate failWhen = FailPredicate())
        : m_failWhen(std::move(failWhen)) {}

    HttpResult post(const std::string& host, uint16_t port, const std::string& path,
                    const std::string& body, uint32_t timeoutMs) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_posts.push_back(path + " " + body);
        }
        if (m_failWhen && m_failWhen(path, body)) {
            HttpResult failed;
            failed.errorMsg = "connection reset by peer";
            return failed;
        }
        return m_client.post(host, port, path, body, timeoutMs);
    }

    HttpResult get(const std::string& host, uint16_t port, const std::string& path,
                   uint32_t timeoutMs) override {
        return m_client.get(host, port, path, timeoutMs);
    }

    size_t countPosts(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t n = 0;
        for (const auto& p : m_posts) {
            if (p.find(needle) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }

private:
    FailPredicate m_failWhen;
    HttpClient m_client;
    mutable std::mutex m_mutex;
    std::vector<std::string> m_posts;
};

}  // namespace Test
}  // namespace SmsBridge
