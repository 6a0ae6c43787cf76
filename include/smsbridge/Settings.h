/**
 * @file Settings.h
 * @brief Runtime settings loaded from an optional JSON file
 */

#pragma once

#include "Debug.h"
#include "config.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace SmsBridge {

/**
 * @brief Runtime configuration
 *
 * Every field starts at its config.h default. A settings file only needs to
 * name the keys it overrides:
 * @code
 * {
 *   "device_name": "Office laptop",
 *   "transfer_port": 8080,
 *   "batch_size": 100,
 *   "batch_delay_ms": 50,
 *   "probe_timeout_ms": 2000,
 *   "sweep_timeout_ms": 10000,
 *   "request_timeout_ms": 30000,
 *   "strict_session_match": true,
 *   "log_file": "smsbridge_trace.log",
 *   "log_level": "info"
 * }
 * @endcode
 */
struct Settings {
    std::string deviceName;                         ///< Empty: use the hostname
    uint16_t transferPort = TRANSFER_PORT_DEFAULT;
    size_t batchSize = BATCH_SIZE_DEFAULT;
    uint32_t batchDelayMs = BATCH_DELAY_MS;
    uint32_t probeTimeoutMs = PROBE_TIMEOUT_MS;
    uint32_t sweepTimeoutMs = SWEEP_TIMEOUT_MS;
    uint32_t requestTimeoutMs = REQUEST_TIMEOUT_MS;
    bool strictSessionMatch = true;                 ///< Reject transfer envelopes for another session
    std::string logFile;                            ///< Empty: no trace file
    LogLevel logLevel = LogLevel::Info;             ///< Console threshold

    nlohmann::json toJson() const;

    /**
     * @brief Apply the keys present in j on top of the current values
     * @return false on a mistyped or out-of-range value (nothing applied)
     */
    bool applyJson(const nlohmann::json& j, std::string& errorMsg);

    /**
     * @brief Load settings from a file
     * @return false if the file cannot be read or parsed, or a value is invalid
     */
    static bool loadFromFile(const std::filesystem::path& path, Settings& out, std::string& errorMsg);

    /**
     * @brief Save settings atomically
     */
    bool saveToFile(const std::filesystem::path& path, std::string& errorMsg) const;
};

}  // namespace SmsBridge
