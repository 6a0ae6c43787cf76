/**
 * @file DeviceIdentity.h
 * @brief Identity of a device taking part in a transfer
 */

#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace SmsBridge {

/**
 * @brief Information a device advertises about itself
 *
 * Built once per process by LocalDevice and never modified afterwards.
 * Copies of a peer's identity arrive inside pairing tokens and discovery
 * envelopes.
 *
 * JSON keys: device_id, device_name, ip_address, port, os_version, app_version.
 */
struct DeviceIdentity {
    std::string deviceId;      ///< Random UUID minted at startup
    std::string deviceName;    ///< Human-readable device name
    std::string ipAddress;     ///< Dotted-quad IPv4 the device listens on
    uint16_t port;             ///< HTTP listener port
    std::string osVersion;     ///< e.g. "Linux 6.8.0"
    std::string appVersion;    ///< Application version string

    DeviceIdentity() : port(0) {}

    DeviceIdentity(const std::string& id, const std::string& name,
                   const std::string& ip, uint16_t port_,
                   const std::string& os, const std::string& app)
        : deviceId(id), deviceName(name), ipAddress(ip), port(port_),
          osVersion(os), appVersion(app) {}

    /**
     * @brief Check the fields a peer needs to reach this device
     *
     * Requires a non-empty name, a dotted-quad IPv4 address and a non-zero port.
     */
    bool isWellFormed() const;

    nlohmann::json toJson() const;

    /**
     * @brief Decode an identity object
     * @param j JSON object with the identity keys
     * @param out Decoded identity
     * @param errorMsg Reason on failure
     * @return true if all keys are present with the right types and the
     *         result is well-formed
     */
    static bool fromJson(const nlohmann::json& j, DeviceIdentity& out, std::string& errorMsg);

    bool operator==(const DeviceIdentity& other) const {
        return deviceId == other.deviceId && deviceName == other.deviceName &&
               ipAddress == other.ipAddress && port == other.port &&
               osVersion == other.osVersion && appVersion == other.appVersion;
    }
    bool operator!=(const DeviceIdentity& other) const { return !(*this == other); }
};

/**
 * @brief Check that a string is a dotted-quad IPv4 address
 */
bool isIpv4Address(const std::string& ip);

}  // namespace SmsBridge
