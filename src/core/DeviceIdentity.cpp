/**
 * @file DeviceIdentity.cpp
 * @brief DeviceIdentity JSON mapping and validation
 */

#include "smsbridge/DeviceIdentity.h"

#include <arpa/inet.h>

namespace SmsBridge {

bool isIpv4Address(const std::string& ip) {
    in_addr addr{};
    return inet_pton(AF_INET, ip.c_str(), &addr) == 1;
}

bool DeviceIdentity::isWellFormed() const {
    return !deviceName.empty() && isIpv4Address(ipAddress) && port != 0;
}

nlohmann::json DeviceIdentity::toJson() const {
    nlohmann::json j;
    j["device_id"] = deviceId;
    j["device_name"] = deviceName;
    j["ip_address"] = ipAddress;
    j["port"] = port;
    j["os_version"] = osVersion;
    j["app_version"] = appVersion;
    return j;
}

bool DeviceIdentity::fromJson(const nlohmann::json& j, DeviceIdentity& out, std::string& errorMsg) {
    errorMsg.clear();

    if (!j.is_object()) {
        errorMsg = "device info is not an object";
        return false;
    }

    DeviceIdentity id;
    const char* stringKeys[] = {"device_id", "device_name", "ip_address", "os_version", "app_version"};
    for (const char* key : stringKeys) {
        if (!j.contains(key) || !j[key].is_string()) {
            errorMsg = std::string("device info missing string field '") + key + "'";
            return false;
        }
    }
    if (!j.contains("port") || !j["port"].is_number_integer()) {
        errorMsg = "device info missing integer field 'port'";
        return false;
    }
    const int64_t port = j["port"].get<int64_t>();
    if (port < 1 || port > 65535) {
        errorMsg = "device info port out of range";
        return false;
    }

    id.deviceId = j["device_id"].get<std::string>();
    id.deviceName = j["device_name"].get<std::string>();
    id.ipAddress = j["ip_address"].get<std::string>();
    id.port = static_cast<uint16_t>(port);
    id.osVersion = j["os_version"].get<std::string>();
    id.appVersion = j["app_version"].get<std::string>();

    if (id.deviceId.empty()) {
        errorMsg = "device info has empty device_id";
        return false;
    }
    if (!id.isWellFormed()) {
        errorMsg = "device info is malformed (name/ip/port)";
        return false;
    }

    out = std::move(id);
    return true;
}

}  // namespace SmsBridge
