/**
 * @file LocalDevice.h
 * @brief Build this process's DeviceIdentity from the host environment
 */

#pragma once

#include "DeviceIdentity.h"
#include "Settings.h"

#include <string>
#include <vector>

namespace SmsBridge {

/**
 * @brief IPv4 addresses of the up, non-loopback interfaces
 *
 * Private-range addresses (192.168/16, 10/8, 172.16/12) come first.
 */
std::vector<std::string> listLocalIpv4Addresses();

/**
 * @brief Preferred LAN address, or LOCALHOST_IP when none is up
 */
std::string detectLocalIpv4();

/**
 * @brief Host name, or "SmsBridge device" if unavailable
 */
std::string detectHostName();

/**
 * @brief Kernel name and release, e.g. "Linux 6.8.0-45-generic"
 */
std::string detectOsVersion();

/**
 * @brief Build the identity advertised by this process
 * @param settings Device name and port overrides
 * @param out Identity with a fresh random device id
 * @param errorMsg Reason on failure (RNG failure)
 */
bool buildLocalIdentity(const Settings& settings, DeviceIdentity& out, std::string& errorMsg);

}  // namespace SmsBridge
