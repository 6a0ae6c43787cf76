/**
 * @file LocalDevice.cpp
 * @brief Host environment probing for the local identity
 */

#include "smsbridge/LocalDevice.h"
#include "smsbridge/Debug.h"
#include "smsbridge/UuidGenerator.h"
#include "smsbridge/config.h"

#include <algorithm>
#include <cstdlib>
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/utsname.h>
#include <unistd.h>

namespace SmsBridge {

namespace {

int addressRank(const std::string& ip) {
    if (ip.rfind("192.168.", 0) == 0) return 0;
    if (ip.rfind("10.", 0) == 0) return 1;
    if (ip.rfind("172.", 0) == 0) {
        const int second = std::atoi(ip.c_str() + 4);
        if (second >= 16 && second <= 31) return 2;
    }
    if (ip.rfind("169.254.", 0) == 0) return 4;  // link-local last
    return 3;
}

} // anonymous namespace

std::vector<std::string> listLocalIpv4Addresses() {
    std::vector<std::string> out;

    ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) {
        LOG_WARNING("getifaddrs failed, falling back to loopback");
        return out;
    }

    for (ifaddrs* it = list; it != nullptr; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if ((it->ifa_flags & IFF_UP) == 0 || (it->ifa_flags & IFF_LOOPBACK) != 0) {
            continue;
        }

        const auto* sin = reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
        char buf[INET_ADDRSTRLEN] = {};
        if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf)) == nullptr) {
            continue;
        }
        const std::string ip(buf);
        if (std::find(out.begin(), out.end(), ip) == out.end()) {
            out.push_back(ip);
        }
    }
    freeifaddrs(list);

    std::stable_sort(out.begin(), out.end(), [](const std::string& a, const std::string& b) {
        return addressRank(a) < addressRank(b);
    });
    return out;
}

std::string detectLocalIpv4() {
    const auto addrs = listLocalIpv4Addresses();
    return addrs.empty() ? std::string(LOCALHOST_IP) : addrs.front();
}

std::string detectHostName() {
    char buf[256] = {};
    if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
        return "SmsBridge device";
    }
    return std::string(buf);
}

std::string detectOsVersion() {
    utsname info{};
    if (uname(&info) != 0) {
        return "Unknown";
    }
    return std::string(info.sysname) + " " + info.release;
}

bool buildLocalIdentity(const Settings& settings, DeviceIdentity& out, std::string& errorMsg) {
    errorMsg.clear();

    const std::string deviceId = UuidGenerator::generate();
    if (deviceId.empty()) {
        errorMsg = "random number generator failed while minting device id";
        return false;
    }

    std::string name = settings.deviceName.empty() ? detectHostName() : settings.deviceName;
    if (name.size() > MAX_DEVICE_NAME) {
        name.resize(MAX_DEVICE_NAME);
    }

    out = DeviceIdentity(deviceId, name, detectLocalIpv4(), settings.transferPort,
                         detectOsVersion(), APP_VERSION);
    return true;
}

}  // namespace SmsBridge
