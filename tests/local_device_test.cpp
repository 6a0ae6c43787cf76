/**
 * @file local_device_test.cpp
 * @brief Local identity assembly.
 */

#include "smsbridge/LocalDevice.h"
#include "smsbridge/config.h"

#include <gtest/gtest.h>

using namespace SmsBridge;

TEST(LocalDeviceTest, AddressesAreIpv4AndNotLoopback) {
    for (const auto& ip : listLocalIpv4Addresses()) {
        EXPECT_TRUE(isIpv4Address(ip)) << ip;
        EXPECT_NE(ip.rfind("127.", 0), 0u) << ip;
    }
    EXPECT_TRUE(isIpv4Address(detectLocalIpv4()));
}

TEST(LocalDeviceTest, IdentityUsesConfiguredNameAndPort) {
    Settings settings;
    settings.deviceName = "Kitchen laptop";
    settings.transferPort = 9090;

    DeviceIdentity identity;
    std::string err;
    ASSERT_TRUE(buildLocalIdentity(settings, identity, err)) << err;

    EXPECT_EQ(identity.deviceName, "Kitchen laptop");
    EXPECT_EQ(identity.port, 9090);
    EXPECT_EQ(identity.appVersion, APP_VERSION);
    EXPECT_EQ(identity.deviceId.size(), 36u);
    EXPECT_FALSE(identity.osVersion.empty());
}

TEST(LocalDeviceTest, LongNamesAreTruncated) {
    Settings settings;
    settings.deviceName = std::string(MAX_DEVICE_NAME + 40, 'x');

    DeviceIdentity identity;
    std::string err;
    ASSERT_TRUE(buildLocalIdentity(settings, identity, err)) << err;
    EXPECT_EQ(identity.deviceName.size(), MAX_DEVICE_NAME);
}

TEST(LocalDeviceTest, EveryIdentityGetsAFreshId) {
    DeviceIdentity a, b;
    std::string err;
    ASSERT_TRUE(buildLocalIdentity(Settings(), a, err));
    ASSERT_TRUE(buildLocalIdentity(Settings(), b, err));
    EXPECT_NE(a.deviceId, b.deviceId);
    EXPECT_FALSE(detectHostName().empty());
}
