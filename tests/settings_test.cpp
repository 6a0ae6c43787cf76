/**
 * @file settings_test.cpp
 * @brief Tests for runtime settings loading and saving.
 */

#include "smsbridge/Settings.h"

#include "TestHelpers.h"

#include <gtest/gtest.h>

#include <fstream>

using namespace SmsBridge;

TEST(SettingsTest, DefaultsMatchProtocolConstants) {
    Settings s;
    EXPECT_EQ(s.transferPort, 8080);
    EXPECT_EQ(s.batchSize, 100u);
    EXPECT_EQ(s.batchDelayMs, 50u);
    EXPECT_EQ(s.probeTimeoutMs, 2000u);
    EXPECT_EQ(s.sweepTimeoutMs, 10000u);
    EXPECT_EQ(s.requestTimeoutMs, 30000u);
    EXPECT_TRUE(s.strictSessionMatch);
}

TEST(SettingsTest, PartialJsonOverridesOnlyNamedKeys) {
    Settings s;
    std::string err;
    ASSERT_TRUE(s.applyJson(nlohmann::json::parse(R"({"batch_size": 25, "device_name": "Office"})"), err)) << err;
    EXPECT_EQ(s.batchSize, 25u);
    EXPECT_EQ(s.deviceName, "Office");
    EXPECT_EQ(s.transferPort, 8080);
}

TEST(SettingsTest, InvalidValueAppliesNothing) {
    Settings s;
    std::string err;
    EXPECT_FALSE(s.applyJson(nlohmann::json::parse(R"({"batch_size": 25, "transfer_port": 70000})"), err));
    EXPECT_NE(err.find("transfer_port"), std::string::npos);
    EXPECT_EQ(s.batchSize, 100u);

    EXPECT_FALSE(s.applyJson(nlohmann::json::parse(R"({"strict_session_match": "yes"})"), err));
    EXPECT_FALSE(s.applyJson(nlohmann::json::parse(R"({"batch_size": 0})"), err));
    EXPECT_FALSE(s.applyJson(nlohmann::json::parse("[1,2]"), err));
}

TEST(SettingsTest, SaveThenLoad) {
    const auto file = SmsBridge::Test::scratchDir("settings") / "settings.json";

    Settings s;
    s.deviceName = "Kitchen tablet";
    s.transferPort = 9090;
    s.strictSessionMatch = false;
    s.logFile = "trace.log";
    s.logLevel = LogLevel::Debug;

    std::string err;
    ASSERT_TRUE(s.saveToFile(file, err)) << err;

    Settings loaded;
    ASSERT_TRUE(Settings::loadFromFile(file, loaded, err)) << err;
    EXPECT_EQ(loaded.deviceName, "Kitchen tablet");
    EXPECT_EQ(loaded.transferPort, 9090);
    EXPECT_FALSE(loaded.strictSessionMatch);
    EXPECT_EQ(loaded.logFile, "trace.log");
    EXPECT_EQ(loaded.logLevel, LogLevel::Debug);
}

TEST(SettingsTest, LogLevelMustBeKnownName) {
    Settings s;
    std::string err;
    ASSERT_TRUE(s.applyJson(nlohmann::json::parse(R"({"log_level": "warning"})"), err)) << err;
    EXPECT_EQ(s.logLevel, LogLevel::Warning);

    EXPECT_FALSE(s.applyJson(nlohmann::json::parse(R"({"log_level": "verbose"})"), err));
    EXPECT_NE(err.find("log_level"), std::string::npos);
    EXPECT_FALSE(s.applyJson(nlohmann::json::parse(R"({"log_level": 2})"), err));
    EXPECT_EQ(s.logLevel, LogLevel::Warning);
}

TEST(SettingsTest, LogThresholdFiltersLowerLevels) {
    const LogLevel saved = logLevel();

    setLogLevel(LogLevel::Warning);
    EXPECT_FALSE(isLogEnabled(LogLevel::Debug));
    EXPECT_FALSE(isLogEnabled(LogLevel::Info));
    EXPECT_TRUE(isLogEnabled(LogLevel::Warning));
    EXPECT_TRUE(isLogEnabled(LogLevel::Error));

    // Suppressed messages are never formatted
    int evaluated = 0;
    auto count = [&evaluated]() { return ++evaluated; };
    LOG_INFO("skipped " << count());
    EXPECT_EQ(evaluated, 0);
    LOG_ERROR("shown " << count());
    EXPECT_EQ(evaluated, 1);

    setLogLevel(saved);
}

TEST(SettingsTest, UnparsableFileFails) {
    const auto file = SmsBridge::Test::scratchDir("settings_bad") / "settings.json";
    {
        std::ofstream out(file);
        out << "{ not json";
    }
    Settings loaded;
    std::string err;
    EXPECT_FALSE(Settings::loadFromFile(file, loaded, err));
    EXPECT_FALSE(err.empty());
}
