/**
 * @file cli_args_test.cpp
 * @brief Tests for smsbridge argument parsing.
 */

#include "smsbridge/CliArgs.h"

#include <gtest/gtest.h>

using namespace SmsBridge;

TEST(CliArgsTest, HelpFlagSelectsHelp) {
    const char* argv[] = {"smsbridge", "--help"};
    EXPECT_EQ(CliArgs::parseOrThrow(2, argv).command, CliArgs::Command::Help);

    const char* sub[] = {"smsbridge", "send", "-h"};
    EXPECT_EQ(CliArgs::parseOrThrow(3, sub).command, CliArgs::Command::Help);
}

TEST(CliArgsTest, SendWithPeerAndPort) {
    const char* argv[] = {"smsbridge", "send", "--records", "sms.json", "--peer", "192.168.1.30:9090"};
    const CliArgs a = CliArgs::parseOrThrow(6, argv);
    EXPECT_EQ(a.command, CliArgs::Command::Send);
    EXPECT_EQ(a.recordsPath, "sms.json");
    EXPECT_TRUE(a.hasPeer());
    EXPECT_EQ(a.peerHost, "192.168.1.30");
    EXPECT_EQ(a.peerPort, 9090);
}

TEST(CliArgsTest, PeerWithoutPortKeepsZero) {
    const char* argv[] = {"smsbridge", "send", "--records", "sms.json", "--peer", "10.0.0.2"};
    const CliArgs a = CliArgs::parseOrThrow(6, argv);
    EXPECT_EQ(a.peerHost, "10.0.0.2");
    EXPECT_EQ(a.peerPort, 0);
}

TEST(CliArgsTest, ReceiveNeedsPairingAndStore) {
    const char* ok[] = {"smsbridge", "receive", "--pairing", "@token.txt", "--store", "out.json", "--config", "c.json"};
    const CliArgs a = CliArgs::parseOrThrow(8, ok);
    EXPECT_EQ(a.command, CliArgs::Command::Receive);
    EXPECT_EQ(a.pairing, "@token.txt");
    EXPECT_EQ(a.storePath, "out.json");
    EXPECT_EQ(a.configPath, "c.json");

    const char* missing[] = {"smsbridge", "receive", "--pairing", "tok"};
    EXPECT_THROW((void)CliArgs::parseOrThrow(4, missing), std::runtime_error);
}

TEST(CliArgsTest, HealthTakesPositionalHostAndPort) {
    const char* argv[] = {"smsbridge", "health", "127.0.0.1", "8081"};
    const CliArgs a = CliArgs::parseOrThrow(4, argv);
    EXPECT_EQ(a.command, CliArgs::Command::Health);
    EXPECT_EQ(a.healthHost, "127.0.0.1");
    EXPECT_EQ(a.healthPort, 8081);
}

TEST(CliArgsTest, BadInputThrows) {
    const char* none[] = {"smsbridge"};
    EXPECT_THROW((void)CliArgs::parseOrThrow(1, none), std::runtime_error);

    const char* unknownCmd[] = {"smsbridge", "sync"};
    EXPECT_THROW((void)CliArgs::parseOrThrow(2, unknownCmd), std::runtime_error);

    const char* unknownFlag[] = {"smsbridge", "discover", "--fast"};
    EXPECT_THROW((void)CliArgs::parseOrThrow(3, unknownFlag), std::runtime_error);

    const char* noValue[] = {"smsbridge", "send", "--records"};
    EXPECT_THROW((void)CliArgs::parseOrThrow(3, noValue), std::runtime_error);

    const char* badPeer[] = {"smsbridge", "send", "--records", "a", "--peer", "host.local"};
    EXPECT_THROW((void)CliArgs::parseOrThrow(6, badPeer), std::runtime_error);

    const char* badPort[] = {"smsbridge", "health", "127.0.0.1", "0"};
    EXPECT_THROW((void)CliArgs::parseOrThrow(4, badPort), std::runtime_error);
}
