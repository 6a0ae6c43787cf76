/**
 * @file CliArgs.h
 * @brief smsbridge command-line argument parsing.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace SmsBridge {

struct CliArgs {
    enum class Command {
        Help,
        Send,      ///< smsbridge send --records FILE [--peer IP[:PORT]]
        Receive,   ///< smsbridge receive --pairing TOKEN|@FILE --store FILE
        Discover,  ///< smsbridge discover
        Health     ///< smsbridge health IP [PORT]
    };

    Command command = Command::Help;

    std::string configPath;

    // send
    std::string recordsPath;
    std::string peerHost;
    uint16_t peerPort = 0;      ///< 0: use the configured transfer port

    // receive
    std::string pairing;        ///< Token text, or @path to read it from
    std::string storePath;

    // health
    std::string healthHost;
    uint16_t healthPort = 0;

    bool hasPeer() const { return !peerHost.empty(); }

    static CliArgs parseOrThrow(int argc, const char* const* argv);
};

/**
 * @brief Parse "IP" or "IP:PORT"
 * @throws std::runtime_error on a malformed address or port
 */
void parseHostPortOrThrow(const std::string& text, std::string& host, uint16_t& port);

}  // namespace SmsBridge
