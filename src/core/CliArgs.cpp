/**
 * @file CliArgs.cpp
 * @brief smsbridge command-line argument parsing.
 */

#include "smsbridge/CliArgs.h"
#include "smsbridge/DeviceIdentity.h"

#include <string>

namespace SmsBridge {

namespace {

uint16_t parsePortOrThrow(const std::string& text) {
    if (text.empty() || text.size() > 5 || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error("Invalid port: " + text);
    }
    const unsigned long value = std::stoul(text);
    if (value == 0 || value > 65535) {
        throw std::runtime_error("Port out of range: " + text);
    }
    return static_cast<uint16_t>(value);
}

} // anonymous namespace

void parseHostPortOrThrow(const std::string& text, std::string& host, uint16_t& port) {
    const size_t colon = text.find(':');
    host = text.substr(0, colon);
    port = 0;
    if (!isIpv4Address(host)) {
        throw std::runtime_error("Invalid IPv4 address: " + host);
    }
    if (colon != std::string::npos) {
        port = parsePortOrThrow(text.substr(colon + 1));
    }
}

CliArgs CliArgs::parseOrThrow(int argc, const char* const* argv) {
    CliArgs out;

    if (argc < 2 || argv[1] == nullptr) {
        throw std::runtime_error("No command given. Use send, receive, discover or health.");
    }

    const std::string cmd(argv[1]);
    if (cmd == "--help" || cmd == "-h" || cmd == "help") {
        out.command = Command::Help;
        return out;
    } else if (cmd == "send") {
        out.command = Command::Send;
    } else if (cmd == "receive") {
        out.command = Command::Receive;
    } else if (cmd == "discover") {
        out.command = Command::Discover;
    } else if (cmd == "health") {
        out.command = Command::Health;
    } else {
        throw std::runtime_error("Unknown command: " + cmd);
    }

    auto valueOf = [argc, argv](int& i, const std::string& flag) {
        if (i + 1 >= argc || argv[i + 1] == nullptr) {
            throw std::runtime_error("Missing value for " + flag);
        }
        return std::string(argv[++i]);
    };

    int positional = 0;
    for (int i = 2; i < argc; ++i) {
        const std::string a = argv[i] ? std::string(argv[i]) : std::string();

        if (a == "--help" || a == "-h") {
            out.command = Command::Help;
            return out;
        }

        if (a == "--config") {
            out.configPath = valueOf(i, a);
            continue;
        }

        if (a == "--records" && out.command == Command::Send) {
            out.recordsPath = valueOf(i, a);
            continue;
        }

        if (a == "--peer" && out.command == Command::Send) {
            parseHostPortOrThrow(valueOf(i, a), out.peerHost, out.peerPort);
            continue;
        }

        if (a == "--pairing" && out.command == Command::Receive) {
            out.pairing = valueOf(i, a);
            continue;
        }

        if (a == "--store" && out.command == Command::Receive) {
            out.storePath = valueOf(i, a);
            continue;
        }

        if (out.command == Command::Health && a.rfind("--", 0) != 0) {
            if (positional == 0) {
                out.healthHost = a;
                if (!isIpv4Address(a)) {
                    throw std::runtime_error("Invalid IPv4 address: " + a);
                }
            } else if (positional == 1) {
                out.healthPort = parsePortOrThrow(a);
            } else {
                throw std::runtime_error("Unexpected argument: " + a);
            }
            ++positional;
            continue;
        }

        throw std::runtime_error("Unknown argument: " + a);
    }

    if (out.command == Command::Send && out.recordsPath.empty()) {
        throw std::runtime_error("send requires --records FILE");
    }
    if (out.command == Command::Receive && (out.pairing.empty() || out.storePath.empty())) {
        throw std::runtime_error("receive requires --pairing TOKEN|@FILE and --store FILE");
    }
    if (out.command == Command::Health && out.healthHost.empty()) {
        throw std::runtime_error("health requires an IP address");
    }

    return out;
}

}  // namespace SmsBridge
