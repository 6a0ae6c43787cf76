/**
 * @file smsbridge.cpp
 * @brief Command-line front end: send, receive, discover and health.
 *
 * Exit codes: 0 success, 1 failure, 2 usage error.
 */

#include "smsbridge/AtomicFile.h"
#include "smsbridge/CliArgs.h"
#include "smsbridge/Debug.h"
#include "smsbridge/DiscoverySweep.h"
#include "smsbridge/EnvelopeTransport.h"
#include "smsbridge/LocalDevice.h"
#include "smsbridge/MessageEnvelope.h"
#include "smsbridge/RecordStore.h"
#include "smsbridge/SessionController.h"
#include "smsbridge/Settings.h"
#include "smsbridge/ThreadSafeLog.h"

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace SmsBridge;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(200);

static void printHelp()
{
    std::cout
        << "smsbridge " << APP_VERSION << "\n"
        << "\n"
        << "Usage:\n"
        << "  smsbridge send --records FILE [--peer IP[:PORT]] [--config FILE]\n"
        << "  smsbridge receive --pairing TOKEN|@FILE --store FILE [--config FILE]\n"
        << "  smsbridge discover [--config FILE]\n"
        << "  smsbridge health IP [PORT]\n"
        << "\n"
        << "send      Print a pairing token, wait for the receiver, then stream the records\n"
        << "receive   Accept a pairing token and store the records the sender streams\n"
        << "discover  Sweep the local /24 for listening devices\n"
        << "health    Probe a device's /health endpoint\n";
}

static bool loadSettings(const CliArgs& args, Settings& settings)
{
    if (!args.configPath.empty()) {
        std::string err;
        if (!Settings::loadFromFile(args.configPath, settings, err)) {
            std::cerr << "Config error: " << err << "\n";
            return false;
        }
    }
    setLogLevel(settings.logLevel);
    if (!settings.logFile.empty()) {
        ThreadSafeLog::initialize(settings.logFile);
    }
    return true;
}

static void printProgress(const TransferSession& s)
{
    std::cout << "[" << sessionStatusToString(s.status()) << "] "
              << s.transferredRecords() << "/" << s.totalRecords()
              << " (" << static_cast<int>(s.progress() * 100.0) << "%)";
    if (!s.errorMessage().empty()) {
        std::cout << " " << s.errorMessage();
    }
    std::cout << std::endl;
}

static bool readPairingToken(const std::string& arg, std::string& token)
{
    if (arg.empty() || arg[0] != '@') {
        token = arg;
        return true;
    }
    std::string err;
    if (!readWholeFile(arg.substr(1), token, err)) {
        std::cerr << "Cannot read pairing token: " << err << "\n";
        return false;
    }
    const auto last = token.find_last_not_of(" \t\r\n");
    token.erase(last == std::string::npos ? 0 : last + 1);
    return true;
}

//=============================================================================
// send
//=============================================================================

static bool waitForReceiver(SessionController& controller, const Settings& settings, DeviceIdentity& peer)
{
    const auto giveUp = std::chrono::steady_clock::now() + std::chrono::milliseconds(PAIRING_MAX_AGE_MS);

    while (std::chrono::steady_clock::now() < giveUp) {
        const auto sweepAt = std::chrono::steady_clock::now() +
                             std::chrono::milliseconds(settings.sweepTimeoutMs);
        while (std::chrono::steady_clock::now() < sweepAt) {
            const auto announced = controller.inboundPeers();
            if (!announced.empty()) {
                peer = announced.front();
                return true;
            }
            std::this_thread::sleep_for(POLL_INTERVAL);
        }

        std::cout << "No receiver announced itself yet, sweeping the local network..." << std::endl;
        const auto found = controller.discoverPeers([](const DeviceIdentity& d) {
            std::cout << "  found " << d.deviceName << " at " << d.ipAddress << ":" << d.port << std::endl;
        }, true);
        if (!found.empty()) {
            peer = found.front();
            return true;
        }
    }
    return false;
}

static int runSend(const CliArgs& args, const Settings& settings, const DeviceIdentity& self)
{
    JsonFileRecordStore source(args.recordsPath);
    SmsRecordList records;
    std::string err;
    if (!source.readAll(records, err)) {
        std::cerr << err << "\n";
        return EXIT_FAILED;
    }
    const size_t before = records.size();
    records = deduplicateRecords(records);
    std::cout << "Loaded " << records.size() << " records";
    if (before != records.size()) {
        std::cout << " (" << (before - records.size()) << " duplicates dropped)";
    }
    std::cout << "\n";

    // The sender never receives, so nothing is written to this store
    InMemoryRecordStore unused;
    SessionController controller(settings, self, unused);

    std::string token;
    if (!controller.beginSenderSession(token, err)) {
        std::cerr << "Cannot start session: " << err << "\n";
        return EXIT_FAILED;
    }
    std::cout << "Pairing token:\n" << token << "\n" << std::endl;

    DeviceIdentity peer;
    if (args.hasPeer()) {
        const uint16_t port = args.peerPort != 0 ? args.peerPort : settings.transferPort;
        HttpClient client;
        const std::string body =
            MessageEnvelope::discovery(controller.snapshot().sessionId(), controller.localIdentity()).toJsonString();
        const ProbeResult probe = DiscoverySweep::probe(client, args.peerHost, port, body,
                                                        settings.probeTimeoutMs);
        if (!probe.isReachable()) {
            std::cerr << "Peer " << args.peerHost << ":" << port << " not reachable: " << probe.reason << "\n";
            controller.abortSession("peer not reachable");
            return EXIT_FAILED;
        }
        if (probe.sessionId != controller.snapshot().sessionId()) {
            std::cerr << "Warning: " << args.peerHost << " is not paired with this session yet\n";
        }
        peer = probe.identity;
    } else if (!waitForReceiver(controller, settings, peer)) {
        std::cerr << "No receiver found before the pairing token expired\n";
        controller.abortSession("no receiver found");
        return EXIT_FAILED;
    }

    std::cout << "Sending to " << peer.deviceName << " (" << peer.ipAddress << ":" << peer.port << ")" << std::endl;
    controller.setProgressCallback(printProgress);

    if (!controller.sendBatchStream(peer, records, err)) {
        std::cerr << "Transfer failed: " << err << "\n";
        return EXIT_FAILED;
    }
    std::cout << "Transfer complete: " << records.size() << " records sent\n";
    return EXIT_OK;
}

//=============================================================================
// receive
//=============================================================================

static int runReceive(const CliArgs& args, const Settings& settings, const DeviceIdentity& self)
{
    std::string token;
    if (!readPairingToken(args.pairing, token)) {
        return EXIT_FAILED;
    }

    JsonFileRecordStore store(args.storePath);
    SessionController controller(settings, self, store);
    controller.setProgressCallback(printProgress);

    PairingCheck check = PairingCheck::Malformed;
    std::string err;
    if (!controller.beginReceiverSession(token, check, err)) {
        std::cerr << "Pairing failed: " << err << "\n";
        return EXIT_FAILED;
    }
    std::cout << "Paired, waiting for the sender..." << std::endl;

    const auto pairedAt = std::chrono::steady_clock::now();
    auto lastChange = pairedAt;
    uint64_t lastCount = 0;

    for (;;) {
        std::this_thread::sleep_for(POLL_INTERVAL);
        const TransferSession s = controller.snapshot();
        if (s.isTerminal()) {
            break;
        }

        const auto now = std::chrono::steady_clock::now();
        if (s.transferredRecords() != lastCount) {
            lastCount = s.transferredRecords();
            lastChange = now;
        }
        if (s.status() == SessionStatus::TRANSFERRING &&
            now - lastChange > std::chrono::milliseconds(settings.requestTimeoutMs)) {
            controller.abortSession("transfer stalled");
        } else if (s.status() == SessionStatus::PREPARING &&
                   now - pairedAt > std::chrono::milliseconds(PAIRING_MAX_AGE_MS)) {
            controller.abortSession("sender never started the transfer");
        }
    }

    const TransferSession done = controller.snapshot();
    if (done.status() != SessionStatus::COMPLETED) {
        std::cerr << "Transfer failed: " << done.errorMessage() << "\n";
        return EXIT_FAILED;
    }

    const StoreWriteResult written = controller.lastWriteResult();
    std::cout << "Stored " << written.written << " records in " << args.storePath
              << " (" << written.skipped << " duplicates skipped)\n";
    return EXIT_OK;
}

//=============================================================================
// discover / health
//=============================================================================

static int runDiscover(const Settings& settings, const DeviceIdentity& self)
{
    DiscoverySweep::Options options;
    options.port = settings.transferPort;
    options.probeTimeoutMs = settings.probeTimeoutMs;
    options.sweepTimeoutMs = settings.sweepTimeoutMs;

    std::cout << "Sweeping " << self.ipAddress << "/24 on port " << options.port << "..." << std::endl;
    DiscoverySweep sweep(std::make_shared<HttpClient>(), self, options);
    const auto devices = sweep.run(std::string(), [](const DeviceIdentity& d) {
        std::cout << d.deviceName << "  " << d.ipAddress << ":" << d.port
                  << "  " << d.osVersion << "  " << d.appVersion << std::endl;
    });
    std::cout << devices.size() << " device(s) found\n";
    return EXIT_OK;
}

static int runHealth(const CliArgs& args, const Settings& settings)
{
    const uint16_t port = args.healthPort != 0 ? args.healthPort : settings.transferPort;
    HttpClient client;
    const HttpResult result = client.get(args.healthHost, port, HEALTH_PATH, settings.probeTimeoutMs);
    if (!result.ok) {
        std::cerr << "Unhealthy: " << result.errorMsg << "\n";
        return EXIT_FAILED;
    }
    std::cout << result.body << "\n";
    return EXIT_OK;
}

}  // namespace

int main(int argc, char** argv)
{
    CliArgs args;
    try {
        args = CliArgs::parseOrThrow(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Argument error: " << e.what() << "\n";
        printHelp();
        return EXIT_USAGE;
    }

    if (args.command == CliArgs::Command::Help) {
        printHelp();
        return EXIT_OK;
    }

    Settings settings;
    if (!loadSettings(args, settings)) {
        return EXIT_FAILED;
    }

    if (args.command == CliArgs::Command::Health) {
        return runHealth(args, settings);
    }

    DeviceIdentity self;
    std::string err;
    if (!buildLocalIdentity(settings, self, err)) {
        std::cerr << "Cannot build device identity: " << err << "\n";
        return EXIT_FAILED;
    }
    LOG_INFO("Local device " << self.deviceName << " at " << self.ipAddress << ":" << self.port);

    try {
        switch (args.command) {
            case CliArgs::Command::Send:     return runSend(args, settings, self);
            case CliArgs::Command::Receive:  return runReceive(args, settings, self);
            case CliArgs::Command::Discover: return runDiscover(settings, self);
            default:                         break;
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return EXIT_FAILED;
    }

    printHelp();
    return EXIT_USAGE;
}
