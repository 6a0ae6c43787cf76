/**
 * @file discovery_sweep_test.cpp
 * @brief Tests for the /24 discovery sweep.
 */

#include "smsbridge/DiscoverySweep.h"
#include "smsbridge/MessageEnvelope.h"
#include "smsbridge/TransferServer.h"

#include "TestHelpers.h"

#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <mutex>
#include <thread>

using namespace SmsBridge;

namespace {

/**
 * @brief Answers discovery for a fixed host table, refuses everything else.
 */
class FakeLanTransport : public EnvelopeTransport {
public:
    explicit FakeLanTransport(std::map<std::string, DeviceIdentity> hosts,
                              std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : m_hosts(std::move(hosts)), m_delay(delay) {}

    HttpResult post(const std::string& host, uint16_t, const std::string& path,
                    const std::string& body, uint32_t) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_probes;
            m_lastBody = body;
        }
        if (m_delay.count() > 0) {
            std::this_thread::sleep_for(m_delay);
        }

        HttpResult r;
        auto it = m_hosts.find(host);
        if (path != DISCOVERY_PATH || it == m_hosts.end()) {
            r.errorMsg = "connect " + host + " failed: Connection refused";
            return r;
        }
        r.ok = true;
        r.status = 200;
        auto bound = m_sessions.find(host);
        const std::string sessionId = bound == m_sessions.end() ? std::string() : bound->second;
        r.body = MessageEnvelope::discoveryResponse(sessionId, it->second).toJsonString();
        return r;
    }

    HttpResult get(const std::string&, uint16_t, const std::string&, uint32_t) override {
        HttpResult r;
        r.errorMsg = "not used";
        return r;
    }

    // Call before sweeping
    void bindSession(const std::string& host, const std::string& sessionId) {
        m_sessions[host] = sessionId;
    }

    size_t probes() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_probes;
    }

    std::string lastBody() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastBody;
    }

private:
    std::map<std::string, DeviceIdentity> m_hosts;
    std::map<std::string, std::string> m_sessions;
    std::chrono::milliseconds m_delay;
    mutable std::mutex m_mutex;
    size_t m_probes = 0;
    std::string m_lastBody;
};

DiscoverySweep::Options fastOptions() {
    DiscoverySweep::Options o;
    o.port = 8080;
    o.probeTimeoutMs = 200;
    o.sweepTimeoutMs = 3000;
    o.workerCount = 16;
    return o;
}

}  // namespace

TEST(DiscoverySweepTest, TargetsCoverTheSlash24ExceptSelf) {
    const auto targets = DiscoverySweep::buildTargets("192.168.1.20");
    ASSERT_EQ(targets.size(), 253u);
    EXPECT_EQ(targets.front(), "192.168.1.1");
    EXPECT_EQ(targets.back(), "192.168.1.254");
    for (const auto& t : targets) {
        EXPECT_NE(t, "192.168.1.20");
    }

    EXPECT_TRUE(DiscoverySweep::buildTargets("not an ip").empty());
    EXPECT_TRUE(DiscoverySweep::buildTargets("").empty());
}

TEST(DiscoverySweepTest, FindsDevicesDedupsAndDropsSelf) {
    const DeviceIdentity self = SmsBridge::Test::makeIdentity("self", "192.168.1.20");
    const DeviceIdentity phone = SmsBridge::Test::makeIdentity("phone", "192.168.1.7");
    const DeviceIdentity laptop = SmsBridge::Test::makeIdentity("laptop", "192.168.1.9");

    std::map<std::string, DeviceIdentity> lan;
    lan["192.168.1.7"] = phone;
    lan["192.168.1.9"] = laptop;
    lan["192.168.1.10"] = laptop;   // second interface of the same device
    lan["192.168.1.33"] = self;     // own id seen through another address

    auto transport = std::make_shared<FakeLanTransport>(lan);
    DiscoverySweep sweep(transport, self, fastOptions());

    std::vector<std::string> callbackIds;
    const auto found = sweep.run("sess_1", [&](const DeviceIdentity& d) { callbackIds.push_back(d.deviceId); });

    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(callbackIds.size(), 2u);
    EXPECT_EQ(transport->probes(), 253u);

    bool sawPhone = false;
    for (const auto& d : found) {
        EXPECT_NE(d.deviceId, "self");
        if (d.deviceId == "phone") {
            sawPhone = true;
            EXPECT_EQ(d.ipAddress, "192.168.1.7");
        }
    }
    EXPECT_TRUE(sawPhone);

    // Probes announce this device
    MessageEnvelope probe;
    std::string err;
    ASSERT_TRUE(MessageEnvelope::fromJsonString(transport->lastBody(), probe, err)) << err;
    EXPECT_EQ(probe.type(), EnvelopeType::DISCOVERY);
    EXPECT_EQ(probe.sessionId(), "sess_1");
    EXPECT_EQ(probe.payloadAs<DeviceIdentity>()->deviceId, "self");
}

TEST(DiscoverySweepTest, SessionFilterKeepsOnlyPairedResponders) {
    const DeviceIdentity self = SmsBridge::Test::makeIdentity("self", "192.168.1.20");

    std::map<std::string, DeviceIdentity> lan;
    lan["192.168.1.7"] = SmsBridge::Test::makeIdentity("paired", "192.168.1.7");
    lan["192.168.1.8"] = SmsBridge::Test::makeIdentity("other-sender", "192.168.1.8");
    lan["192.168.1.9"] = SmsBridge::Test::makeIdentity("idle", "192.168.1.9");

    auto transport = std::make_shared<FakeLanTransport>(lan);
    transport->bindSession("192.168.1.7", "sess_mine");
    transport->bindSession("192.168.1.8", "sess_theirs");

    DiscoverySweep::Options options = fastOptions();
    options.sessionFilter = "sess_mine";
    DiscoverySweep filtered(transport, self, options);

    const auto found = filtered.run("sess_mine");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].deviceId, "paired");

    // Without a filter every responder counts
    DiscoverySweep unfiltered(transport, self, fastOptions());
    EXPECT_EQ(unfiltered.run("sess_mine").size(), 3u);

    const ProbeResult hit = DiscoverySweep::probe(*transport, "192.168.1.8", 8080, "{}", 100);
    ASSERT_TRUE(hit.isReachable());
    EXPECT_EQ(hit.sessionId, "sess_theirs");
}

TEST(DiscoverySweepTest, ReturnsAtDeadlineWhenProbesHang) {
    const DeviceIdentity self = SmsBridge::Test::makeIdentity("self", "10.1.2.3");
    auto slow = std::make_shared<FakeLanTransport>(std::map<std::string, DeviceIdentity>(),
                                                   std::chrono::milliseconds(1500));

    DiscoverySweep::Options options = fastOptions();
    options.sweepTimeoutMs = 400;
    options.workerCount = 8;
    DiscoverySweep sweep(slow, self, options);

    const auto begin = std::chrono::steady_clock::now();
    const auto found = sweep.run("s");
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_TRUE(found.empty());
    EXPECT_GE(elapsed, std::chrono::milliseconds(400));
    EXPECT_LT(elapsed, std::chrono::milliseconds(1400));
}

TEST(DiscoverySweepTest, EmptyHostListReturnsImmediately) {
    auto transport = std::make_shared<FakeLanTransport>(std::map<std::string, DeviceIdentity>());
    DiscoverySweep sweep(transport, SmsBridge::Test::makeIdentity("self"), fastOptions());
    EXPECT_TRUE(sweep.runTargets({}, "s").empty());
    EXPECT_EQ(transport->probes(), 0u);
}

TEST(DiscoverySweepTest, ProbeReportsUnexpectedReplies) {
    FakeLanTransport refusing{std::map<std::string, DeviceIdentity>()};
    const ProbeResult r = DiscoverySweep::probe(refusing, "10.0.0.1", 8080, "{}", 100);
    EXPECT_FALSE(r.isReachable());
    EXPECT_EQ(r.host, "10.0.0.1");
    EXPECT_NE(r.reason.find("refused"), std::string::npos);
}

TEST(DiscoverySweepTest, FindsLoopbackListener) {
    const DeviceIdentity listener = SmsBridge::Test::makeIdentity("listener", "192.168.50.5", 8080);
    TransferServer server(listener, 0);

    DeviceIdentity announced;
    std::mutex mutex;
    server.setDiscoveryObserver([&](const DeviceIdentity& peer, const std::string&, const std::string&) {
        std::lock_guard<std::mutex> lock(mutex);
        announced = peer;
    });

    std::string err;
    ASSERT_TRUE(server.start(err)) << err;

    DiscoverySweep::Options options = fastOptions();
    options.port = server.getPort();
    options.probeTimeoutMs = 2000;
    const DeviceIdentity self = SmsBridge::Test::makeIdentity("sweeper", "127.0.0.9");
    DiscoverySweep sweep(std::make_shared<HttpClient>(), self, options);

    const auto found = sweep.runTargets({"127.0.0.1"}, "sess_loop");
    server.stop();

    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].deviceId, "listener");
    EXPECT_EQ(found[0].ipAddress, "127.0.0.1");

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(announced.deviceId, "sweeper");
}
