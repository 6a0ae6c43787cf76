/**
 * @file DiscoverySweep.cpp
 * @brief Deadline-bounded /24 sweep for listening peers
 */

#include "smsbridge/DiscoverySweep.h"
#include "smsbridge/Debug.h"
#include "smsbridge/MessageEnvelope.h"
#include "smsbridge/ThreadSafeLog.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <system_error>
#include <thread>
#include <unordered_set>

namespace SmsBridge {

namespace {

//=============================================================================
// Shared sweep state
//=============================================================================

// Owned jointly by the driver and every worker so abandoned workers never
// touch freed memory
struct SweepState {
    std::mutex mutex;
    std::condition_variable cv;

    std::vector<std::string> hosts;
    size_t nextHost = 0;
    size_t reported = 0;
    std::deque<ProbeResult> results;
    bool abandoned = false;

    std::shared_ptr<EnvelopeTransport> transport;
    std::string body;
    uint16_t port = 0;
    uint32_t probeTimeoutMs = 0;
};

void sweepWorker(std::shared_ptr<SweepState> state) {
    for (;;) {
        std::string host;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->abandoned || state->nextHost >= state->hosts.size()) {
                return;
            }
            host = state->hosts[state->nextHost++];
        }

        ProbeResult result = DiscoverySweep::probe(*state->transport, host, state->port,
                                                   state->body, state->probeTimeoutMs);

        {
            std::lock_guard<std::mutex> lock(state->mutex);
            ++state->reported;
            if (!state->abandoned) {
                state->results.push_back(std::move(result));
            }
        }
        state->cv.notify_all();
    }
}

} // anonymous namespace

//=============================================================================
// DiscoverySweep
//=============================================================================

DiscoverySweep::DiscoverySweep(std::shared_ptr<EnvelopeTransport> transport,
                               const DeviceIdentity& self,
                               const Options& options)
    : m_transport(std::move(transport))
    , m_self(self)
    , m_options(options)
{
}

std::vector<std::string> DiscoverySweep::buildTargets(const std::string& selfIp) {
    std::vector<std::string> targets;
    if (!isIpv4Address(selfIp)) {
        return targets;
    }

    const std::string prefix = selfIp.substr(0, selfIp.rfind('.'));
    targets.reserve(253);
    for (int suffix = 1; suffix <= 254; ++suffix) {
        std::string host = prefix + "." + std::to_string(suffix);
        if (host != selfIp) {
            targets.push_back(std::move(host));
        }
    }
    return targets;
}

ProbeResult DiscoverySweep::probe(EnvelopeTransport& transport, const std::string& host, uint16_t port,
                                  const std::string& body, uint32_t timeoutMs) {
    ProbeResult result;
    result.host = host;

    const HttpResult reply = transport.post(host, port, DISCOVERY_PATH, body, timeoutMs);
    if (!reply.ok) {
        result.reason = reply.errorMsg;
        return result;
    }

    MessageEnvelope envelope;
    std::string err;
    if (!MessageEnvelope::fromJsonString(reply.body, envelope, err)) {
        result.reason = "undecodable discovery reply: " + err;
        return result;
    }
    const DeviceIdentity* identity = envelope.payloadAs<DeviceIdentity>();
    if (envelope.type() != EnvelopeType::DISCOVERY_RESPONSE || identity == nullptr) {
        result.reason = std::string("unexpected ") + envelopeTypeToString(envelope.type()) + " reply";
        return result;
    }

    result.kind = ProbeResult::Kind::Reachable;
    result.identity = *identity;
    result.sessionId = envelope.sessionId();
    // The address that answered is the one that works from here
    result.identity.ipAddress = host;
    return result;
}

std::vector<DeviceIdentity> DiscoverySweep::run(const std::string& sessionId,
                                                const DeviceFoundCallback& onFound) {
    const auto targets = buildTargets(m_self.ipAddress);
    if (targets.empty()) {
        LOG_WARNING("[DiscoverySweep] No /24 to sweep for local address '" << m_self.ipAddress << "'");
        return {};
    }
    return runTargets(targets, sessionId, onFound);
}

std::vector<DeviceIdentity> DiscoverySweep::runTargets(const std::vector<std::string>& hosts,
                                                       const std::string& sessionId,
                                                       const DeviceFoundCallback& onFound) {
    std::vector<DeviceIdentity> found;
    if (hosts.empty() || !m_transport) {
        return found;
    }

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(m_options.sweepTimeoutMs);

    auto state = std::make_shared<SweepState>();
    state->hosts = hosts;
    state->transport = m_transport;
    state->body = MessageEnvelope::discovery(sessionId, m_self).toJsonString();
    state->port = m_options.port;
    state->probeTimeoutMs = m_options.probeTimeoutMs;

    ThreadSafeLog::log("DiscoverySweep: start, " + std::to_string(hosts.size()) + " hosts");

    const size_t wanted = std::min(std::max<size_t>(m_options.workerCount, 1), hosts.size());
    size_t launched = 0;
    for (; launched < wanted; ++launched) {
        try {
            std::thread(sweepWorker, state).detach();
        } catch (const std::system_error& e) {
            LOG_WARNING("[DiscoverySweep] Started " << launched << " of " << wanted
                        << " workers: " << e.what());
            break;
        }
    }
    if (launched == 0) {
        ThreadSafeLog::log("DiscoverySweep: no worker threads, sweep skipped");
        return found;
    }

    std::unordered_set<std::string> seenIds;
    std::deque<ProbeResult> batch;

    std::unique_lock<std::mutex> lock(state->mutex);
    for (;;) {
        state->cv.wait_until(lock, deadline, [&state]() {
            return !state->results.empty() || state->reported >= state->hosts.size();
        });

        batch.swap(state->results);
        const bool allReported = state->reported >= state->hosts.size();
        lock.unlock();

        for (const auto& result : batch) {
            if (!result.isReachable()) {
                continue;
            }
            if (!m_options.sessionFilter.empty() && result.sessionId != m_options.sessionFilter) {
                LOG_DEBUG("[DiscoverySweep] Skipping " << result.host << ", bound to session '"
                          << result.sessionId << "'");
                continue;
            }
            const DeviceIdentity& device = result.identity;
            if (device.deviceId == m_self.deviceId || !seenIds.insert(device.deviceId).second) {
                continue;
            }
            LOG_INFO("[DiscoverySweep] Found " << device.deviceName << " at " << device.ipAddress);
            found.push_back(device);
            if (onFound) {
                onFound(device);
            }
        }
        batch.clear();

        lock.lock();
        if (allReported && state->results.empty()) {
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
    }

    const size_t outstanding = state->hosts.size() - state->reported;
    state->abandoned = true;
    lock.unlock();

    ThreadSafeLog::log("DiscoverySweep: end, " + std::to_string(found.size()) + " found, " +
                       std::to_string(outstanding) + " probes abandoned");
    return found;
}

}  // namespace SmsBridge
