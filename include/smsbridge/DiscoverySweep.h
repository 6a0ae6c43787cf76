/**
 * @file DiscoverySweep.h
 * @brief Deadline-bounded /24 sweep for listening peers
 */

#pragma once

#include "DeviceIdentity.h"
#include "EnvelopeTransport.h"
#include "config.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace SmsBridge {

/**
 * @brief Outcome of probing one host
 */
struct ProbeResult {
    enum class Kind : uint8_t {
        Reachable,   ///< Host answered with a DISCOVERY_RESPONSE
        Unreachable  ///< No listener, timeout, or an unexpected answer
    };

    Kind kind = Kind::Unreachable;
    std::string host;
    DeviceIdentity identity;   ///< Set when Reachable
    std::string sessionId;     ///< Session the responder is bound to (empty if none)
    std::string reason;        ///< Set when Unreachable

    bool isReachable() const { return kind == Kind::Reachable; }
};

/**
 * @brief Called once for each distinct device, as soon as it is found
 */
using DeviceFoundCallback = std::function<void(const DeviceIdentity& device)>;

/**
 * @class DiscoverySweep
 * @brief Probes every host of the local /24 with POST /discover
 *
 * Architecture:
 * - A bounded set of detached worker threads pull host addresses from a
 *   shared queue and push ProbeResults onto a shared result queue
 * - The calling thread drains results until every probe has reported or the
 *   overall deadline passes, whichever comes first
 * - Workers still probing at the deadline are abandoned; the state they
 *   touch is shared-owned, so they finish harmlessly and exit
 *
 * run() therefore returns within sweepTimeoutMs plus scheduling slack,
 * regardless of how many hosts are slow.
 *
 * Results are de-duplicated by device id, and this device's own id is
 * dropped. Options::sessionFilter narrows them to devices paired with one
 * session.
 */
class DiscoverySweep {
public:
    struct Options {
        uint16_t port = TRANSFER_PORT_DEFAULT;
        uint32_t probeTimeoutMs = PROBE_TIMEOUT_MS;
        uint32_t sweepTimeoutMs = SWEEP_TIMEOUT_MS;
        size_t workerCount = SWEEP_WORKER_COUNT;
        std::string sessionFilter;   ///< Non-empty: keep only responders bound to this session
    };

    /**
     * @param transport Request transport, shared with abandoned workers
     * @param self Local identity (announced in probes and excluded from results)
     * @param options Port and timing
     */
    DiscoverySweep(std::shared_ptr<EnvelopeTransport> transport,
                   const DeviceIdentity& self,
                   const Options& options);

    /**
     * @brief Sweep the /24 of the local address
     * @param sessionId Session id stamped on the DISCOVERY envelopes
     * @param onFound Optional per-device callback (called on this thread)
     * @return Distinct devices found before the deadline
     */
    std::vector<DeviceIdentity> run(const std::string& sessionId,
                                    const DeviceFoundCallback& onFound = DeviceFoundCallback());

    /**
     * @brief Sweep an explicit host list
     */
    std::vector<DeviceIdentity> runTargets(const std::vector<std::string>& hosts,
                                           const std::string& sessionId,
                                           const DeviceFoundCallback& onFound = DeviceFoundCallback());

    /**
     * @brief Host addresses of the /24 containing selfIp, except selfIp
     * @return Empty when selfIp is not a dotted-quad IPv4 address
     */
    static std::vector<std::string> buildTargets(const std::string& selfIp);

    /**
     * @brief Probe one host
     * @param transport Request transport
     * @param host Host to probe
     * @param port Listener port
     * @param body Serialized DISCOVERY envelope
     * @param timeoutMs Per-host deadline
     */
    static ProbeResult probe(EnvelopeTransport& transport, const std::string& host, uint16_t port,
                             const std::string& body, uint32_t timeoutMs);

private:
    std::shared_ptr<EnvelopeTransport> m_transport;
    DeviceIdentity m_self;
    Options m_options;
};

}  // namespace SmsBridge
