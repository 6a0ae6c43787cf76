/**
 * @file TransferServer.h
 * @brief HTTP listener serving the discovery, transfer and health endpoints
 */

#pragma once

#include "DeviceIdentity.h"
#include "MessageEnvelope.h"
#include "config.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

namespace SmsBridge {

//=============================================================================
// Handler Types
//=============================================================================

/**
 * @brief How the session owner disposed of a transfer-endpoint envelope
 */
struct EnvelopeDisposition {
    enum class Outcome : uint8_t {
        Accepted,        ///< Applied (or idempotently ignored); reply 200 ack
        Rejected,        ///< Refused by the session; reply 409 with ERROR envelope
        SessionMismatch  ///< Envelope names another session; reply 403
    };

    Outcome outcome = Outcome::Accepted;
    std::string errorMsg;

    static EnvelopeDisposition accepted() { return {}; }
    static EnvelopeDisposition rejected(const std::string& msg) {
        return {Outcome::Rejected, msg};
    }
    static EnvelopeDisposition mismatch(const std::string& msg) {
        return {Outcome::SessionMismatch, msg};
    }
};

/**
 * @brief Receives TRANSFER_REQUEST, SMS_DATA, TRANSFER_COMPLETE and ERROR
 * envelopes. Called from handler threads, possibly concurrently.
 */
using EnvelopeHandler = std::function<EnvelopeDisposition(const MessageEnvelope& envelope)>;

/**
 * @brief Receives identities announced through POST /discover
 * @param peer Identity carried by the DISCOVERY envelope
 * @param sessionId Session id the announcement was made for (may be empty)
 * @param remoteIp Address the request came from
 */
using DiscoveryObserver = std::function<void(const DeviceIdentity& peer,
                                             const std::string& sessionId,
                                             const std::string& remoteIp)>;

/**
 * @brief Supplies the session id stamped on discovery responses
 */
using SessionIdProvider = std::function<std::string()>;

/**
 * @brief Routed response before it is written to the wire
 */
struct HttpReply {
    int status = 200;
    std::string body;   ///< Empty for OPTIONS
};

//=============================================================================
// TransferServer Class
//=============================================================================

/**
 * @class TransferServer
 * @brief HTTP/1.1 listener bound to 0.0.0.0:port
 *
 * Architecture:
 * - Single listener thread running a non-blocking accept loop
 * - One detached handler thread per connection, capped at
 *   MAX_CONCURRENT_HANDLER_THREADS (excess connections are closed)
 * - Every connection is read with a deadline and answered with
 *   "Connection: close"
 *
 * Routes:
 * - /discover      GET, POST (DISCOVERY envelope)
 * - /sms-transfer  POST (transfer envelopes, forwarded to the EnvelopeHandler)
 * - /health        GET
 * - OPTIONS on any of the above answers an empty 200
 *
 * Every response carries permissive CORS headers. Malformed input yields a
 * 4xx and an exception inside a handler yields a 500; neither affects the
 * listener.
 *
 * Thread Safety:
 * - start() and stop() must be called from one thread at a time
 * - Handlers and callbacks must be set before start()
 *
 * Usage:
 * @code
 * TransferServer server(localIdentity, 8080);
 * server.setEnvelopeHandler([&](const MessageEnvelope& env) { return owner.apply(env); });
 * std::string err;
 * if (server.start(err)) {
 *     // ...
 *     server.stop();
 * }
 * @endcode
 */
class TransferServer {
public:
    /**
     * @param localIdentity Identity returned by /discover
     * @param port Listen port (0 lets the OS pick one, see getPort())
     */
    TransferServer(const DeviceIdentity& localIdentity, uint16_t port = TRANSFER_PORT_DEFAULT);

    ~TransferServer();

    TransferServer(const TransferServer&) = delete;
    TransferServer& operator=(const TransferServer&) = delete;
    TransferServer(TransferServer&&) = delete;
    TransferServer& operator=(TransferServer&&) = delete;

    //=========================================================================
    // Server Control Methods
    //=========================================================================

    /**
     * @brief Bind and start accepting
     * @param errorMsg Bind/listen failure reason
     * @return true if listening
     *
     * A listener that is already running is stopped first, so at most one
     * listener exists per server object.
     */
    bool start(std::string& errorMsg);

    /**
     * @brief Stop accepting and wait for in-flight handlers
     *
     * Active client sockets are shut down so blocked handlers return promptly.
     */
    void stop();

    bool isRunning() const { return m_running.load(); }

    /**
     * @brief Bound port (the configured one, or the OS-assigned one for 0)
     * @return 0 when not running
     */
    uint16_t getPort() const { return m_boundPort.load(); }

    size_t getActiveHandlerCount() const { return m_activeHandlerCount.load(); }

    /**
     * @brief Identity served by /discover (port filled in after start() on port 0)
     */
    const DeviceIdentity& localIdentity() const { return m_localIdentity; }

    //=========================================================================
    // Configuration Methods
    //=========================================================================

    void setEnvelopeHandler(EnvelopeHandler handler) { m_envelopeHandler = std::move(handler); }
    void setDiscoveryObserver(DiscoveryObserver observer) { m_discoveryObserver = std::move(observer); }
    void setSessionIdProvider(SessionIdProvider provider) { m_sessionIdProvider = std::move(provider); }
    void setConnectionTimeoutMs(uint32_t timeoutMs) { m_connectionTimeoutMs = timeoutMs; }

    /**
     * @brief Route one request
     * @param method HTTP method name
     * @param target Request target (query string ignored)
     * @param body Request body
     * @param remoteIp Peer address
     *
     * Exposed so routing can be exercised without sockets.
     */
    HttpReply route(const std::string& method, const std::string& target,
                    const std::string& body, const std::string& remoteIp) const;

private:
    struct ClientConnection;

    void listenerThreadFunc();
    void handleClient(ClientConnection& conn);
    void closeAcceptor();

    HttpReply handleDiscover(const std::string& method, const std::string& body,
                             const std::string& remoteIp) const;
    HttpReply handleTransfer(const std::string& method, const std::string& body) const;
    HttpReply handleHealth(const std::string& method) const;
    HttpReply errorReply(int status, const std::string& message) const;
    std::string currentSessionId() const;

    //=========================================================================
    // Member Variables
    //=========================================================================

    // Configuration
    DeviceIdentity m_localIdentity;
    uint16_t m_port;
    uint32_t m_connectionTimeoutMs;

    // Acceptor (pimpl keeps Asio out of this header)
    struct Acceptor;
    std::unique_ptr<Acceptor> m_acceptor;
    std::atomic<uint16_t> m_boundPort;

    // Threads
    std::thread m_listenerThread;

    // Client handler tracking
    std::mutex m_activeClientsMutex;
    std::unordered_set<int> m_activeClientSockets;   ///< Native handles of live connections
    std::atomic<size_t> m_activeHandlerCount;
    std::condition_variable m_activeClientsCv;
    std::mutex m_activeClientsCvMutex;

    // Control flags
    std::atomic<bool> m_running;
    std::atomic<bool> m_stopRequested;

    // Callbacks
    EnvelopeHandler m_envelopeHandler;
    DiscoveryObserver m_discoveryObserver;
    SessionIdProvider m_sessionIdProvider;
};

}  // namespace SmsBridge
