/**
 * @file TransferServer.cpp
 * @brief HTTP listener serving the discovery, transfer and health endpoints
 */

#include "smsbridge/TransferServer.h"
#include "smsbridge/Debug.h"
#include "smsbridge/ErrorCodes.h"
#include "smsbridge/ThreadSafeLog.h"
#include "smsbridge/Timestamp.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <chrono>
#include <sys/socket.h>
#include <system_error>

namespace SmsBridge {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

//=============================================================================
// Private types
//=============================================================================

struct TransferServer::Acceptor {
    net::io_context ioc;
    tcp::acceptor acceptor{ioc};
};

// Each connection runs on its own io_context so its deadline and
// shutdown never depend on other handlers
struct TransferServer::ClientConnection {
    net::io_context ioc;
    beast::tcp_stream stream{ioc};
    std::string remoteIp;
};

namespace {

http::response<http::string_body> buildResponse(const HttpReply& reply, unsigned version) {
    http::response<http::string_body> res{static_cast<http::status>(reply.status), version};
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type");
    if (!reply.body.empty()) {
        res.set(http::field::content_type, "application/json");
    }
    res.keep_alive(false);
    res.body() = reply.body;
    res.prepare_payload();
    return res;
}

} // anonymous namespace

//=============================================================================
// Constructor / Destructor
//=============================================================================

TransferServer::TransferServer(const DeviceIdentity& localIdentity, uint16_t port)
    : m_localIdentity(localIdentity)
    , m_port(port)
    , m_connectionTimeoutMs(CONNECTION_TIMEOUT_MS)
    , m_boundPort(0)
    , m_activeHandlerCount(0)
    , m_running(false)
    , m_stopRequested(false)
{
}

TransferServer::~TransferServer() {
    stop();
}

//=============================================================================
// TransferServer: start()
//=============================================================================

bool TransferServer::start(std::string& errorMsg) {
    errorMsg.clear();

    // At most one listener: replace a running one
    if (m_running.load()) {
        stop();
    }

    auto acceptor = std::make_unique<Acceptor>();
    beast::error_code ec;
    const tcp::endpoint endpoint(net::ip::make_address_v4(LISTEN_ADDRESS), m_port);

    acceptor->acceptor.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor->acceptor.set_option(net::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor->acceptor.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor->acceptor.listen(net::socket_base::max_listen_connections, ec);
    }
    if (!ec) {
        acceptor->acceptor.non_blocking(true, ec);
    }
    if (ec) {
        errorMsg = std::string(ErrorCodes::LISTENER_BIND_FAILED) + ": cannot listen on " +
                   LISTEN_ADDRESS + ":" + std::to_string(m_port) + ": " + ec.message();
        LOG_ERROR("[TransferServer] " << errorMsg);
        return false;
    }

    const tcp::endpoint local = acceptor->acceptor.local_endpoint(ec);
    m_boundPort.store(ec ? m_port : local.port());
    m_acceptor = std::move(acceptor);

    // Advertise the OS-assigned port when bound to port 0
    if (m_port == 0) {
        m_localIdentity.port = m_boundPort.load();
    }

    m_stopRequested.store(false);
    m_running.store(true);
    m_listenerThread = std::thread(&TransferServer::listenerThreadFunc, this);

    LOG_INFO("[TransferServer] Listening on " << LISTEN_ADDRESS << ":" << m_boundPort.load());
    ThreadSafeLog::log("TransferServer: listening on port " + std::to_string(m_boundPort.load()));
    return true;
}

//=============================================================================
// TransferServer: stop()
//=============================================================================

void TransferServer::stop() {
    if (!m_running.load()) {
        return;
    }

    ThreadSafeLog::log("=== TransferServer::stop START ===");

    m_stopRequested.store(true);

    // Listener polls the stop flag between accept attempts
    if (m_listenerThread.joinable()) {
        m_listenerThread.join();
    }
    closeAcceptor();

    // Unblock handlers still reading or writing
    {
        std::lock_guard<std::mutex> lock(m_activeClientsMutex);
        for (int fd : m_activeClientSockets) {
            (void)::shutdown(fd, SHUT_RDWR);
        }
    }

    {
        std::unique_lock<std::mutex> lock(m_activeClientsCvMutex);
        m_activeClientsCv.wait(lock, [this]() {
            return m_activeHandlerCount.load(std::memory_order_acquire) == 0;
        });
    }

    m_acceptor.reset();
    m_boundPort.store(0);
    m_running.store(false);

    LOG_INFO("[TransferServer] Stopped");
    ThreadSafeLog::log("=== TransferServer::stop END ===");
}

void TransferServer::closeAcceptor() {
    if (!m_acceptor) {
        return;
    }
    beast::error_code ec;
    m_acceptor->acceptor.close(ec);
}

//=============================================================================
// TransferServer: listenerThreadFunc()
//=============================================================================

void TransferServer::listenerThreadFunc() {
    std::unique_ptr<ClientConnection> pending;

    while (!m_stopRequested.load()) {
        if (!pending) {
            pending = std::make_unique<ClientConnection>();
        }

        beast::error_code ec;
        m_acceptor->acceptor.accept(pending->stream.socket(), ec);

        if (ec) {
            if (m_stopRequested.load()) {
                break;
            }
            if (ec != net::error::would_block && ec != net::error::try_again) {
                LOG_DEBUG("[TransferServer] accept failed: " << ec.message());
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(ACCEPT_POLL_INTERVAL_MS));
            continue;
        }

        std::unique_ptr<ClientConnection> conn = std::move(pending);

        const tcp::endpoint remote = conn->stream.socket().remote_endpoint(ec);
        conn->remoteIp = ec ? std::string("unknown") : remote.address().to_string();

        // Cap concurrent handler threads before spawning
        size_t prev = m_activeHandlerCount.load(std::memory_order_relaxed);
        bool admitted = false;
        while (prev < MAX_CONCURRENT_HANDLER_THREADS) {
            if (m_activeHandlerCount.compare_exchange_weak(
                    prev, prev + 1, std::memory_order_acq_rel, std::memory_order_relaxed)) {
                admitted = true;
                break;
            }
        }
        if (!admitted) {
            LOG_WARNING("[TransferServer] Handler limit reached, dropping connection from " << conn->remoteIp);
            continue;  // conn closes the socket
        }

        const int fd = conn->stream.socket().native_handle();
        {
            std::lock_guard<std::mutex> lock(m_activeClientsMutex);
            m_activeClientSockets.insert(fd);
        }

        auto finishHandler = [this, fd]() {
            {
                std::lock_guard<std::mutex> lock(m_activeClientsMutex);
                m_activeClientSockets.erase(fd);
            }
            {
                std::lock_guard<std::mutex> lock(m_activeClientsCvMutex);
                m_activeHandlerCount.fetch_sub(1, std::memory_order_acq_rel);
            }
            m_activeClientsCv.notify_all();
        };

        try {
            std::thread clientThread([this, finishHandler, c = std::move(conn)]() mutable {
                try {
                    this->handleClient(*c);
                } catch (const std::exception& e) {
                    LOG_ERROR("[TransferServer] handler exception: " << e.what());
                    ThreadSafeLog::log(std::string("=== handleClient: UNCAUGHT EXCEPTION === ") + e.what());
                }
                // Untrack before the socket closes so stop() never shuts down a reused fd
                finishHandler();
                c.reset();
            });
            clientThread.detach();
        } catch (const std::system_error& e) {
            LOG_ERROR("[TransferServer] cannot spawn handler thread: " << e.what());
            finishHandler();
        }
    }
}

//=============================================================================
// TransferServer: handleClient()
//=============================================================================

void TransferServer::handleClient(ClientConnection& conn) {
    beast::flat_buffer buffer;
    http::request_parser<http::string_body> parser;
    parser.body_limit(MAX_REQUEST_BODY_BYTES);
    http::response<http::string_body> response;

    conn.stream.expires_after(std::chrono::milliseconds(m_connectionTimeoutMs));

    http::async_read(conn.stream, buffer, parser, [&](beast::error_code ec, std::size_t) {
        HttpReply reply;
        unsigned version = 11;

        if (ec == http::error::body_limit) {
            reply = errorReply(413, "request body too large");
        } else if (ec) {
            if (ec != http::error::end_of_stream) {
                LOG_DEBUG("[TransferServer] read from " << conn.remoteIp << " failed: " << ec.message());
            }
            return;
        } else {
            const auto& req = parser.get();
            version = req.version();
            try {
                reply = route(std::string(req.method_string()), std::string(req.target()),
                              req.body(), conn.remoteIp);
            } catch (const std::exception& e) {
                LOG_ERROR("[TransferServer] " << req.target() << " handler failed: " << e.what());
                reply = errorReply(500, std::string("internal error: ") + e.what());
            }
        }

        response = buildResponse(reply, version);
        http::async_write(conn.stream, response, [&](beast::error_code writeEc, std::size_t) {
            if (writeEc) {
                LOG_DEBUG("[TransferServer] write to " << conn.remoteIp << " failed: " << writeEc.message());
            }
        });
    });

    conn.ioc.run();

    beast::error_code ec;
    conn.stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

//=============================================================================
// Routing
//=============================================================================

HttpReply TransferServer::route(const std::string& method, const std::string& target,
                                const std::string& body, const std::string& remoteIp) const {
    const std::string path = target.substr(0, target.find('?'));
    const bool known = (path == DISCOVERY_PATH || path == TRANSFER_PATH || path == HEALTH_PATH);

    if (!known) {
        return errorReply(404, "no route for " + path);
    }
    if (method == "OPTIONS") {
        return HttpReply{200, std::string()};
    }
    if (path == DISCOVERY_PATH) {
        return handleDiscover(method, body, remoteIp);
    }
    if (path == TRANSFER_PATH) {
        return handleTransfer(method, body);
    }
    return handleHealth(method);
}

HttpReply TransferServer::handleDiscover(const std::string& method, const std::string& body,
                                         const std::string& remoteIp) const {
    if (method == "GET") {
        return HttpReply{200, MessageEnvelope::discoveryResponse(currentSessionId(), m_localIdentity).toJsonString()};
    }
    if (method != "POST") {
        return errorReply(405, "method " + method + " not allowed on " + DISCOVERY_PATH);
    }

    MessageEnvelope envelope;
    std::string err;
    if (!MessageEnvelope::fromJsonString(body, envelope, err)) {
        LOG_DEBUG("[TransferServer] bad discovery body from " << remoteIp << ": " << err);
        return errorReply(400, err);
    }
    if (envelope.type() != EnvelopeType::DISCOVERY) {
        return errorReply(400, std::string("expected DISCOVERY envelope, got ") +
                               envelopeTypeToString(envelope.type()));
    }

    const DeviceIdentity* peer = envelope.payloadAs<DeviceIdentity>();
    if (peer && m_discoveryObserver) {
        m_discoveryObserver(*peer, envelope.sessionId(), remoteIp);
    }

    return HttpReply{200, MessageEnvelope::discoveryResponse(currentSessionId(), m_localIdentity).toJsonString()};
}

HttpReply TransferServer::handleTransfer(const std::string& method, const std::string& body) const {
    if (method != "POST") {
        return errorReply(405, "method " + method + " not allowed on " + TRANSFER_PATH);
    }

    MessageEnvelope envelope;
    std::string err;
    if (!MessageEnvelope::fromJsonString(body, envelope, err)) {
        return errorReply(400, err);
    }
    if (envelope.type() == EnvelopeType::DISCOVERY || envelope.type() == EnvelopeType::DISCOVERY_RESPONSE) {
        return errorReply(400, std::string(envelopeTypeToString(envelope.type())) +
                               " is not accepted on " + TRANSFER_PATH);
    }
    if (!m_envelopeHandler) {
        return errorReply(503, "no active session");
    }

    const EnvelopeDisposition disposition = m_envelopeHandler(envelope);
    switch (disposition.outcome) {
        case EnvelopeDisposition::Outcome::Accepted:
            return HttpReply{200, makeAck("received", envelope.sessionId()).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)};
        case EnvelopeDisposition::Outcome::SessionMismatch:
            return errorReply(403, disposition.errorMsg);
        case EnvelopeDisposition::Outcome::Rejected:
        default:
            return errorReply(409, disposition.errorMsg);
    }
}

HttpReply TransferServer::handleHealth(const std::string& method) const {
    if (method != "GET") {
        return errorReply(405, "method " + method + " not allowed on " + HEALTH_PATH);
    }
    nlohmann::json j;
    j["status"] = "healthy";
    j["timestamp"] = nowIso8601();
    return HttpReply{200, j.dump()};
}

HttpReply TransferServer::errorReply(int status, const std::string& message) const {
    return HttpReply{status, MessageEnvelope::error(currentSessionId(), message).toJsonString()};
}

std::string TransferServer::currentSessionId() const {
    return m_sessionIdProvider ? m_sessionIdProvider() : std::string();
}

}  // namespace SmsBridge
