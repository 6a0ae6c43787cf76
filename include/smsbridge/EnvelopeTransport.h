/**
 * @file EnvelopeTransport.h
 * @brief Outbound request abstraction and its HTTP implementation
 */

#pragma once

#include "MessageEnvelope.h"

#include <cstdint>
#include <string>

namespace SmsBridge {

/**
 * @brief Outcome of one outbound request
 *
 * ok is true only for an HTTP 200 answer. For other statuses, status and
 * body are still filled in so callers can surface the peer's ERROR envelope.
 */
struct HttpResult {
    bool ok = false;
    int status = 0;          ///< HTTP status, 0 if no response was received
    std::string body;
    std::string errorMsg;
};

/**
 * @brief Minimal request interface used by the sweep and the sender.
 *
 * Production code uses HttpClient. Tests substitute implementations that
 * delay or fail specific requests.
 */
class EnvelopeTransport {
public:
    virtual ~EnvelopeTransport() = default;

    virtual HttpResult post(const std::string& host, uint16_t port, const std::string& path,
                            const std::string& body, uint32_t timeoutMs) = 0;

    virtual HttpResult get(const std::string& host, uint16_t port, const std::string& path,
                           uint32_t timeoutMs) = 0;

    HttpResult postEnvelope(const std::string& host, uint16_t port, const std::string& path,
                            const MessageEnvelope& envelope, uint32_t timeoutMs) {
        return post(host, port, path, envelope.toJsonString(), timeoutMs);
    }
};

/**
 * @class HttpClient
 * @brief HTTP/1.1 client over Boost.Beast
 *
 * Every request opens a fresh connection and is bounded by a single deadline
 * covering connect, write and read. Safe to use from many threads at once;
 * each call runs its own io_context.
 */
class HttpClient final : public EnvelopeTransport {
public:
    HttpResult post(const std::string& host, uint16_t port, const std::string& path,
                    const std::string& body, uint32_t timeoutMs) override;

    HttpResult get(const std::string& host, uint16_t port, const std::string& path,
                   uint32_t timeoutMs) override;

    /**
     * @brief Issue an arbitrary request
     * @param method "GET", "POST", "OPTIONS", ...
     */
    HttpResult request(const std::string& method, const std::string& host, uint16_t port,
                       const std::string& path, const std::string& body, uint32_t timeoutMs);
};

}  // namespace SmsBridge
