/**
 * @file HttpClient.cpp
 * @brief Boost.Beast HTTP client with per-request deadline
 */

#include "smsbridge/EnvelopeTransport.h"
#include "smsbridge/config.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <chrono>

namespace SmsBridge {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

HttpResult HttpClient::post(const std::string& host, uint16_t port, const std::string& path,
                            const std::string& body, uint32_t timeoutMs) {
    return request("POST", host, port, path, body, timeoutMs);
}

HttpResult HttpClient::get(const std::string& host, uint16_t port, const std::string& path,
                           uint32_t timeoutMs) {
    return request("GET", host, port, path, std::string(), timeoutMs);
}

HttpResult HttpClient::request(const std::string& method, const std::string& host, uint16_t port,
                               const std::string& path, const std::string& body, uint32_t timeoutMs) {
    HttpResult result;

    beast::error_code ec;
    const auto address = net::ip::make_address_v4(host, ec);
    if (ec) {
        result.errorMsg = "invalid IPv4 address '" + host + "'";
        return result;
    }

    const http::verb verb = http::string_to_verb(method);
    if (verb == http::verb::unknown) {
        result.errorMsg = "unsupported HTTP method '" + method + "'";
        return result;
    }

    net::io_context ioc;
    beast::tcp_stream stream(ioc);

    http::request<http::string_body> req{verb, path, 11};
    req.set(http::field::host, host + ":" + std::to_string(port));
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.keep_alive(false);
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
    }
    req.prepare_payload();

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(MAX_REQUEST_BODY_BYTES);

    beast::error_code opError;
    const char* stage = "connect";

    // One deadline for the whole exchange
    stream.expires_after(std::chrono::milliseconds(timeoutMs));
    stream.async_connect(tcp::endpoint(address, port), [&](beast::error_code connectEc) {
        if (connectEc) {
            opError = connectEc;
            return;
        }
        stage = "write";
        http::async_write(stream, req, [&](beast::error_code writeEc, std::size_t) {
            if (writeEc) {
                opError = writeEc;
                return;
            }
            stage = "read";
            http::async_read(stream, buffer, parser, [&](beast::error_code readEc, std::size_t) {
                opError = readEc;
            });
        });
    });

    try {
        ioc.run();
    } catch (const std::exception& e) {
        result.errorMsg = std::string("request to ") + host + " failed: " + e.what();
        return result;
    }

    if (opError) {
        result.errorMsg = std::string(stage) + " " + host + ":" + std::to_string(port) +
                          path + " failed: " + opError.message();
        return result;
    }

    beast::error_code shutdownEc;
    stream.socket().shutdown(tcp::socket::shutdown_both, shutdownEc);

    const auto& res = parser.get();
    result.status = static_cast<int>(res.result_int());
    result.body = res.body();
    result.ok = (res.result() == http::status::ok);
    if (!result.ok) {
        result.errorMsg = "HTTP " + std::to_string(result.status) + " from " + host + path;
    }
    return result;
}

}  // namespace SmsBridge
