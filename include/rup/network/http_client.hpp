#pragma once

#include "rup/core/result.hpp"
#include "rup/network/http_types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace rup {
namespace network {

/**
 * @brief Sends one HTTP request and returns the peer's response
 *
 * Errors are transport failures only (resolve, connect, timeout, malformed
 * response). Any status code the server sends back is a successful result.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

/**
 * @brief Blocking HTTP/1.1 client over Boost.Asio, one connection per request
 *
 * Each call resolves, connects, writes the serialized request and reads the
 * response until the parser reports completion or the server closes. The
 * whole exchange is bounded by the configured timeout.
 *
 * Safe to use from several threads; each call has its own io_context.
 */
class AsioHttpTransport : public HttpTransport {
public:
    AsioHttpTransport(std::string host, std::uint16_t port,
                      std::chrono::milliseconds timeout = std::chrono::seconds(30));

    Result<HttpResponse> send(const HttpRequest& request) override;

    const std::string& host() const { return host_; }
    std::uint16_t port() const { return port_; }

private:
    std::string host_;
    std::uint16_t port_;
    std::chrono::milliseconds timeout_;
};

} // namespace network
} // namespace rup
