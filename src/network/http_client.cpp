#include "rup/network/http_client.hpp"

#include "rup/network/http_parser.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <memory>

namespace rup {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

/**
 * @brief State of one request/response exchange driven by the io_context
 */
struct Exchange : std::enable_shared_from_this<Exchange> {
    Exchange(asio::io_context& io, std::vector<uint8_t> payload, bool head_request)
        : resolver(io), socket(io), request_bytes(std::move(payload)) {
        if (head_request) {
            parser.expect_no_body();
        }
    }

    tcp::resolver resolver;
    tcp::socket socket;
    std::vector<uint8_t> request_bytes;
    std::array<char, 16 * 1024> buffer{};
    HttpResponseParser parser;
    std::string error;
    bool done = false;

    void fail(const std::string& message) {
        if (!done) {
            error = message;
            done = true;
        }
        resolver.cancel();
        boost::system::error_code ignored;
        socket.close(ignored);
    }

    void start(const std::string& host, const std::string& port) {
        auto self = shared_from_this();
        resolver.async_resolve(host, port,
            [this, self](boost::system::error_code ec, tcp::resolver::results_type endpoints) {
                if (ec) {
                    fail("resolve failed: " + ec.message());
                    return;
                }
                asio::async_connect(socket, endpoints,
                    [this, self](boost::system::error_code connect_ec, const tcp::endpoint&) {
                        if (connect_ec) {
                            fail("connect failed: " + connect_ec.message());
                            return;
                        }
                        do_write();
                    });
            });
    }

    void do_write() {
        auto self = shared_from_this();
        asio::async_write(socket, asio::buffer(request_bytes),
            [this, self](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    fail("write failed: " + ec.message());
                    return;
                }
                do_read();
            });
    }

    void do_read() {
        auto self = shared_from_this();
        socket.async_read_some(asio::buffer(buffer),
            [this, self](boost::system::error_code ec, std::size_t n) {
                if (ec) {
                    // A server that omits Content-Length ends the body by closing.
                    if (ec == asio::error::eof && parser.headers_complete()) {
                        done = true;
                        return;
                    }
                    fail("read failed: " + ec.message());
                    return;
                }
                auto parsed = parser.parse(buffer.data(), n);
                if (parsed.is_error()) {
                    fail(parsed.error());
                    return;
                }
                if (parsed.value()) {
                    done = true;
                    boost::system::error_code ignored;
                    socket.shutdown(tcp::socket::shutdown_both, ignored);
                    return;
                }
                do_read();
            });
    }
};

} // namespace

AsioHttpTransport::AsioHttpTransport(std::string host, std::uint16_t port,
                                     std::chrono::milliseconds timeout)
    : host_(std::move(host)), port_(port), timeout_(timeout) {
}

Result<HttpResponse> AsioHttpTransport::send(const HttpRequest& request) {
    HttpRequest outgoing = request;
    if (!outgoing.has_header("Host")) {
        outgoing.set_header("Host", host_ + ":" + std::to_string(port_));
    }
    outgoing.set_header("Connection", "close");

    asio::io_context io;
    auto exchange = std::make_shared<Exchange>(io, outgoing.serialize(),
                                               request.method == HttpMethod::HEAD);
    exchange->start(host_, std::to_string(port_));

    io.run_for(timeout_);

    if (!exchange->done) {
        exchange->fail("timed out after " + std::to_string(timeout_.count()) + "ms");
        io.restart();
        io.poll();
    }

    if (!exchange->error.empty()) {
        spdlog::debug("{} {} -> transport error: {}",
                      HttpMethodUtils::to_string(request.method), request.url, exchange->error);
        return Err<HttpResponse, std::string>(exchange->error);
    }

    HttpResponse response = exchange->parser.get_response();
    spdlog::debug("{} {} -> {}", HttpMethodUtils::to_string(request.method), request.url,
                  response.status_code);
    return Ok(std::move(response));
}

} // namespace network
} // namespace rup
