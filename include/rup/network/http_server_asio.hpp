#pragma once

#include "rup/network/http_parser.hpp"
#include "rup/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace rup {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief Per-connection handler for async HTTP requests
 *
 * Each accepted connection gets its own HttpConnection object that manages
 * the async I/O for that connection. Uses enable_shared_from_this to keep
 * the connection alive while async operations are pending.
 *
 * Lifecycle:
 * 1. Created when connection is accepted
 * 2. start() begins async read operation
 * 3. Callbacks handle data arrival and parsing
 * 4. One response is written, then the socket is shut down
 *
 * A request whose Content-Length exceeds the body limit is answered with
 * 413 as soon as its headers have been read; the body is never buffered.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler, std::size_t max_body_size);

    void start();

private:
    void do_read();
    void do_write(const HttpResponse& response);
    void handle_error(HttpStatus status, const std::string& message);

    HttpResponse create_error_response(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 64 * 1024> buffer_;
};

/**
 * @brief Event-driven HTTP server using Boost.Asio
 *
 * The server owns its io_context and a fixed set of worker threads that all
 * call io_context::run(). Handlers are therefore invoked concurrently for
 * different connections; the upload session manager serializes work per
 * session, so requests for different uploads proceed in parallel.
 *
 * Usage:
 * ```cpp
 * HttpServerAsio server(1080, 4, 64 * 1024 * 1024);
 * server.set_handler([&router](const HttpRequest& req) {
 *     return router.handle_request(req);
 * });
 * server.start();
 * // ...
 * server.stop();
 * ```
 */
class HttpServerAsio {
public:
    /**
     * @param port Port to listen on (0 picks an ephemeral port)
     * @param workers Number of threads running the event loop
     * @param max_body_size Largest accepted request body in bytes
     */
    HttpServerAsio(uint16_t port, std::size_t workers, std::size_t max_body_size);
    ~HttpServerAsio();

    HttpServerAsio(const HttpServerAsio&) = delete;
    HttpServerAsio& operator=(const HttpServerAsio&) = delete;

    /**
     * @brief Set the request handler function
     *
     * Must be called before start(). The handler is called from worker threads.
     */
    void set_handler(HttpRequestHandler handler);

    void start();

    /**
     * @brief Stop accepting, abort pending I/O and join the workers
     */
    void stop();

    /**
     * @brief Get the listening port (the bound one when constructed with 0)
     */
    uint16_t get_port() const { return port_; }

    bool is_running() const { return running_; }

private:
    void do_accept();

    asio::io_context io_context_;
    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    uint16_t port_;
    std::size_t workers_;
    std::size_t max_body_size_;
    std::vector<std::thread> threads_;
    bool running_ = false;
};

} // namespace network
} // namespace rup
