#include "rup/network/http_server_asio.hpp"

#include <spdlog/spdlog.h>

namespace rup {
namespace network {

// ──────────────────────────────────────────────────────────
// HttpConnection Implementation
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket, HttpRequestHandler handler, std::size_t max_body_size)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , parser_(max_body_size) {
}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();  // Keep connection alive during async operation

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                    spdlog::debug("Read error: {}", ec.message());
                }
                return;
            }

            auto parse_result = parser_.parse(buffer_.data(), bytes_transferred);

            if (parse_result.is_error()) {
                if (parser_.body_too_large()) {
                    handle_error(HttpStatus::PAYLOAD_TOO_LARGE, parse_result.error());
                } else {
                    handle_error(HttpStatus::BAD_REQUEST, "Parse error: " + parse_result.error());
                }
                return;
            }

            if (!parse_result.value()) {
                // Need more data - continue reading
                do_read();
                return;
            }

            HttpRequest request = parser_.take_request();

            spdlog::debug("{} {} ({} body bytes)",
                HttpMethodUtils::to_string(request.method),
                request.url,
                request.body.size());

            HttpResponse response;
            try {
                response = handler_(request);
            } catch (const std::exception& e) {
                spdlog::error("Handler threw exception: {}", e.what());
                response = create_error_response(
                    HttpStatus::INTERNAL_SERVER_ERROR,
                    "Internal server error"
                );
            }

            do_write(response);
        }
    );
}

void HttpConnection::do_write(const HttpResponse& response) {
    auto self = shared_from_this();  // Keep connection alive during async write

    auto data_ptr = std::make_shared<std::vector<uint8_t>>(response.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*data_ptr),
        [this, self, data_ptr](boost::system::error_code ec, size_t bytes_transferred) {
            if (!ec) {
                spdlog::trace("Sent {} bytes", bytes_transferred);

                boost::system::error_code shutdown_ec;
                socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
            } else if (ec != asio::error::operation_aborted) {
                spdlog::debug("Write error: {}", ec.message());
            }
        }
    );
}

void HttpConnection::handle_error(HttpStatus status, const std::string& message) {
    spdlog::warn("Connection error: {}", message);
    do_write(create_error_response(status, message));
}

HttpResponse HttpConnection::create_error_response(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_body(message);
    response.set_header("Content-Type", "text/plain");
    response.set_header("Connection", "close");
    return response;
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio Implementation
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(uint16_t port, std::size_t workers, std::size_t max_body_size)
    : acceptor_(io_context_, tcp::endpoint(tcp::v4(), port))
    , port_(acceptor_.local_endpoint().port())
    , workers_(workers == 0 ? 1 : workers)
    , max_body_size_(max_body_size) {
}

HttpServerAsio::~HttpServerAsio() {
    stop();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServerAsio::start() {
    if (running_) {
        return;
    }
    running_ = true;

    do_accept();

    threads_.reserve(workers_);
    for (std::size_t i = 0; i < workers_; ++i) {
        threads_.emplace_back([this] { io_context_.run(); });
    }

    spdlog::info("HTTP server (Asio, {} workers) listening on port {}", workers_, port_);
}

void HttpServerAsio::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    boost::system::error_code ec;
    acceptor_.close(ec);
    io_context_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    spdlog::debug("HTTP server on port {} stopped", port_);
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!ec) {
                std::make_shared<HttpConnection>(
                    std::move(socket),
                    handler_,
                    max_body_size_
                )->start();
            } else if (ec == asio::error::operation_aborted) {
                return;
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }

            do_accept();
        }
    );
}

} // namespace network
} // namespace rup
