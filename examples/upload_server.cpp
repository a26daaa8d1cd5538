#include "rup/core/clock.hpp"
#include "rup/core/config.hpp"
#include "rup/core/logging.hpp"
#include "rup/events/components.hpp"
#include "rup/events/event_bus.hpp"
#include "rup/events/events.hpp"
#include "rup/network/http_router.hpp"
#include "rup/network/http_server_asio.hpp"
#include "rup/protocol/authenticator.hpp"
#include "rup/protocol/protocol_handler.hpp"
#include "rup/session/expiry_sweeper.hpp"
#include "rup/session/file_session_store.hpp"
#include "rup/session/session_manager.hpp"
#include "rup/storage/filesystem_multipart_store.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>

using rup::network::HttpContext;
using rup::network::HttpMethodUtils;
using rup::network::HttpResponse;
using rup::network::HttpRouter;
using rup::network::HttpServerAsio;

namespace fs = std::filesystem;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  -c, --config <file>   JSON configuration file\n"
              << "  -p, --port <port>     Listen port (default 1080)\n"
              << "  -d, --data <dir>      Data directory for sessions and objects\n"
              << "  -t, --token <t:owner> Accept bearer token t for owner (repeatable)\n"
              << "  -v, --verbose         Debug logging\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        }
    }

    rup::config::ServerConfig config;
    if (!config_path.empty()) {
        auto loaded = rup::config::load_server_config(config_path);
        if (loaded.is_error()) {
            std::cerr << loaded.error() << std::endl;
            return 1;
        }
        config = loaded.value();
    }

    // Flags override the file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            ++i;
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            try {
                config.port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                return 1;
            }
        } else if ((arg == "-d" || arg == "--data") && i + 1 < argc) {
            config.data_root = fs::path(argv[++i]);
        } else if ((arg == "-t" || arg == "--token") && i + 1 < argc) {
            std::string value = argv[++i];
            const auto colon = value.find(':');
            if (colon == std::string::npos || colon == 0 || colon + 1 == value.size()) {
                std::cerr << "Token must look like <token>:<owner>" << std::endl;
                return 1;
            }
            config.tokens[value.substr(0, colon)] = value.substr(colon + 1);
        } else if (arg == "-v" || arg == "--verbose") {
            config.log.level = "debug";
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    auto valid = rup::config::validate(config);
    if (valid.is_error()) {
        std::cerr << "Invalid configuration: " << valid.error() << std::endl;
        return 1;
    }

    rup::logging::configure(config.log);
    if (config.tokens.empty()) {
        spdlog::warn("No bearer tokens configured; every request will be rejected with 401");
    }

    try {
        rup::events::EventBus event_bus;
        rup::events::LoggerComponent logger(event_bus);
        rup::events::MetricsComponent metrics(event_bus);

        rup::SystemClock clock;
        rup::session::FileSessionStore session_store(config.sessions_root());
        rup::storage::FilesystemMultipartStore object_store(config.storage_root());

        rup::session::ManagerOptions manager_options;
        manager_options.max_upload_size = config.max_upload_size;
        manager_options.session_ttl = config.session_ttl;
        rup::session::SessionManager manager(session_store, object_store, clock, event_bus, manager_options);

        rup::session::ExpirySweeper sweeper(
            manager, event_bus,
            std::chrono::duration_cast<std::chrono::milliseconds>(config.sweep_interval));

        rup::protocol::TokenAuthenticator authenticator(config.tokens);
        rup::protocol::HandlerOptions handler_options;
        handler_options.base_path = config.base_path;
        handler_options.public_url = config.public_url;
        rup::protocol::ProtocolHandler handler(manager, authenticator, handler_options);

        HttpRouter router;
        router.use([](const HttpContext& ctx, HttpResponse&) {
            spdlog::debug("{} {}", HttpMethodUtils::to_string(ctx.request.method), ctx.request.url);
            return true;
        });
        handler.register_routes(router);
        for (const auto& route : router.list_routes()) {
            spdlog::debug("Route: {}", route);
        }

        // No single request may carry more than a whole upload
        HttpServerAsio server(config.port, config.workers,
                              static_cast<std::size_t>(config.max_upload_size));
        server.set_handler([&router](const rup::network::HttpRequest& request) {
            return router.handle_request(request);
        });

        // Expired sessions left over from the previous run go first
        sweeper.run_once();
        sweeper.start();
        server.start();
        event_bus.emit(rup::events::ServerStartedEvent{server.get_port()});

        spdlog::info("Upload endpoint: http://localhost:{}{}", server.get_port(), config.base_path);
        spdlog::info("Data directory: {}", fs::absolute(config.data_root).string());
        spdlog::info("Press Ctrl+C to stop");

        boost::asio::io_context signals_io;
        boost::asio::signal_set signals(signals_io, SIGINT, SIGTERM);
        std::string reason = "signal";
        signals.async_wait([&reason](const boost::system::error_code& ec, int signal_number) {
            if (!ec) {
                reason = signal_number == SIGINT ? "SIGINT" : "SIGTERM";
            }
        });
        signals_io.run();

        event_bus.emit(rup::events::ServerShuttingDownEvent{reason});
        server.stop();
        sweeper.stop();
        metrics.print_stats();

        spdlog::info("Server shut down cleanly");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Server error: {}", e.what());
        return 1;
    }
}
