#include "rup/client/task_store.hpp"
#include "rup/client/tus_client.hpp"
#include "rup/client/upload_queue.hpp"
#include "rup/core/config.hpp"
#include "rup/core/logging.hpp"
#include "rup/network/http_client.hpp"
#include "rup/protocol/checksum.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using rup::client::TaskStatus;
using rup::client::UploadTask;

namespace fs = std::filesystem;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_interrupted = 1;
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <file>...\n"
              << "  -c, --config <file>   JSON configuration file\n"
              << "  -H, --host <host>     Server host (default 127.0.0.1)\n"
              << "  -p, --port <port>     Server port (default 1080)\n"
              << "  -t, --token <token>   Bearer token\n"
              << "  -s, --state <file>    Task store (default upload_tasks.json)\n"
              << "      --list            Print stored tasks and exit\n"
              << "  -v, --verbose         Debug logging\n"
              << "Files already in the task store resume where the server left them.\n";
}

void print_task(const UploadTask& task) {
    std::cout << task.id << "  " << rup::client::to_string(task.status) << "  "
              << task.bytes_transferred << "/" << task.declared_size << "  "
              << task.file_reference.string();
    if (!task.last_error.empty()) {
        std::cout << "  (" << task.last_error << ")";
    }
    std::cout << "\n";
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

    rup::config::ClientConfig config;
    if (!config_path.empty()) {
        auto loaded = rup::config::load_client_config(config_path);
        if (loaded.is_error()) {
            std::cerr << loaded.error() << std::endl;
            return 1;
        }
        config = loaded.value();
    }

    bool list_only = false;
    std::vector<fs::path> files;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            ++i;
        } else if ((arg == "-H" || arg == "--host") && i + 1 < argc) {
            config.host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            try {
                config.port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                return 1;
            }
        } else if ((arg == "-t" || arg == "--token") && i + 1 < argc) {
            config.token = argv[++i];
        } else if ((arg == "-s" || arg == "--state") && i + 1 < argc) {
            config.task_store = fs::path(argv[++i]);
        } else if (arg == "--list") {
            list_only = true;
        } else if (arg == "-v" || arg == "--verbose") {
            config.log.level = "debug";
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else {
            files.emplace_back(arg);
        }
    }

    auto valid = rup::config::validate(config);
    if (valid.is_error()) {
        std::cerr << "Invalid configuration: " << valid.error() << std::endl;
        return 1;
    }
    rup::logging::configure(config.log);

    rup::client::QueueOptions options;
    options.max_concurrent = config.max_concurrent;
    options.engine.chunk_size = config.chunk_size;
    options.engine.max_retries = config.max_retries;
    options.engine.initial_backoff = config.initial_backoff;
    options.engine.max_backoff = config.max_backoff;
    options.engine.checksum_algorithm = config.checksum_algorithm.empty()
        ? std::nullopt
        : rup::protocol::parse_algorithm(config.checksum_algorithm);

    rup::network::AsioHttpTransport transport(config.host, config.port, config.request_timeout);
    rup::client::TusClient client(transport, config.base_path, config.token);
    rup::client::TaskStore store(config.task_store);
    rup::client::UploadQueue queue(store, client, options);

    auto restored = queue.restore();
    if (restored.is_error()) {
        spdlog::error("Cannot restore upload queue: {}", restored.error());
        return 1;
    }

    if (list_only) {
        for (const auto& task : queue.snapshot()) {
            print_task(task);
        }
        return 0;
    }

    auto capabilities = client.discover();
    if (capabilities.is_error()) {
        spdlog::warn("Server discovery failed: {}", capabilities.error().message);
    } else {
        spdlog::info("Server speaks TUS {} (max size {}, checksums: {})",
                     capabilities.value().version, capabilities.value().max_size,
                     capabilities.value().checksum_algorithms.size());
    }

    // Known files resume through the stored task rather than being queued twice
    auto known = queue.snapshot();
    for (const auto& file : files) {
        std::error_code ec;
        const fs::path absolute = fs::absolute(file, ec);
        bool already_queued = false;
        for (const auto& task : known) {
            if (!task.is_terminal() && task.file_reference == absolute) {
                already_queued = true;
                if (task.status == TaskStatus::Failed) {
                    auto retried = queue.retry(task.id);
                    if (retried.is_error()) {
                        spdlog::warn("{}", retried.error());
                    }
                } else if (task.status == TaskStatus::Paused) {
                    auto resumed = queue.resume(task.id);
                    if (resumed.is_error()) {
                        spdlog::warn("{}", resumed.error());
                    }
                }
            }
        }
        if (already_queued) {
            continue;
        }
        auto queued = queue.enqueue(file);
        if (queued.is_error()) {
            spdlog::error("{}", queued.error());
        }
    }

    queue.set_progress_callback([](const UploadTask& task) {
        spdlog::info("{} {} {:.1f}%", task.file_reference.filename().string(),
                     rup::client::to_string(task.status), task.progress());
    });

    std::signal(SIGINT, signal_handler);
    queue.start();

    while (!g_interrupted && !queue.wait_idle(std::chrono::milliseconds(200))) {
    }

    queue.stop();

    int failures = 0;
    for (const auto& task : queue.snapshot()) {
        print_task(task);
        if (task.status == TaskStatus::Failed) {
            ++failures;
        }
    }
    return failures == 0 ? 0 : 2;
}
