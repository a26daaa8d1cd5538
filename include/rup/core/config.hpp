#pragma once

#include "rup/core/logging.hpp"
#include "rup/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>

namespace rup::config {

/**
 * @brief Server-side settings
 *
 * Every field has a default; a JSON file may override any subset of them and
 * command-line flags are applied last by the program entry point.
 *
 * JSON layout (all keys optional):
 * {
 *   "port": 1080, "workers": 4, "max_upload_size": 524288000,
 *   "session_ttl_seconds": 86400, "sweep_interval_seconds": 300,
 *   "data_root": "./upload_data", "base_path": "/files", "public_url": "",
 *   "tokens": {"<bearer token>": "<owner id>"},
 *   "log": {"level": "info", "file": ""}
 * }
 */
struct ServerConfig {
    std::uint16_t port = 1080;
    std::size_t workers = 4;
    std::uint64_t max_upload_size = 500ULL * 1024 * 1024;
    std::chrono::seconds session_ttl{24 * 60 * 60};
    std::chrono::seconds sweep_interval{5 * 60};
    std::filesystem::path data_root = "upload_data";
    std::string base_path = "/files";
    std::string public_url;                                      ///< Prefix for Location headers
    std::unordered_map<std::string, std::string> tokens;         ///< bearer token -> owner id
    logging::LogOptions log;

    std::filesystem::path storage_root() const { return data_root / "storage"; }
    std::filesystem::path sessions_root() const { return data_root / "sessions"; }
};

/**
 * @brief Client-side settings for the upload queue and transfer engine
 */
struct ClientConfig {
    std::string host = "127.0.0.1";
    std::uint16_t port = 1080;
    std::string base_path = "/files";
    std::string token;
    std::uint64_t chunk_size = 5ULL * 1024 * 1024;
    std::size_t max_concurrent = 2;
    std::uint32_t max_retries = 5;
    std::chrono::milliseconds initial_backoff{1000};
    std::chrono::milliseconds max_backoff{30000};
    std::chrono::milliseconds request_timeout{30000};
    std::string checksum_algorithm = "sha256";                   ///< Empty disables chunk checksums
    std::filesystem::path task_store = "upload_tasks.json";
    logging::LogOptions log;
};

Result<ServerConfig> load_server_config(const std::filesystem::path& path);
Result<ClientConfig> load_client_config(const std::filesystem::path& path);

Result<void> validate(const ServerConfig& config);
Result<void> validate(const ClientConfig& config);

} // namespace rup::config
