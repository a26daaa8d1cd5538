#include "rup/core/config.hpp"

#include "rup/protocol/checksum.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>

namespace rup::config {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Result<json> read_json_file(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<json>(std::string("Cannot open config file: ") + path.string());
    }
    auto document = json::parse(input, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return Err<json>(std::string("Config file is not a JSON object: ") + path.string());
    }
    return Ok(std::move(document));
}

void read_log_options(const json& j, logging::LogOptions& log) {
    if (!j.contains("log") || !j["log"].is_object()) {
        return;
    }
    const auto& section = j["log"];
    log.level = section.value("level", log.level);
    log.pattern = section.value("pattern", log.pattern);
    log.file = section.value("file", log.file);
    log.max_file_size = section.value("max_file_size", log.max_file_size);
    log.max_files = section.value("max_files", log.max_files);
}

} // namespace

Result<ServerConfig> load_server_config(const fs::path& path) {
    auto document = read_json_file(path);
    if (document.is_error()) {
        return Err<ServerConfig>(document.error());
    }
    const auto& j = document.value();

    ServerConfig config;
    try {
        config.port = j.value("port", config.port);
        config.workers = j.value("workers", config.workers);
        config.max_upload_size = j.value("max_upload_size", config.max_upload_size);
        config.session_ttl = std::chrono::seconds(
            j.value("session_ttl_seconds", static_cast<std::int64_t>(config.session_ttl.count())));
        config.sweep_interval = std::chrono::seconds(
            j.value("sweep_interval_seconds", static_cast<std::int64_t>(config.sweep_interval.count())));
        config.data_root = j.value("data_root", config.data_root.string());
        config.base_path = j.value("base_path", config.base_path);
        config.public_url = j.value("public_url", config.public_url);
        if (j.contains("tokens") && j["tokens"].is_object()) {
            for (const auto& [token, owner] : j["tokens"].items()) {
                config.tokens[token] = owner.get<std::string>();
            }
        }
        read_log_options(j, config.log);
    } catch (const json::exception& e) {
        return Err<ServerConfig>(std::string("Invalid server config: ") + e.what());
    }

    if (auto valid = validate(config); valid.is_error()) {
        return Err<ServerConfig>(valid.error());
    }
    spdlog::debug("Loaded server config from {}", path.string());
    return Ok(std::move(config));
}

Result<ClientConfig> load_client_config(const fs::path& path) {
    auto document = read_json_file(path);
    if (document.is_error()) {
        return Err<ClientConfig>(document.error());
    }
    const auto& j = document.value();

    ClientConfig config;
    try {
        config.host = j.value("host", config.host);
        config.port = j.value("port", config.port);
        config.base_path = j.value("base_path", config.base_path);
        config.token = j.value("token", config.token);
        config.chunk_size = j.value("chunk_size", config.chunk_size);
        config.max_concurrent = j.value("max_concurrent", config.max_concurrent);
        config.max_retries = j.value("max_retries", config.max_retries);
        config.initial_backoff = std::chrono::milliseconds(
            j.value("initial_backoff_ms", static_cast<std::int64_t>(config.initial_backoff.count())));
        config.max_backoff = std::chrono::milliseconds(
            j.value("max_backoff_ms", static_cast<std::int64_t>(config.max_backoff.count())));
        config.request_timeout = std::chrono::milliseconds(
            j.value("request_timeout_ms", static_cast<std::int64_t>(config.request_timeout.count())));
        config.checksum_algorithm = j.value("checksum_algorithm", config.checksum_algorithm);
        config.task_store = j.value("task_store", config.task_store.string());
        read_log_options(j, config.log);
    } catch (const json::exception& e) {
        return Err<ClientConfig>(std::string("Invalid client config: ") + e.what());
    }

    if (auto valid = validate(config); valid.is_error()) {
        return Err<ClientConfig>(valid.error());
    }
    spdlog::debug("Loaded client config from {}", path.string());
    return Ok(std::move(config));
}

Result<void> validate(const ServerConfig& config) {
    if (config.max_upload_size == 0) {
        return Err<void>(std::string("max_upload_size must be > 0"));
    }
    if (config.workers == 0) {
        return Err<void>(std::string("workers must be > 0"));
    }
    if (config.session_ttl.count() <= 0) {
        return Err<void>(std::string("session_ttl_seconds must be > 0"));
    }
    if (config.sweep_interval.count() <= 0) {
        return Err<void>(std::string("sweep_interval_seconds must be > 0"));
    }
    if (config.base_path.empty() || config.base_path.front() != '/') {
        return Err<void>(std::string("base_path must start with '/'"));
    }
    return Ok();
}

Result<void> validate(const ClientConfig& config) {
    if (config.chunk_size == 0) {
        return Err<void>(std::string("chunk_size must be > 0"));
    }
    if (config.max_concurrent == 0) {
        return Err<void>(std::string("max_concurrent must be > 0"));
    }
    if (config.initial_backoff > config.max_backoff) {
        return Err<void>(std::string("initial_backoff_ms must not exceed max_backoff_ms"));
    }
    if (config.base_path.empty() || config.base_path.front() != '/') {
        return Err<void>(std::string("base_path must start with '/'"));
    }
    if (!config.checksum_algorithm.empty() && !protocol::parse_algorithm(config.checksum_algorithm)) {
        return Err<void>("Unsupported checksum_algorithm: " + config.checksum_algorithm);
    }
    return Ok();
}

} // namespace rup::config
