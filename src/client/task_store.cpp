#include "rup/client/task_store.hpp"

#include "rup/core/ids.hpp"
#include "rup/protocol/tus.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

namespace rup::client {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Paths and metadata are raw bytes; base64 keeps them intact in JSON.
std::string encode_bytes(const std::string& value) {
    return protocol::tus::base64_encode(value);
}

std::string decode_bytes(const std::string& value) {
    auto decoded = protocol::tus::base64_decode(value);
    if (!decoded) {
        throw std::runtime_error("invalid base64 field");
    }
    return std::string(decoded->begin(), decoded->end());
}

json task_to_json(const UploadTask& task) {
    json metadata = json::object();
    for (const auto& [key, value] : task.metadata) {
        metadata[encode_bytes(key)] = encode_bytes(value);
    }

    json item = {
        {"id", task.id},
        {"session_url", task.session_url},
        {"file", encode_bytes(task.file_reference.native())},
        {"declared_size", task.declared_size},
        {"bytes_transferred", task.bytes_transferred},
        {"status", std::string(to_string(task.status))},
        {"last_error", task.last_error},
        {"metadata", metadata},
        {"created_at", to_unix_millis(task.created_at)}
    };
    if (task.completed_at) {
        item["completed_at"] = to_unix_millis(*task.completed_at);
    }
    return item;
}

UploadTask task_from_json(const json& item) {
    UploadTask task;
    task.id = item.at("id").get<std::string>();
    task.session_url = item.value("session_url", std::string{});
    task.file_reference = fs::path(decode_bytes(item.at("file").get<std::string>()));
    task.declared_size = item.at("declared_size").get<std::uint64_t>();
    task.bytes_transferred = item.value("bytes_transferred", std::uint64_t{0});
    task.status = parse_task_status(item.value("status", std::string{})).value_or(TaskStatus::Queued);
    task.last_error = item.value("last_error", std::string{});
    if (item.contains("metadata")) {
        for (const auto& [key, value] : item.at("metadata").items()) {
            task.metadata[decode_bytes(key)] = decode_bytes(value.get<std::string>());
        }
    }
    task.created_at = from_unix_millis(item.value("created_at", std::int64_t{0}));
    if (item.contains("completed_at")) {
        task.completed_at = from_unix_millis(item.at("completed_at").get<std::int64_t>());
    }
    return task;
}

} // namespace

TaskStore::TaskStore(fs::path path)
    : path_(std::move(path)) {
}

Result<QueueState> TaskStore::load() const {
    std::lock_guard lock(mutex_);
    QueueState state;

    if (!fs::exists(path_)) {
        return Ok(std::move(state));
    }

    std::ifstream in(path_);
    if (!in.is_open()) {
        return Err<QueueState>(std::string("Cannot open task store: ") + path_.string());
    }

    try {
        json document;
        in >> document;
        if (document.contains("tasks")) {
            for (const auto& item : document.at("tasks")) {
                state.tasks.push_back(task_from_json(item));
            }
        }
        if (document.contains("pending_terminations")) {
            state.pending_terminations =
                document.at("pending_terminations").get<std::vector<std::string>>();
        }
    } catch (const std::exception& e) {
        return Err<QueueState>(std::string("Corrupt task store ") + path_.string() + ": " + e.what());
    }

    spdlog::debug("Loaded {} upload tasks from {}", state.tasks.size(), path_.string());
    return Ok(std::move(state));
}

Result<void> TaskStore::save(const QueueState& state) {
    std::lock_guard lock(mutex_);

    const auto dir = path_.parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        fs::create_directories(dir, ec);
    }

    json tasks = json::array();
    for (const auto& task : state.tasks) {
        tasks.push_back(task_to_json(task));
    }
    json document = {
        {"tasks", tasks},
        {"pending_terminations", state.pending_terminations}
    };

    fs::path temp = path_;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out.is_open()) {
            return Err<void>(std::string("Cannot write task store: ") + temp.string());
        }
        try {
            // last_error echoes server text; replace invalid bytes rather than refuse to persist
            out << document.dump(2, ' ', false, json::error_handler_t::replace);
        } catch (const json::exception& e) {
            return Err<void>(std::string("Cannot encode task store: ") + e.what());
        }
        out.flush();
        if (!out) {
            return Err<void>(std::string("Cannot write task store: ") + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, path_, ec);
    if (ec) {
        return Err<void>(std::string("Cannot replace task store: ") + ec.message());
    }
    return Ok();
}

} // namespace rup::client
