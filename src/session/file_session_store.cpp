#include "rup/session/file_session_store.hpp"

#include "rup/core/ids.hpp"
#include "rup/protocol/tus.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <fstream>
#include <stdexcept>

namespace rup::session {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Client-supplied strings may hold any bytes; JSON only carries UTF-8.
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

json to_json(const UploadSession& session) {
    json parts = json::array();
    for (const auto& part : session.part_manifest) {
        parts.push_back({
            {"index", part.part_index},
            {"size", part.size},
            {"part_id", part.storage_part_id}
        });
    }

    json metadata = json::object();
    for (const auto& [key, value] : session.metadata) {
        metadata[encode_bytes(key)] = encode_bytes(value);
    }

    json document = {
        {"id", session.id},
        {"owner_id", session.owner_id},
        {"target_ref", encode_bytes(session.target_ref)},
        {"total_size", session.total_size},
        {"offset", session.offset},
        {"metadata", metadata},
        {"storage_handle", session.storage_handle},
        {"parts", parts},
        {"completed", session.completed},
        {"final_ref", session.final_ref},
        {"created_at", to_unix_millis(session.created_at)},
        {"expires_at", to_unix_millis(session.expires_at)}
    };
    if (session.checksum_algorithm) {
        document["checksum_algorithm"] = *session.checksum_algorithm;
    }
    if (session.completed_at) {
        document["completed_at"] = to_unix_millis(*session.completed_at);
    }
    return document;
}

UploadSession from_json(const json& document) {
    UploadSession session;
    session.id = document.at("id").get<std::string>();
    session.owner_id = document.value("owner_id", std::string{});
    if (document.contains("target_ref")) {
        session.target_ref = decode_bytes(document["target_ref"].get<std::string>());
    }
    session.total_size = document.at("total_size").get<std::uint64_t>();
    session.offset = document.at("offset").get<std::uint64_t>();
    if (document.contains("metadata")) {
        for (const auto& [key, value] : document["metadata"].items()) {
            session.metadata[decode_bytes(key)] = decode_bytes(value.get<std::string>());
        }
    }
    session.storage_handle = document.at("storage_handle").get<std::string>();
    if (document.contains("parts")) {
        for (const auto& item : document["parts"]) {
            PartRecord part;
            part.part_index = item.at("index").get<std::uint32_t>();
            part.size = item.at("size").get<std::uint64_t>();
            part.storage_part_id = item.at("part_id").get<std::string>();
            session.part_manifest.push_back(std::move(part));
        }
    }
    session.completed = document.value("completed", false);
    session.final_ref = document.value("final_ref", std::string{});
    session.created_at = from_unix_millis(document.at("created_at").get<std::int64_t>());
    session.expires_at = from_unix_millis(document.at("expires_at").get<std::int64_t>());
    if (document.contains("checksum_algorithm")) {
        session.checksum_algorithm = document["checksum_algorithm"].get<std::string>();
    }
    if (document.contains("completed_at")) {
        session.completed_at = from_unix_millis(document["completed_at"].get<std::int64_t>());
    }
    return session;
}

bool is_valid_id(const std::string& id) {
    if (id.empty()) {
        return false;
    }
    for (char c : id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

Result<UploadSession> read_record(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<UploadSession>(std::string("Cannot open session record: ") + path.string());
    }
    try {
        json document;
        input >> document;
        return Ok(from_json(document));
    } catch (const std::exception& e) {
        return Err<UploadSession>(std::string("Corrupt session record ") + path.string() + ": " + e.what());
    }
}

} // namespace

FileSessionStore::FileSessionStore(fs::path directory)
    : directory_(std::move(directory)) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        spdlog::warn("Could not create session directory {}: {}", directory_.string(), ec.message());
    }
}

Result<void> FileSessionStore::save(const UploadSession& session) {
    if (!is_valid_id(session.id)) {
        return Err<void>(std::string("Invalid session id: ") + session.id);
    }

    std::lock_guard lock(mutex_);

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec && !fs::exists(directory_)) {
        return Err<void>(std::string("Failed to create session directory: ") + directory_.string());
    }

    const fs::path target = record_path(session.id);
    fs::path temp = target;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            return Err<void>(std::string("Failed to write session record: ") + temp.string());
        }
        try {
            out << to_json(session).dump(2);
        } catch (const json::exception& e) {
            out.close();
            fs::remove(temp, ec);
            return Err<void>(std::string("Cannot encode session record ") + session.id + ": " + e.what());
        }
        out.flush();
        if (!out) {
            return Err<void>(std::string("Failed to write session record: ") + temp.string());
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        fs::remove(temp, ec);
        return Err<void>(std::string("Failed to commit session record: ") + target.string());
    }
    return Ok();
}

Result<std::optional<UploadSession>> FileSessionStore::load(const std::string& id) {
    if (!is_valid_id(id)) {
        return Ok(std::optional<UploadSession>{});
    }

    std::lock_guard lock(mutex_);
    const fs::path path = record_path(id);
    if (!fs::exists(path)) {
        return Ok(std::optional<UploadSession>{});
    }

    auto record = read_record(path);
    if (record.is_error()) {
        return Err<std::optional<UploadSession>>(record.error());
    }
    return Ok(std::optional<UploadSession>{std::move(record.value())});
}

Result<void> FileSessionStore::remove(const std::string& id) {
    if (!is_valid_id(id)) {
        return Ok();
    }

    std::lock_guard lock(mutex_);
    std::error_code ec;
    fs::remove(record_path(id), ec);
    if (ec) {
        return Err<void>(std::string("Failed to delete session record ") + id + ": " + ec.message());
    }
    return Ok();
}

Result<std::vector<UploadSession>> FileSessionStore::list() {
    std::lock_guard lock(mutex_);
    std::vector<UploadSession> sessions;

    std::error_code ec;
    fs::directory_iterator it(directory_, ec);
    if (ec) {
        return Err<std::vector<UploadSession>>(std::string("Cannot scan session directory: ") + ec.message());
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        auto record = read_record(entry.path());
        if (record.is_error()) {
            spdlog::warn("Skipping session record: {}", record.error());
            continue;
        }
        sessions.push_back(std::move(record.value()));
    }
    return Ok(std::move(sessions));
}

fs::path FileSessionStore::record_path(const std::string& id) const {
    return directory_ / (id + ".json");
}

} // namespace rup::session
