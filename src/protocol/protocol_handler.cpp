#include "rup/protocol/protocol_handler.hpp"

#include "rup/core/ids.hpp"
#include "rup/protocol/tus.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace rup::protocol {

using network::HttpContext;
using network::HttpRequest;
using network::HttpResponse;
using network::HttpStatus;
using json = nlohmann::json;

namespace {

constexpr const char* kAllowMethods = "POST, GET, HEAD, PATCH, DELETE, OPTIONS";
constexpr const char* kAllowHeaders =
    "Authorization, Content-Type, Tus-Resumable, Upload-Length, Upload-Metadata, "
    "Upload-Offset, Upload-Checksum";
constexpr const char* kExposeHeaders =
    "Location, Tus-Resumable, Upload-Offset, Upload-Length, Upload-Expires";

HttpResponse make_json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(body.dump(2));
    return response;
}

bool is_offset_stream(const HttpRequest& request) {
    std::string content_type = request.get_header("Content-Type");
    const auto semicolon = content_type.find(';');
    if (semicolon != std::string::npos) {
        content_type.resize(semicolon);
    }
    while (!content_type.empty() && content_type.back() == ' ') {
        content_type.pop_back();
    }
    return content_type == tus::kOffsetContentType;
}

UploadResult<std::optional<ChunkChecksum>> read_checksum(const HttpRequest& request) {
    if (!request.has_header(tus::kUploadChecksum)) {
        return Ok<std::optional<ChunkChecksum>, UploadError>(std::nullopt);
    }
    auto parsed = tus::parse_checksum(request.get_header(tus::kUploadChecksum));
    if (parsed.is_error()) {
        return Fail<std::optional<ChunkChecksum>>(ErrorCode::InvalidRequest, parsed.error());
    }
    return Ok<std::optional<ChunkChecksum>, UploadError>(std::move(parsed.value()));
}

} // namespace

ProtocolHandler::ProtocolHandler(session::SessionManager& manager,
                                 const Authenticator& authenticator,
                                 HandlerOptions options)
    : manager_(manager),
      authenticator_(authenticator),
      options_(std::move(options)) {
}

void ProtocolHandler::register_routes(network::HttpRouter& router) {
    auto uploads = router.group(options_.base_path);

    uploads->options("", [this](const HttpContext& ctx) { return handle_options(ctx); });
    uploads->options("/:id", [this](const HttpContext& ctx) { return handle_options(ctx); });
    uploads->post("", [this](const HttpContext& ctx) { return handle_create(ctx); });
    uploads->head("/:id", [this](const HttpContext& ctx) { return handle_head(ctx); });
    uploads->patch("/:id", [this](const HttpContext& ctx) { return handle_patch(ctx); });
    uploads->delete_("/:id", [this](const HttpContext& ctx) { return handle_delete(ctx); });
    uploads->get("/:id", [this](const HttpContext& ctx) { return handle_info(ctx); });
}

// ────────────────────────────────────────────────────────────
// OPTIONS: capability discovery
// ────────────────────────────────────────────────────────────

HttpResponse ProtocolHandler::handle_options(const HttpContext& ctx) {
    // Discovery is how a client learns the version, so a missing header is fine.
    if (ctx.request.has_header(tus::kTusResumable) &&
        ctx.request.get_header(tus::kTusResumable) != tus::kVersion) {
        return error_response(UploadError{ErrorCode::ProtocolVersionMismatch,
                                          "Unsupported Tus-Resumable version"});
    }

    HttpResponse response = tus_response(HttpStatus::NO_CONTENT);
    response.set_header(tus::kTusVersion, tus::kVersion);
    response.set_header(tus::kTusMaxSize, std::to_string(manager_.options().max_upload_size));
    response.set_header(tus::kTusExtension, tus::kExtensions);
    response.set_header(tus::kTusChecksumAlgorithm, kSupportedChecksumAlgorithms);
    response.set_header("Access-Control-Allow-Origin", "*");
    response.set_header("Access-Control-Allow-Methods", kAllowMethods);
    response.set_header("Access-Control-Allow-Headers", kAllowHeaders);
    response.set_header("Access-Control-Max-Age", "86400");
    return response;
}

// ────────────────────────────────────────────────────────────
// POST: create, optionally with the first chunk
// ────────────────────────────────────────────────────────────

HttpResponse ProtocolHandler::handle_create(const HttpContext& ctx) {
    const HttpRequest& request = ctx.request;
    std::string owner;
    if (auto rejected = admit(request, owner)) {
        return *rejected;
    }

    const auto total_size = tus::parse_uint(request.get_header(tus::kUploadLength));
    if (!total_size) {
        return error_response(UploadError{ErrorCode::InvalidRequest,
                                          "Upload-Length must be a non-negative integer"});
    }

    auto metadata = tus::parse_metadata(request.get_header(tus::kUploadMetadata));
    if (metadata.is_error()) {
        return error_response(UploadError{ErrorCode::InvalidRequest, metadata.error()});
    }

    const bool with_upload = !request.body.empty();
    std::optional<ChunkChecksum> checksum;
    if (with_upload) {
        if (!is_offset_stream(request)) {
            return error_response(UploadError{ErrorCode::UnsupportedMediaType,
                                              std::string("Initial data must be ") + tus::kOffsetContentType});
        }
        auto parsed = read_checksum(request);
        if (parsed.is_error()) {
            return error_response(parsed.error());
        }
        checksum = std::move(parsed.value());
    }

    session::CreateRequest create;
    create.owner_id = owner;
    create.total_size = *total_size;
    create.metadata = metadata.value();
    if (auto it = create.metadata.find(tus::kTargetRefKey); it != create.metadata.end()) {
        create.target_ref = it->second;
    }
    if (auto it = create.metadata.find(tus::kChecksumAlgorithmKey); it != create.metadata.end()) {
        create.checksum_algorithm = it->second;
    }

    auto created = manager_.create_session(create);
    if (created.is_error()) {
        return error_response(created.error());
    }
    const session::UploadSession& upload = created.value();

    HttpResponse response = tus_response(HttpStatus::CREATED);
    response.set_header(tus::kLocation, location_for(upload.id));
    response.set_header("Access-Control-Expose-Headers", kExposeHeaders);

    std::uint64_t offset = 0;
    if (with_upload) {
        auto applied = manager_.apply_chunk(upload.id, owner, 0, request.body, checksum);
        if (applied.is_ok()) {
            offset = applied.value();
            auto finalized = finalize_if_done(upload.id, owner);
            if (finalized.is_error()) {
                spdlog::warn("Upload {} will be finalized on the next PATCH", upload.id);
            }
        } else {
            // The session exists either way; the client resumes from Upload-Offset.
            spdlog::warn("Initial chunk for {} rejected: {}", upload.id, applied.error().message);
        }
        response.set_header(tus::kUploadOffset, std::to_string(offset));
    }

    auto refreshed = manager_.get_session(upload.id, owner);
    const auto& expires_at = refreshed.is_ok() ? refreshed.value().expires_at : upload.expires_at;
    if (offset < upload.total_size) {
        response.set_header(tus::kUploadExpires, to_http_date(expires_at));
    }
    return response;
}

// ────────────────────────────────────────────────────────────
// HEAD: status
// ────────────────────────────────────────────────────────────

HttpResponse ProtocolHandler::handle_head(const HttpContext& ctx) {
    std::string owner;
    if (auto rejected = admit(ctx.request, owner)) {
        rejected->body.clear();
        rejected->headers.erase("Content-Type");
        rejected->headers.erase("Content-Length");
        return *rejected;
    }

    auto loaded = manager_.get_session(ctx.get_param("id"), owner);
    if (loaded.is_error()) {
        return error_response(loaded.error(), false);
    }
    const session::UploadSession& upload = loaded.value();

    HttpResponse response = tus_response(HttpStatus::OK);
    response.set_header(tus::kUploadOffset, std::to_string(upload.offset));
    response.set_header(tus::kUploadLength, std::to_string(upload.total_size));
    response.set_header("Cache-Control", "no-store");
    response.set_header("Access-Control-Expose-Headers", kExposeHeaders);
    if (!upload.metadata.empty()) {
        response.set_header(tus::kUploadMetadata, tus::encode_metadata(upload.metadata));
    }
    if (!upload.completed) {
        response.set_header(tus::kUploadExpires, to_http_date(upload.expires_at));
    }
    return response;
}

// ────────────────────────────────────────────────────────────
// PATCH: apply one chunk
// ────────────────────────────────────────────────────────────

HttpResponse ProtocolHandler::handle_patch(const HttpContext& ctx) {
    const HttpRequest& request = ctx.request;
    std::string owner;
    if (auto rejected = admit(request, owner)) {
        return *rejected;
    }

    if (!is_offset_stream(request)) {
        return error_response(UploadError{ErrorCode::UnsupportedMediaType,
                                          std::string("Chunks must be sent as ") + tus::kOffsetContentType});
    }

    const auto expected_offset = tus::parse_uint(request.get_header(tus::kUploadOffset));
    if (!expected_offset) {
        return error_response(UploadError{ErrorCode::InvalidRequest,
                                          "Upload-Offset must be a non-negative integer"});
    }

    auto checksum = read_checksum(request);
    if (checksum.is_error()) {
        return error_response(checksum.error());
    }

    const std::string session_id = ctx.get_param("id");
    auto applied = manager_.apply_chunk(session_id, owner, *expected_offset, request.body, checksum.value());
    if (applied.is_error()) {
        return error_response(applied.error());
    }

    // A failed finalization is reported so the client retries it with an empty PATCH
    auto finalized = finalize_if_done(session_id, owner);
    if (finalized.is_error()) {
        return error_response(finalized.error());
    }

    HttpResponse response = tus_response(HttpStatus::NO_CONTENT);
    response.set_header(tus::kUploadOffset, std::to_string(applied.value()));
    response.set_header("Access-Control-Expose-Headers", kExposeHeaders);

    auto refreshed = manager_.get_session(session_id, owner);
    if (refreshed.is_ok() && !refreshed.value().completed) {
        response.set_header(tus::kUploadExpires, to_http_date(refreshed.value().expires_at));
    }
    return response;
}

// ────────────────────────────────────────────────────────────
// DELETE: terminate
// ────────────────────────────────────────────────────────────

HttpResponse ProtocolHandler::handle_delete(const HttpContext& ctx) {
    std::string owner;
    if (auto rejected = admit(ctx.request, owner)) {
        return *rejected;
    }

    auto terminated = manager_.terminate(ctx.get_param("id"), owner);
    if (terminated.is_error()) {
        return error_response(terminated.error());
    }
    return tus_response(HttpStatus::NO_CONTENT);
}

// ────────────────────────────────────────────────────────────
// GET: upload description (outside the TUS surface)
// ────────────────────────────────────────────────────────────

HttpResponse ProtocolHandler::handle_info(const HttpContext& ctx) {
    std::string owner;
    if (auto rejected = admit(ctx.request, owner, false)) {
        return *rejected;
    }

    auto loaded = manager_.get_session(ctx.get_param("id"), owner);
    if (loaded.is_error()) {
        return error_response(loaded.error());
    }
    const session::UploadSession& upload = loaded.value();

    json body = {
        {"id", upload.id},
        {"target_ref", upload.target_ref},
        {"metadata", upload.metadata},
        {"offset", upload.offset},
        {"size", upload.total_size},
        {"progress", upload.progress_percent()},
        {"created_at", to_iso8601(upload.created_at)},
        {"expires_at", to_iso8601(upload.expires_at)},
        {"is_complete", upload.completed},
        {"parts", upload.part_manifest.size()}
    };
    if (upload.completed) {
        body["final_ref"] = upload.final_ref;
    }
    if (upload.checksum_algorithm) {
        body["checksum_algorithm"] = *upload.checksum_algorithm;
    }

    HttpResponse response = make_json_response(HttpStatus::OK, body);
    response.set_header(tus::kTusResumable, tus::kVersion);
    return response;
}

std::string ProtocolHandler::location_for(const std::string& session_id) const {
    return options_.public_url + options_.base_path + "/" + session_id;
}

// ────────────────────────────────────────────────────────────
// Helpers
// ────────────────────────────────────────────────────────────

std::optional<HttpResponse> ProtocolHandler::admit(const HttpRequest& request,
                                                   std::string& owner,
                                                   bool check_version) const {
    if (check_version) {
        if (!request.has_header(tus::kTusResumable)) {
            return error_response(UploadError{ErrorCode::ProtocolVersionMismatch,
                                              "Missing Tus-Resumable header"});
        }
        if (request.get_header(tus::kTusResumable) != tus::kVersion) {
            return error_response(UploadError{ErrorCode::ProtocolVersionMismatch,
                                              "Unsupported Tus-Resumable version " +
                                              request.get_header(tus::kTusResumable)});
        }
    }

    auto identity = authenticator_.authenticate(request);
    if (!identity) {
        HttpResponse response = error_response(UploadError{ErrorCode::Unauthenticated,
                                                           "Missing or invalid bearer token"});
        response.set_header("WWW-Authenticate", "Bearer");
        return response;
    }
    owner = *identity;
    return std::nullopt;
}

UploadResult<void> ProtocolHandler::finalize_if_done(const std::string& session_id, const std::string& owner) {
    auto status = manager_.get_status(session_id, owner);
    if (status.is_error() || status.value().completed ||
        status.value().offset != status.value().total_size) {
        return Success();
    }

    auto completed = manager_.complete(session_id, owner);
    if (completed.is_error()) {
        spdlog::error("Upload {} reached its length but could not be finalized: {}",
                      session_id, completed.error().message);
        UploadError error = completed.error();
        error.current_offset = status.value().offset;
        return Err<void, UploadError>(std::move(error));
    }
    return Success();
}

HttpResponse ProtocolHandler::error_response(const UploadError& error, bool with_body) {
    HttpResponse response(static_cast<HttpStatus>(http_status_for(error.code)));
    response.set_header(tus::kTusResumable, tus::kVersion);

    if (error.code == ErrorCode::ProtocolVersionMismatch) {
        response.set_header(tus::kTusVersion, tus::kVersion);
    }
    if (error.current_offset) {
        response.set_header(tus::kUploadOffset, std::to_string(*error.current_offset));
    }

    if (with_body) {
        json body = {
            {"error", std::string(to_string(error.code))},
            {"message", error.message}
        };
        if (error.current_offset) {
            body["offset"] = *error.current_offset;
        }
        response.set_header("Content-Type", "application/json");
        response.set_body(body.dump());
    }
    return response;
}

HttpResponse ProtocolHandler::tus_response(HttpStatus status) {
    HttpResponse response(status);
    response.set_header(tus::kTusResumable, tus::kVersion);
    return response;
}

} // namespace rup::protocol
