#include "rup/client/tus_client.hpp"

#include "rup/protocol/tus.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <sstream>

namespace rup::client {

using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;
namespace tus = protocol::tus;

namespace {

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        const auto begin = item.find_first_not_of(' ');
        const auto end = item.find_last_not_of(' ');
        if (begin != std::string::npos) {
            items.push_back(item.substr(begin, end - begin + 1));
        }
    }
    return items;
}

ErrorCode code_for_status(int status) {
    switch (status) {
        case 400: return ErrorCode::InvalidRequest;
        case 401: return ErrorCode::Unauthenticated;
        case 403: return ErrorCode::Forbidden;
        case 404: return ErrorCode::NotFound;
        case 409: return ErrorCode::OffsetConflict;
        case 410: return ErrorCode::Expired;
        case 412: return ErrorCode::ProtocolVersionMismatch;
        case 413: return ErrorCode::SizeExceeded;
        case 415: return ErrorCode::UnsupportedMediaType;
        case 460: return ErrorCode::ChecksumMismatch;
        default: break;
    }
    return status >= 500 ? ErrorCode::StorageFailure : ErrorCode::InvalidRequest;
}

} // namespace

TusClient::TusClient(network::HttpTransport& transport, std::string base_path, std::string token)
    : transport_(transport), base_path_(std::move(base_path)), token_(std::move(token)) {
}

UploadResult<ServerCapabilities> TusClient::discover() {
    HttpRequest request = make_request(HttpMethod::OPTIONS, base_path_);
    auto sent = send(request);
    if (sent.is_error()) {
        return Err<ServerCapabilities, UploadError>(sent.error());
    }
    const HttpResponse& response = sent.value();
    if (response.status_code != 200 && response.status_code != 204) {
        return Err<ServerCapabilities, UploadError>(error_from(response));
    }

    ServerCapabilities capabilities;
    capabilities.version = response.get_header(tus::kTusVersion);
    capabilities.max_size = tus::parse_uint(response.get_header(tus::kTusMaxSize)).value_or(0);
    capabilities.extensions = split_list(response.get_header(tus::kTusExtension));
    capabilities.checksum_algorithms = split_list(response.get_header(tus::kTusChecksumAlgorithm));
    return Ok<ServerCapabilities, UploadError>(std::move(capabilities));
}

UploadResult<std::string> TusClient::create(std::uint64_t length,
                                            const std::map<std::string, std::string>& metadata) {
    HttpRequest request = make_request(HttpMethod::POST, base_path_);
    request.set_header(tus::kUploadLength, std::to_string(length));
    if (!metadata.empty()) {
        request.set_header(tus::kUploadMetadata, tus::encode_metadata(metadata));
    }

    auto sent = send(request);
    if (sent.is_error()) {
        return Err<std::string, UploadError>(sent.error());
    }
    const HttpResponse& response = sent.value();
    if (response.status_code != 201) {
        return Err<std::string, UploadError>(error_from(response));
    }

    std::string location = response.get_header(tus::kLocation);
    if (location.empty()) {
        return Fail<std::string>(ErrorCode::InvalidRequest, "Server created an upload without a Location");
    }
    return Ok<std::string, UploadError>(std::move(location));
}

UploadResult<RemoteStatus> TusClient::status(const std::string& session_url) {
    auto sent = send(make_request(HttpMethod::HEAD, path_of(session_url)));
    if (sent.is_error()) {
        return Err<RemoteStatus, UploadError>(sent.error());
    }
    const HttpResponse& response = sent.value();
    if (response.status_code != 200) {
        return Err<RemoteStatus, UploadError>(error_from(response));
    }

    const auto offset = tus::parse_uint(response.get_header(tus::kUploadOffset));
    const auto length = tus::parse_uint(response.get_header(tus::kUploadLength));
    if (!offset || !length) {
        return Fail<RemoteStatus>(ErrorCode::InvalidRequest, "Status response lacks Upload-Offset/Upload-Length");
    }
    return Ok<RemoteStatus, UploadError>(RemoteStatus{*offset, *length});
}

UploadResult<std::uint64_t> TusClient::patch(const std::string& session_url,
                                             std::uint64_t offset,
                                             const std::vector<std::uint8_t>& bytes,
                                             const std::optional<protocol::ChunkChecksum>& checksum) {
    HttpRequest request = make_request(HttpMethod::PATCH, path_of(session_url));
    request.set_header("Content-Type", tus::kOffsetContentType);
    request.set_header(tus::kUploadOffset, std::to_string(offset));
    if (checksum) {
        request.set_header(tus::kUploadChecksum, tus::format_checksum(*checksum));
    }
    request.set_body(bytes);

    auto sent = send(request);
    if (sent.is_error()) {
        return Err<std::uint64_t, UploadError>(sent.error());
    }
    const HttpResponse& response = sent.value();
    if (response.status_code != 204 && response.status_code != 200) {
        return Err<std::uint64_t, UploadError>(error_from(response));
    }

    const auto new_offset = tus::parse_uint(response.get_header(tus::kUploadOffset));
    if (!new_offset) {
        return Fail<std::uint64_t>(ErrorCode::InvalidRequest, "Chunk response lacks Upload-Offset");
    }
    return Ok<std::uint64_t, UploadError>(*new_offset);
}

UploadResult<void> TusClient::terminate(const std::string& session_url) {
    auto sent = send(make_request(HttpMethod::DELETE_METHOD, path_of(session_url)));
    if (sent.is_error()) {
        return Err<void, UploadError>(sent.error());
    }
    const int status = sent.value().status_code;
    if (status == 204 || status == 200 || status == 404 || status == 410) {
        return Success();
    }
    return Err<void, UploadError>(error_from(sent.value()));
}

std::string TusClient::path_of(const std::string& session_url) {
    const auto scheme = session_url.find("://");
    if (scheme == std::string::npos) {
        return session_url;
    }
    const auto path = session_url.find('/', scheme + 3);
    return path == std::string::npos ? std::string("/") : session_url.substr(path);
}

HttpRequest TusClient::make_request(HttpMethod method, const std::string& path) const {
    HttpRequest request;
    request.method = method;
    request.url = path;
    request.set_header(tus::kTusResumable, tus::kVersion);
    if (!token_.empty()) {
        request.set_header("Authorization", "Bearer " + token_);
    }
    return request;
}

UploadResult<HttpResponse> TusClient::send(const HttpRequest& request) {
    auto result = transport_.send(request);
    if (result.is_error()) {
        return Fail<HttpResponse>(ErrorCode::NetworkFailure, result.error());
    }
    return Ok<HttpResponse, UploadError>(std::move(result.value()));
}

UploadError TusClient::error_from(const HttpResponse& response) {
    UploadError error(code_for_status(response.status_code),
                      "HTTP " + std::to_string(response.status_code));

    const auto body = nlohmann::json::parse(response.body_as_string(), nullptr, false);
    if (!body.is_discarded() && body.is_object()) {
        if (auto named = parse_error_code(body.value("error", std::string{}))) {
            error.code = *named;
        }
        error.message = body.value("message", error.message);
    }

    if (response.has_header(tus::kUploadOffset)) {
        error.current_offset = tus::parse_uint(response.get_header(tus::kUploadOffset));
    }
    return error;
}

} // namespace rup::client
