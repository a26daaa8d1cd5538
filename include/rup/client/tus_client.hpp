#pragma once

#include "rup/core/error.hpp"
#include "rup/network/http_client.hpp"
#include "rup/protocol/checksum.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rup::client {

struct ServerCapabilities {
    std::string version;
    std::uint64_t max_size = 0;
    std::vector<std::string> extensions;
    std::vector<std::string> checksum_algorithms;
};

struct RemoteStatus {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
};

/**
 * @brief One call per TUS request, with responses mapped to UploadError
 *
 * Transport failures become NetworkFailure. Error responses are mapped by
 * the "error" field of their JSON body when present, otherwise by status
 * code; the Upload-Offset header of a 409 lands in current_offset.
 *
 * Session URLs may be absolute (when the server has a public URL) or
 * server-relative; only their path is used for requests.
 */
class TusClient {
public:
    TusClient(network::HttpTransport& transport, std::string base_path, std::string token);

    UploadResult<ServerCapabilities> discover();

    /// @return Session URL from the Location header
    UploadResult<std::string> create(std::uint64_t length,
                                     const std::map<std::string, std::string>& metadata);

    UploadResult<RemoteStatus> status(const std::string& session_url);

    /// @return Offset reported by the server after the chunk
    UploadResult<std::uint64_t> patch(const std::string& session_url,
                                      std::uint64_t offset,
                                      const std::vector<std::uint8_t>& bytes,
                                      const std::optional<protocol::ChunkChecksum>& checksum = std::nullopt);

    /// Succeeds for 204 and for sessions the server no longer knows.
    UploadResult<void> terminate(const std::string& session_url);

    /// Path component of a session URL.
    static std::string path_of(const std::string& session_url);

private:
    network::HttpRequest make_request(network::HttpMethod method, const std::string& path) const;
    UploadResult<network::HttpResponse> send(const network::HttpRequest& request);

    static UploadError error_from(const network::HttpResponse& response);

    network::HttpTransport& transport_;
    std::string base_path_;
    std::string token_;
};

} // namespace rup::client
