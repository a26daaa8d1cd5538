#pragma once

#include "rup/core/result.hpp"
#include "rup/protocol/checksum.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rup::protocol::tus {

// ────────────────────────────────────────────────────────────
// Protocol constants (TUS 1.0.0)
// ────────────────────────────────────────────────────────────

inline constexpr const char* kVersion = "1.0.0";
inline constexpr const char* kExtensions = "creation,creation-with-upload,termination";
inline constexpr const char* kOffsetContentType = "application/offset+octet-stream";

inline constexpr const char* kTusResumable = "Tus-Resumable";
inline constexpr const char* kTusVersion = "Tus-Version";
inline constexpr const char* kTusMaxSize = "Tus-Max-Size";
inline constexpr const char* kTusExtension = "Tus-Extension";
inline constexpr const char* kTusChecksumAlgorithm = "Tus-Checksum-Algorithm";
inline constexpr const char* kUploadOffset = "Upload-Offset";
inline constexpr const char* kUploadLength = "Upload-Length";
inline constexpr const char* kUploadMetadata = "Upload-Metadata";
inline constexpr const char* kUploadChecksum = "Upload-Checksum";
inline constexpr const char* kUploadExpires = "Upload-Expires";
inline constexpr const char* kLocation = "Location";

/// Metadata keys with a meaning to the server; every other key is opaque.
inline constexpr const char* kTargetRefKey = "target_ref";
inline constexpr const char* kChecksumAlgorithmKey = "checksum_algorithm";

using Metadata = std::map<std::string, std::string>;

// ────────────────────────────────────────────────────────────
// Codecs
// ────────────────────────────────────────────────────────────

std::string base64_encode(const std::uint8_t* data, std::size_t size);

inline std::string base64_encode(std::string_view text) {
    return base64_encode(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

/// Strict decoding: padded input only, no whitespace.
std::optional<std::vector<std::uint8_t>> base64_decode(std::string_view encoded);

/**
 * @brief Parse an Upload-Metadata header
 *
 * Format: "key base64value,key2 base64value2,flag". Keys are unique and
 * contain no spaces or commas; a key may appear without a value.
 */
Result<Metadata> parse_metadata(std::string_view header);

std::string encode_metadata(const Metadata& metadata);

/**
 * @brief Parse an Upload-Checksum header: "<algorithm> <base64 digest>"
 */
Result<ChunkChecksum> parse_checksum(std::string_view header);

std::string format_checksum(const ChunkChecksum& checksum);

/// Non-negative decimal integer with no sign, whitespace or overflow.
std::optional<std::uint64_t> parse_uint(std::string_view text);

} // namespace rup::protocol::tus
