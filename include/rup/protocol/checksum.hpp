#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rup::protocol {

enum class ChecksumAlgorithm {
    Sha1,
    Md5,
    Sha256
};

/// Comma separated list advertised in Tus-Checksum-Algorithm.
inline constexpr const char* kSupportedChecksumAlgorithms = "sha1,md5,sha256";

std::optional<ChecksumAlgorithm> parse_algorithm(std::string_view name);
std::string_view algorithm_name(ChecksumAlgorithm algorithm) noexcept;

/**
 * @brief Digest of a byte range computed with OpenSSL EVP
 */
std::vector<std::uint8_t> compute_digest(ChecksumAlgorithm algorithm,
                                         const std::uint8_t* data, std::size_t size);

inline std::vector<std::uint8_t> compute_digest(ChecksumAlgorithm algorithm,
                                                const std::vector<std::uint8_t>& data) {
    return compute_digest(algorithm, data.data(), data.size());
}

/**
 * @brief Checksum a client attached to one chunk
 */
struct ChunkChecksum {
    ChecksumAlgorithm algorithm = ChecksumAlgorithm::Sha256;
    std::vector<std::uint8_t> digest;

    [[nodiscard]] bool matches(const std::vector<std::uint8_t>& payload) const {
        return compute_digest(algorithm, payload) == digest;
    }
};

} // namespace rup::protocol
