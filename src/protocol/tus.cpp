#include "rup/protocol/tus.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <limits>

namespace rup::protocol::tus {

namespace {

bool is_base64_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace

std::string base64_encode(const std::uint8_t* data, std::size_t size) {
    if (size == 0) {
        return {};
    }
    std::string encoded(4 * ((size + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]),
                                        data, static_cast<int>(size));
    encoded.resize(static_cast<std::size_t>(written));
    return encoded;
}

std::optional<std::vector<std::uint8_t>> base64_decode(std::string_view encoded) {
    if (encoded.empty()) {
        return std::vector<std::uint8_t>{};
    }
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }

    std::size_t padding = 0;
    for (std::size_t i = 0; i < encoded.size(); ++i) {
        const char c = encoded[i];
        if (c == '=') {
            // Padding only in the last two positions
            if (i < encoded.size() - 2) {
                return std::nullopt;
            }
            ++padding;
        } else if (padding > 0 || !is_base64_char(c)) {
            return std::nullopt;
        }
    }

    std::vector<std::uint8_t> decoded(encoded.size() / 4 * 3);
    const int length = EVP_DecodeBlock(decoded.data(),
                                       reinterpret_cast<const unsigned char*>(encoded.data()),
                                       static_cast<int>(encoded.size()));
    if (length < 0) {
        return std::nullopt;
    }
    decoded.resize(static_cast<std::size_t>(length) - padding);
    return decoded;
}

Result<Metadata> parse_metadata(std::string_view header) {
    Metadata metadata;
    header = trim(header);
    if (header.empty()) {
        return Ok(std::move(metadata));
    }

    std::size_t start = 0;
    while (start <= header.size()) {
        const auto comma = header.find(',', start);
        const auto pair = trim(header.substr(start, comma == std::string_view::npos ? std::string_view::npos
                                                                                      : comma - start));
        if (pair.empty()) {
            return Err<Metadata>(std::string("Empty Upload-Metadata entry"));
        }

        const auto space = pair.find(' ');
        const std::string key(pair.substr(0, space));
        std::string value;
        if (space != std::string_view::npos) {
            auto decoded = base64_decode(trim(pair.substr(space + 1)));
            if (!decoded) {
                return Err<Metadata>("Upload-Metadata value for '" + key + "' is not valid base64");
            }
            value.assign(decoded->begin(), decoded->end());
        }

        if (metadata.count(key) > 0) {
            return Err<Metadata>("Duplicate Upload-Metadata key '" + key + "'");
        }
        metadata.emplace(key, std::move(value));

        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return Ok(std::move(metadata));
}

std::string encode_metadata(const Metadata& metadata) {
    std::string header;
    for (const auto& [key, value] : metadata) {
        if (!header.empty()) {
            header += ',';
        }
        header += key;
        if (!value.empty()) {
            header += ' ';
            header += base64_encode(value);
        }
    }
    return header;
}

Result<ChunkChecksum> parse_checksum(std::string_view header) {
    header = trim(header);
    const auto space = header.find(' ');
    if (space == std::string_view::npos) {
        return Err<ChunkChecksum>(std::string("Upload-Checksum must be '<algorithm> <base64 digest>'"));
    }

    const auto algorithm = parse_algorithm(header.substr(0, space));
    if (!algorithm) {
        return Err<ChunkChecksum>("Unsupported checksum algorithm '" +
                                  std::string(header.substr(0, space)) + "'");
    }

    auto digest = base64_decode(trim(header.substr(space + 1)));
    if (!digest || digest->empty()) {
        return Err<ChunkChecksum>(std::string("Upload-Checksum digest is not valid base64"));
    }

    ChunkChecksum checksum;
    checksum.algorithm = *algorithm;
    checksum.digest = std::move(*digest);
    return Ok(std::move(checksum));
}

std::string format_checksum(const ChunkChecksum& checksum) {
    return std::string(algorithm_name(checksum.algorithm)) + " " +
           base64_encode(checksum.digest.data(), checksum.digest.size());
}

std::optional<std::uint64_t> parse_uint(std::string_view text) {
    if (text.empty() || text.size() > 20) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        const std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

} // namespace rup::protocol::tus
