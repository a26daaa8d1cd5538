#include "rup/protocol/checksum.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace rup::protocol {

namespace {

const EVP_MD* evp_for(ChecksumAlgorithm algorithm) {
    switch (algorithm) {
        case ChecksumAlgorithm::Sha1: return EVP_sha1();
        case ChecksumAlgorithm::Md5: return EVP_md5();
        case ChecksumAlgorithm::Sha256: return EVP_sha256();
    }
    return EVP_sha256();
}

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

std::optional<ChecksumAlgorithm> parse_algorithm(std::string_view name) {
    if (name == "sha1") return ChecksumAlgorithm::Sha1;
    if (name == "md5") return ChecksumAlgorithm::Md5;
    if (name == "sha256") return ChecksumAlgorithm::Sha256;
    return std::nullopt;
}

std::string_view algorithm_name(ChecksumAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case ChecksumAlgorithm::Sha1: return "sha1";
        case ChecksumAlgorithm::Md5: return "md5";
        case ChecksumAlgorithm::Sha256: return "sha256";
    }
    return "sha256";
}

std::vector<std::uint8_t> compute_digest(ChecksumAlgorithm algorithm,
                                         const std::uint8_t* data, std::size_t size) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    std::vector<std::uint8_t> digest(EVP_MAX_MD_SIZE);
    unsigned int length = 0;
    if (EVP_DigestInit_ex(ctx.get(), evp_for(algorithm), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
        throw std::runtime_error("OpenSSL digest computation failed");
    }
    digest.resize(length);
    return digest;
}

} // namespace rup::protocol
