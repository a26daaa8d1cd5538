#pragma once

#include "rup/core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rup {

/**
 * @brief Failure taxonomy shared by the session manager, protocol handler and client
 *
 * OffsetConflict and ChecksumMismatch are recoverable by retrying with
 * corrected input. StorageFailure never leaves partial progress behind.
 */
enum class ErrorCode {
    SizeExceeded,
    OffsetConflict,
    ChecksumMismatch,
    IncompleteUpload,
    NotFound,
    Forbidden,
    ProtocolVersionMismatch,
    StorageFailure,
    Expired,
    InvalidRequest,
    Unauthenticated,
    UnsupportedMediaType,
    NetworkFailure      ///< Client side only: no usable response from the server
};

struct UploadError {
    ErrorCode code = ErrorCode::InvalidRequest;
    std::string message;
    std::optional<std::uint64_t> current_offset; ///< Authoritative offset for OffsetConflict

    UploadError() = default;
    UploadError(ErrorCode c, std::string msg, std::optional<std::uint64_t> offset = std::nullopt)
        : code(c), message(std::move(msg)), current_offset(offset) {}
};

template<typename T>
using UploadResult = Result<T, UploadError>;

std::string_view to_string(ErrorCode code) noexcept;

/// Inverse of to_string, used by the client to read error bodies.
std::optional<ErrorCode> parse_error_code(std::string_view name) noexcept;

/// HTTP status code surfaced on the wire for each failure kind.
int http_status_for(ErrorCode code) noexcept;

/// Transient failures the client retries with backoff instead of giving up.
bool is_retryable(ErrorCode code) noexcept;

template<typename T>
UploadResult<T> Fail(ErrorCode code, std::string message,
                     std::optional<std::uint64_t> offset = std::nullopt) {
    return Err<T, UploadError>(UploadError{code, std::move(message), offset});
}

inline UploadResult<void> Success() { return Ok<UploadError>(); }

} // namespace rup
