#include "rup/core/error.hpp"

namespace rup {

std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SizeExceeded: return "SizeExceeded";
        case ErrorCode::OffsetConflict: return "OffsetConflict";
        case ErrorCode::ChecksumMismatch: return "ChecksumMismatch";
        case ErrorCode::IncompleteUpload: return "IncompleteUpload";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::Forbidden: return "Forbidden";
        case ErrorCode::ProtocolVersionMismatch: return "ProtocolVersionMismatch";
        case ErrorCode::StorageFailure: return "StorageFailure";
        case ErrorCode::Expired: return "Expired";
        case ErrorCode::InvalidRequest: return "InvalidRequest";
        case ErrorCode::Unauthenticated: return "Unauthenticated";
        case ErrorCode::UnsupportedMediaType: return "UnsupportedMediaType";
        case ErrorCode::NetworkFailure: return "NetworkFailure";
    }
    return "Unknown";
}

std::optional<ErrorCode> parse_error_code(std::string_view name) noexcept {
    static constexpr ErrorCode all[] = {
        ErrorCode::SizeExceeded, ErrorCode::OffsetConflict, ErrorCode::ChecksumMismatch,
        ErrorCode::IncompleteUpload, ErrorCode::NotFound, ErrorCode::Forbidden,
        ErrorCode::ProtocolVersionMismatch, ErrorCode::StorageFailure, ErrorCode::Expired,
        ErrorCode::InvalidRequest, ErrorCode::Unauthenticated, ErrorCode::UnsupportedMediaType,
        ErrorCode::NetworkFailure
    };
    for (ErrorCode code : all) {
        if (to_string(code) == name) {
            return code;
        }
    }
    return std::nullopt;
}

int http_status_for(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ProtocolVersionMismatch:
        case ErrorCode::InvalidRequest:
        case ErrorCode::IncompleteUpload:
            return 400;
        case ErrorCode::Unauthenticated: return 401;
        case ErrorCode::Forbidden: return 403;
        case ErrorCode::NotFound: return 404;
        case ErrorCode::OffsetConflict: return 409;
        case ErrorCode::Expired: return 410;
        case ErrorCode::SizeExceeded: return 413;
        case ErrorCode::UnsupportedMediaType: return 415;
        case ErrorCode::ChecksumMismatch: return 460;
        case ErrorCode::StorageFailure: return 500;
        case ErrorCode::NetworkFailure: return 503;
    }
    return 500;
}

bool is_retryable(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::OffsetConflict:
        case ErrorCode::ChecksumMismatch:
        case ErrorCode::StorageFailure:
        case ErrorCode::NetworkFailure:
            return true;
        default:
            return false;
    }
}

} // namespace rup
