#include "rup/core/error.hpp"
#include "rup/core/result.hpp"

#include <gtest/gtest.h>

using rup::ErrorCode;

namespace {

const ErrorCode kAllCodes[] = {
    ErrorCode::SizeExceeded, ErrorCode::OffsetConflict, ErrorCode::ChecksumMismatch,
    ErrorCode::IncompleteUpload, ErrorCode::NotFound, ErrorCode::Forbidden,
    ErrorCode::ProtocolVersionMismatch, ErrorCode::StorageFailure, ErrorCode::Expired,
    ErrorCode::InvalidRequest, ErrorCode::Unauthenticated, ErrorCode::UnsupportedMediaType,
    ErrorCode::NetworkFailure
};

rup::Result<int> parse_positive(int value) {
    if (value <= 0) {
        return rup::Err<int>(std::string("not positive"));
    }
    return rup::Ok(value);
}

} // namespace

TEST(ResultTest, HoldsValueOrError) {
    auto good = parse_positive(4);
    ASSERT_TRUE(good.is_ok());
    EXPECT_EQ(good.value(), 4);

    auto bad = parse_positive(-1);
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error(), "not positive");
    EXPECT_EQ(bad.value_or(7), 7);
}

TEST(ResultTest, VoidResult) {
    rup::Result<void> ok = rup::Ok();
    EXPECT_TRUE(ok.is_ok());

    rup::Result<void> failed = rup::Err<void>(std::string("boom"));
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error(), "boom");
}

TEST(ResultTest, SameValueAndErrorType) {
    auto ok = rup::Ok<std::string, std::string>("value");
    auto err = rup::Err<std::string, std::string>("error");
    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), "value");
    EXPECT_TRUE(err.is_error());
    EXPECT_EQ(err.error(), "error");
}

TEST(ErrorCodeTest, NamesRoundTrip) {
    for (ErrorCode code : kAllCodes) {
        auto parsed = rup::parse_error_code(rup::to_string(code));
        ASSERT_TRUE(parsed.has_value()) << rup::to_string(code);
        EXPECT_EQ(*parsed, code);
    }
    EXPECT_FALSE(rup::parse_error_code("Teapot").has_value());
}

TEST(ErrorCodeTest, WireStatusCodes) {
    EXPECT_EQ(rup::http_status_for(ErrorCode::ProtocolVersionMismatch), 400);
    EXPECT_EQ(rup::http_status_for(ErrorCode::InvalidRequest), 400);
    EXPECT_EQ(rup::http_status_for(ErrorCode::IncompleteUpload), 400);
    EXPECT_EQ(rup::http_status_for(ErrorCode::Unauthenticated), 401);
    EXPECT_EQ(rup::http_status_for(ErrorCode::Forbidden), 403);
    EXPECT_EQ(rup::http_status_for(ErrorCode::NotFound), 404);
    EXPECT_EQ(rup::http_status_for(ErrorCode::OffsetConflict), 409);
    EXPECT_EQ(rup::http_status_for(ErrorCode::Expired), 410);
    EXPECT_EQ(rup::http_status_for(ErrorCode::SizeExceeded), 413);
    EXPECT_EQ(rup::http_status_for(ErrorCode::UnsupportedMediaType), 415);
    EXPECT_EQ(rup::http_status_for(ErrorCode::ChecksumMismatch), 460);
    EXPECT_EQ(rup::http_status_for(ErrorCode::StorageFailure), 500);
    EXPECT_EQ(rup::http_status_for(ErrorCode::NetworkFailure), 503);
}

TEST(ErrorCodeTest, OnlyTransientFailuresAreRetryable) {
    EXPECT_TRUE(rup::is_retryable(ErrorCode::OffsetConflict));
    EXPECT_TRUE(rup::is_retryable(ErrorCode::ChecksumMismatch));
    EXPECT_TRUE(rup::is_retryable(ErrorCode::StorageFailure));
    EXPECT_TRUE(rup::is_retryable(ErrorCode::NetworkFailure));

    EXPECT_FALSE(rup::is_retryable(ErrorCode::Forbidden));
    EXPECT_FALSE(rup::is_retryable(ErrorCode::SizeExceeded));
    EXPECT_FALSE(rup::is_retryable(ErrorCode::Unauthenticated));
    EXPECT_FALSE(rup::is_retryable(ErrorCode::NotFound));
}

TEST(ErrorCodeTest, FailCarriesOffset) {
    auto failed = rup::Fail<std::uint64_t>(ErrorCode::OffsetConflict, "stale", 512);
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().code, ErrorCode::OffsetConflict);
    ASSERT_TRUE(failed.error().current_offset.has_value());
    EXPECT_EQ(*failed.error().current_offset, 512u);

    EXPECT_TRUE(rup::Success().is_ok());
}
