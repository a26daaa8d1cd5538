#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace rup {

/// 128 random bits rendered as 32 lowercase hex characters.
std::string generate_id();

/// Milliseconds since the Unix epoch, the on-disk representation of timestamps.
std::int64_t to_unix_millis(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point from_unix_millis(std::int64_t millis);

/// RFC 7231 IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT".
std::string to_http_date(std::chrono::system_clock::time_point tp);

/// ISO-8601 UTC with second precision, e.g. "2024-03-01T12:00:00Z".
std::string to_iso8601(std::chrono::system_clock::time_point tp);

} // namespace rup
