#include "rup/core/ids.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>

#include <array>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace rup {
namespace {

std::tm to_utc_tm(std::chrono::system_clock::time_point tp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    return utc;
}

} // namespace

std::string generate_id() {
    std::array<unsigned char, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        char reason[256] = {};
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        spdlog::warn("RAND_bytes failed ({}), generating id from std::random_device", reason);
        std::random_device device;
        for (auto& byte : bytes) {
            byte = static_cast<unsigned char>(device() & 0xFF);
        }
    }

    std::ostringstream oss;
    for (auto byte : bytes) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return oss.str();
}

std::int64_t to_unix_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_unix_millis(std::int64_t millis) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(millis)));
}

std::string to_http_date(std::chrono::system_clock::time_point tp) {
    const std::tm utc = to_utc_tm(tp);
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::put_time(&utc, "%a, %d %b %Y %H:%M:%S GMT");
    return oss.str();
}

std::string to_iso8601(std::chrono::system_clock::time_point tp) {
    const std::tm utc = to_utc_tm(tp);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace rup
