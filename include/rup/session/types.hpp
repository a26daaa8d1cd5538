#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rup::session {

using TimePoint = std::chrono::system_clock::time_point;
using Metadata = std::map<std::string, std::string>;

/**
 * @brief One stored part of the multipart transfer behind a session
 */
struct PartRecord {
    std::uint32_t part_index = 0;   ///< 1-based, equal to position in the manifest + 1
    std::uint64_t size = 0;
    std::string storage_part_id;
};

/**
 * @brief Server-side record of one resumable upload
 *
 * offset only grows and never passes total_size. part_manifest is
 * append-only; the sum of its sizes equals offset. completed implies
 * offset == total_size and a non-empty final_ref.
 */
struct UploadSession {
    std::string id;
    std::string owner_id;
    std::string target_ref;
    std::uint64_t total_size = 0;
    std::uint64_t offset = 0;
    std::optional<std::string> checksum_algorithm;
    Metadata metadata;
    std::string storage_handle;
    std::vector<PartRecord> part_manifest;
    bool completed = false;
    std::string final_ref;
    TimePoint created_at{};
    TimePoint expires_at{};
    std::optional<TimePoint> completed_at;

    [[nodiscard]] bool is_expired(TimePoint now) const noexcept {
        return !completed && now > expires_at;
    }

    [[nodiscard]] double progress_percent() const noexcept {
        if (total_size == 0) {
            return completed ? 100.0 : 0.0;
        }
        return static_cast<double>(offset) * 100.0 / static_cast<double>(total_size);
    }
};

/**
 * @brief Read-only view returned by status queries
 */
struct SessionStatus {
    std::uint64_t offset = 0;
    std::uint64_t total_size = 0;
    bool completed = false;
    TimePoint expires_at{};
};

/**
 * @brief Parameters of a new upload session
 */
struct CreateRequest {
    std::string owner_id;
    std::string target_ref;
    std::uint64_t total_size = 0;
    Metadata metadata;
    std::optional<std::string> checksum_algorithm;
};

} // namespace rup::session
