#pragma once

#include "rup/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace rup::client {

/**
 * @brief Client-side states of an upload
 *
 *   Queued ──► Uploading ──► Completed
 *     ▲  │        │  ▲  └──► Failed ──► Queued (retry)
 *     │  │        ▼  │
 *     └──┴───── Paused
 *
 * Any non-terminal state may move to Cancelled. Completed and Cancelled
 * are terminal.
 */
enum class TaskStatus {
    Queued,
    Uploading,
    Paused,
    Completed,
    Failed,
    Cancelled
};

std::string_view to_string(TaskStatus status) noexcept;
std::optional<TaskStatus> parse_task_status(std::string_view name) noexcept;

[[nodiscard]] bool can_transition(TaskStatus from, TaskStatus to) noexcept;

struct UploadTask {
    using TimePoint = std::chrono::system_clock::time_point;

    std::string id;
    std::string session_url;                    ///< Location returned on creation, empty until bound
    std::filesystem::path file_reference;
    std::uint64_t declared_size = 0;
    std::uint64_t bytes_transferred = 0;        ///< Last offset confirmed by the server
    TaskStatus status = TaskStatus::Queued;
    std::string last_error;
    std::map<std::string, std::string> metadata;
    TimePoint created_at{};
    std::optional<TimePoint> completed_at;

    [[nodiscard]] bool has_session() const noexcept { return !session_url.empty(); }

    [[nodiscard]] bool is_terminal() const noexcept {
        return status == TaskStatus::Completed || status == TaskStatus::Cancelled;
    }

    [[nodiscard]] double progress() const noexcept {
        if (declared_size == 0) {
            return status == TaskStatus::Completed ? 100.0 : 0.0;
        }
        return static_cast<double>(bytes_transferred) * 100.0 / static_cast<double>(declared_size);
    }

    /// Session id: last path segment of session_url.
    std::string session_id() const;

    /**
     * @brief Move to a new status if the transition table allows it
     */
    Result<void> transition_to(TaskStatus next);
};

} // namespace rup::client
