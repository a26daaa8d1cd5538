#include "rup/client/upload_task.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace rup::client {

namespace {

const std::unordered_map<TaskStatus, std::vector<TaskStatus>>& transitions() {
    static const std::unordered_map<TaskStatus, std::vector<TaskStatus>> table {
        {TaskStatus::Queued, {TaskStatus::Uploading, TaskStatus::Paused, TaskStatus::Failed}},
        // Back to Queued when a restart or shutdown interrupts the transfer
        {TaskStatus::Uploading, {TaskStatus::Completed, TaskStatus::Failed, TaskStatus::Paused, TaskStatus::Queued}},
        // Completed when the last chunk lands while a pause is pending
        {TaskStatus::Paused, {TaskStatus::Queued, TaskStatus::Completed}},
        {TaskStatus::Failed, {TaskStatus::Queued}},
    };
    return table;
}

} // namespace

std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Queued: return "queued";
        case TaskStatus::Uploading: return "uploading";
        case TaskStatus::Paused: return "paused";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Cancelled: return "cancelled";
    }
    return "queued";
}

std::optional<TaskStatus> parse_task_status(std::string_view name) noexcept {
    if (name == "queued") return TaskStatus::Queued;
    if (name == "uploading") return TaskStatus::Uploading;
    if (name == "paused") return TaskStatus::Paused;
    if (name == "completed") return TaskStatus::Completed;
    if (name == "failed") return TaskStatus::Failed;
    if (name == "cancelled") return TaskStatus::Cancelled;
    return std::nullopt;
}

bool can_transition(TaskStatus from, TaskStatus to) noexcept {
    if (from == TaskStatus::Completed || from == TaskStatus::Cancelled) {
        return false;
    }
    if (to == TaskStatus::Cancelled) {
        return true;
    }

    const auto& table = transitions();
    const auto it = table.find(from);
    if (it == table.end()) {
        return false;
    }
    return std::find(it->second.begin(), it->second.end(), to) != it->second.end();
}

std::string UploadTask::session_id() const {
    const auto slash = session_url.find_last_of('/');
    return slash == std::string::npos ? session_url : session_url.substr(slash + 1);
}

Result<void> UploadTask::transition_to(TaskStatus next) {
    if (status == next) {
        return Ok();
    }
    if (!can_transition(status, next)) {
        return Err<void>("Illegal task transition " + std::string(to_string(status)) +
                         " -> " + std::string(to_string(next)));
    }
    status = next;
    return Ok();
}

} // namespace rup::client
