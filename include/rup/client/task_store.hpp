#pragma once

#include "rup/client/upload_task.hpp"
#include "rup/core/result.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace rup::client {

/**
 * @brief Everything the upload queue must find again after a restart
 *
 * pending_terminations holds session URLs whose DELETE has not yet been
 * acknowledged by the server.
 */
struct QueueState {
    std::vector<UploadTask> tasks;
    std::vector<std::string> pending_terminations;
};

/**
 * @brief Local JSON file holding the upload queue
 *
 * The queue saves the complete state after every transition. Writes go to
 * a temporary file renamed over the previous one, so a crash leaves either
 * the old or the new state on disk.
 */
class TaskStore {
public:
    explicit TaskStore(std::filesystem::path path);

    /// Empty state when the file does not exist yet.
    Result<QueueState> load() const;

    Result<void> save(const QueueState& state);

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    mutable std::mutex mutex_;
};

} // namespace rup::client
