#pragma once

#include "rup/client/tus_client.hpp"
#include "rup/client/upload_task.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace rup::client {

struct EngineOptions {
    std::uint64_t chunk_size = 5ULL * 1024 * 1024;
    std::uint32_t max_retries = 5;
    std::chrono::milliseconds initial_backoff{1000};
    std::chrono::milliseconds max_backoff{30000};
    std::optional<protocol::ChecksumAlgorithm> checksum_algorithm = protocol::ChecksumAlgorithm::Sha256;
};

enum class TransferOutcome {
    Completed,
    Stopped,    ///< should_stop() returned true at a chunk boundary
    Failed      ///< Retry budget exhausted or a permanent error; see task.last_error
};

/**
 * @brief Drives one task through create, reconcile and sequential PATCHes
 *
 * Before sending anything the engine asks the server for the session's
 * offset and continues from there; the task's own bytes_transferred is
 * never trusted. A 409 realigns to the offset the server reports. Only
 * bytes the server acknowledged are counted as progress.
 *
 * Transient failures (network, storage, checksum) are retried with
 * exponential backoff: initial_backoff * 2^(attempt-1), capped at
 * max_backoff. The attempt counter resets whenever a chunk lands. A
 * session the server no longer knows is recreated from offset 0. A stop
 * request during a backoff wait ends the run as Stopped.
 */
class TransferEngine {
public:
    using StopPredicate = std::function<bool()>;
    /// Waits out a backoff delay; false when should_stop turned true first.
    using Sleeper = std::function<bool(std::chrono::milliseconds, const StopPredicate&)>;
    using ProgressCallback = std::function<void(const UploadTask&)>;

    TransferEngine(TusClient& client, EngineOptions options, Sleeper sleeper = {});

    /**
     * @param on_progress Called after the session is bound and after every
     *        acknowledged chunk, with the updated task
     */
    TransferOutcome run(UploadTask& task,
                        const StopPredicate& should_stop,
                        const ProgressCallback& on_progress);

    std::chrono::milliseconds backoff_for(std::uint32_t attempt) const;

    /// Default Sleeper: sleeps in short slices, polling should_stop between them.
    static bool interruptible_sleep(std::chrono::milliseconds delay, const StopPredicate& should_stop);

    const EngineOptions& options() const noexcept { return options_; }

private:
    /// One pass from reconciliation to the last chunk; errors end the pass.
    UploadResult<bool> transfer_pass(UploadTask& task,
                                     const StopPredicate& should_stop,
                                     const ProgressCallback& on_progress,
                                     std::uint32_t& attempt);

    UploadResult<std::vector<std::uint8_t>> read_chunk(const UploadTask& task,
                                                       std::uint64_t offset,
                                                       std::uint64_t length) const;

    TusClient& client_;
    EngineOptions options_;
    Sleeper sleeper_;
};

} // namespace rup::client
