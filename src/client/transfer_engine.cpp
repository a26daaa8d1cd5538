#include "rup/client/transfer_engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <thread>

namespace rup::client {

namespace {

constexpr std::chrono::milliseconds kStopPollInterval{50};

} // namespace

TransferEngine::TransferEngine(TusClient& client, EngineOptions options, Sleeper sleeper)
    : client_(client),
      options_(options),
      sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = &TransferEngine::interruptible_sleep;
    }
}

TransferOutcome TransferEngine::run(UploadTask& task,
                                    const StopPredicate& should_stop,
                                    const ProgressCallback& on_progress) {
    std::uint32_t attempt = 0;

    while (true) {
        if (should_stop && should_stop()) {
            return TransferOutcome::Stopped;
        }

        auto pass = transfer_pass(task, should_stop, on_progress, attempt);
        if (pass.is_ok()) {
            if (pass.value()) {
                task.last_error.clear();
                return TransferOutcome::Completed;
            }
            return TransferOutcome::Stopped;
        }

        const UploadError& error = pass.error();
        task.last_error = std::string(to_string(error.code)) + ": " + error.message;

        if (error.code == ErrorCode::NotFound || error.code == ErrorCode::Expired) {
            if (task.has_session()) {
                spdlog::warn("Upload {} lost its server session ({}), starting over",
                             task.id, to_string(error.code));
                task.session_url.clear();
                task.bytes_transferred = 0;
                if (on_progress) {
                    on_progress(task);
                }
            }
        } else if (!is_retryable(error.code)) {
            spdlog::error("Upload {} failed permanently: {}", task.id, task.last_error);
            return TransferOutcome::Failed;
        }

        ++attempt;
        if (attempt > options_.max_retries) {
            spdlog::error("Upload {} gave up after {} retries: {}", task.id, options_.max_retries, task.last_error);
            return TransferOutcome::Failed;
        }

        const auto delay = backoff_for(attempt);
        spdlog::info("Upload {} retry {}/{} in {}ms ({})",
                     task.id, attempt, options_.max_retries, delay.count(), task.last_error);
        if (!sleeper_(delay, should_stop)) {
            spdlog::debug("Upload {} stopped during backoff", task.id);
            return TransferOutcome::Stopped;
        }
    }
}

bool TransferEngine::interruptible_sleep(std::chrono::milliseconds delay, const StopPredicate& should_stop) {
    const auto deadline = std::chrono::steady_clock::now() + delay;
    while (true) {
        if (should_stop && should_stop()) {
            return false;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(deadline - now, kStopPollInterval));
    }
}

std::chrono::milliseconds TransferEngine::backoff_for(std::uint32_t attempt) const {
    if (attempt == 0) {
        return std::chrono::milliseconds(0);
    }
    auto delay = options_.initial_backoff;
    for (std::uint32_t i = 1; i < attempt && delay < options_.max_backoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, options_.max_backoff);
}

UploadResult<bool> TransferEngine::transfer_pass(UploadTask& task,
                                                 const StopPredicate& should_stop,
                                                 const ProgressCallback& on_progress,
                                                 std::uint32_t& attempt) {
    auto notify = [&] {
        if (on_progress) {
            on_progress(task);
        }
    };

    if (!task.has_session()) {
        auto created = client_.create(task.declared_size, task.metadata);
        if (created.is_error()) {
            return Err<bool, UploadError>(created.error());
        }
        task.session_url = created.value();
        task.bytes_transferred = 0;
        spdlog::debug("Upload {} bound to {}", task.id, task.session_url);
        notify();
    }

    // Reconcile with the server before sending anything
    auto remote = client_.status(task.session_url);
    if (remote.is_error()) {
        return Err<bool, UploadError>(remote.error());
    }
    if (remote.value().length != task.declared_size) {
        return Fail<bool>(ErrorCode::InvalidRequest,
                          "Server expects " + std::to_string(remote.value().length) +
                          " bytes but the file declares " + std::to_string(task.declared_size));
    }
    task.bytes_transferred = remote.value().offset;
    notify();

    bool sent_any = false;
    std::uint32_t conflicts = 0;

    while (task.bytes_transferred < task.declared_size) {
        if (should_stop && should_stop()) {
            return Ok<bool, UploadError>(false);
        }

        const std::uint64_t length = std::min(options_.chunk_size,
                                              task.declared_size - task.bytes_transferred);
        auto chunk = read_chunk(task, task.bytes_transferred, length);
        if (chunk.is_error()) {
            return Err<bool, UploadError>(chunk.error());
        }

        std::optional<protocol::ChunkChecksum> checksum;
        if (options_.checksum_algorithm) {
            checksum = protocol::ChunkChecksum{
                *options_.checksum_algorithm,
                protocol::compute_digest(*options_.checksum_algorithm, chunk.value())};
        }

        auto applied = client_.patch(task.session_url, task.bytes_transferred, chunk.value(), checksum);
        if (applied.is_error()) {
            const UploadError& error = applied.error();
            if (error.code == ErrorCode::OffsetConflict && error.current_offset &&
                ++conflicts <= options_.max_retries) {
                spdlog::info("Upload {} realigning from {} to server offset {}",
                             task.id, task.bytes_transferred, *error.current_offset);
                task.bytes_transferred = *error.current_offset;
                notify();
                continue;
            }
            return Err<bool, UploadError>(error);
        }

        conflicts = 0;
        attempt = 0;
        sent_any = true;
        task.bytes_transferred = applied.value();
        notify();
    }

    if (!sent_any) {
        // Nothing left to send: an empty PATCH asks the server to finish finalization
        auto applied = client_.patch(task.session_url, task.bytes_transferred, {}, std::nullopt);
        if (applied.is_error()) {
            return Err<bool, UploadError>(applied.error());
        }
    }

    return Ok<bool, UploadError>(true);
}

UploadResult<std::vector<std::uint8_t>> TransferEngine::read_chunk(const UploadTask& task,
                                                                   std::uint64_t offset,
                                                                   std::uint64_t length) const {
    std::ifstream input(task.file_reference, std::ios::binary);
    if (!input) {
        return Fail<std::vector<std::uint8_t>>(ErrorCode::InvalidRequest,
                                               "Cannot open " + task.file_reference.string());
    }

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(length));
    input.seekg(static_cast<std::streamoff>(offset));
    input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
    if (static_cast<std::uint64_t>(input.gcount()) != length) {
        return Fail<std::vector<std::uint8_t>>(ErrorCode::InvalidRequest,
                                               task.file_reference.string() + " is shorter than its declared size");
    }
    return Ok<std::vector<std::uint8_t>, UploadError>(std::move(buffer));
}

} // namespace rup::client
