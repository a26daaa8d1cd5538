#pragma once

#include "rup/core/clock.hpp"
#include "rup/core/error.hpp"
#include "rup/events/event_bus.hpp"
#include "rup/protocol/checksum.hpp"
#include "rup/session/session_store.hpp"
#include "rup/session/types.hpp"
#include "rup/storage/multipart_store.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rup::session {

struct ManagerOptions {
    std::uint64_t max_upload_size = 500ULL * 1024 * 1024;
    std::chrono::seconds session_ttl{24 * 60 * 60};
};

/**
 * @brief Owns the lifecycle of upload sessions
 *
 * Every mutating operation runs under a lock dedicated to its session id, so
 * the offset check and the offset advance of apply_chunk are one atomic step
 * while different sessions proceed in parallel. A lock exists only while
 * some operation holds or waits for it. Reads go straight to the
 * store, whose records are replaced atomically.
 *
 * A chunk is applied in this order: ownership, expiry, offset, checksum,
 * declared length, storage part, record. Any failure before the record is
 * saved leaves offset and part_manifest untouched. A part stored without
 * its record being saved is overwritten by the retry, which reuses the
 * same part index.
 *
 * Lifecycle events are published on the bus for every state change.
 */
class SessionManager {
public:
    SessionManager(SessionStore& store,
                   storage::MultipartStore& storage,
                   const Clock& clock,
                   events::EventBus& bus,
                   ManagerOptions options = {});

    UploadResult<UploadSession> create_session(const CreateRequest& request);

    /**
     * @return The new offset; OffsetConflict carries the authoritative one
     */
    UploadResult<std::uint64_t> apply_chunk(const std::string& session_id,
                                            const std::string& owner,
                                            std::uint64_t expected_offset,
                                            const std::vector<std::uint8_t>& payload,
                                            const std::optional<protocol::ChunkChecksum>& checksum = std::nullopt);

    UploadResult<SessionStatus> get_status(const std::string& session_id, const std::string& owner);

    /// Full record, for status headers and the info endpoint.
    UploadResult<UploadSession> get_session(const std::string& session_id, const std::string& owner);

    /**
     * @return final_ref; a second call returns the same value without finalizing again
     */
    UploadResult<std::string> complete(const std::string& session_id, const std::string& owner);

    /// Succeeds for sessions that no longer exist.
    UploadResult<void> terminate(const std::string& session_id, const std::string& owner);

    /// Ids of incomplete sessions whose deadline has passed.
    UploadResult<std::vector<std::string>> find_expired();

    /**
     * @brief Terminate a session on behalf of the expiry sweeper
     *
     * Re-checks the deadline under the session lock, so a chunk that
     * extended the session in the meantime keeps it alive.
     * @return true if the session was reaped
     */
    UploadResult<bool> expire(const std::string& session_id);

    const ManagerOptions& options() const noexcept { return options_; }

    /// Session locks currently held or waited on.
    std::size_t active_locks() const;

private:
    struct LockEntry {
        std::mutex mutex;
        std::size_t users = 0;
    };

    /// Holds the lock of one session id; the entry is dropped with its last user.
    class SessionLock {
    public:
        SessionLock(SessionManager& manager, const std::string& session_id);
        ~SessionLock();

        SessionLock(const SessionLock&) = delete;
        SessionLock& operator=(const SessionLock&) = delete;

    private:
        SessionManager& manager_;
        std::string session_id_;
        std::shared_ptr<LockEntry> entry_;
    };

    UploadResult<UploadSession> load_owned(const std::string& session_id, const std::string& owner);
    UploadResult<void> discard(const UploadSession& session, const std::string& source);
    void reject(const UploadSession& session, ErrorCode reason);

    SessionStore& store_;
    storage::MultipartStore& storage_;
    const Clock& clock_;
    events::EventBus& event_bus_;
    ManagerOptions options_;

    mutable std::mutex locks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<LockEntry>> session_locks_;
};

} // namespace rup::session
