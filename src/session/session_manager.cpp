#include "rup/session/session_manager.hpp"

#include "rup/core/ids.hpp"
#include "rup/events/events.hpp"

#include <spdlog/spdlog.h>

namespace rup::session {

SessionManager::SessionManager(SessionStore& store,
                               storage::MultipartStore& storage,
                               const Clock& clock,
                               events::EventBus& bus,
                               ManagerOptions options)
    : store_(store),
      storage_(storage),
      clock_(clock),
      event_bus_(bus),
      options_(options) {
}

// ────────────────────────────────────────────────────────────
// Creation
// ────────────────────────────────────────────────────────────

UploadResult<UploadSession> SessionManager::create_session(const CreateRequest& request) {
    if (request.total_size > options_.max_upload_size) {
        return Fail<UploadSession>(ErrorCode::SizeExceeded,
                                   "Upload of " + std::to_string(request.total_size) +
                                   " bytes exceeds the maximum of " +
                                   std::to_string(options_.max_upload_size));
    }
    if (request.checksum_algorithm && !protocol::parse_algorithm(*request.checksum_algorithm)) {
        return Fail<UploadSession>(ErrorCode::InvalidRequest,
                                   "Unsupported checksum algorithm '" + *request.checksum_algorithm + "'");
    }

    UploadSession session;
    session.id = generate_id();
    session.owner_id = request.owner_id;
    session.target_ref = request.target_ref;
    session.total_size = request.total_size;
    session.checksum_algorithm = request.checksum_algorithm;
    session.metadata = request.metadata;
    session.created_at = clock_.now();
    session.expires_at = session.created_at + options_.session_ttl;

    auto handle = storage_.initiate(session.id);
    if (handle.is_error()) {
        spdlog::error("Storage initiate failed for new upload: {}", handle.error());
        return Fail<UploadSession>(ErrorCode::StorageFailure, handle.error());
    }
    session.storage_handle = handle.value();

    if (auto saved = store_.save(session); saved.is_error()) {
        spdlog::error("Could not persist session {}: {}", session.id, saved.error());
        if (auto aborted = storage_.abort(session.storage_handle); aborted.is_error()) {
            spdlog::warn("Could not release transfer {}: {}", session.storage_handle, aborted.error());
        }
        return Fail<UploadSession>(ErrorCode::StorageFailure, saved.error());
    }

    event_bus_.emit(events::UploadCreatedEvent{
        session.id, session.owner_id, session.target_ref, session.total_size});
    return Ok<UploadSession, UploadError>(std::move(session));
}

// ────────────────────────────────────────────────────────────
// Chunk application
// ────────────────────────────────────────────────────────────

UploadResult<std::uint64_t> SessionManager::apply_chunk(const std::string& session_id,
                                                        const std::string& owner,
                                                        std::uint64_t expected_offset,
                                                        const std::vector<std::uint8_t>& payload,
                                                        const std::optional<protocol::ChunkChecksum>& checksum) {
    SessionLock guard(*this, session_id);

    auto loaded = load_owned(session_id, owner);
    if (loaded.is_error()) {
        return Err<std::uint64_t, UploadError>(loaded.error());
    }
    UploadSession session = std::move(loaded.value());

    const auto now = clock_.now();
    if (session.is_expired(now)) {
        reject(session, ErrorCode::Expired);
        return Fail<std::uint64_t>(ErrorCode::Expired, "Upload session has expired", session.offset);
    }

    if (expected_offset != session.offset) {
        reject(session, ErrorCode::OffsetConflict);
        return Fail<std::uint64_t>(ErrorCode::OffsetConflict,
                                   "Expected offset " + std::to_string(expected_offset) +
                                   " but upload is at " + std::to_string(session.offset),
                                   session.offset);
    }

    if (!payload.empty() && session.checksum_algorithm) {
        if (!checksum) {
            return Fail<std::uint64_t>(ErrorCode::InvalidRequest,
                                       "Upload requires a " + *session.checksum_algorithm + " checksum per chunk",
                                       session.offset);
        }
        if (protocol::algorithm_name(checksum->algorithm) != *session.checksum_algorithm) {
            return Fail<std::uint64_t>(ErrorCode::InvalidRequest,
                                       "Upload requires " + *session.checksum_algorithm + " checksums",
                                       session.offset);
        }
    }

    if (checksum && !checksum->matches(payload)) {
        reject(session, ErrorCode::ChecksumMismatch);
        return Fail<std::uint64_t>(ErrorCode::ChecksumMismatch,
                                   "Chunk does not match its " +
                                   std::string(protocol::algorithm_name(checksum->algorithm)) + " checksum",
                                   session.offset);
    }

    if (payload.size() > session.total_size - session.offset) {
        reject(session, ErrorCode::SizeExceeded);
        return Fail<std::uint64_t>(ErrorCode::SizeExceeded,
                                   "Chunk of " + std::to_string(payload.size()) +
                                   " bytes runs past the declared length " + std::to_string(session.total_size),
                                   session.offset);
    }

    if (payload.empty()) {
        return Ok<std::uint64_t, UploadError>(session.offset);
    }

    const auto part_index = static_cast<std::uint32_t>(session.part_manifest.size() + 1);
    auto part_id = storage_.upload_part(session.storage_handle, part_index, payload);
    if (part_id.is_error()) {
        spdlog::error("Storing part {} of {} failed: {}", part_index, session.id, part_id.error());
        reject(session, ErrorCode::StorageFailure);
        return Fail<std::uint64_t>(ErrorCode::StorageFailure, part_id.error(), session.offset);
    }

    const std::uint64_t previous_offset = session.offset;
    session.part_manifest.push_back(PartRecord{part_index, payload.size(), part_id.value()});
    session.offset += payload.size();
    session.expires_at = now + options_.session_ttl;

    if (auto saved = store_.save(session); saved.is_error()) {
        spdlog::error("Could not persist progress of {}: {}", session.id, saved.error());
        return Fail<std::uint64_t>(ErrorCode::StorageFailure, saved.error(), previous_offset);
    }

    event_bus_.emit(events::ChunkAppliedEvent{
        session.id, part_index, payload.size(), session.offset, session.total_size});
    return Ok<std::uint64_t, UploadError>(session.offset);
}

// ────────────────────────────────────────────────────────────
// Queries
// ────────────────────────────────────────────────────────────

UploadResult<SessionStatus> SessionManager::get_status(const std::string& session_id, const std::string& owner) {
    auto loaded = get_session(session_id, owner);
    if (loaded.is_error()) {
        return Err<SessionStatus, UploadError>(loaded.error());
    }
    const auto& session = loaded.value();
    return Ok<SessionStatus, UploadError>(
        SessionStatus{session.offset, session.total_size, session.completed, session.expires_at});
}

UploadResult<UploadSession> SessionManager::get_session(const std::string& session_id, const std::string& owner) {
    auto loaded = load_owned(session_id, owner);
    if (loaded.is_error()) {
        return loaded;
    }
    if (loaded.value().is_expired(clock_.now())) {
        return Fail<UploadSession>(ErrorCode::Expired, "Upload session has expired", loaded.value().offset);
    }
    return loaded;
}

// ────────────────────────────────────────────────────────────
// Completion
// ────────────────────────────────────────────────────────────

UploadResult<std::string> SessionManager::complete(const std::string& session_id, const std::string& owner) {
    SessionLock guard(*this, session_id);

    auto loaded = load_owned(session_id, owner);
    if (loaded.is_error()) {
        return Err<std::string, UploadError>(loaded.error());
    }
    UploadSession session = std::move(loaded.value());

    if (session.completed) {
        return Ok<std::string, UploadError>(session.final_ref);
    }

    const auto now = clock_.now();
    if (session.is_expired(now)) {
        return Fail<std::string>(ErrorCode::Expired, "Upload session has expired", session.offset);
    }

    if (session.offset != session.total_size) {
        return Fail<std::string>(ErrorCode::IncompleteUpload,
                                 "Upload is at " + std::to_string(session.offset) + " of " +
                                 std::to_string(session.total_size) + " bytes",
                                 session.offset);
    }

    std::vector<std::string> part_ids;
    part_ids.reserve(session.part_manifest.size());
    for (const auto& part : session.part_manifest) {
        part_ids.push_back(part.storage_part_id);
    }

    auto final_ref = storage_.complete(session.storage_handle, part_ids);
    if (final_ref.is_error()) {
        spdlog::error("Finalizing {} failed: {}", session.id, final_ref.error());
        return Fail<std::string>(ErrorCode::StorageFailure, final_ref.error(), session.offset);
    }

    session.completed = true;
    session.final_ref = final_ref.value();
    session.completed_at = now;

    if (auto saved = store_.save(session); saved.is_error()) {
        spdlog::error("Upload {} finalized as {} but its record was not updated: {}",
                      session.id, session.final_ref, saved.error());
        return Fail<std::string>(ErrorCode::StorageFailure, saved.error(), session.offset);
    }

    // The record now carries final_ref, so the storage handle is no longer needed
    if (auto released = storage_.abort(session.storage_handle); released.is_error()) {
        spdlog::warn("Upload {} completed but its storage handle was not released: {}",
                     session.id, released.error());
    }

    event_bus_.emit(events::UploadCompletedEvent{
        session.id, session.owner_id, session.target_ref, session.final_ref, session.total_size,
        std::chrono::duration_cast<std::chrono::milliseconds>(now - session.created_at)});
    return Ok<std::string, UploadError>(session.final_ref);
}

// ────────────────────────────────────────────────────────────
// Termination
// ────────────────────────────────────────────────────────────

UploadResult<void> SessionManager::terminate(const std::string& session_id, const std::string& owner) {
    SessionLock guard(*this, session_id);

    auto loaded = load_owned(session_id, owner);
    if (loaded.is_error()) {
        if (loaded.error().code == ErrorCode::NotFound) {
            return Success();
        }
        return Err<void, UploadError>(loaded.error());
    }

    return discard(loaded.value(), "client");
}

UploadResult<std::vector<std::string>> SessionManager::find_expired() {
    auto sessions = store_.list();
    if (sessions.is_error()) {
        return Fail<std::vector<std::string>>(ErrorCode::StorageFailure, sessions.error());
    }

    const auto now = clock_.now();
    std::vector<std::string> expired;
    for (const auto& session : sessions.value()) {
        if (session.is_expired(now)) {
            expired.push_back(session.id);
        }
    }
    return Ok<std::vector<std::string>, UploadError>(std::move(expired));
}

UploadResult<bool> SessionManager::expire(const std::string& session_id) {
    SessionLock guard(*this, session_id);

    auto loaded = store_.load(session_id);
    if (loaded.is_error()) {
        return Fail<bool>(ErrorCode::StorageFailure, loaded.error());
    }
    if (!loaded.value() || !loaded.value()->is_expired(clock_.now())) {
        return Ok<bool, UploadError>(false);
    }

    const UploadSession& session = *loaded.value();
    auto result = discard(session, "sweeper");
    if (result.is_error()) {
        return Err<bool, UploadError>(result.error());
    }

    event_bus_.emit(events::UploadExpiredEvent{session.id, session.offset, session.total_size});
    return Ok<bool, UploadError>(true);
}

// ────────────────────────────────────────────────────────────
// Helpers
// ────────────────────────────────────────────────────────────

SessionManager::SessionLock::SessionLock(SessionManager& manager, const std::string& session_id)
    : manager_(manager), session_id_(session_id) {
    {
        std::lock_guard lock(manager_.locks_mutex_);
        auto& entry = manager_.session_locks_[session_id_];
        if (!entry) {
            entry = std::make_shared<LockEntry>();
        }
        ++entry->users;
        entry_ = entry;
    }
    entry_->mutex.lock();
}

SessionManager::SessionLock::~SessionLock() {
    entry_->mutex.unlock();

    std::lock_guard lock(manager_.locks_mutex_);
    if (--entry_->users == 0) {
        manager_.session_locks_.erase(session_id_);
    }
}

std::size_t SessionManager::active_locks() const {
    std::lock_guard lock(locks_mutex_);
    return session_locks_.size();
}

UploadResult<UploadSession> SessionManager::load_owned(const std::string& session_id, const std::string& owner) {
    auto loaded = store_.load(session_id);
    if (loaded.is_error()) {
        return Fail<UploadSession>(ErrorCode::StorageFailure, loaded.error());
    }
    if (!loaded.value()) {
        return Fail<UploadSession>(ErrorCode::NotFound, "Unknown upload " + session_id);
    }
    if (loaded.value()->owner_id != owner) {
        return Fail<UploadSession>(ErrorCode::Forbidden, "Upload " + session_id + " belongs to another owner");
    }
    return Ok<UploadSession, UploadError>(std::move(*loaded.value()));
}

UploadResult<void> SessionManager::discard(const UploadSession& session, const std::string& source) {
    // A completed upload has no open transfer left; only its record goes.
    if (!session.completed) {
        if (auto aborted = storage_.abort(session.storage_handle); aborted.is_error()) {
            spdlog::error("Aborting transfer of {} failed: {}", session.id, aborted.error());
            return Fail<void>(ErrorCode::StorageFailure, aborted.error());
        }
    }

    if (auto removed = store_.remove(session.id); removed.is_error()) {
        spdlog::error("Removing record of {} failed: {}", session.id, removed.error());
        return Fail<void>(ErrorCode::StorageFailure, removed.error());
    }

    event_bus_.emit(events::UploadTerminatedEvent{session.id, session.owner_id, source});
    return Success();
}

void SessionManager::reject(const UploadSession& session, ErrorCode reason) {
    event_bus_.emit(events::ChunkRejectedEvent{session.id, std::string(to_string(reason)), session.offset});
}

} // namespace rup::session
