#include "rup/session/memory_session_store.hpp"

namespace rup::session {

Result<void> MemorySessionStore::save(const UploadSession& session) {
    std::lock_guard lock(mutex_);
    sessions_[session.id] = session;
    return Ok();
}

Result<std::optional<UploadSession>> MemorySessionStore::load(const std::string& id) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return Ok(std::optional<UploadSession>{});
    }
    return Ok(std::optional<UploadSession>{it->second});
}

Result<void> MemorySessionStore::remove(const std::string& id) {
    std::lock_guard lock(mutex_);
    sessions_.erase(id);
    return Ok();
}

Result<std::vector<UploadSession>> MemorySessionStore::list() {
    std::lock_guard lock(mutex_);
    std::vector<UploadSession> result;
    result.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        result.push_back(session);
    }
    return Ok(std::move(result));
}

std::size_t MemorySessionStore::size() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

} // namespace rup::session
