#pragma once

#include "rup/session/session_store.hpp"

#include <mutex>
#include <unordered_map>

namespace rup::session {

/**
 * @brief Session store that lives and dies with the process
 */
class MemorySessionStore : public SessionStore {
public:
    Result<void> save(const UploadSession& session) override;
    Result<std::optional<UploadSession>> load(const std::string& id) override;
    Result<void> remove(const std::string& id) override;
    Result<std::vector<UploadSession>> list() override;

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, UploadSession> sessions_;
};

} // namespace rup::session
