#pragma once

#include "rup/core/result.hpp"
#include "rup/session/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rup::session {

/**
 * @brief Durable home of UploadSession records
 *
 * save() replaces the whole record. Implementations must make a save either
 * fully visible or not at all, so a crash never leaves a half-written record
 * behind. load() distinguishes "not found" (empty optional) from an I/O
 * failure (error).
 */
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual Result<void> save(const UploadSession& session) = 0;
    virtual Result<std::optional<UploadSession>> load(const std::string& id) = 0;
    virtual Result<void> remove(const std::string& id) = 0;

    /// Snapshot of every stored record.
    virtual Result<std::vector<UploadSession>> list() = 0;
};

} // namespace rup::session
