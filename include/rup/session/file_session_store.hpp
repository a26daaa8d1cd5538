#pragma once

#include "rup/session/session_store.hpp"

#include <filesystem>
#include <mutex>

namespace rup::session {

/**
 * @brief Session store keeping one JSON document per session on disk
 *
 * Records live at <directory>/<id>.json and are written through a temporary
 * file that is renamed over the previous version. Files that fail to parse
 * are skipped by list() with a warning rather than failing the whole scan.
 */
class FileSessionStore : public SessionStore {
public:
    explicit FileSessionStore(std::filesystem::path directory);

    Result<void> save(const UploadSession& session) override;
    Result<std::optional<UploadSession>> load(const std::string& id) override;
    Result<void> remove(const std::string& id) override;
    Result<std::vector<UploadSession>> list() override;

    const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path record_path(const std::string& id) const;

    std::filesystem::path directory_;
    mutable std::mutex mutex_;
};

} // namespace rup::session
