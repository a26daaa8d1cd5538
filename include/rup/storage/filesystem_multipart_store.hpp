#pragma once

#include "rup/storage/multipart_store.hpp"

#include <filesystem>

namespace rup::storage {

/**
 * @brief Multipart store backed by a local directory tree
 *
 * Layout under the root:
 *   staging/<handle>/key            object key the transfer was opened for
 *   staging/<handle>/part-000001    one file per part
 *   staging/<handle>/completed      marker left by complete()
 *   objects/<key>                   assembled objects
 *
 * Parts are written to a temporary file and renamed into place, so a part
 * is either fully present or absent. complete() concatenates the listed
 * parts in order into objects/<key>, drops the parts and marks the handle
 * completed; abort() removes what is left of the staging directory.
 */
class FilesystemMultipartStore : public MultipartStore {
public:
    explicit FilesystemMultipartStore(std::filesystem::path root);

    Result<std::string> initiate(const std::string& key) override;
    Result<std::string> upload_part(const std::string& handle, std::uint32_t index,
                                    const std::vector<std::uint8_t>& bytes) override;
    Result<std::string> complete(const std::string& handle,
                                 const std::vector<std::string>& part_ids) override;
    Result<void> abort(const std::string& handle) override;

    /// Absolute path of an object returned by complete().
    std::filesystem::path object_path(const std::string& final_ref) const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path staging_dir(const std::string& handle) const;
    static std::string part_name(std::uint32_t index);
    static bool is_safe_component(const std::string& value);

    std::filesystem::path root_;
};

} // namespace rup::storage
