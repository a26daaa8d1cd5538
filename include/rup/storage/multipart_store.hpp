#pragma once

#include "rup/core/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace rup::storage {

/**
 * @brief Multipart upload primitives of an object store
 *
 * A transfer is opened with initiate(), filled with numbered parts and then
 * either completed into a single object or aborted. The store knows nothing
 * about offsets or sessions.
 *
 * Guarantees expected from every implementation:
 * - upload_part() for an (handle, index) pair that already exists replaces
 *   the previous part, so a retried part never duplicates bytes.
 * - complete() fails if any listed part is missing; on success the
 *   transfer's parts are gone and only the final object remains.
 * - complete() of a handle that already completed returns the same
 *   reference without assembling again, until abort() releases the handle.
 * - abort() of an unknown or already aborted handle succeeds. Aborting a
 *   completed handle releases it and leaves the object in place.
 *
 * Errors are plain strings; callers wrap them into their own taxonomy.
 */
class MultipartStore {
public:
    virtual ~MultipartStore() = default;

    /// @return Opaque handle identifying the transfer
    virtual Result<std::string> initiate(const std::string& key) = 0;

    /// @param index 1-based part number
    /// @return Identifier of the stored part, as required by complete()
    virtual Result<std::string> upload_part(const std::string& handle, std::uint32_t index,
                                            const std::vector<std::uint8_t>& bytes) = 0;

    /// @return Reference of the assembled object
    virtual Result<std::string> complete(const std::string& handle,
                                         const std::vector<std::string>& part_ids) = 0;

    virtual Result<void> abort(const std::string& handle) = 0;
};

} // namespace rup::storage
