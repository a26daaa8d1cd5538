#pragma once

#include "rup/storage/multipart_store.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace rup::storage {

/**
 * @brief In-process multipart store
 *
 * Keeps parts and finished objects in memory and counts every call, which
 * lets tests assert how often the session layer touched storage.
 */
class MemoryMultipartStore : public MultipartStore {
public:
    struct Counters {
        std::atomic<std::uint32_t> initiate{0};
        std::atomic<std::uint32_t> upload_part{0};
        std::atomic<std::uint32_t> complete{0};
        std::atomic<std::uint32_t> abort{0};
    };

    Result<std::string> initiate(const std::string& key) override;
    Result<std::string> upload_part(const std::string& handle, std::uint32_t index,
                                    const std::vector<std::uint8_t>& bytes) override;
    Result<std::string> complete(const std::string& handle,
                                 const std::vector<std::string>& part_ids) override;
    Result<void> abort(const std::string& handle) override;

    const Counters& counters() const { return counters_; }

    /// Contents of a completed object, if it exists.
    std::optional<std::vector<std::uint8_t>> object(const std::string& final_ref) const;

    bool has_transfer(const std::string& handle) const;
    std::size_t open_transfers() const;

private:
    struct Transfer {
        std::string key;
        std::map<std::uint32_t, std::vector<std::uint8_t>> parts;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Transfer> transfers_;
    std::unordered_map<std::string, std::string> completed_;  // handle -> final ref
    std::unordered_map<std::string, std::vector<std::uint8_t>> objects_;
    Counters counters_;
    std::uint64_t next_handle_ = 1;
};

} // namespace rup::storage
