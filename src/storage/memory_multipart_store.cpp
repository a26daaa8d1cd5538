#include "rup/storage/memory_multipart_store.hpp"

#include <exception>

namespace rup::storage {

namespace {

std::string part_id_for(std::uint32_t index) {
    return "part-" + std::to_string(index);
}

std::optional<std::uint32_t> index_from_part_id(const std::string& part_id) {
    static const std::string prefix = "part-";
    if (part_id.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    try {
        return static_cast<std::uint32_t>(std::stoul(part_id.substr(prefix.size())));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

Result<std::string> MemoryMultipartStore::initiate(const std::string& key) {
    counters_.initiate++;
    std::lock_guard lock(mutex_);
    std::string handle = "mem-" + std::to_string(next_handle_++);
    transfers_[handle] = Transfer{key, {}};
    return Ok<std::string, std::string>(std::move(handle));
}

Result<std::string> MemoryMultipartStore::upload_part(const std::string& handle, std::uint32_t index,
                                                      const std::vector<std::uint8_t>& bytes) {
    counters_.upload_part++;
    std::lock_guard lock(mutex_);
    auto it = transfers_.find(handle);
    if (it == transfers_.end()) {
        return Err<std::string, std::string>("Unknown transfer: " + handle);
    }
    it->second.parts[index] = bytes;
    return Ok<std::string, std::string>(part_id_for(index));
}

Result<std::string> MemoryMultipartStore::complete(const std::string& handle,
                                                   const std::vector<std::string>& part_ids) {
    counters_.complete++;
    std::lock_guard lock(mutex_);
    if (auto done = completed_.find(handle); done != completed_.end()) {
        return Ok<std::string, std::string>(done->second);
    }
    auto it = transfers_.find(handle);
    if (it == transfers_.end()) {
        return Err<std::string, std::string>("Unknown transfer: " + handle);
    }

    std::vector<std::uint8_t> assembled;
    for (const auto& part_id : part_ids) {
        auto index = index_from_part_id(part_id);
        if (!index) {
            return Err<std::string, std::string>("Malformed part id: " + part_id);
        }
        auto part = it->second.parts.find(*index);
        if (part == it->second.parts.end()) {
            return Err<std::string, std::string>("Missing part " + part_id);
        }
        assembled.insert(assembled.end(), part->second.begin(), part->second.end());
    }

    std::string final_ref = "mem://" + it->second.key;
    objects_[final_ref] = std::move(assembled);
    completed_[handle] = final_ref;
    transfers_.erase(it);
    return Ok<std::string, std::string>(std::move(final_ref));
}

Result<void> MemoryMultipartStore::abort(const std::string& handle) {
    counters_.abort++;
    std::lock_guard lock(mutex_);
    transfers_.erase(handle);
    completed_.erase(handle);
    return Ok();
}

std::optional<std::vector<std::uint8_t>> MemoryMultipartStore::object(const std::string& final_ref) const {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(final_ref);
    if (it == objects_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryMultipartStore::has_transfer(const std::string& handle) const {
    std::lock_guard lock(mutex_);
    return transfers_.count(handle) > 0;
}

std::size_t MemoryMultipartStore::open_transfers() const {
    std::lock_guard lock(mutex_);
    return transfers_.size();
}

} // namespace rup::storage
