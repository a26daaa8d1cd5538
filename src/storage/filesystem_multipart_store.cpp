#include "rup/storage/filesystem_multipart_store.hpp"

#include "rup/core/ids.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace rup::storage {
namespace fs = std::filesystem;

namespace {

Result<void> ensure_directory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec && !fs::exists(dir)) {
        return Err<void>(std::string("Failed to create directory: ") + dir.string());
    }
    return Ok();
}

Result<void> write_file_atomically(const fs::path& target, const std::uint8_t* data, std::size_t size) {
    fs::path temp = target;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Err<void>(std::string("Failed to open for writing: ") + temp.string());
        }
        out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        out.flush();
        if (!out) {
            return Err<void>(std::string("Failed to write: ") + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        fs::remove(temp, ec);
        return Err<void>(std::string("Failed to move into place: ") + target.string());
    }
    return Ok();
}

bool is_valid_key(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    const fs::path path(key);
    if (path.is_absolute()) {
        return false;
    }
    for (const auto& component : path) {
        if (component == ".." || component == ".") {
            return false;
        }
    }
    return true;
}

} // namespace

FilesystemMultipartStore::FilesystemMultipartStore(fs::path root)
    : root_(std::move(root)) {
}

Result<std::string> FilesystemMultipartStore::initiate(const std::string& key) {
    if (!is_valid_key(key)) {
        return Err<std::string, std::string>("Invalid object key: " + key);
    }

    const std::string handle = generate_id();
    const auto dir = staging_dir(handle);
    if (auto res = ensure_directory(dir); res.is_error()) {
        return Err<std::string, std::string>(res.error());
    }

    if (auto res = write_file_atomically(dir / "key",
                                         reinterpret_cast<const std::uint8_t*>(key.data()),
                                         key.size());
        res.is_error()) {
        std::error_code ec;
        fs::remove_all(dir, ec);
        return Err<std::string, std::string>(res.error());
    }

    spdlog::debug("Initiated multipart transfer {} for key {}", handle, key);
    return Ok<std::string, std::string>(handle);
}

Result<std::string> FilesystemMultipartStore::upload_part(const std::string& handle, std::uint32_t index,
                                                          const std::vector<std::uint8_t>& bytes) {
    if (!is_safe_component(handle)) {
        return Err<std::string, std::string>("Invalid transfer handle: " + handle);
    }
    if (index == 0) {
        return Err<std::string, std::string>(std::string("Part numbers start at 1"));
    }

    const auto dir = staging_dir(handle);
    if (!fs::exists(dir / "key")) {
        return Err<std::string, std::string>("Unknown transfer: " + handle);
    }
    if (fs::exists(dir / "completed")) {
        return Err<std::string, std::string>("Transfer already completed: " + handle);
    }

    const std::string name = part_name(index);
    if (auto res = write_file_atomically(dir / name, bytes.data(), bytes.size()); res.is_error()) {
        return Err<std::string, std::string>(res.error());
    }
    return Ok<std::string, std::string>(name);
}

Result<std::string> FilesystemMultipartStore::complete(const std::string& handle,
                                                       const std::vector<std::string>& part_ids) {
    if (!is_safe_component(handle)) {
        return Err<std::string, std::string>("Invalid transfer handle: " + handle);
    }

    const auto dir = staging_dir(handle);
    std::ifstream key_file(dir / "key", std::ios::binary);
    if (!key_file) {
        return Err<std::string, std::string>("Unknown transfer: " + handle);
    }
    std::ostringstream key_stream;
    key_stream << key_file.rdbuf();
    const std::string key = key_stream.str();
    key_file.close();

    const fs::path destination = object_path(key);
    if (fs::exists(dir / "completed")) {
        if (!fs::exists(destination)) {
            return Err<std::string, std::string>("Completed transfer " + handle + " lost its object " + key);
        }
        return Ok<std::string, std::string>(key);
    }

    for (const auto& part_id : part_ids) {
        if (!is_safe_component(part_id) || !fs::exists(dir / part_id)) {
            return Err<std::string, std::string>("Missing part " + part_id + " in transfer " + handle);
        }
    }

    if (auto res = ensure_directory(destination.parent_path()); res.is_error()) {
        return Err<std::string, std::string>(res.error());
    }

    fs::path temp = destination;
    temp += ".assembling";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Err<std::string, std::string>("Failed to create object: " + temp.string());
        }
        for (const auto& part_id : part_ids) {
            std::ifstream part(dir / part_id, std::ios::binary);
            if (!part) {
                return Err<std::string, std::string>("Failed to read part " + part_id);
            }
            // Streaming an empty buffer would set failbit on out
            if (part.peek() != std::ifstream::traits_type::eof()) {
                out << part.rdbuf();
            }
        }
        out.flush();
        if (!out) {
            return Err<std::string, std::string>("Failed to write object: " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, destination, ec);
    if (ec) {
        fs::remove(temp, ec);
        return Err<std::string, std::string>("Failed to publish object: " + destination.string());
    }

    // Parts go, the key stays as a receipt until abort() releases the handle
    if (auto res = write_file_atomically(dir / "completed", nullptr, 0); res.is_error()) {
        return Err<std::string, std::string>(res.error());
    }
    for (const auto& part_id : part_ids) {
        fs::remove(dir / part_id, ec);
        if (ec) {
            spdlog::warn("Completed {} but could not remove {}: {}", handle, part_id, ec.message());
        }
    }

    spdlog::debug("Completed multipart transfer {} into {} ({} parts)", handle, key, part_ids.size());
    return Ok<std::string, std::string>(key);
}

Result<void> FilesystemMultipartStore::abort(const std::string& handle) {
    if (!is_safe_component(handle)) {
        return Err<void>(std::string("Invalid transfer handle: ") + handle);
    }

    std::error_code ec;
    fs::remove_all(staging_dir(handle), ec);
    if (ec) {
        return Err<void>(std::string("Failed to abort transfer ") + handle + ": " + ec.message());
    }
    return Ok();
}

fs::path FilesystemMultipartStore::object_path(const std::string& final_ref) const {
    return root_ / "objects" / fs::path(final_ref);
}

fs::path FilesystemMultipartStore::staging_dir(const std::string& handle) const {
    return root_ / "staging" / handle;
}

std::string FilesystemMultipartStore::part_name(std::uint32_t index) {
    std::ostringstream oss;
    oss << "part-" << std::setw(6) << std::setfill('0') << index;
    return oss.str();
}

bool FilesystemMultipartStore::is_safe_component(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    for (char c : value) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

} // namespace rup::storage
