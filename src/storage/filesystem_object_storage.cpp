#include "uplink/storage/filesystem_object_storage.hpp"
#include "uplink/crypto/hash.hpp"
#include "uplink/crypto/random.hpp"
#include "uplink/core/utils.hpp"
#include "uplink/core/logger.hpp"
#include <fstream>
#include <algorithm>
#include <chrono>

namespace uplink::storage {

namespace {

constexpr const char* LOCATION_SCHEME = "file://";
constexpr const char* METADATA_SUFFIX = ".meta";

bool write_file(const std::filesystem::path& path, const char* data, size_t size) {
    auto temp_path = path;
    temp_path += ".tmp";
    
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return false;
        }
        file.write(data, static_cast<std::streamsize>(size));
        file.flush();
        if (!file.good()) {
            file.close();
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return false;
        }
    }
    
    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return false;
    }
    return true;
}

}

FilesystemObjectStorage::FilesystemObjectStorage(const std::filesystem::path& root)
    : root_(std::filesystem::absolute(root).lexically_normal()) {
    if (!root_.has_filename() && root_.has_relative_path()) {
        root_ = root_.parent_path();
    }
}

std::string FilesystemObjectStorage::sanitize_bucket(const std::string& bucket) {
    std::string clean;
    for (char c : bucket) {
        if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_') {
            clean.push_back(c);
        } else if (c >= 'A' && c <= 'Z') {
            clean.push_back(static_cast<char>(c - 'A' + 'a'));
        }
    }
    return clean.empty() ? "uploads" : clean;
}

std::string FilesystemObjectStorage::extension_for(const std::string& original_name) {
    auto extension = std::filesystem::path(original_name).extension().string();
    if (extension.size() > 16) {
        return "";
    }
    return core::utils::StringUtils::to_lower(extension);
}

StorageResult FilesystemObjectStorage::store(const std::vector<uint8_t>& data, const ObjectMetadata& metadata,
                                             StoredObject& stored) {
    auto bucket_dir = root_ / sanitize_bucket(metadata.bucket);
    
    std::error_code ec;
    std::filesystem::create_directories(bucket_dir, ec);
    if (ec) {
        return StorageResult(StorageError::IO_ERROR, "Failed to create bucket directory: " + ec.message());
    }
    
    std::string object_id;
    try {
        auto millis = core::utils::TimeUtils::to_unix_millis(std::chrono::system_clock::now());
        object_id = std::to_string(millis) + "-" + crypto::SecureRandom::generate_hex(8);
    } catch (const std::runtime_error& e) {
        return StorageResult(StorageError::IO_ERROR, e.what());
    }
    
    auto object_path = bucket_dir / (object_id + extension_for(metadata.original_name));
    auto content_hash = crypto::hash_utils::hex_digest(data);
    
    if (!write_file(object_path, reinterpret_cast<const char*>(data.data()), data.size())) {
        return StorageResult(StorageError::IO_ERROR, "Failed to write object " + object_path.string());
    }
    
    std::string sidecar;
    sidecar += "content_type=" + metadata.content_type + "\n";
    sidecar += "original_name=" + metadata.original_name + "\n";
    sidecar += "owner_id=" + metadata.owner_id + "\n";
    sidecar += "content_hash=" + content_hash + "\n";
    sidecar += "size=" + std::to_string(data.size()) + "\n";
    for (const auto& [key, value] : metadata.extra) {
        sidecar += "x-" + key + "=" + value + "\n";
    }
    
    auto metadata_path = object_path;
    metadata_path += METADATA_SUFFIX;
    if (!write_file(metadata_path, sidecar.data(), sidecar.size())) {
        std::filesystem::remove(object_path, ec);
        return StorageResult(StorageError::IO_ERROR, "Failed to write metadata for " + object_path.string());
    }
    
    stored.location = std::string(LOCATION_SCHEME) + object_path.string();
    stored.content_hash = content_hash;
    stored.size = data.size();
    
    LOG_DEBUG("Stored object {} ({})", stored.location, core::utils::StringUtils::format_bytes(stored.size));
    return StorageResult();
}

std::optional<std::filesystem::path> FilesystemObjectStorage::resolve(const std::string& location) const {
    std::string scheme(LOCATION_SCHEME);
    if (location.compare(0, scheme.size(), scheme) != 0) {
        return std::nullopt;
    }
    
    auto path = std::filesystem::path(location.substr(scheme.size())).lexically_normal();
    auto relative = path.lexically_relative(root_);
    if (relative.empty() || *relative.begin() == "..") {
        return std::nullopt;
    }
    return path;
}

StorageResult FilesystemObjectStorage::load(const std::string& location, std::vector<uint8_t>& data) const {
    auto path = resolve(location);
    if (!path) {
        return StorageResult(StorageError::INVALID_ARGUMENT, "Location outside object storage: " + location);
    }
    
    auto bytes = core::utils::FileUtils::read_binary(*path);
    if (!bytes) {
        return StorageResult(StorageError::NOT_FOUND, "Object not found: " + location);
    }
    data = std::move(*bytes);
    return StorageResult();
}

std::optional<ObjectMetadata> FilesystemObjectStorage::load_metadata(const std::string& location) const {
    auto path = resolve(location);
    if (!path) {
        return std::nullopt;
    }
    
    auto metadata_path = *path;
    metadata_path += METADATA_SUFFIX;
    std::ifstream file(metadata_path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    
    ObjectMetadata metadata;
    metadata.bucket = path->parent_path().filename().string();
    
    std::string line;
    while (std::getline(file, line)) {
        auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }
        auto key = line.substr(0, pos);
        auto value = line.substr(pos + 1);
        
        if (key == "content_type") {
            metadata.content_type = value;
        } else if (key == "original_name") {
            metadata.original_name = value;
        } else if (key == "owner_id") {
            metadata.owner_id = value;
        } else if (key.rfind("x-", 0) == 0) {
            metadata.extra[key.substr(2)] = value;
        }
    }
    
    return metadata;
}

}
