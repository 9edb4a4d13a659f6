#pragma once

#include "object_storage.hpp"
#include <filesystem>
#include <optional>

namespace uplink::storage {

class FilesystemObjectStorage : public ObjectStorage {
public:
    explicit FilesystemObjectStorage(const std::filesystem::path& root);
    
    StorageResult store(const std::vector<uint8_t>& data, const ObjectMetadata& metadata,
                        StoredObject& stored) override;
    
    StorageResult load(const std::string& location, std::vector<uint8_t>& data) const;
    
    std::optional<ObjectMetadata> load_metadata(const std::string& location) const;
    
    // Maps a file:// location back to a path under root, or nullopt if the
    // location points anywhere else.
    std::optional<std::filesystem::path> resolve(const std::string& location) const;
    
    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    
    static std::string sanitize_bucket(const std::string& bucket);
    static std::string extension_for(const std::string& original_name);
};

}
