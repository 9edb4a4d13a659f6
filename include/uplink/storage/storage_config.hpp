#pragma once

#include <filesystem>
#include <string>
#include <cstdint>

namespace uplink::core {
class Config;
}

namespace uplink::storage {

struct StorageConfig {
    std::filesystem::path base_directory;
    std::filesystem::path chunk_directory;
    std::filesystem::path object_directory;
    std::filesystem::path database_path;
    
    StorageConfig() = default;
    
    explicit StorageConfig(const std::filesystem::path& base_dir);
    
    // Reads storage.base_dir, expanding a leading "~".
    static StorageConfig from_config(const core::Config& config);
    
    bool validate() const;
    
    bool create_directories() const;
    
    uint64_t get_available_space() const;
    
    void set_base_directory(const std::filesystem::path& base_dir);
};

}
