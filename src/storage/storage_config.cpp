#include "uplink/storage/storage_config.hpp"
#include "uplink/core/config.hpp"
#include "uplink/core/utils.hpp"

namespace uplink::storage {

StorageConfig::StorageConfig(const std::filesystem::path& base_dir) {
    set_base_directory(base_dir);
}

StorageConfig StorageConfig::from_config(const core::Config& config) {
    auto base = config.get_string("storage.base_dir", "./uplink_data");
    return StorageConfig(core::utils::FileUtils::expand_home(base));
}

bool StorageConfig::validate() const {
    if (chunk_directory.empty() || object_directory.empty() || database_path.empty()) {
        return false;
    }
    
    // Chunks and finished objects must never share a directory, the orphan
    // sweep treats every entry under chunk_directory as a session.
    if (chunk_directory == object_directory) {
        return false;
    }
    
    return true;
}

bool StorageConfig::create_directories() const {
    try {
        std::filesystem::create_directories(chunk_directory);
        std::filesystem::create_directories(object_directory);
        
        auto db_dir = database_path.parent_path();
        if (!db_dir.empty()) {
            std::filesystem::create_directories(db_dir);
        }
        
        return true;
    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }
}

uint64_t StorageConfig::get_available_space() const {
    std::error_code ec;
    auto space_info = std::filesystem::space(base_directory, ec);
    if (ec) {
        return 0;
    }
    return space_info.available;
}

void StorageConfig::set_base_directory(const std::filesystem::path& base_dir) {
    base_directory = base_dir;
    chunk_directory = base_dir / "chunks";
    object_directory = base_dir / "objects";
    database_path = base_dir / "uplink.db";
}

}
