#pragma once

#include "chunk_store.hpp"
#include <filesystem>

namespace uplink::storage {

// Lays chunks out as <root>/<session>/<index>.chunk. Writes go to a temp
// file first and are renamed into place.
class FileChunkStore : public ChunkStore {
public:
    explicit FileChunkStore(const std::filesystem::path& root);
    
    StorageResult put(const std::string& session_id, uint32_t index,
                      const std::vector<uint8_t>& data) override;
    
    StorageResult get(const std::string& session_id, uint32_t index,
                      std::vector<uint8_t>& data) const override;
    
    bool exists(const std::string& session_id, uint32_t index) const override;
    
    StorageResult remove(const std::string& session_id, uint32_t index) override;
    
    StorageResult delete_all(const std::string& session_id) override;
    
    std::vector<std::string> list_sessions() const override;
    
    std::filesystem::path get_chunk_path(const std::string& session_id, uint32_t index) const;
    
    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

}
