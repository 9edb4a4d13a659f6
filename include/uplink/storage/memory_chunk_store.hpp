#pragma once

#include "chunk_store.hpp"
#include <map>
#include <mutex>
#include <atomic>

namespace uplink::storage {

class MemoryChunkStore : public ChunkStore {
public:
    StorageResult put(const std::string& session_id, uint32_t index,
                      const std::vector<uint8_t>& data) override;
    
    StorageResult get(const std::string& session_id, uint32_t index,
                      std::vector<uint8_t>& data) const override;
    
    bool exists(const std::string& session_id, uint32_t index) const override;
    
    StorageResult remove(const std::string& session_id, uint32_t index) override;
    
    StorageResult delete_all(const std::string& session_id) override;
    
    std::vector<std::string> list_sessions() const override;
    
    size_t chunk_count(const std::string& session_id) const;
    uint64_t total_bytes() const;
    uint64_t put_count() const { return put_count_; }
    
    // Makes the next N put() calls fail with IO_ERROR.
    void fail_next_puts(uint32_t count) { failing_puts_ = count; }

private:
    std::map<std::string, std::map<uint32_t, std::vector<uint8_t>>> chunks_;
    mutable std::mutex mutex_;
    std::atomic<uint64_t> put_count_{0};
    std::atomic<uint32_t> failing_puts_{0};
};

}
