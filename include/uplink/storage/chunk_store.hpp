#pragma once

#include "storage_result.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace uplink::storage {

// Temporary storage for chunk bytes keyed by (session, index). A successful
// put() must be readable by a later get() for the lifetime of the process.
class ChunkStore {
public:
    virtual ~ChunkStore() = default;
    
    virtual StorageResult put(const std::string& session_id, uint32_t index,
                              const std::vector<uint8_t>& data) = 0;
    
    virtual StorageResult get(const std::string& session_id, uint32_t index,
                              std::vector<uint8_t>& data) const = 0;
    
    virtual bool exists(const std::string& session_id, uint32_t index) const = 0;
    
    virtual StorageResult remove(const std::string& session_id, uint32_t index) = 0;
    
    // Removing a session that holds nothing is not an error.
    virtual StorageResult delete_all(const std::string& session_id) = 0;
    
    virtual std::vector<std::string> list_sessions() const = 0;
};

bool is_valid_session_key(const std::string& session_id);

}
