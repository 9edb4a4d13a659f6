#pragma once

#include "storage_result.hpp"
#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace uplink::storage {

struct ObjectMetadata {
    std::string bucket;
    std::string content_type;
    std::string original_name;
    std::string owner_id;
    std::map<std::string, std::string> extra;
};

struct StoredObject {
    std::string location;
    std::string content_hash;
    uint64_t size = 0;
};

// Durable destination for assembled uploads. A store() call is atomic from
// the caller's point of view; retrying is the caller's business.
class ObjectStorage {
public:
    virtual ~ObjectStorage() = default;
    
    virtual StorageResult store(const std::vector<uint8_t>& data, const ObjectMetadata& metadata,
                                StoredObject& stored) = 0;
};

}
