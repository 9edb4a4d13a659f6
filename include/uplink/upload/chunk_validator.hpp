#pragma once

#include "upload_result.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace uplink::upload {

// Stateless size and content hash check for a single chunk. On success
// computed_hash holds the lowercase hex SHA-256 of the bytes.
class ChunkValidator {
public:
    static UploadResult validate(uint32_t index, uint64_t declared_size,
                                 const std::vector<uint8_t>& data,
                                 const std::string& declared_hash,
                                 std::string& computed_hash);
    
    static bool hashes_equal(const std::string& lhs, const std::string& rhs);
};

}
