#pragma once

#include "upload_result.hpp"
#include "upload_session.hpp"
#include "../storage/chunk_store.hpp"
#include <memory>
#include <vector>

namespace uplink::upload {

struct AssembledObject {
    std::vector<uint8_t> data;
    std::string content_hash;
};

// Concatenates a session's chunks in index order and checks the result
// against the declared size and, if present, the expected hash. Chunk
// storage is left untouched whatever the outcome.
class Reassembler {
public:
    explicit Reassembler(std::shared_ptr<storage::ChunkStore> chunk_store);
    
    UploadResult reassemble(const UploadSession& session, AssembledObject& object) const;

private:
    std::shared_ptr<storage::ChunkStore> chunk_store_;
};

}
