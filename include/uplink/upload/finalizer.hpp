#pragma once

#include "upload_result.hpp"
#include "upload_session.hpp"
#include "reassembler.hpp"
#include "../storage/object_storage.hpp"
#include "../storage/chunk_store.hpp"
#include <memory>

namespace uplink::upload {

class Finalizer {
public:
    Finalizer(std::shared_ptr<storage::ObjectStorage> object_storage,
              std::shared_ptr<storage::ChunkStore> chunk_store,
              uint32_t attempts = 1);
    
    // Hands the assembled object to object storage, trying up to `attempts`
    // times. Chunk storage is kept on failure.
    UploadResult finalize(const UploadSession& session, const AssembledObject& object,
                          storage::StoredObject& stored) const;
    
    // Deletes the session's temporary chunks once the object is stored.
    UploadResult release(const std::string& session_id) const;
    
    static storage::ObjectMetadata metadata_for(const UploadSession& session, const AssembledObject& object);

private:
    std::shared_ptr<storage::ObjectStorage> object_storage_;
    std::shared_ptr<storage::ChunkStore> chunk_store_;
    uint32_t attempts_;
};

}
