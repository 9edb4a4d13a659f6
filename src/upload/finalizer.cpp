#include "uplink/upload/finalizer.hpp"
#include "uplink/upload/chunk_validator.hpp"
#include "uplink/core/logger.hpp"

namespace uplink::upload {

Finalizer::Finalizer(std::shared_ptr<storage::ObjectStorage> object_storage,
                     std::shared_ptr<storage::ChunkStore> chunk_store,
                     uint32_t attempts)
    : object_storage_(std::move(object_storage))
    , chunk_store_(std::move(chunk_store))
    , attempts_(attempts == 0 ? 1 : attempts) {
}

storage::ObjectMetadata Finalizer::metadata_for(const UploadSession& session, const AssembledObject& object) {
    storage::ObjectMetadata metadata;
    metadata.bucket = session.bucket;
    metadata.content_type = session.mime_type;
    metadata.original_name = session.filename;
    metadata.owner_id = session.owner_id;
    metadata.extra = session.metadata;
    metadata.extra["session_id"] = session.session_id;
    metadata.extra["sha256"] = object.content_hash;
    return metadata;
}

UploadResult Finalizer::finalize(const UploadSession& session, const AssembledObject& object,
                                 storage::StoredObject& stored) const {
    ErrorDetail detail;
    detail.stage = ErrorStage::FINALIZATION;
    
    auto metadata = metadata_for(session, object);
    storage::StorageResult last_error;
    
    for (uint32_t attempt = 1; attempt <= attempts_; ++attempt) {
        storage::StoredObject candidate;
        last_error = object_storage_->store(object.data, metadata, candidate);
        
        if (last_error) {
            if (candidate.content_hash.empty()) {
                candidate.content_hash = object.content_hash;
            }
            
            if (!ChunkValidator::hashes_equal(candidate.content_hash, object.content_hash)) {
                detail.expected_hash = object.content_hash;
                detail.actual_hash = candidate.content_hash;
                return UploadResult(UploadError::TERMINAL, "Object storage reported a different content hash", detail);
            }
            
            if (candidate.size == 0) {
                candidate.size = object.data.size();
            }
            
            stored = std::move(candidate);
            return UploadResult();
        }
        
        LOG_WARN("Finalization attempt {}/{} for session {} failed: {}",
                 attempt, attempts_, session.session_id, last_error.message);
        detail.retries_used = attempt - 1;
    }
    
    return UploadResult(UploadError::TERMINAL, "Object storage failed: " + last_error.message, detail);
}

UploadResult Finalizer::release(const std::string& session_id) const {
    auto result = chunk_store_->delete_all(session_id);
    if (!result) {
        ErrorDetail detail;
        detail.stage = ErrorStage::STORAGE;
        return UploadResult(UploadError::STORAGE_ERROR, "Failed to release chunks: " + result.message, detail);
    }
    return UploadResult();
}

}
