#include "uplink/upload/reassembler.hpp"
#include "uplink/upload/chunk_validator.hpp"
#include "uplink/crypto/hash.hpp"
#include "uplink/core/logger.hpp"

namespace uplink::upload {

Reassembler::Reassembler(std::shared_ptr<storage::ChunkStore> chunk_store)
    : chunk_store_(std::move(chunk_store)) {
}

UploadResult Reassembler::reassemble(const UploadSession& session, AssembledObject& object) const {
    ErrorDetail detail;
    detail.stage = ErrorStage::REASSEMBLY;
    
    if (!session.all_chunks_uploaded()) {
        return UploadResult(UploadError::INVALID_STATE, "Not every chunk has been uploaded", detail);
    }
    
    crypto::Sha256Hasher hasher;
    auto hash_result = hasher.initialize();
    if (!hash_result) {
        return UploadResult(UploadError::TERMINAL, "Failed to initialize hasher: " + hash_result.message, detail);
    }
    
    object.data.clear();
    object.data.reserve(static_cast<size_t>(session.total_size));
    
    std::vector<uint8_t> buffer;
    for (const auto& chunk : session.chunks) {
        detail.chunk_index = chunk.index;
        
        auto read_result = chunk_store_->get(session.session_id, chunk.index, buffer);
        if (!read_result) {
            return UploadResult(UploadError::TERMINAL,
                                "Failed to read chunk: " + read_result.message, detail);
        }
        
        if (buffer.size() != chunk.size) {
            detail.expected_size = chunk.size;
            detail.actual_size = buffer.size();
            return UploadResult(UploadError::TERMINAL, "Stored chunk has wrong size", detail);
        }
        
        if (!chunk.hash.empty()) {
            auto stored_hash = crypto::hash_utils::hex_digest(buffer);
            if (!ChunkValidator::hashes_equal(stored_hash, chunk.hash)) {
                detail.expected_hash = chunk.hash;
                detail.actual_hash = stored_hash;
                return UploadResult(UploadError::TERMINAL, "Stored chunk is corrupted", detail);
            }
        }
        
        auto update_result = hasher.update(buffer);
        if (!update_result) {
            return UploadResult(UploadError::TERMINAL, "Failed to hash chunk: " + update_result.message, detail);
        }
        object.data.insert(object.data.end(), buffer.begin(), buffer.end());
    }
    detail.chunk_index.reset();
    
    if (object.data.size() != session.total_size) {
        detail.expected_size = session.total_size;
        detail.actual_size = object.data.size();
        return UploadResult(UploadError::TERMINAL, "Assembled size does not match declared size", detail);
    }
    
    crypto::Sha256Hash digest;
    auto final_result = hasher.finalize(digest);
    if (!final_result) {
        return UploadResult(UploadError::TERMINAL, "Failed to hash object: " + final_result.message, detail);
    }
    object.content_hash = crypto::hash_utils::hash_to_hex(digest);
    
    if (!session.expected_hash.empty() &&
        !ChunkValidator::hashes_equal(session.expected_hash, object.content_hash)) {
        detail.expected_hash = session.expected_hash;
        detail.actual_hash = object.content_hash;
        return UploadResult(UploadError::TERMINAL, "Assembled object hash mismatch", detail);
    }
    
    LOG_DEBUG("Reassembled session {}: {} chunks, {} bytes, sha256 {}",
              session.session_id, session.chunk_count(), object.data.size(), object.content_hash);
    return UploadResult();
}

}
