#include "uplink/upload/chunk_validator.hpp"
#include "uplink/crypto/hash.hpp"
#include "uplink/core/utils.hpp"

namespace uplink::upload {

UploadResult ChunkValidator::validate(uint32_t index, uint64_t declared_size,
                                      const std::vector<uint8_t>& data,
                                      const std::string& declared_hash,
                                      std::string& computed_hash) {
    ErrorDetail detail;
    detail.stage = ErrorStage::INGESTION;
    detail.chunk_index = index;
    
    if (data.size() != declared_size) {
        detail.expected_size = declared_size;
        detail.actual_size = data.size();
        return UploadResult(UploadError::RETRYABLE, "Chunk size mismatch", detail);
    }
    
    crypto::Sha256Hasher hasher;
    crypto::Sha256Hash digest;
    auto hash_result = hasher.initialize();
    if (hash_result) {
        hash_result = hasher.update(data);
    }
    if (hash_result) {
        hash_result = hasher.finalize(digest);
    }
    if (!hash_result) {
        return UploadResult(UploadError::STORAGE_ERROR, "Failed to hash chunk: " + hash_result.message, detail);
    }
    computed_hash = crypto::hash_utils::hash_to_hex(digest);
    
    if (!declared_hash.empty() && !hashes_equal(declared_hash, computed_hash)) {
        detail.expected_hash = core::utils::StringUtils::to_lower(declared_hash);
        detail.actual_hash = computed_hash;
        return UploadResult(UploadError::RETRYABLE, "Chunk hash mismatch", detail);
    }
    
    return UploadResult();
}

bool ChunkValidator::hashes_equal(const std::string& lhs, const std::string& rhs) {
    return core::utils::StringUtils::to_lower(lhs) == core::utils::StringUtils::to_lower(rhs);
}

}
