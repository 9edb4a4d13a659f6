#include "uplink/upload/upload_result.hpp"
#include <sstream>

namespace uplink::upload {

const char* to_string(UploadError error) {
    switch (error) {
        case UploadError::SUCCESS: return "success";
        case UploadError::VALIDATION_ERROR: return "validation_error";
        case UploadError::RETRYABLE: return "retryable";
        case UploadError::TERMINAL: return "terminal";
        case UploadError::NOT_FOUND: return "not_found";
        case UploadError::INVALID_STATE: return "invalid_state";
        case UploadError::EXPIRED: return "expired";
        case UploadError::SESSION_NOT_ACTIVE: return "session_not_active";
        case UploadError::CHUNK_CONFLICT: return "chunk_conflict";
        case UploadError::STORAGE_ERROR: return "storage_error";
    }
    return "unknown";
}

const char* to_string(ErrorStage stage) {
    switch (stage) {
        case ErrorStage::NONE: return "none";
        case ErrorStage::VALIDATION: return "validation";
        case ErrorStage::INGESTION: return "ingestion";
        case ErrorStage::STORAGE: return "storage";
        case ErrorStage::REASSEMBLY: return "reassembly";
        case ErrorStage::FINALIZATION: return "finalization";
        case ErrorStage::LIFECYCLE: return "lifecycle";
    }
    return "unknown";
}

std::optional<ErrorStage> error_stage_from_string(const std::string& name) {
    for (auto stage : {ErrorStage::NONE, ErrorStage::VALIDATION, ErrorStage::INGESTION, ErrorStage::STORAGE,
                       ErrorStage::REASSEMBLY, ErrorStage::FINALIZATION, ErrorStage::LIFECYCLE}) {
        if (name == to_string(stage)) {
            return stage;
        }
    }
    return std::nullopt;
}

std::string UploadResult::describe() const {
    std::ostringstream oss;
    oss << to_string(error);
    if (detail.stage != ErrorStage::NONE) {
        oss << " [" << to_string(detail.stage) << "]";
    }
    if (!message.empty()) {
        oss << ": " << message;
    }
    if (detail.chunk_index) {
        oss << " (chunk " << *detail.chunk_index << ")";
    }
    if (detail.expected_size && detail.actual_size) {
        oss << " expected " << *detail.expected_size << " bytes, got " << *detail.actual_size;
    }
    if (detail.expected_hash && detail.actual_hash) {
        oss << " expected hash " << *detail.expected_hash << ", got " << *detail.actual_hash;
    }
    if (detail.retry_after) {
        oss << " retry after " << detail.retry_after->count() << "ms";
    }
    return oss.str();
}

}
