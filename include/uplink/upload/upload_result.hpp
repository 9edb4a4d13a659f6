#pragma once

#include <string>
#include <optional>
#include <chrono>
#include <cstdint>

namespace uplink::upload {

enum class UploadError {
    SUCCESS = 0,
    VALIDATION_ERROR,
    RETRYABLE,
    TERMINAL,
    NOT_FOUND,
    INVALID_STATE,
    EXPIRED,
    SESSION_NOT_ACTIVE,
    CHUNK_CONFLICT,
    STORAGE_ERROR
};

enum class ErrorStage {
    NONE,
    VALIDATION,
    INGESTION,
    STORAGE,
    REASSEMBLY,
    FINALIZATION,
    LIFECYCLE
};

const char* to_string(UploadError error);
const char* to_string(ErrorStage stage);
std::optional<ErrorStage> error_stage_from_string(const std::string& name);

// Enough context for a caller to decide between retrying a chunk and
// abandoning the session.
struct ErrorDetail {
    ErrorStage stage = ErrorStage::NONE;
    std::optional<uint32_t> chunk_index;
    std::optional<uint64_t> expected_size;
    std::optional<uint64_t> actual_size;
    std::optional<std::string> expected_hash;
    std::optional<std::string> actual_hash;
    std::optional<std::chrono::milliseconds> retry_after;
    uint32_t retries_used = 0;
};

struct UploadResult {
    UploadError error;
    std::string message;
    ErrorDetail detail;
    
    UploadResult(UploadError err = UploadError::SUCCESS, std::string msg = "", ErrorDetail info = {})
        : error(err), message(std::move(msg)), detail(std::move(info)) {}
    
    bool success() const { return error == UploadError::SUCCESS; }
    bool retryable() const { return error == UploadError::RETRYABLE; }
    operator bool() const { return success(); }
    
    std::string describe() const;
};

}
