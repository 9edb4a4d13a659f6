#pragma once

#include "upload_result.hpp"
#include "../core/clock.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <chrono>
#include <cstdint>

namespace uplink::upload {

enum class SessionState {
    INITIALIZING,
    ACTIVE,
    PAUSED,
    COMPLETED,
    FAILED,
    EXPIRED,
    CANCELLED
};

const char* to_string(SessionState state);
std::optional<SessionState> session_state_from_string(const std::string& name);
bool is_terminal(SessionState state);

struct ChunkRecord {
    uint32_t index = 0;
    uint64_t size = 0;
    std::string hash;
    bool uploaded = false;
    uint32_t retry_count = 0;
    std::optional<core::TimePoint> last_attempt;
};

struct UploadOptions {
    std::optional<uint64_t> chunk_size;
    std::string expected_hash;
    std::string bucket;
    std::vector<std::string> allowed_types;
    std::optional<uint64_t> max_size;
    std::map<std::string, std::string> metadata;
};

struct UploadSession {
    std::string session_id;
    std::string owner_id;
    
    std::string filename;
    std::string mime_type;
    uint64_t total_size = 0;
    uint64_t chunk_size = 0;
    std::string bucket;
    std::string category;
    std::map<std::string, std::string> metadata;
    
    // Dense: chunks[i].index == i for every i.
    std::vector<ChunkRecord> chunks;
    
    SessionState state = SessionState::INITIALIZING;
    uint64_t uploaded_size = 0;
    double percentage = 0.0;
    
    std::string expected_hash;
    bool content_validated = false;
    
    std::string storage_location;
    std::string content_hash;
    
    ErrorStage failure_stage = ErrorStage::NONE;
    std::string failure_reason;
    
    core::TimePoint created_at;
    core::TimePoint last_activity;
    core::TimePoint expires_at;
    std::optional<core::TimePoint> ended_at;
    
    uint32_t chunk_count() const { return static_cast<uint32_t>(chunks.size()); }
    uint32_t uploaded_chunk_count() const;
    bool all_chunks_uploaded() const;
    std::vector<uint32_t> missing_chunks() const;
    
    // Sum of uploaded chunk sizes; equals uploaded_size at all times.
    uint64_t computed_uploaded_size() const;
    void update_percentage();
};

struct ProgressSnapshot {
    std::string session_id;
    SessionState state = SessionState::INITIALIZING;
    uint64_t total_size = 0;
    uint64_t uploaded_size = 0;
    double percentage = 0.0;
    uint32_t uploaded_chunks = 0;
    uint32_t total_chunks = 0;
    double current_speed_bps = 0.0;
    double smoothed_speed_bps = 0.0;
    // Empty while no throughput has been observed.
    std::optional<std::chrono::milliseconds> eta;
    core::TimePoint last_activity;
    core::TimePoint expires_at;
};

struct ChunkReceipt {
    uint32_t index = 0;
    uint64_t size = 0;
    std::string hash;
    bool duplicate = false;
    uint64_t uploaded_size = 0;
    bool session_completed = false;
    std::string storage_location;
};

}
