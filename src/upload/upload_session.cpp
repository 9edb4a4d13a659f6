#include "uplink/upload/upload_session.hpp"
#include <algorithm>

namespace uplink::upload {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::INITIALIZING: return "initializing";
        case SessionState::ACTIVE: return "active";
        case SessionState::PAUSED: return "paused";
        case SessionState::COMPLETED: return "completed";
        case SessionState::FAILED: return "failed";
        case SessionState::EXPIRED: return "expired";
        case SessionState::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::optional<SessionState> session_state_from_string(const std::string& name) {
    for (auto state : {SessionState::INITIALIZING, SessionState::ACTIVE, SessionState::PAUSED,
                       SessionState::COMPLETED, SessionState::FAILED, SessionState::EXPIRED,
                       SessionState::CANCELLED}) {
        if (name == to_string(state)) {
            return state;
        }
    }
    return std::nullopt;
}

bool is_terminal(SessionState state) {
    return state == SessionState::COMPLETED ||
           state == SessionState::FAILED ||
           state == SessionState::EXPIRED ||
           state == SessionState::CANCELLED;
}

uint32_t UploadSession::uploaded_chunk_count() const {
    return static_cast<uint32_t>(std::count_if(chunks.begin(), chunks.end(),
                                               [](const ChunkRecord& chunk) { return chunk.uploaded; }));
}

bool UploadSession::all_chunks_uploaded() const {
    return !chunks.empty() &&
           std::all_of(chunks.begin(), chunks.end(), [](const ChunkRecord& chunk) { return chunk.uploaded; });
}

std::vector<uint32_t> UploadSession::missing_chunks() const {
    std::vector<uint32_t> missing;
    for (const auto& chunk : chunks) {
        if (!chunk.uploaded) {
            missing.push_back(chunk.index);
        }
    }
    return missing;
}

uint64_t UploadSession::computed_uploaded_size() const {
    uint64_t total = 0;
    for (const auto& chunk : chunks) {
        if (chunk.uploaded) {
            total += chunk.size;
        }
    }
    return total;
}

void UploadSession::update_percentage() {
    percentage = total_size > 0 ?
        (static_cast<double>(uploaded_size) / static_cast<double>(total_size)) * 100.0 : 0.0;
}

}
