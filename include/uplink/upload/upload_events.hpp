#pragma once

#include "upload_session.hpp"
#include <functional>
#include <optional>
#include <string>

namespace uplink::upload {

enum class UploadEventType {
    SESSION_CREATED,
    CHUNK_UPLOADED,
    PROGRESS,
    SESSION_PAUSED,
    SESSION_RESUMED,
    SESSION_COMPLETED,
    SESSION_FAILED,
    SESSION_CANCELLED,
    SESSION_EXPIRED
};

const char* to_string(UploadEventType type);

struct UploadEvent {
    UploadEventType type;
    std::string session_id;
    std::optional<uint32_t> chunk_index;
    ProgressSnapshot snapshot;
    std::string message;
};

using UploadListener = std::function<void(const UploadEvent&)>;
using ListenerId = uint64_t;

}
