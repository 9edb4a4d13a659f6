#include "uplink/upload/upload_events.hpp"

namespace uplink::upload {

const char* to_string(UploadEventType type) {
    switch (type) {
        case UploadEventType::SESSION_CREATED: return "session_created";
        case UploadEventType::CHUNK_UPLOADED: return "chunk_uploaded";
        case UploadEventType::PROGRESS: return "progress";
        case UploadEventType::SESSION_PAUSED: return "session_paused";
        case UploadEventType::SESSION_RESUMED: return "session_resumed";
        case UploadEventType::SESSION_COMPLETED: return "session_completed";
        case UploadEventType::SESSION_FAILED: return "session_failed";
        case UploadEventType::SESSION_CANCELLED: return "session_cancelled";
        case UploadEventType::SESSION_EXPIRED: return "session_expired";
    }
    return "unknown";
}

}
