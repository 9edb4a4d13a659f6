#include "uplink/storage/chunk_store.hpp"
#include <algorithm>

namespace uplink::storage {

bool is_valid_session_key(const std::string& session_id) {
    if (session_id.empty() || session_id.size() > 128) {
        return false;
    }
    return std::all_of(session_id.begin(), session_id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '-' || c == '_';
    });
}

}
