#include "uplink/storage/memory_chunk_store.hpp"

namespace uplink::storage {

StorageResult MemoryChunkStore::put(const std::string& session_id, uint32_t index,
                                    const std::vector<uint8_t>& data) {
    if (!is_valid_session_key(session_id)) {
        return StorageResult(StorageError::INVALID_ARGUMENT, "Invalid session id: " + session_id);
    }
    
    uint32_t failing = failing_puts_.load();
    while (failing > 0) {
        if (failing_puts_.compare_exchange_weak(failing, failing - 1)) {
            return StorageResult(StorageError::IO_ERROR, "Simulated write failure");
        }
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_[session_id][index] = data;
    ++put_count_;
    return StorageResult();
}

StorageResult MemoryChunkStore::get(const std::string& session_id, uint32_t index,
                                    std::vector<uint8_t>& data) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto session_it = chunks_.find(session_id);
    if (session_it == chunks_.end()) {
        return StorageResult(StorageError::NOT_FOUND, "No chunks for session " + session_id);
    }
    
    auto chunk_it = session_it->second.find(index);
    if (chunk_it == session_it->second.end()) {
        return StorageResult(StorageError::NOT_FOUND, "Chunk " + std::to_string(index) + " not found");
    }
    
    data = chunk_it->second;
    return StorageResult();
}

bool MemoryChunkStore::exists(const std::string& session_id, uint32_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto session_it = chunks_.find(session_id);
    return session_it != chunks_.end() && session_it->second.count(index) > 0;
}

StorageResult MemoryChunkStore::remove(const std::string& session_id, uint32_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto session_it = chunks_.find(session_id);
    if (session_it != chunks_.end()) {
        session_it->second.erase(index);
        if (session_it->second.empty()) {
            chunks_.erase(session_it);
        }
    }
    return StorageResult();
}

StorageResult MemoryChunkStore::delete_all(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_.erase(session_id);
    return StorageResult();
}

std::vector<std::string> MemoryChunkStore::list_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> sessions;
    sessions.reserve(chunks_.size());
    for (const auto& [session_id, chunks] : chunks_) {
        sessions.push_back(session_id);
    }
    return sessions;
}

size_t MemoryChunkStore::chunk_count(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto session_it = chunks_.find(session_id);
    return session_it == chunks_.end() ? 0 : session_it->second.size();
}

uint64_t MemoryChunkStore::total_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t total = 0;
    for (const auto& [session_id, chunks] : chunks_) {
        for (const auto& [index, data] : chunks) {
            total += data.size();
        }
    }
    return total;
}

}
