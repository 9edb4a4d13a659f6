#include "uplink/storage/file_chunk_store.hpp"
#include "uplink/core/logger.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <algorithm>

namespace uplink::storage {

FileChunkStore::FileChunkStore(const std::filesystem::path& root) : root_(root) {
}

std::filesystem::path FileChunkStore::get_chunk_path(const std::string& session_id, uint32_t index) const {
    std::ostringstream name;
    name << std::setw(6) << std::setfill('0') << index << ".chunk";
    return root_ / session_id / name.str();
}

StorageResult FileChunkStore::put(const std::string& session_id, uint32_t index,
                                  const std::vector<uint8_t>& data) {
    if (!is_valid_session_key(session_id)) {
        return StorageResult(StorageError::INVALID_ARGUMENT, "Invalid session id: " + session_id);
    }
    
    auto chunk_path = get_chunk_path(session_id, index);
    auto temp_path = chunk_path;
    temp_path += ".tmp";
    
    std::error_code ec;
    std::filesystem::create_directories(chunk_path.parent_path(), ec);
    if (ec) {
        return StorageResult(StorageError::IO_ERROR,
                             "Failed to create chunk directory: " + ec.message());
    }
    
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return StorageResult(StorageError::IO_ERROR,
                                 "Failed to open chunk file: " + temp_path.string());
        }
        
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file.good()) {
            file.close();
            std::filesystem::remove(temp_path, ec);
            return StorageResult(StorageError::IO_ERROR,
                                 "Failed to write chunk " + std::to_string(index));
        }
    }
    
    std::filesystem::rename(temp_path, chunk_path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return StorageResult(StorageError::IO_ERROR,
                             "Failed to commit chunk " + std::to_string(index) + ": " + ec.message());
    }
    
    return StorageResult();
}

StorageResult FileChunkStore::get(const std::string& session_id, uint32_t index,
                                  std::vector<uint8_t>& data) const {
    if (!is_valid_session_key(session_id)) {
        return StorageResult(StorageError::INVALID_ARGUMENT, "Invalid session id: " + session_id);
    }
    
    auto chunk_path = get_chunk_path(session_id, index);
    std::ifstream file(chunk_path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return StorageResult(StorageError::NOT_FOUND,
                             "Chunk " + std::to_string(index) + " not found for session " + session_id);
    }
    
    auto size = file.tellg();
    file.seekg(0, std::ios::beg);
    data.resize(static_cast<size_t>(size));
    
    if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
        data.clear();
        return StorageResult(StorageError::IO_ERROR, "Failed to read chunk " + std::to_string(index));
    }
    
    return StorageResult();
}

bool FileChunkStore::exists(const std::string& session_id, uint32_t index) const {
    if (!is_valid_session_key(session_id)) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(get_chunk_path(session_id, index), ec);
}

StorageResult FileChunkStore::remove(const std::string& session_id, uint32_t index) {
    if (!is_valid_session_key(session_id)) {
        return StorageResult(StorageError::INVALID_ARGUMENT, "Invalid session id: " + session_id);
    }
    
    std::error_code ec;
    std::filesystem::remove(get_chunk_path(session_id, index), ec);
    if (ec) {
        return StorageResult(StorageError::IO_ERROR, "Failed to remove chunk: " + ec.message());
    }
    return StorageResult();
}

StorageResult FileChunkStore::delete_all(const std::string& session_id) {
    if (!is_valid_session_key(session_id)) {
        return StorageResult(StorageError::INVALID_ARGUMENT, "Invalid session id: " + session_id);
    }
    
    std::error_code ec;
    auto removed = std::filesystem::remove_all(root_ / session_id, ec);
    if (ec) {
        return StorageResult(StorageError::IO_ERROR,
                             "Failed to delete chunks for " + session_id + ": " + ec.message());
    }
    
    if (removed > 0) {
        LOG_DEBUG("Removed chunk directory for session {} ({} entries)", session_id, removed);
    }
    return StorageResult();
}

std::vector<std::string> FileChunkStore::list_sessions() const {
    std::vector<std::string> sessions;
    
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        return sessions;
    }
    
    // Must not throw: a directory removed mid-listing just ends the loop.
    std::filesystem::directory_iterator end;
    for (std::filesystem::directory_iterator it(root_, ec); !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_directory(entry_ec)) {
            sessions.push_back(it->path().filename().string());
        }
    }
    
    if (ec) {
        LOG_WARN("Listing chunk directory {} stopped early: {}", root_.string(), ec.message());
    }
    
    std::sort(sessions.begin(), sessions.end());
    return sessions;
}

}
