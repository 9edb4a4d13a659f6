#pragma once

#include "storage_result.hpp"
#include "../upload/upload_session.hpp"
#include "../core/clock.hpp"
#include <string>
#include <vector>
#include <filesystem>
#include <mutex>

struct sqlite3;

namespace uplink::storage {

// One accepted or rejected chunk attempt together with the session's
// running totals at that point.
struct ChunkProgress {
    std::string session_id;
    upload::ChunkRecord chunk;
    uint64_t uploaded_size = 0;
    core::TimePoint last_activity;
    core::TimePoint expires_at;
};

// SQLite-backed record of upload sessions: one row per session in
// upload_sessions, one row per chunk in upload_chunks.
class SessionIndex {
public:
    explicit SessionIndex(const std::filesystem::path& db_path);
    virtual ~SessionIndex();
    
    SessionIndex(const SessionIndex&) = delete;
    SessionIndex& operator=(const SessionIndex&) = delete;
    
    StorageResult initialize();
    
    // Replaces the session row and every chunk row in one transaction.
    virtual StorageResult save_session(const upload::UploadSession& session);
    
    // Writes a single chunk row and the session totals. Totals only move
    // forward and an uploaded chunk stays uploaded, so writes for one
    // session may land in any order. NOT_FOUND once the session is gone.
    virtual StorageResult save_chunk(const ChunkProgress& progress);
    
    virtual StorageResult remove_session(const std::string& session_id);
    
    // Runs a trivial query against the session table.
    StorageResult check();
    
    StorageResult load_session(const std::string& session_id, upload::UploadSession& session);
    
    StorageResult load_sessions(std::vector<upload::UploadSession>& sessions);
    
    size_t session_count();
    
    const std::filesystem::path& path() const { return db_path_; }

private:
    std::filesystem::path db_path_;
    sqlite3* db_;
    std::mutex mutex_;
    
    bool create_tables();
    StorageResult exec(const char* sql);
    StorageResult write_session(const upload::UploadSession& session);
    StorageResult write_chunk(const std::string& session_id, const upload::ChunkRecord& chunk);
    StorageResult write_progress(const ChunkProgress& progress);
    StorageResult read_chunks(upload::UploadSession& session);
    StorageResult read_metadata(upload::UploadSession& session);
    StorageResult read_sessions(const char* sql, const std::string* session_id,
                                std::vector<upload::UploadSession>& sessions);
    StorageResult database_error(const std::string& context) const;
};

}
