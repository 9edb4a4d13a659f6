#include "uplink/storage/session_index.hpp"
#include "uplink/core/logger.hpp"
#include "uplink/core/utils.hpp"
#include <sqlite3.h>

namespace uplink::storage {

namespace {

using core::utils::TimeUtils;

std::string column_text(sqlite3_stmt* stmt, int column) {
    auto text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void bind_time(sqlite3_stmt* stmt, int index, const std::optional<core::TimePoint>& time) {
    if (time) {
        sqlite3_bind_int64(stmt, index, TimeUtils::to_unix_millis(*time));
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

std::optional<core::TimePoint> column_time(sqlite3_stmt* stmt, int column) {
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return TimeUtils::from_unix_millis(sqlite3_column_int64(stmt, column));
}

}

SessionIndex::SessionIndex(const std::filesystem::path& db_path)
    : db_path_(db_path), db_(nullptr) {
}

SessionIndex::~SessionIndex() {
    if (db_) {
        sqlite3_close(db_);
    }
}

StorageResult SessionIndex::database_error(const std::string& context) const {
    std::string detail = db_ ? sqlite3_errmsg(db_) : "database not open";
    return StorageResult(StorageError::DATABASE_ERROR, context + ": " + detail);
}

StorageResult SessionIndex::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (db_) {
        return StorageResult();
    }
    
    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        auto error = database_error("Failed to open " + db_path_.string());
        sqlite3_close(db_);
        db_ = nullptr;
        return error;
    }
    
    sqlite3_busy_timeout(db_, 5000);
    
    if (!create_tables()) {
        auto error = database_error("Failed to create session tables");
        sqlite3_close(db_);
        db_ = nullptr;
        return error;
    }
    
    return StorageResult();
}

bool SessionIndex::create_tables() {
    const char* create_sessions_table = R"(
        CREATE TABLE IF NOT EXISTS upload_sessions (
            session_id TEXT PRIMARY KEY,
            owner_id TEXT NOT NULL,
            filename TEXT NOT NULL,
            mime_type TEXT NOT NULL,
            total_size INTEGER NOT NULL,
            chunk_size INTEGER NOT NULL,
            bucket TEXT,
            category TEXT,
            state TEXT NOT NULL,
            uploaded_size INTEGER NOT NULL DEFAULT 0,
            expected_hash TEXT,
            content_validated INTEGER NOT NULL DEFAULT 0,
            storage_location TEXT,
            content_hash TEXT,
            failure_stage TEXT,
            failure_reason TEXT,
            created_at INTEGER NOT NULL,
            last_activity INTEGER NOT NULL,
            expires_at INTEGER NOT NULL,
            ended_at INTEGER
        );
    )";
    
    const char* create_chunks_table = R"(
        CREATE TABLE IF NOT EXISTS upload_chunks (
            session_id TEXT NOT NULL,
            chunk_index INTEGER NOT NULL,
            size INTEGER NOT NULL,
            hash TEXT,
            uploaded INTEGER NOT NULL DEFAULT 0,
            retry_count INTEGER NOT NULL DEFAULT 0,
            last_attempt INTEGER,
            PRIMARY KEY (session_id, chunk_index),
            FOREIGN KEY (session_id) REFERENCES upload_sessions(session_id) ON DELETE CASCADE
        );
    )";
    
    const char* create_metadata_table = R"(
        CREATE TABLE IF NOT EXISTS upload_session_metadata (
            session_id TEXT NOT NULL,
            key TEXT NOT NULL,
            value TEXT NOT NULL,
            PRIMARY KEY (session_id, key),
            FOREIGN KEY (session_id) REFERENCES upload_sessions(session_id) ON DELETE CASCADE
        );
    )";
    
    const char* create_indexes = R"(
        CREATE INDEX IF NOT EXISTS idx_sessions_owner ON upload_sessions(owner_id);
        CREATE INDEX IF NOT EXISTS idx_sessions_state ON upload_sessions(state);
    )";
    
    for (const char* sql : {"PRAGMA foreign_keys = ON;", create_sessions_table, create_chunks_table,
                            create_metadata_table, create_indexes}) {
        if (!exec(sql)) {
            return false;
        }
    }
    
    return true;
}

StorageResult SessionIndex::exec(const char* sql) {
    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        std::string message = error_msg ? error_msg : "unknown error";
        sqlite3_free(error_msg);
        return StorageResult(StorageError::DATABASE_ERROR, message);
    }
    return StorageResult();
}

StorageResult SessionIndex::write_session(const upload::UploadSession& session) {
    const char* insert_session_sql = R"(
        INSERT OR REPLACE INTO upload_sessions
        (session_id, owner_id, filename, mime_type, total_size, chunk_size, bucket, category, state,
         uploaded_size, expected_hash, content_validated, storage_location, content_hash,
         failure_stage, failure_reason, created_at, last_activity, expires_at, ended_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";
    
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, insert_session_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return database_error("Failed to prepare session insert");
    }
    
    bind_text(stmt, 1, session.session_id);
    bind_text(stmt, 2, session.owner_id);
    bind_text(stmt, 3, session.filename);
    bind_text(stmt, 4, session.mime_type);
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(session.total_size));
    sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(session.chunk_size));
    bind_text(stmt, 7, session.bucket);
    bind_text(stmt, 8, session.category);
    bind_text(stmt, 9, upload::to_string(session.state));
    sqlite3_bind_int64(stmt, 10, static_cast<sqlite3_int64>(session.uploaded_size));
    bind_text(stmt, 11, session.expected_hash);
    sqlite3_bind_int(stmt, 12, session.content_validated ? 1 : 0);
    bind_text(stmt, 13, session.storage_location);
    bind_text(stmt, 14, session.content_hash);
    bind_text(stmt, 15, upload::to_string(session.failure_stage));
    bind_text(stmt, 16, session.failure_reason);
    bind_time(stmt, 17, session.created_at);
    bind_time(stmt, 18, session.last_activity);
    bind_time(stmt, 19, session.expires_at);
    bind_time(stmt, 20, session.ended_at);
    
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (result != SQLITE_DONE) {
        return database_error("Failed to write session " + session.session_id);
    }
    
    const char* delete_metadata_sql = "DELETE FROM upload_session_metadata WHERE session_id = ?;";
    if (sqlite3_prepare_v2(db_, delete_metadata_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return database_error("Failed to prepare metadata delete");
    }
    bind_text(stmt, 1, session.session_id);
    result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (result != SQLITE_DONE) {
        return database_error("Failed to clear metadata for " + session.session_id);
    }
    
    const char* insert_metadata_sql =
        "INSERT INTO upload_session_metadata (session_id, key, value) VALUES (?, ?, ?);";
    for (const auto& [key, value] : session.metadata) {
        if (sqlite3_prepare_v2(db_, insert_metadata_sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return database_error("Failed to prepare metadata insert");
        }
        bind_text(stmt, 1, session.session_id);
        bind_text(stmt, 2, key);
        bind_text(stmt, 3, value);
        result = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (result != SQLITE_DONE) {
            return database_error("Failed to write metadata for " + session.session_id);
        }
    }
    
    for (const auto& chunk : session.chunks) {
        auto chunk_result = write_chunk(session.session_id, chunk);
        if (!chunk_result) {
            return chunk_result;
        }
    }
    
    return StorageResult();
}

StorageResult SessionIndex::write_chunk(const std::string& session_id, const upload::ChunkRecord& chunk) {
    const char* insert_chunk_sql = R"(
        INSERT OR REPLACE INTO upload_chunks
        (session_id, chunk_index, size, hash, uploaded, retry_count, last_attempt)
        VALUES (?, ?, ?, ?, ?, ?, ?);
    )";
    
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, insert_chunk_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return database_error("Failed to prepare chunk insert");
    }
    
    bind_text(stmt, 1, session_id);
    sqlite3_bind_int64(stmt, 2, chunk.index);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(chunk.size));
    bind_text(stmt, 4, chunk.hash);
    sqlite3_bind_int(stmt, 5, chunk.uploaded ? 1 : 0);
    sqlite3_bind_int64(stmt, 6, chunk.retry_count);
    bind_time(stmt, 7, chunk.last_attempt);
    
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (result != SQLITE_DONE) {
        return database_error("Failed to write chunk " + std::to_string(chunk.index) + " of " + session_id);
    }
    return StorageResult();
}

StorageResult SessionIndex::save_session(const upload::UploadSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return StorageResult(StorageError::DATABASE_ERROR, "Session index not initialized");
    }
    
    auto result = exec("BEGIN IMMEDIATE;");
    if (!result) {
        return result;
    }
    
    result = write_session(session);
    if (!result) {
        auto rollback = exec("ROLLBACK;");
        if (!rollback) {
            LOG_ERROR("Rollback failed for session {}: {}", session.session_id, rollback.message);
        }
        return result;
    }
    
    return exec("COMMIT;");
}

StorageResult SessionIndex::write_progress(const ChunkProgress& progress) {
    const char* update_session_sql = R"(
        UPDATE upload_sessions
        SET uploaded_size = MAX(uploaded_size, ?),
            last_activity = MAX(last_activity, ?),
            expires_at = MAX(expires_at, ?)
        WHERE session_id = ?;
    )";
    
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, update_session_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return database_error("Failed to prepare progress update");
    }
    
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(progress.uploaded_size));
    bind_time(stmt, 2, progress.last_activity);
    bind_time(stmt, 3, progress.expires_at);
    bind_text(stmt, 4, progress.session_id);
    
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (result != SQLITE_DONE) {
        return database_error("Failed to update progress of " + progress.session_id);
    }
    if (sqlite3_changes(db_) == 0) {
        return StorageResult(StorageError::NOT_FOUND, "Session not found: " + progress.session_id);
    }
    
    const char* upsert_chunk_sql = R"(
        INSERT INTO upload_chunks
        (session_id, chunk_index, size, hash, uploaded, retry_count, last_attempt)
        VALUES (?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT (session_id, chunk_index) DO UPDATE SET
            hash = CASE WHEN upload_chunks.uploaded = 1 THEN upload_chunks.hash ELSE excluded.hash END,
            uploaded = MAX(upload_chunks.uploaded, excluded.uploaded),
            retry_count = MAX(upload_chunks.retry_count, excluded.retry_count),
            last_attempt = COALESCE(MAX(upload_chunks.last_attempt, excluded.last_attempt),
                                    upload_chunks.last_attempt, excluded.last_attempt);
    )";
    
    if (sqlite3_prepare_v2(db_, upsert_chunk_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return database_error("Failed to prepare chunk upsert");
    }
    
    const auto& chunk = progress.chunk;
    bind_text(stmt, 1, progress.session_id);
    sqlite3_bind_int64(stmt, 2, chunk.index);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(chunk.size));
    bind_text(stmt, 4, chunk.hash);
    sqlite3_bind_int(stmt, 5, chunk.uploaded ? 1 : 0);
    sqlite3_bind_int64(stmt, 6, chunk.retry_count);
    bind_time(stmt, 7, chunk.last_attempt);
    
    result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (result != SQLITE_DONE) {
        return database_error("Failed to write chunk " + std::to_string(chunk.index) + " of " + progress.session_id);
    }
    return StorageResult();
}

StorageResult SessionIndex::save_chunk(const ChunkProgress& progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return StorageResult(StorageError::DATABASE_ERROR, "Session index not initialized");
    }
    
    auto result = exec("BEGIN IMMEDIATE;");
    if (!result) {
        return result;
    }
    
    result = write_progress(progress);
    if (!result) {
        auto rollback = exec("ROLLBACK;");
        if (!rollback) {
            LOG_ERROR("Rollback failed for session {}: {}", progress.session_id, rollback.message);
        }
        return result;
    }
    
    return exec("COMMIT;");
}

StorageResult SessionIndex::check() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return StorageResult(StorageError::DATABASE_ERROR, "Session index not initialized");
    }
    return exec("SELECT 1 FROM upload_sessions LIMIT 1;");
}

StorageResult SessionIndex::remove_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return StorageResult(StorageError::DATABASE_ERROR, "Session index not initialized");
    }
    
    // Cascades to upload_chunks and upload_session_metadata.
    const char* delete_sql = "DELETE FROM upload_sessions WHERE session_id = ?;";
    
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, delete_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return database_error("Failed to prepare session delete");
    }
    
    bind_text(stmt, 1, session_id);
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_DONE) {
        return database_error("Failed to remove session " + session_id);
    }
    
    if (sqlite3_changes(db_) == 0) {
        return StorageResult(StorageError::NOT_FOUND, "Session not in index: " + session_id);
    }
    return StorageResult();
}

StorageResult SessionIndex::read_chunks(upload::UploadSession& session) {
    const char* select_sql = R"(
        SELECT chunk_index, size, hash, uploaded, retry_count, last_attempt
        FROM upload_chunks WHERE session_id = ? ORDER BY chunk_index;
    )";
    
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return database_error("Failed to prepare chunk query");
    }
    
    bind_text(stmt, 1, session.session_id);
    session.chunks.clear();
    
    int result;
    while ((result = sqlite3_step(stmt)) == SQLITE_ROW) {
        upload::ChunkRecord chunk;
        chunk.index = static_cast<uint32_t>(sqlite3_column_int64(stmt, 0));
        chunk.size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 1));
        chunk.hash = column_text(stmt, 2);
        chunk.uploaded = sqlite3_column_int(stmt, 3) != 0;
        chunk.retry_count = static_cast<uint32_t>(sqlite3_column_int64(stmt, 4));
        chunk.last_attempt = column_time(stmt, 5);
        session.chunks.push_back(std::move(chunk));
    }
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_DONE) {
        return database_error("Failed to read chunks of " + session.session_id);
    }
    
    for (size_t i = 0; i < session.chunks.size(); ++i) {
        if (session.chunks[i].index != i) {
            return StorageResult(StorageError::DATABASE_ERROR,
                                 "Chunk map of " + session.session_id + " is not contiguous");
        }
    }
    return StorageResult();
}

StorageResult SessionIndex::read_metadata(upload::UploadSession& session) {
    const char* select_sql = "SELECT key, value FROM upload_session_metadata WHERE session_id = ?;";
    
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return database_error("Failed to prepare metadata query");
    }
    
    bind_text(stmt, 1, session.session_id);
    session.metadata.clear();
    
    int result;
    while ((result = sqlite3_step(stmt)) == SQLITE_ROW) {
        session.metadata[column_text(stmt, 0)] = column_text(stmt, 1);
    }
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_DONE) {
        return database_error("Failed to read metadata of " + session.session_id);
    }
    return StorageResult();
}

StorageResult SessionIndex::read_sessions(const char* sql, const std::string* session_id,
                                          std::vector<upload::UploadSession>& sessions) {
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return database_error("Failed to prepare session query");
    }
    
    if (session_id) {
        bind_text(stmt, 1, *session_id);
    }
    
    int result;
    while ((result = sqlite3_step(stmt)) == SQLITE_ROW) {
        upload::UploadSession session;
        session.session_id = column_text(stmt, 0);
        session.owner_id = column_text(stmt, 1);
        session.filename = column_text(stmt, 2);
        session.mime_type = column_text(stmt, 3);
        session.total_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
        session.chunk_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
        session.bucket = column_text(stmt, 6);
        session.category = column_text(stmt, 7);
        
        auto state_name = column_text(stmt, 8);
        auto state = upload::session_state_from_string(state_name);
        if (!state) {
            LOG_WARN("Skipping session {} with unknown state '{}'", session.session_id, state_name);
            continue;
        }
        session.state = *state;
        
        session.uploaded_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 9));
        session.expected_hash = column_text(stmt, 10);
        session.content_validated = sqlite3_column_int(stmt, 11) != 0;
        session.storage_location = column_text(stmt, 12);
        session.content_hash = column_text(stmt, 13);
        session.failure_stage = upload::error_stage_from_string(column_text(stmt, 14))
                                    .value_or(upload::ErrorStage::NONE);
        session.failure_reason = column_text(stmt, 15);
        session.created_at = column_time(stmt, 16).value_or(core::TimePoint{});
        session.last_activity = column_time(stmt, 17).value_or(core::TimePoint{});
        session.expires_at = column_time(stmt, 18).value_or(core::TimePoint{});
        session.ended_at = column_time(stmt, 19);
        
        sessions.push_back(std::move(session));
    }
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_DONE) {
        return database_error("Failed to read sessions");
    }
    
    for (auto& session : sessions) {
        auto chunk_result = read_chunks(session);
        if (!chunk_result) {
            return chunk_result;
        }
        auto metadata_result = read_metadata(session);
        if (!metadata_result) {
            return metadata_result;
        }
        session.update_percentage();
    }
    
    return StorageResult();
}

namespace {

constexpr const char* SELECT_SESSION_COLUMNS = R"(
    SELECT session_id, owner_id, filename, mime_type, total_size, chunk_size, bucket, category, state,
           uploaded_size, expected_hash, content_validated, storage_location, content_hash,
           failure_stage, failure_reason, created_at, last_activity, expires_at, ended_at
    FROM upload_sessions
)";

}

StorageResult SessionIndex::load_session(const std::string& session_id, upload::UploadSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return StorageResult(StorageError::DATABASE_ERROR, "Session index not initialized");
    }
    
    std::string sql = std::string(SELECT_SESSION_COLUMNS) + " WHERE session_id = ?;";
    std::vector<upload::UploadSession> sessions;
    auto result = read_sessions(sql.c_str(), &session_id, sessions);
    if (!result) {
        return result;
    }
    
    if (sessions.empty()) {
        return StorageResult(StorageError::NOT_FOUND, "Session not in index: " + session_id);
    }
    
    session = std::move(sessions.front());
    return StorageResult();
}

StorageResult SessionIndex::load_sessions(std::vector<upload::UploadSession>& sessions) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return StorageResult(StorageError::DATABASE_ERROR, "Session index not initialized");
    }
    
    std::string sql = std::string(SELECT_SESSION_COLUMNS) + " ORDER BY created_at;";
    return read_sessions(sql.c_str(), nullptr, sessions);
}

size_t SessionIndex::session_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }
    
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM upload_sessions;", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    
    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return count;
}

}
