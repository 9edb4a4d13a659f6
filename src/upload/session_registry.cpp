#include "uplink/upload/session_registry.hpp"
#include "uplink/upload/chunk_validator.hpp"
#include "uplink/crypto/random.hpp"
#include "uplink/core/logger.hpp"
#include "uplink/core/utils.hpp"
#include <algorithm>

namespace uplink::upload {

namespace {

constexpr size_t SESSION_ID_BYTES = 16;

bool is_open(SessionState state) {
    return state == SessionState::ACTIVE || state == SessionState::PAUSED;
}

}

SessionRegistry::SessionRegistry(UploadPolicy policy,
                                 std::shared_ptr<storage::ChunkStore> chunk_store,
                                 std::shared_ptr<storage::ObjectStorage> object_storage,
                                 std::shared_ptr<core::Clock> clock,
                                 std::shared_ptr<storage::SessionIndex> session_index)
    : policy_(std::move(policy))
    , chunk_store_(std::move(chunk_store))
    , object_storage_(std::move(object_storage))
    , clock_(std::move(clock))
    , session_index_(std::move(session_index))
    , reassembler_(chunk_store_)
    , finalizer_(object_storage_, chunk_store_, policy_.finalize_attempts) {
}

UploadResult SessionRegistry::not_found(const std::string& session_id) {
    ErrorDetail detail;
    detail.stage = ErrorStage::LIFECYCLE;
    return UploadResult(UploadError::NOT_FOUND, "Unknown session: " + session_id, detail);
}

SessionRegistry::EntryPtr SessionRegistry::find_entry(const std::string& session_id) const {
    std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::vector<SessionRegistry::EntryPtr> SessionRegistry::all_entries() const {
    std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
    std::vector<EntryPtr> entries;
    entries.reserve(sessions_.size());
    for (const auto& [session_id, entry] : sessions_) {
        entries.push_back(entry);
    }
    return entries;
}

void SessionRegistry::erase_entry(const std::string& session_id, const EntryPtr& entry) {
    {
        std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end() && it->second == entry) {
            sessions_.erase(it);
        }
    }

    if (session_index_) {
        auto result = session_index_->remove_session(session_id);
        if (!result && result.error != storage::StorageError::NOT_FOUND) {
            LOG_WARN("Failed to remove session {} from index: {}", session_id, result.message);
        }
    }
}

ProgressSnapshot SessionRegistry::make_snapshot(const SessionEntry& entry) const {
    const auto& session = entry.session;

    ProgressSnapshot snapshot;
    snapshot.session_id = session.session_id;
    snapshot.state = session.state;
    snapshot.total_size = session.total_size;
    snapshot.uploaded_size = session.uploaded_size;
    snapshot.percentage = session.percentage;
    snapshot.uploaded_chunks = session.uploaded_chunk_count();
    snapshot.total_chunks = session.chunk_count();
    snapshot.current_speed_bps = entry.estimator.current_speed();
    snapshot.smoothed_speed_bps = entry.estimator.smoothed_speed();
    snapshot.eta = entry.estimator.eta(session.total_size - session.uploaded_size);
    snapshot.last_activity = session.last_activity;
    snapshot.expires_at = session.expires_at;
    return snapshot;
}

UploadEvent SessionRegistry::make_event(UploadEventType type, const SessionEntry& entry,
                                        std::string message, std::optional<uint32_t> chunk_index) const {
    UploadEvent event;
    event.type = type;
    event.session_id = entry.session.session_id;
    event.chunk_index = chunk_index;
    event.snapshot = make_snapshot(entry);
    event.message = std::move(message);
    return event;
}

void SessionRegistry::persist(const UploadSession& session) {
    if (!session_index_) {
        return;
    }

    auto result = session_index_->save_session(session);
    if (!result) {
        LOG_WARN("Failed to persist session {}: {}", session.session_id, result.message);
    }
}

std::optional<storage::ChunkProgress> SessionRegistry::make_progress(const UploadSession& session,
                                                                     uint32_t index) const {
    if (!session_index_) {
        return std::nullopt;
    }

    storage::ChunkProgress progress;
    progress.session_id = session.session_id;
    progress.chunk = session.chunks[index];
    progress.uploaded_size = session.uploaded_size;
    progress.last_activity = session.last_activity;
    progress.expires_at = session.expires_at;
    return progress;
}

void SessionRegistry::persist_progress(const std::optional<storage::ChunkProgress>& progress) {
    if (!progress || !session_index_) {
        return;
    }

    // NOT_FOUND means the session was cancelled or evicted meanwhile.
    auto result = session_index_->save_chunk(*progress);
    if (!result && result.error != storage::StorageError::NOT_FOUND) {
        LOG_WARN("Failed to persist chunk {} of session {}: {}",
                 progress->chunk.index, progress->session_id, result.message);
    }
}

bool SessionRegistry::expire_if_due(SessionEntry& entry, core::TimePoint now, EventList& events) {
    auto& session = entry.session;
    if (!is_open(session.state) || entry.finalizing || now < session.expires_at) {
        return false;
    }

    session.state = SessionState::EXPIRED;
    session.ended_at = now;
    persist(session);

    LOG_INFO("Session {} expired ({} of {} chunks uploaded)",
             session.session_id, session.uploaded_chunk_count(), session.chunk_count());
    events.push_back(make_event(UploadEventType::SESSION_EXPIRED, entry, "Session TTL elapsed"));
    return true;
}

void SessionRegistry::fail_session(SessionEntry& entry, ErrorStage stage, const std::string& reason,
                                   core::TimePoint now, EventList& events) {
    auto& session = entry.session;
    session.state = SessionState::FAILED;
    session.failure_stage = stage;
    session.failure_reason = reason;
    session.ended_at = now;
    persist(session);

    LOG_ERROR("Session {} failed during {}: {}", session.session_id, to_string(stage), reason);
    events.push_back(make_event(UploadEventType::SESSION_FAILED, entry, reason));
}

void SessionRegistry::emit(const EventList& events) {
    if (events.empty()) {
        return;
    }

    std::vector<UploadListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners.reserve(listeners_.size());
        for (const auto& [id, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }

    for (const auto& event : events) {
        for (const auto& listener : listeners) {
            try {
                listener(event);
            } catch (const std::exception& e) {
                LOG_WARN("Upload listener threw on {} for {}: {}",
                         to_string(event.type), event.session_id, e.what());
            }
        }
    }
}

void SessionRegistry::reclaim_storage(const std::string& session_id) {
    auto result = chunk_store_->delete_all(session_id);
    if (!result) {
        LOG_WARN("Failed to reclaim chunk storage for {}: {}", session_id, result.message);
    }
}

size_t SessionRegistry::active_session_count(const std::string& owner_id) const {
    size_t count = 0;
    for (const auto& entry : all_entries()) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->session.owner_id == owner_id && !is_terminal(entry->session.state)) {
            ++count;
        }
    }
    return count;
}

UploadResult SessionRegistry::create_session(const std::string& owner_id,
                                             const std::string& filename,
                                             uint64_t total_size,
                                             const std::string& mime_type,
                                             const UploadOptions& options,
                                             UploadSession& session) {
    auto validation = policy_.validate_request(filename, total_size, mime_type, options);
    if (!validation) {
        LOG_DEBUG("Rejected upload of '{}' for {}: {}", filename, owner_id, validation.message);
        return validation;
    }

    if (policy_.max_sessions_per_owner > 0 &&
        active_session_count(owner_id) >= policy_.max_sessions_per_owner) {
        ErrorDetail detail;
        detail.stage = ErrorStage::VALIDATION;
        return UploadResult(UploadError::VALIDATION_ERROR,
                            "Owner " + owner_id + " already has " +
                            std::to_string(policy_.max_sessions_per_owner) + " open sessions", detail);
    }

    std::string session_id;
    try {
        session_id = crypto::SecureRandom::generate_hex(SESSION_ID_BYTES);
    } catch (const std::runtime_error& e) {
        ErrorDetail detail;
        detail.stage = ErrorStage::LIFECYCLE;
        return UploadResult(UploadError::STORAGE_ERROR, e.what(), detail);
    }

    auto now = clock_->now();
    auto entry = std::make_shared<SessionEntry>(policy_.progress_window);
    auto& created = entry->session;

    created.session_id = session_id;
    created.owner_id = owner_id;
    created.filename = filename;
    created.mime_type = mime_type;
    created.total_size = total_size;
    created.chunk_size = policy_.choose_chunk_size(total_size, options.chunk_size);
    created.category = UploadPolicy::category_for(mime_type);
    created.bucket = options.bucket.empty() ? UploadPolicy::bucket_for(mime_type) : options.bucket;
    created.metadata = options.metadata;
    created.expected_hash = core::utils::StringUtils::to_lower(options.expected_hash);
    created.state = SessionState::INITIALIZING;
    created.created_at = now;
    created.last_activity = now;
    created.expires_at = now + policy_.session_ttl;

    auto chunk_count = UploadPolicy::chunk_count(total_size, created.chunk_size);
    created.chunks.reserve(chunk_count);
    for (uint32_t i = 0; i < chunk_count; ++i) {
        ChunkRecord chunk;
        chunk.index = i;
        chunk.size = UploadPolicy::chunk_size_at(total_size, created.chunk_size, i);
        created.chunks.push_back(std::move(chunk));
    }
    entry->chunk_in_flight.assign(chunk_count, false);
    entry->estimator.reset(0, now);

    created.state = SessionState::ACTIVE;
    created.update_percentage();
    persist(created);

    EventList events;
    events.push_back(make_event(UploadEventType::SESSION_CREATED, *entry));
    session = created;

    {
        std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
        sessions_[session_id] = entry;
    }

    LOG_INFO("Created session {} for {}: '{}' {} in {} chunks of {}",
             session_id, owner_id, filename,
             core::utils::StringUtils::format_bytes(total_size), chunk_count,
             core::utils::StringUtils::format_bytes(session.chunk_size));

    emit(events);
    return UploadResult();
}

UploadResult SessionRegistry::check_duplicate(const std::string& session_id, const ChunkRecord& recorded,
                                              const std::vector<uint8_t>& data, ChunkReceipt& receipt) const {
    ErrorDetail detail;
    detail.stage = ErrorStage::INGESTION;
    detail.chunk_index = recorded.index;

    if (data.size() != recorded.size) {
        detail.expected_size = recorded.size;
        detail.actual_size = data.size();
        return UploadResult(UploadError::CHUNK_CONFLICT,
                            "Chunk was already uploaded with a different size", detail);
    }

    std::string computed_hash;
    auto validation = ChunkValidator::validate(recorded.index, recorded.size, data, "", computed_hash);
    if (!validation) {
        return validation;
    }

    if (!ChunkValidator::hashes_equal(computed_hash, recorded.hash)) {
        detail.expected_hash = recorded.hash;
        detail.actual_hash = computed_hash;
        LOG_WARN("Rejected conflicting resubmission of chunk {} for session {}", recorded.index, session_id);
        return UploadResult(UploadError::CHUNK_CONFLICT,
                            "Chunk was already uploaded with different content", detail);
    }

    receipt.index = recorded.index;
    receipt.size = recorded.size;
    receipt.hash = recorded.hash;
    receipt.duplicate = true;
    return UploadResult();
}


UploadResult SessionRegistry::submit_chunk(const std::string& session_id,
                                           uint32_t index,
                                           const std::vector<uint8_t>& data,
                                           const std::string& declared_hash,
                                           ChunkReceipt& receipt) {
    auto entry = find_entry(session_id);
    if (!entry) {
        return not_found(session_id);
    }

    ErrorDetail detail;
    detail.stage = ErrorStage::INGESTION;
    detail.chunk_index = index;

    EventList events;
    UploadResult rejection;
    uint64_t declared_size = 0;
    std::optional<ChunkRecord> duplicate_of;

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        auto& session = entry->session;
        auto now = clock_->now();

        if (expire_if_due(*entry, now, events) || session.state == SessionState::EXPIRED) {
            detail.stage = ErrorStage::LIFECYCLE;
            rejection = UploadResult(UploadError::EXPIRED, "Session has expired", detail);
        } else if (session.state == SessionState::CANCELLED) {
            detail.stage = ErrorStage::LIFECYCLE;
            rejection = UploadResult(UploadError::SESSION_NOT_ACTIVE, "Session was cancelled", detail);
        } else if (session.state == SessionState::FAILED || session.state == SessionState::INITIALIZING) {
            detail.stage = ErrorStage::LIFECYCLE;
            rejection = UploadResult(UploadError::INVALID_STATE,
                                     std::string("Session is ") + to_string(session.state), detail);
        } else if (index >= session.chunk_count()) {
            detail.stage = ErrorStage::VALIDATION;
            rejection = UploadResult(UploadError::VALIDATION_ERROR,
                                     "Chunk index out of range (session has " +
                                     std::to_string(session.chunk_count()) + " chunks)", detail);
        } else if (session.chunks[index].uploaded) {
            duplicate_of = session.chunks[index];
            receipt.uploaded_size = session.uploaded_size;
            receipt.session_completed = session.state == SessionState::COMPLETED;
            receipt.storage_location = session.storage_location;
        } else if (session.state != SessionState::ACTIVE) {
            detail.stage = ErrorStage::LIFECYCLE;
            rejection = UploadResult(UploadError::SESSION_NOT_ACTIVE,
                                     std::string("Session is ") + to_string(session.state), detail);
        } else if (entry->chunk_in_flight[index]) {
            detail.retry_after = policy_.backoff_base;
            rejection = UploadResult(UploadError::RETRYABLE, "Chunk is already being uploaded", detail);
        } else if (entry->in_flight >= policy_.max_concurrent_chunks) {
            detail.retry_after = policy_.backoff_base;
            rejection = UploadResult(UploadError::RETRYABLE,
                                     "Too many concurrent chunk uploads for this session", detail);
        } else {
            entry->chunk_in_flight[index] = true;
            ++entry->in_flight;
            declared_size = session.chunks[index].size;
        }
    }

    emit(events);
    events.clear();

    if (!rejection) {
        return rejection;
    }

    if (duplicate_of) {
        return check_duplicate(session_id, *duplicate_of, data, receipt);
    }

    // Validation and the chunk write run without the session lock so other
    // chunks of the same session can proceed in parallel.
    std::string computed_hash;
    auto validation = ChunkValidator::validate(index, declared_size, data, declared_hash, computed_hash);

    storage::StorageResult write_result;
    if (validation) {
        write_result = chunk_store_->put(session_id, index, data);
    }

    UploadResult outcome;
    std::optional<storage::ChunkProgress> progress;
    bool discard_chunk = false;
    bool discard_session_storage = false;
    bool trigger_completion = false;

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        auto& session = entry->session;
        auto& chunk = session.chunks[index];
        auto now = clock_->now();

        entry->chunk_in_flight[index] = false;
        --entry->in_flight;

        bool wrote = validation.success() && write_result.success();

        if (session.state == SessionState::CANCELLED || session.state == SessionState::EXPIRED) {
            detail.stage = ErrorStage::LIFECYCLE;
            outcome = UploadResult(session.state == SessionState::EXPIRED ? UploadError::EXPIRED
                                                                         : UploadError::SESSION_NOT_ACTIVE,
                                   std::string("Session became ") + to_string(session.state) +
                                   " while the chunk was in flight", detail);
            discard_session_storage = wrote;
        } else if (session.state == SessionState::FAILED) {
            detail.stage = ErrorStage::LIFECYCLE;
            outcome = UploadResult(UploadError::SESSION_NOT_ACTIVE,
                                   "Session failed while the chunk was in flight", detail);
            discard_chunk = wrote;
        } else if (!validation && validation.error == UploadError::RETRYABLE) {
            chunk.retry_count++;
            chunk.last_attempt = now;
            validation.detail.retries_used = chunk.retry_count;

            if (chunk.retry_count >= policy_.max_chunk_retries) {
                fail_session(*entry, ErrorStage::INGESTION,
                             "Chunk " + std::to_string(index) + " exhausted " +
                             std::to_string(policy_.max_chunk_retries) + " attempts: " + validation.message,
                             now, events);
                outcome = UploadResult(UploadError::TERMINAL,
                                       "Retries exhausted for chunk " + std::to_string(index) +
                                       ": " + validation.message, validation.detail);
            } else {
                validation.detail.retry_after = policy_.backoff_hint(chunk.retry_count - 1);
                progress = make_progress(session, index);
                LOG_WARN("Chunk {} of session {} rejected (attempt {}/{}): {}",
                         index, session_id, chunk.retry_count, policy_.max_chunk_retries,
                         validation.describe());
                outcome = validation;
            }
        } else if (!validation || !write_result) {
            detail.stage = ErrorStage::STORAGE;
            detail.retries_used = chunk.retry_count;
            detail.retry_after = policy_.backoff_hint(chunk.retry_count);
            auto message = !validation ? validation.message : write_result.message;
            LOG_WARN("Storing chunk {} of session {} failed: {}", index, session_id, message);
            outcome = UploadResult(UploadError::RETRYABLE, "Chunk storage failed: " + message, detail);
        } else if (expire_if_due(*entry, now, events)) {
            detail.stage = ErrorStage::LIFECYCLE;
            outcome = UploadResult(UploadError::EXPIRED, "Session expired while the chunk was in flight", detail);
            discard_session_storage = true;
        } else {
            chunk.uploaded = true;
            chunk.hash = computed_hash;
            chunk.last_attempt = now;

            session.uploaded_size += chunk.size;
            session.update_percentage();
            session.last_activity = now;
            if (policy_.sliding_ttl) {
                session.expires_at = now + policy_.session_ttl;
            }
            entry->estimator.sample(session.uploaded_size, now);
            progress = make_progress(session, index);

            receipt.index = index;
            receipt.size = chunk.size;
            receipt.hash = computed_hash;
            receipt.duplicate = false;
            receipt.uploaded_size = session.uploaded_size;
            receipt.session_completed = false;

            LOG_DEBUG("Session {} accepted chunk {} ({}/{} chunks, {:.1f}%)",
                      session_id, index, session.uploaded_chunk_count(), session.chunk_count(),
                      session.percentage);

            events.push_back(make_event(UploadEventType::CHUNK_UPLOADED, *entry, "", index));
            events.push_back(make_event(UploadEventType::PROGRESS, *entry));

            // Only the submission that observes the last missing chunk gets
            // here with finalizing still false.
            if (session.state == SessionState::ACTIVE && session.all_chunks_uploaded() && !entry->finalizing) {
                entry->finalizing = true;
                trigger_completion = true;
            }
        }
    }

    persist_progress(progress);
    emit(events);

    if (discard_session_storage) {
        reclaim_storage(session_id);
    } else if (discard_chunk) {
        auto removed = chunk_store_->remove(session_id, index);
        if (!removed) {
            LOG_WARN("Failed to discard chunk {} of {}: {}", index, session_id, removed.message);
        }
    }

    if (trigger_completion) {
        return run_completion(entry, &receipt);
    }

    return outcome;
}

UploadResult SessionRegistry::run_completion(const EntryPtr& entry, ChunkReceipt* receipt) {
    UploadSession snapshot;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        snapshot = entry->session;
    }

    LOG_INFO("Session {} complete, reassembling {} chunks", snapshot.session_id, snapshot.chunk_count());

    AssembledObject object;
    auto result = reassembler_.reassemble(snapshot, object);

    storage::StoredObject stored;
    if (result) {
        result = finalizer_.finalize(snapshot, object, stored);
    }

    EventList events;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        auto& session = entry->session;
        auto now = clock_->now();
        entry->finalizing = false;

        if (!result) {
            auto stage = result.detail.stage == ErrorStage::NONE ? ErrorStage::REASSEMBLY : result.detail.stage;
            fail_session(*entry, stage, result.describe(), now, events);
            result = UploadResult(UploadError::TERMINAL, result.message, result.detail);
        } else {
            session.state = SessionState::COMPLETED;
            session.storage_location = stored.location;
            session.content_hash = object.content_hash;
            session.content_validated = true;
            session.failure_stage = ErrorStage::NONE;
            session.failure_reason.clear();
            session.ended_at = now;
            session.last_activity = now;
            persist(session);

            LOG_INFO("Session {} completed: {} stored at {}", session.session_id,
                     core::utils::StringUtils::format_bytes(stored.size), stored.location);
            events.push_back(make_event(UploadEventType::SESSION_COMPLETED, *entry, stored.location));
        }

        if (receipt) {
            receipt->uploaded_size = session.uploaded_size;
            receipt->session_completed = session.state == SessionState::COMPLETED;
            receipt->storage_location = session.storage_location;
        }
    }

    emit(events);

    if (result) {
        auto released = finalizer_.release(snapshot.session_id);
        if (!released) {
            LOG_WARN("Session {} completed but {}", snapshot.session_id, released.message);
        }
    }

    return result;
}

UploadResult SessionRegistry::get_progress(const std::string& session_id, ProgressSnapshot& snapshot) const {
    auto entry = find_entry(session_id);
    if (!entry) {
        return not_found(session_id);
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    snapshot = make_snapshot(*entry);
    return UploadResult();
}

UploadResult SessionRegistry::get_session(const std::string& session_id, UploadSession& session) const {
    auto entry = find_entry(session_id);
    if (!entry) {
        return not_found(session_id);
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    session = entry->session;
    return UploadResult();
}

UploadResult SessionRegistry::missing_chunks(const std::string& session_id, std::vector<uint32_t>& missing) const {
    auto entry = find_entry(session_id);
    if (!entry) {
        return not_found(session_id);
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    missing = entry->session.missing_chunks();
    return UploadResult();
}

UploadResult SessionRegistry::pause(const std::string& session_id) {
    auto entry = find_entry(session_id);
    if (!entry) {
        return not_found(session_id);
    }

    ErrorDetail detail;
    detail.stage = ErrorStage::LIFECYCLE;

    EventList events;
    UploadResult result;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        auto& session = entry->session;
        auto now = clock_->now();

        if (expire_if_due(*entry, now, events) || session.state == SessionState::EXPIRED) {
            result = UploadResult(UploadError::EXPIRED, "Session has expired", detail);
        } else if (entry->finalizing) {
            result = UploadResult(UploadError::INVALID_STATE, "Session is being finalized", detail);
        } else if (session.state == SessionState::PAUSED) {
            result = UploadResult();
        } else if (session.state != SessionState::ACTIVE) {
            result = UploadResult(UploadError::INVALID_STATE,
                                  std::string("Cannot pause a session that is ") + to_string(session.state),
                                  detail);
        } else {
            session.state = SessionState::PAUSED;
            session.last_activity = now;
            persist(session);
            LOG_INFO("Session {} paused at {:.1f}%", session_id, session.percentage);
            events.push_back(make_event(UploadEventType::SESSION_PAUSED, *entry));
        }
    }

    emit(events);
    return result;
}

UploadResult SessionRegistry::resume(const std::string& session_id) {
    auto entry = find_entry(session_id);
    if (!entry) {
        return not_found(session_id);
    }

    ErrorDetail detail;
    detail.stage = ErrorStage::LIFECYCLE;

    EventList events;
    UploadResult result;
    bool trigger_completion = false;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        auto& session = entry->session;
        auto now = clock_->now();

        if (expire_if_due(*entry, now, events) || session.state == SessionState::EXPIRED) {
            result = UploadResult(UploadError::EXPIRED,
                                  "Session has expired, start a new upload", detail);
        } else if (session.state == SessionState::ACTIVE) {
            result = UploadResult();
        } else if (session.state != SessionState::PAUSED) {
            result = UploadResult(UploadError::INVALID_STATE,
                                  std::string("Cannot resume a session that is ") + to_string(session.state),
                                  detail);
        } else {
            session.state = SessionState::ACTIVE;
            session.last_activity = now;
            if (policy_.sliding_ttl) {
                session.expires_at = now + policy_.session_ttl;
            }
            entry->estimator.reset(session.uploaded_size, now);
            persist(session);
            LOG_INFO("Session {} resumed, {} chunks missing", session_id,
                     session.chunk_count() - session.uploaded_chunk_count());
            events.push_back(make_event(UploadEventType::SESSION_RESUMED, *entry));

            // Chunks that were in flight during the pause may have completed it.
            if (session.all_chunks_uploaded() && !entry->finalizing) {
                entry->finalizing = true;
                trigger_completion = true;
            }
        }
    }

    emit(events);

    if (trigger_completion) {
        return run_completion(entry, nullptr);
    }
    return result;
}

UploadResult SessionRegistry::cancel(const std::string& session_id) {
    auto entry = find_entry(session_id);
    if (!entry) {
        return not_found(session_id);
    }

    ErrorDetail detail;
    detail.stage = ErrorStage::LIFECYCLE;

    EventList events;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        auto& session = entry->session;

        if (entry->finalizing) {
            return UploadResult(UploadError::INVALID_STATE, "Session is being finalized", detail);
        }
        if (session.state == SessionState::COMPLETED) {
            return UploadResult(UploadError::INVALID_STATE, "Cannot cancel a completed session", detail);
        }
        if (session.state == SessionState::CANCELLED) {
            return not_found(session_id);
        }

        auto now = clock_->now();
        session.state = SessionState::CANCELLED;
        session.ended_at = now;
        entry->storage_reclaimed = true;

        LOG_INFO("Session {} cancelled with {}/{} chunks uploaded", session_id,
                 session.uploaded_chunk_count(), session.chunk_count());
        events.push_back(make_event(UploadEventType::SESSION_CANCELLED, *entry));
    }

    erase_entry(session_id, entry);
    reclaim_storage(session_id);
    emit(events);
    return UploadResult();
}

UploadResult SessionRegistry::retry_finalization(const std::string& session_id) {
    auto entry = find_entry(session_id);
    if (!entry) {
        return not_found(session_id);
    }

    ErrorDetail detail;
    detail.stage = ErrorStage::FINALIZATION;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        auto& session = entry->session;

        if (session.state != SessionState::FAILED || session.failure_stage != ErrorStage::FINALIZATION) {
            return UploadResult(UploadError::INVALID_STATE,
                                "Only sessions that failed during finalization can be retried", detail);
        }
        if (entry->finalizing) {
            return UploadResult(UploadError::INVALID_STATE, "Finalization already in progress", detail);
        }
        if (entry->storage_reclaimed || !session.all_chunks_uploaded()) {
            return UploadResult(UploadError::INVALID_STATE, "Chunk storage is no longer available", detail);
        }

        entry->finalizing = true;
        LOG_INFO("Retrying finalization of session {}", session_id);
    }

    return run_completion(entry, nullptr);
}

std::vector<UploadSession> SessionRegistry::list_sessions_for_owner(const std::string& owner_id) const {
    std::vector<UploadSession> sessions;
    for (const auto& entry : all_entries()) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->session.owner_id == owner_id) {
            sessions.push_back(entry->session);
        }
    }

    std::sort(sessions.begin(), sessions.end(), [](const UploadSession& lhs, const UploadSession& rhs) {
        return lhs.created_at < rhs.created_at;
    });
    return sessions;
}

size_t SessionRegistry::sample_progress() {
    size_t sampled = 0;
    EventList events;
    auto now = clock_->now();

    for (const auto& entry : all_entries()) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->session.state != SessionState::ACTIVE) {
            continue;
        }
        entry->estimator.sample(entry->session.uploaded_size, now);
        events.push_back(make_event(UploadEventType::PROGRESS, *entry));
        ++sampled;
    }

    emit(events);
    return sampled;
}

UploadResult SessionRegistry::recover(size_t& recovered) {
    recovered = 0;

    if (!session_index_) {
        return UploadResult(UploadError::INVALID_STATE, "No session index configured");
    }

    std::vector<UploadSession> stored;
    auto load_result = session_index_->load_sessions(stored);
    if (!load_result) {
        ErrorDetail detail;
        detail.stage = ErrorStage::STORAGE;
        return UploadResult(UploadError::STORAGE_ERROR, "Failed to load sessions: " + load_result.message, detail);
    }

    auto now = clock_->now();

    for (auto& session : stored) {
        if (find_entry(session.session_id)) {
            continue;
        }

        if (session.state == SessionState::CANCELLED || session.state == SessionState::INITIALIZING) {
            auto removed = session_index_->remove_session(session.session_id);
            if (!removed) {
                LOG_WARN("Failed to drop stale session {}: {}", session.session_id, removed.message);
            }
            continue;
        }

        auto entry = std::make_shared<SessionEntry>(policy_.progress_window);
        bool chunks_expected = is_open(session.state) || session.state == SessionState::FAILED;

        if (chunks_expected) {
            uint32_t demoted = 0;
            for (auto& chunk : session.chunks) {
                if (chunk.uploaded && !chunk_store_->exists(session.session_id, chunk.index)) {
                    chunk.uploaded = false;
                    chunk.hash.clear();
                    ++demoted;
                }
            }
            if (demoted > 0) {
                LOG_WARN("Session {}: {} uploaded chunks missing from storage, marked for re-upload",
                         session.session_id, demoted);
            }
        } else {
            entry->storage_reclaimed = true;
        }

        session.uploaded_size = session.computed_uploaded_size();
        session.update_percentage();

        // Crashed between the last chunk and finalization.
        if (session.state == SessionState::ACTIVE && session.all_chunks_uploaded()) {
            session.state = SessionState::FAILED;
            session.failure_stage = ErrorStage::FINALIZATION;
            session.failure_reason = "Interrupted before finalization completed";
            session.ended_at = now;
        }

        entry->session = std::move(session);
        entry->chunk_in_flight.assign(entry->session.chunk_count(), false);
        entry->estimator.reset(entry->session.uploaded_size, now);
        persist(entry->session);

        {
            std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
            sessions_[entry->session.session_id] = entry;
        }
        ++recovered;
    }

    LOG_INFO("Recovered {} upload sessions from {}", recovered, session_index_->path().string());
    return UploadResult();
}

SweepAction SessionRegistry::sweep_session(const std::string& session_id, core::TimePoint now) {
    SweepAction action;

    auto entry = find_entry(session_id);
    if (!entry) {
        return action;
    }

    EventList events;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        auto& session = entry->session;

        if (entry->finalizing || entry->in_flight > 0) {
            action.skipped = true;
            return action;
        }

        if (expire_if_due(*entry, now, events)) {
            action.expired = true;
        }

        auto ended = session.ended_at.value_or(session.last_activity);

        switch (session.state) {
            case SessionState::EXPIRED:
                if (!entry->storage_reclaimed) {
                    action.reclaimed = true;
                }
                if (now >= ended + policy_.completed_retention) {
                    action.evicted = true;
                }
                break;
            case SessionState::FAILED:
                if (now >= ended + policy_.failed_grace || now >= session.expires_at) {
                    action.reclaimed = !entry->storage_reclaimed;
                    action.evicted = true;
                }
                break;
            case SessionState::COMPLETED:
                if (now >= ended + policy_.completed_retention) {
                    action.evicted = true;
                }
                break;
            default:
                break;
        }

        if (action.reclaimed) {
            entry->storage_reclaimed = true;
        }
    }

    emit(events);

    if (action.reclaimed) {
        reclaim_storage(session_id);
    }

    if (action.evicted) {
        LOG_DEBUG("Evicting session {} from the registry", session_id);
        erase_entry(session_id, entry);
    }

    return action;
}

bool SessionRegistry::owns_chunk_storage(const std::string& session_id) const {
    auto entry = find_entry(session_id);
    if (!entry) {
        return false;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->finalizing || entry->in_flight > 0) {
        return true;
    }
    if (entry->storage_reclaimed) {
        return false;
    }
    return is_open(entry->session.state) || entry->session.state == SessionState::FAILED;
}

ListenerId SessionRegistry::add_listener(UploadListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    auto id = next_listener_id_++;
    listeners_[id] = std::move(listener);
    return id;
}

bool SessionRegistry::remove_listener(ListenerId id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return listeners_.erase(id) > 0;
}

bool SessionRegistry::contains(const std::string& session_id) const {
    return find_entry(session_id) != nullptr;
}

std::vector<std::string> SessionRegistry::session_ids() const {
    std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [session_id, entry] : sessions_) {
        ids.push_back(session_id);
    }
    return ids;
}

size_t SessionRegistry::session_count() const {
    std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
    return sessions_.size();
}

std::map<SessionState, size_t> SessionRegistry::count_by_state() const {
    std::map<SessionState, size_t> counts;
    for (const auto& entry : all_entries()) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        ++counts[entry->session.state];
    }
    return counts;
}

}
