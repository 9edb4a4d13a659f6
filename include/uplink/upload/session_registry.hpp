#pragma once

#include "upload_result.hpp"
#include "upload_session.hpp"
#include "upload_policy.hpp"
#include "upload_events.hpp"
#include "progress_estimator.hpp"
#include "reassembler.hpp"
#include "finalizer.hpp"
#include "../core/clock.hpp"
#include "../storage/chunk_store.hpp"
#include "../storage/object_storage.hpp"
#include "../storage/session_index.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace uplink::upload {

// What a single sweep did to one session.
struct SweepAction {
    bool skipped = false;
    bool expired = false;
    bool reclaimed = false;
    bool evicted = false;
};

// Owns every UploadSession. Sessions are kept in a map guarded by a
// reader/writer lock that is only held to look entries up; all mutation of
// a session happens under that session's own mutex, and listeners are
// called after every lock has been released.
class SessionRegistry {
public:
    SessionRegistry(UploadPolicy policy,
                    std::shared_ptr<storage::ChunkStore> chunk_store,
                    std::shared_ptr<storage::ObjectStorage> object_storage,
                    std::shared_ptr<core::Clock> clock,
                    std::shared_ptr<storage::SessionIndex> session_index = nullptr);
    
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;
    
    UploadResult create_session(const std::string& owner_id,
                                const std::string& filename,
                                uint64_t total_size,
                                const std::string& mime_type,
                                const UploadOptions& options,
                                UploadSession& session);
    
    // An empty declared_hash skips the hash comparison. If this chunk
    // completes the session, reassembly and finalization run before the
    // call returns.
    UploadResult submit_chunk(const std::string& session_id,
                              uint32_t index,
                              const std::vector<uint8_t>& data,
                              const std::string& declared_hash,
                              ChunkReceipt& receipt);
    
    UploadResult get_progress(const std::string& session_id, ProgressSnapshot& snapshot) const;
    
    UploadResult get_session(const std::string& session_id, UploadSession& session) const;
    
    UploadResult missing_chunks(const std::string& session_id, std::vector<uint32_t>& missing) const;
    
    UploadResult pause(const std::string& session_id);
    UploadResult resume(const std::string& session_id);
    UploadResult cancel(const std::string& session_id);
    
    // Re-runs reassembly and finalization for a session that failed while
    // handing the object to storage. Chunks are still on disk in that case.
    UploadResult retry_finalization(const std::string& session_id);
    
    std::vector<UploadSession> list_sessions_for_owner(const std::string& owner_id) const;
    
    // Takes a throughput sample for every active session.
    size_t sample_progress();
    
    // Reloads persisted sessions from the session index.
    UploadResult recover(size_t& recovered);
    
    SweepAction sweep_session(const std::string& session_id, core::TimePoint now);
    
    // True when the registry expects chunk storage to exist for the id.
    bool owns_chunk_storage(const std::string& session_id) const;
    
    ListenerId add_listener(UploadListener listener);
    bool remove_listener(ListenerId id);
    
    bool contains(const std::string& session_id) const;
    std::vector<std::string> session_ids() const;
    size_t session_count() const;
    std::map<SessionState, size_t> count_by_state() const;
    
    const UploadPolicy& policy() const { return policy_; }
    const std::shared_ptr<core::Clock>& clock() const { return clock_; }

private:
    struct SessionEntry {
        explicit SessionEntry(size_t window) : estimator(window) {}
        
        std::mutex mutex;
        UploadSession session;
        ProgressEstimator estimator;
        uint32_t in_flight = 0;
        std::vector<bool> chunk_in_flight;
        bool finalizing = false;
        bool storage_reclaimed = false;
    };
    
    using EntryPtr = std::shared_ptr<SessionEntry>;
    using EventList = std::vector<UploadEvent>;
    
    UploadPolicy policy_;
    std::shared_ptr<storage::ChunkStore> chunk_store_;
    std::shared_ptr<storage::ObjectStorage> object_storage_;
    std::shared_ptr<core::Clock> clock_;
    std::shared_ptr<storage::SessionIndex> session_index_;
    Reassembler reassembler_;
    Finalizer finalizer_;
    
    mutable std::shared_mutex sessions_mutex_;
    std::map<std::string, EntryPtr> sessions_;
    
    mutable std::mutex listeners_mutex_;
    std::map<ListenerId, UploadListener> listeners_;
    ListenerId next_listener_id_ = 1;
    
    EntryPtr find_entry(const std::string& session_id) const;
    std::vector<EntryPtr> all_entries() const;
    void erase_entry(const std::string& session_id, const EntryPtr& entry);
    
    // The following expect entry.mutex to be held.
    ProgressSnapshot make_snapshot(const SessionEntry& entry) const;
    UploadEvent make_event(UploadEventType type, const SessionEntry& entry,
                           std::string message = "", std::optional<uint32_t> chunk_index = std::nullopt) const;
    bool expire_if_due(SessionEntry& entry, core::TimePoint now, EventList& events);
    void fail_session(SessionEntry& entry, ErrorStage stage, const std::string& reason,
                      core::TimePoint now, EventList& events);
    void persist(const UploadSession& session);
    std::optional<storage::ChunkProgress> make_progress(const UploadSession& session, uint32_t index) const;
    
    UploadResult run_completion(const EntryPtr& entry, ChunkReceipt* receipt);
    UploadResult check_duplicate(const std::string& session_id, const ChunkRecord& recorded,
                                 const std::vector<uint8_t>& data, ChunkReceipt& receipt) const;
    void reclaim_storage(const std::string& session_id);
    void persist_progress(const std::optional<storage::ChunkProgress>& progress);
    
    void emit(const EventList& events);
    size_t active_session_count(const std::string& owner_id) const;
    
    static UploadResult not_found(const std::string& session_id);
};

}
