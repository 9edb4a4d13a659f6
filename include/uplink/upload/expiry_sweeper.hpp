#pragma once

#include "session_registry.hpp"
#include "../core/task_scheduler.hpp"
#include "../storage/chunk_store.hpp"
#include <memory>
#include <string>

namespace uplink::upload {

struct SweepReport {
    size_t sessions_examined = 0;
    size_t sessions_skipped = 0;
    size_t sessions_expired = 0;
    size_t storage_reclaimed = 0;
    size_t sessions_evicted = 0;
    size_t orphans_removed = 0;
    
    size_t total_actions() const {
        return sessions_expired + storage_reclaimed + sessions_evicted + orphans_removed;
    }
};

// Two passes: the first visits every registered session under its own lock,
// the second deletes chunk storage that no registered session claims.
class ExpirySweeper {
public:
    static constexpr const char* TASK_NAME = "upload-expiry-sweep";
    
    ExpirySweeper(SessionRegistry& registry, std::shared_ptr<storage::ChunkStore> chunk_store);
    
    SweepReport sweep();
    
    void schedule(core::TaskScheduler& scheduler, std::chrono::milliseconds interval);
    
    const SweepReport& last_report() const { return last_report_; }

private:
    SessionRegistry& registry_;
    std::shared_ptr<storage::ChunkStore> chunk_store_;
    SweepReport last_report_;
    std::mutex sweep_mutex_;
};

}
