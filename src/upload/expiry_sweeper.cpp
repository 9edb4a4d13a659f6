#include "uplink/upload/expiry_sweeper.hpp"
#include "uplink/core/logger.hpp"

namespace uplink::upload {

ExpirySweeper::ExpirySweeper(SessionRegistry& registry, std::shared_ptr<storage::ChunkStore> chunk_store)
    : registry_(registry), chunk_store_(std::move(chunk_store)) {
}

SweepReport ExpirySweeper::sweep() {
    std::lock_guard<std::mutex> lock(sweep_mutex_);
    SweepReport report;
    auto now = registry_.clock()->now();
    
    for (const auto& session_id : registry_.session_ids()) {
        auto action = registry_.sweep_session(session_id, now);
        ++report.sessions_examined;
        
        if (action.skipped) {
            ++report.sessions_skipped;
            continue;
        }
        if (action.expired) {
            ++report.sessions_expired;
        }
        if (action.reclaimed) {
            ++report.storage_reclaimed;
        }
        if (action.evicted) {
            ++report.sessions_evicted;
        }
    }
    
    for (const auto& session_id : chunk_store_->list_sessions()) {
        if (registry_.owns_chunk_storage(session_id)) {
            continue;
        }
        
        auto result = chunk_store_->delete_all(session_id);
        if (result) {
            ++report.orphans_removed;
            LOG_DEBUG("Removed orphaned chunk storage for {}", session_id);
        } else {
            LOG_WARN("Failed to remove orphaned chunk storage for {}: {}", session_id, result.message);
        }
    }
    
    if (report.total_actions() > 0) {
        LOG_INFO("Sweep: {} sessions examined, {} expired, {} reclaimed, {} evicted, {} orphans removed",
                 report.sessions_examined, report.sessions_expired, report.storage_reclaimed,
                 report.sessions_evicted, report.orphans_removed);
    } else {
        LOG_DEBUG("Sweep: {} sessions examined, nothing to do", report.sessions_examined);
    }
    
    last_report_ = report;
    return report;
}

void ExpirySweeper::schedule(core::TaskScheduler& scheduler, std::chrono::milliseconds interval) {
    scheduler.schedule_every(TASK_NAME, interval, [this]() { sweep(); });
}

}
