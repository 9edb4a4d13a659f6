#include "uplink/upload/upload_service.hpp"
#include "uplink/core/logger.hpp"
#include <algorithm>
#include <filesystem>

namespace uplink::upload {

namespace {

constexpr const char* SAMPLER_TASK_NAME = "upload-progress-sampler";

}

UploadService::UploadService(const storage::StorageConfig& storage_config, UploadPolicy policy,
                             std::shared_ptr<core::Clock> clock)
    : storage_config_(storage_config)
    , clock_(std::move(clock))
    , chunk_store_(std::make_shared<storage::FileChunkStore>(storage_config.chunk_directory))
    , object_storage_(std::make_shared<storage::FilesystemObjectStorage>(storage_config.object_directory))
    , session_index_(std::make_shared<storage::SessionIndex>(storage_config.database_path))
    , registry_(std::make_unique<SessionRegistry>(std::move(policy), chunk_store_, object_storage_,
                                                  clock_, session_index_))
    , sweeper_(std::make_unique<ExpirySweeper>(*registry_, chunk_store_))
    , scheduler_(clock_) {
}

UploadService::~UploadService() {
    stop_background();
}

UploadResult UploadService::start(size_t& recovered) {
    recovered = 0;
    ErrorDetail detail;
    detail.stage = ErrorStage::STORAGE;
    
    if (!storage_config_.validate()) {
        return UploadResult(UploadError::VALIDATION_ERROR, "Invalid storage configuration", detail);
    }
    
    if (!storage_config_.create_directories()) {
        return UploadResult(UploadError::STORAGE_ERROR,
                            "Failed to create storage directories under " +
                            storage_config_.base_directory.string(), detail);
    }
    
    auto index_result = session_index_->initialize();
    if (!index_result) {
        return UploadResult(UploadError::STORAGE_ERROR, index_result.message, detail);
    }
    
    return registry_->recover(recovered);
}

void UploadService::start_background(std::chrono::milliseconds sweep_interval,
                                     std::chrono::milliseconds sample_interval) {
    sweeper_->schedule(scheduler_, sweep_interval);
    scheduler_.schedule_every(SAMPLER_TASK_NAME, sample_interval, [this]() { registry_->sample_progress(); });
    
    auto poll = std::min(sweep_interval, sample_interval);
    scheduler_.start(poll);
    LOG_DEBUG("Background tasks started (sweep every {}ms, sample every {}ms)",
              sweep_interval.count(), sample_interval.count());
}

void UploadService::stop_background() {
    scheduler_.stop();
}

UploadResult UploadService::health(HealthReport& report) {
    report = HealthReport();
    
    auto counts = registry_->count_by_state();
    auto count_of = [&counts](SessionState state) {
        auto it = counts.find(state);
        return it == counts.end() ? size_t(0) : it->second;
    };
    report.active_sessions = count_of(SessionState::ACTIVE);
    report.paused_sessions = count_of(SessionState::PAUSED);
    report.completed_sessions = count_of(SessionState::COMPLETED);
    report.failed_sessions = count_of(SessionState::FAILED);
    report.expired_sessions = count_of(SessionState::EXPIRED);
    
    std::error_code ec;
    report.chunk_storage_ok = std::filesystem::is_directory(storage_config_.chunk_directory, ec);
    if (report.chunk_storage_ok) {
        report.chunk_sessions = chunk_store_->list_sessions().size();
    }
    report.object_storage_ok = std::filesystem::is_directory(storage_config_.object_directory, ec);
    
    auto index_result = session_index_->check();
    report.index_ok = index_result.success();
    report.available_space = storage_config_.get_available_space();
    
    ErrorDetail detail;
    detail.stage = ErrorStage::STORAGE;
    
    if (!report.chunk_storage_ok) {
        report.message = "Chunk directory unavailable: " + storage_config_.chunk_directory.string();
    } else if (!report.object_storage_ok) {
        report.message = "Object directory unavailable: " + storage_config_.object_directory.string();
    } else if (!report.index_ok) {
        report.message = "Session index unavailable: " + index_result.message;
    } else {
        report.healthy = true;
        report.message = "healthy";
        return UploadResult();
    }
    
    LOG_WARN("Upload service unhealthy: {}", report.message);
    return UploadResult(UploadError::STORAGE_ERROR, report.message, detail);
}

}
