#pragma once

#include "session_registry.hpp"
#include "expiry_sweeper.hpp"
#include "upload_policy.hpp"
#include "../core/clock.hpp"
#include "../core/task_scheduler.hpp"
#include "../storage/storage_config.hpp"
#include "../storage/file_chunk_store.hpp"
#include "../storage/filesystem_object_storage.hpp"
#include "../storage/session_index.hpp"
#include <memory>
#include <string>

namespace uplink::upload {

struct HealthReport {
    bool healthy = false;
    size_t active_sessions = 0;
    size_t paused_sessions = 0;
    size_t completed_sessions = 0;
    size_t failed_sessions = 0;
    size_t expired_sessions = 0;
    // Session directories currently present in chunk storage.
    size_t chunk_sessions = 0;
    bool chunk_storage_ok = false;
    bool object_storage_ok = false;
    bool index_ok = false;
    uint64_t available_space = 0;
    std::string message;
};

// Wires the on-disk stores, the session index, the registry and the sweeper
// together over one StorageConfig.
class UploadService {
public:
    UploadService(const storage::StorageConfig& storage_config, UploadPolicy policy,
                  std::shared_ptr<core::Clock> clock = std::make_shared<core::SystemClock>());
    ~UploadService();
    
    UploadService(const UploadService&) = delete;
    UploadService& operator=(const UploadService&) = delete;
    
    // Creates the directory layout, opens the session index and reloads
    // persisted sessions.
    UploadResult start(size_t& recovered);
    
    // Registers the sweep and progress sampling tasks and starts the
    // scheduler's background thread.
    void start_background(std::chrono::milliseconds sweep_interval,
                          std::chrono::milliseconds sample_interval = std::chrono::seconds(1));
    void stop_background();
    
    // Fills the report even when a check fails; the result names the first
    // failing check.
    UploadResult health(HealthReport& report);
    
    SessionRegistry& registry() { return *registry_; }
    ExpirySweeper& sweeper() { return *sweeper_; }
    core::TaskScheduler& scheduler() { return scheduler_; }
    storage::FilesystemObjectStorage& object_storage() { return *object_storage_; }
    storage::FileChunkStore& chunk_store() { return *chunk_store_; }
    const storage::StorageConfig& storage_config() const { return storage_config_; }

private:
    storage::StorageConfig storage_config_;
    std::shared_ptr<core::Clock> clock_;
    std::shared_ptr<storage::FileChunkStore> chunk_store_;
    std::shared_ptr<storage::FilesystemObjectStorage> object_storage_;
    std::shared_ptr<storage::SessionIndex> session_index_;
    std::unique_ptr<SessionRegistry> registry_;
    std::unique_ptr<ExpirySweeper> sweeper_;
    core::TaskScheduler scheduler_;
};

}
