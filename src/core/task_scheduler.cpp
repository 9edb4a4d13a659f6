#include "uplink/core/task_scheduler.hpp"
#include "uplink/core/logger.hpp"
#include <algorithm>
#include <exception>

namespace uplink::core {

TaskScheduler::TaskScheduler(std::shared_ptr<Clock> clock)
    : clock_(std::move(clock))
    , running_(false) {
}

TaskScheduler::~TaskScheduler() {
    stop();
}

void TaskScheduler::schedule_every(const std::string& name, std::chrono::milliseconds interval, Task task) {
    if (interval.count() <= 0) {
        LOG_WARN("Task '{}' has non-positive interval {}ms, using 1ms", name, interval.count());
        interval = std::chrono::milliseconds(1);
    }
    
    auto scheduled = std::make_shared<ScheduledTask>();
    scheduled->name = name;
    scheduled->interval = interval;
    scheduled->next_run = clock_->now() + interval;
    scheduled->task = std::move(task);
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&](const auto& existing) { return existing->name == name; });
    if (it != tasks_.end()) {
        *it = std::move(scheduled);
    } else {
        tasks_.push_back(std::move(scheduled));
    }
    
    LOG_DEBUG("Scheduled task '{}' every {}ms", name, interval.count());
}

bool TaskScheduler::cancel(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&](const auto& existing) { return existing->name == name; });
    if (it == tasks_.end()) {
        return false;
    }
    tasks_.erase(it);
    return true;
}

size_t TaskScheduler::run_due() {
    auto now = clock_->now();
    
    std::vector<std::shared_ptr<ScheduledTask>> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& task : tasks_) {
            if (task->next_run <= now) {
                // Missed periods collapse into a single run.
                while (task->next_run <= now) {
                    task->next_run += task->interval;
                }
                due.push_back(task);
            }
        }
    }
    
    for (const auto& task : due) {
        try {
            task->task();
        } catch (const std::exception& e) {
            LOG_ERROR("Scheduled task '{}' threw: {}", task->name, e.what());
        }
    }
    
    return due.size();
}

void TaskScheduler::start(std::chrono::milliseconds poll_interval) {
    if (running_.exchange(true)) {
        return;
    }
    
    worker_ = std::thread([this, poll_interval]() {
        worker_loop(poll_interval);
    });
    LOG_INFO("Task scheduler started (poll interval {}ms)", poll_interval.count());
}

void TaskScheduler::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_.notify_all();
    
    if (worker_.joinable()) {
        worker_.join();
    }
    LOG_INFO("Task scheduler stopped");
}

size_t TaskScheduler::task_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void TaskScheduler::worker_loop(std::chrono::milliseconds poll_interval) {
    while (running_) {
        run_due();
        
        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_.wait_for(lock, poll_interval, [this]() { return !running_; });
    }
}

}
