#pragma once

#include "clock.hpp"
#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>

namespace uplink::core {

// Runs named periodic tasks against a Clock. run_due() can be driven
// directly (tests) or from the background thread started by start().
class TaskScheduler {
public:
    using Task = std::function<void()>;
    
    explicit TaskScheduler(std::shared_ptr<Clock> clock);
    ~TaskScheduler();
    
    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;
    
    void schedule_every(const std::string& name, std::chrono::milliseconds interval, Task task);
    bool cancel(const std::string& name);
    
    // Returns the number of tasks executed.
    size_t run_due();
    
    void start(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(1000));
    void stop();
    bool is_running() const { return running_; }
    
    size_t task_count() const;

private:
    struct ScheduledTask {
        std::string name;
        std::chrono::milliseconds interval;
        TimePoint next_run;
        Task task;
    };
    
    std::shared_ptr<Clock> clock_;
    std::vector<std::shared_ptr<ScheduledTask>> tasks_;
    mutable std::mutex mutex_;
    
    std::atomic<bool> running_;
    std::thread worker_;
    std::mutex wake_mutex_;
    std::condition_variable wake_;
    
    void worker_loop(std::chrono::milliseconds poll_interval);
};

}
