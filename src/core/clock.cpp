#include "uplink/core/clock.hpp"

namespace uplink::core {

ManualClock::ManualClock(TimePoint start) : now_(start) {
}

TimePoint ManualClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualClock::set(TimePoint time) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = time;
}

void ManualClock::advance(std::chrono::milliseconds delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += delta;
}

}
