#pragma once

#include <chrono>
#include <mutex>

namespace uplink::core {

using TimePoint = std::chrono::system_clock::time_point;

class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

// Only moves when told to. Tests use it to drive expiry and sampling.
class ManualClock : public Clock {
public:
    explicit ManualClock(TimePoint start = TimePoint(std::chrono::seconds(1700000000)));
    
    TimePoint now() const override;
    
    void set(TimePoint time);
    void advance(std::chrono::milliseconds delta);

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

}
