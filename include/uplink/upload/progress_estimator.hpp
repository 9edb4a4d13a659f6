#pragma once

#include "../core/clock.hpp"
#include <deque>
#include <optional>
#include <chrono>
#include <cstdint>

namespace uplink::upload {

// Throughput over a fixed-size window of samples. Each sample is
// (bytes since previous sample) / (time since previous sample).
class ProgressEstimator {
public:
    explicit ProgressEstimator(size_t window_size = 10);
    
    // Starts the first interval without producing a sample.
    void reset(uint64_t uploaded_total, core::TimePoint now);
    
    // Records a sample if time has moved since the last one; otherwise the
    // bytes carry over into the next interval.
    void sample(uint64_t uploaded_total, core::TimePoint now);
    
    double current_speed() const;
    
    // Arithmetic mean of the window, 0 when empty.
    double smoothed_speed() const;
    
    // nullopt while no throughput is known.
    std::optional<std::chrono::milliseconds> eta(uint64_t remaining_bytes) const;
    
    size_t sample_count() const { return samples_.size(); }
    size_t window_size() const { return window_size_; }

private:
    size_t window_size_;
    std::deque<double> samples_;
    uint64_t last_total_;
    std::optional<core::TimePoint> last_time_;
};

}
