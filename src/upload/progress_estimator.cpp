#include "uplink/upload/progress_estimator.hpp"
#include <numeric>
#include <cmath>

namespace uplink::upload {

ProgressEstimator::ProgressEstimator(size_t window_size)
    : window_size_(window_size == 0 ? 1 : window_size), last_total_(0) {
}

void ProgressEstimator::reset(uint64_t uploaded_total, core::TimePoint now) {
    samples_.clear();
    last_total_ = uploaded_total;
    last_time_ = now;
}

void ProgressEstimator::sample(uint64_t uploaded_total, core::TimePoint now) {
    if (!last_time_) {
        reset(uploaded_total, now);
        return;
    }
    
    auto elapsed = std::chrono::duration<double>(now - *last_time_).count();
    if (elapsed <= 0.0) {
        return;
    }
    
    uint64_t delta = uploaded_total > last_total_ ? uploaded_total - last_total_ : 0;
    samples_.push_back(static_cast<double>(delta) / elapsed);
    while (samples_.size() > window_size_) {
        samples_.pop_front();
    }
    
    last_total_ = uploaded_total;
    last_time_ = now;
}

double ProgressEstimator::current_speed() const {
    return samples_.empty() ? 0.0 : samples_.back();
}

double ProgressEstimator::smoothed_speed() const {
    if (samples_.empty()) {
        return 0.0;
    }
    return std::accumulate(samples_.begin(), samples_.end(), 0.0) / static_cast<double>(samples_.size());
}

std::optional<std::chrono::milliseconds> ProgressEstimator::eta(uint64_t remaining_bytes) const {
    if (remaining_bytes == 0) {
        return std::chrono::milliseconds(0);
    }
    
    double speed = smoothed_speed();
    if (speed <= 0.0 || !std::isfinite(speed)) {
        return std::nullopt;
    }
    
    double seconds = static_cast<double>(remaining_bytes) / speed;
    return std::chrono::milliseconds(static_cast<int64_t>(std::ceil(seconds * 1000.0)));
}

}
