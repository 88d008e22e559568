#include "progress_tracker.hpp"

#include <algorithm>
#include <chrono>

namespace chunkflow::engine {

ProgressTracker::ProgressTracker(std::uint64_t total_bytes, double smoothing)
    : total_bytes_(total_bytes), smoothing_(std::clamp(smoothing, 0.01, 1.0)) {}

void ProgressTracker::restart(TimePoint now) {
    last_sample_ = now;
    pending_bytes_ = 0;
}

void ProgressTracker::record(std::uint64_t bytes, TimePoint now) {
    if (!last_sample_) {
        last_sample_ = now;
    }
    pending_bytes_ += bytes;
    const auto elapsed = std::chrono::duration<double>(now - *last_sample_).count();
    if (elapsed <= 0.0) {
        // Completions in the same instant are folded into the next sample.
        return;
    }
    const double sample = static_cast<double>(pending_bytes_) / elapsed;
    speed_ = speed_ == 0.0 ? sample : smoothing_ * sample + (1.0 - smoothing_) * speed_;
    pending_bytes_ = 0;
    last_sample_ = now;
}

double ProgressTracker::estimated_seconds_remaining(std::uint64_t uploaded_bytes) const {
    if (speed_ <= 0.0 || uploaded_bytes >= total_bytes_) {
        return 0.0;
    }
    return static_cast<double>(total_bytes_ - uploaded_bytes) / speed_;
}

}  // namespace chunkflow::engine
