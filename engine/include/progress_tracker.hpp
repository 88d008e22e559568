#pragma once

#include "upload_types.hpp"

#include <cstdint>
#include <optional>

namespace chunkflow::engine {

// Throughput estimate for one session: an exponential moving average of
// bytes/sec sampled at each chunk completion. Not synchronized.
class ProgressTracker {
public:
    ProgressTracker(std::uint64_t total_bytes, double smoothing);

    // Restarts the sampling window, e.g. when a paused session resumes.
    void restart(TimePoint now);

    void record(std::uint64_t bytes, TimePoint now);

    double speed() const { return speed_; }
    double estimated_seconds_remaining(std::uint64_t uploaded_bytes) const;

private:
    std::uint64_t total_bytes_;
    double smoothing_;
    double speed_{0.0};
    std::uint64_t pending_bytes_{0};
    std::optional<TimePoint> last_sample_;
};

}  // namespace chunkflow::engine
