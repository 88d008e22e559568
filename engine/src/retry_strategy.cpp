#include "retry_strategy.hpp"

#include <algorithm>
#include <cmath>

namespace chunkflow::engine {

ExponentialBackoffStrategy::ExponentialBackoffStrategy(RetrySettings settings) : settings_(settings) {
    if (settings_.backoff_multiplier < 1.0) {
        settings_.backoff_multiplier = 1.0;
    }
}

bool ExponentialBackoffStrategy::should_retry(UploadErrorCode code, std::uint32_t attempted_retries) const {
    if (attempted_retries >= settings_.max_retries) {
        return false;
    }
    return is_retryable(code);
}

std::chrono::milliseconds ExponentialBackoffStrategy::delay_before_retry(std::uint32_t retry) const {
    if (retry == 0) {
        return std::chrono::milliseconds(0);
    }
    const double scaled = static_cast<double>(settings_.base_delay.count()) *
                          std::pow(settings_.backoff_multiplier, static_cast<double>(retry - 1));
    const double capped = std::min(scaled, static_cast<double>(settings_.max_delay.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

}  // namespace chunkflow::engine
