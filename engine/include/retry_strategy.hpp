#pragma once

#include "config_loader.hpp"
#include "upload_error.hpp"

#include <chrono>
#include <cstdint>

namespace chunkflow::engine {

class RetryStrategy {
public:
    virtual ~RetryStrategy() = default;

    // attempted_retries counts retries already performed for this chunk.
    [[nodiscard]] virtual bool should_retry(UploadErrorCode code, std::uint32_t attempted_retries) const = 0;

    // Delay before retry number `retry` (1-based).
    [[nodiscard]] virtual std::chrono::milliseconds delay_before_retry(std::uint32_t retry) const = 0;

    [[nodiscard]] virtual std::uint32_t max_retries() const = 0;
};

class ExponentialBackoffStrategy : public RetryStrategy {
public:
    explicit ExponentialBackoffStrategy(RetrySettings settings);

    [[nodiscard]] bool should_retry(UploadErrorCode code, std::uint32_t attempted_retries) const override;
    [[nodiscard]] std::chrono::milliseconds delay_before_retry(std::uint32_t retry) const override;
    [[nodiscard]] std::uint32_t max_retries() const override { return settings_.max_retries; }

private:
    RetrySettings settings_;
};

}  // namespace chunkflow::engine
