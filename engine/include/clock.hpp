#pragma once

#include "upload_types.hpp"

#include <chrono>

namespace chunkflow::engine {

// Wall-clock source for session timestamps, expiry and throughput. Injected so
// tests can drive time explicitly.
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

}  // namespace chunkflow::engine
