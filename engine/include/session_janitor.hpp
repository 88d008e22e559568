#pragma once

#include "upload_types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <thread>

namespace chunkflow::engine {

class Clock;
class Logger;
class UploadOrchestrator;

// Periodic garbage collection of expired sessions and orphaned multipart
// uploads. Nothing runs until start().
class SessionJanitor {
public:
    SessionJanitor(UploadOrchestrator& orchestrator,
                   const Clock& clock,
                   Logger& logger,
                   std::chrono::milliseconds interval);
    ~SessionJanitor();

    SessionJanitor(const SessionJanitor&) = delete;
    SessionJanitor& operator=(const SessionJanitor&) = delete;

    void start();
    void stop();

    // Runs one sweep on the calling thread; returns the number of sessions removed.
    std::size_t sweep_once();

    std::optional<TimePoint> last_sweep() const;
    bool running() const;

private:
    void loop();

    UploadOrchestrator& orchestrator_;
    const Clock& clock_;
    Logger& logger_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    bool running_{false};
    std::optional<TimePoint> last_sweep_;
};

}  // namespace chunkflow::engine
