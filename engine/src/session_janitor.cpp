#include "session_janitor.hpp"

#include "clock.hpp"
#include "logger.hpp"
#include "upload_orchestrator.hpp"

#include <stdexcept>
#include <string>

namespace chunkflow::engine {

SessionJanitor::SessionJanitor(UploadOrchestrator& orchestrator,
                               const Clock& clock,
                               Logger& logger,
                               std::chrono::milliseconds interval)
    : orchestrator_(orchestrator), clock_(clock), logger_(logger), interval_(interval) {
    if (interval_.count() <= 0) {
        throw std::invalid_argument("cleanup interval must be positive");
    }
}

SessionJanitor::~SessionJanitor() {
    stop();
}

void SessionJanitor::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    worker_ = std::thread(&SessionJanitor::loop, this);
    logger_.info("Session janitor started, interval " + std::to_string(interval_.count()) + "ms");
}

void SessionJanitor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    logger_.info("Session janitor stopped");
}

bool SessionJanitor::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

std::optional<TimePoint> SessionJanitor::last_sweep() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_sweep_;
}

std::size_t SessionJanitor::sweep_once() {
    const auto removed = orchestrator_.collect_expired();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_sweep_ = clock_.now();
    }
    if (removed > 0) {
        logger_.info("Cleanup removed " + std::to_string(removed) + " expired session(s)");
    } else {
        logger_.debug("Cleanup found no expired sessions");
    }
    return removed;
}

void SessionJanitor::loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (cv_.wait_for(lock, interval_, [this] { return !running_; })) {
            return;
        }
        lock.unlock();
        try {
            sweep_once();
        } catch (const std::exception& ex) {
            logger_.error(std::string("Cleanup sweep failed: ") + ex.what());
        }
        lock.lock();
    }
}

}  // namespace chunkflow::engine
