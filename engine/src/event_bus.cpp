#include "event_bus.hpp"

#include "logger.hpp"

#include <algorithm>

namespace chunkflow::engine {

std::string_view event_name(UploadEventType type) {
    switch (type) {
        case UploadEventType::kSessionCreated:
            return "session:created";
        case UploadEventType::kSessionProgress:
            return "session:progress";
        case UploadEventType::kSessionPaused:
            return "session:paused";
        case UploadEventType::kSessionResumed:
            return "session:resumed";
        case UploadEventType::kSessionCompleted:
            return "session:completed";
        case UploadEventType::kSessionFailed:
            return "session:failed";
        case UploadEventType::kSessionCancelled:
            return "session:cancelled";
        case UploadEventType::kChunkStarted:
            return "chunk:upload:start";
        case UploadEventType::kChunkCompleted:
            return "chunk:upload:complete";
        case UploadEventType::kChunkFailed:
            return "chunk:upload:failed";
        case UploadEventType::kChunkRetry:
            return "chunk:upload:retry";
        case UploadEventType::kQueueAdded:
            return "queue:added";
        case UploadEventType::kQueueStarted:
            return "queue:started";
        case UploadEventType::kQueueStats:
            return "queue:stats";
        case UploadEventType::kUploadOrphaned:
            return "upload:orphaned";
    }
    return "unknown";
}

EventBus::EventBus(Logger& logger) : logger_(logger) {}

EventBus::~EventBus() {
    stop();
}

EventBus::SubscriptionId EventBus::subscribe(Handler handler, std::string session_filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = next_id_++;
    subscriptions_.push_back(
        Subscription{id, std::move(session_filter), std::make_shared<Handler>(std::move(handler))});
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.erase(std::remove_if(subscriptions_.begin(), subscriptions_.end(),
                                        [id](const Subscription& sub) { return sub.id == id; }),
                         subscriptions_.end());
}

void EventBus::publish(UploadEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
}

void EventBus::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    stopping_ = false;
    dispatcher_ = std::thread(&EventBus::dispatch_loop, this);
}

void EventBus::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
}

void EventBus::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (running_) {
        idle_cv_.wait(lock, [this] { return queue_.empty() && !dispatching_; });
        return;
    }
    while (!queue_.empty()) {
        auto event = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        deliver(event);
        lock.lock();
    }
}

void EventBus::dispatch_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            idle_cv_.notify_all();
            if (stopping_) {
                return;
            }
            continue;
        }
        auto event = std::move(queue_.front());
        queue_.pop_front();
        dispatching_ = true;
        lock.unlock();
        deliver(event);
        lock.lock();
        dispatching_ = false;
        if (queue_.empty()) {
            idle_cv_.notify_all();
        }
    }
}

void EventBus::deliver(const UploadEvent& event) {
    std::vector<std::shared_ptr<Handler>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& sub : subscriptions_) {
            if (sub.session_filter.empty() || sub.session_filter == event.session_id) {
                targets.push_back(sub.handler);
            }
        }
    }
    for (const auto& handler : targets) {
        try {
            (*handler)(event);
        } catch (const std::exception& ex) {
            logger_.error("Event handler for " + std::string(event_name(event.type)) + " failed: " + ex.what());
        }
    }
}

}  // namespace chunkflow::engine
