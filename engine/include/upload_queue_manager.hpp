#pragma once

#include "event_bus.hpp"
#include "upload_orchestrator.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace chunkflow::engine {

class Clock;
class Logger;

using CompletionCallback = std::function<void(const CompletedUploadResult&)>;
using ErrorCallback = std::function<void(const UploadFailure&)>;

struct UploadQueueItem {
    std::string ticket;
    UploadRequest request;
    Priority priority = Priority::kNormal;
    UploadOptions options;
    CompletionCallback on_complete;
    ErrorCallback on_error;
    std::uint64_t sequence = 0;
    TimePoint submitted_at{};
};

// Feeds files into the orchestrator, highest priority first and FIFO within a
// priority, keeping at most max_concurrent_uploads sessions open. A paused
// session keeps its slot until it reaches a terminal state. Sessions are
// started on the queue's own thread, which runs between start() and stop().
class UploadQueueManager {
public:
    UploadQueueManager(UploadOrchestrator& orchestrator,
                       EventBus& events,
                       const Clock& clock,
                       Logger& logger,
                       std::size_t max_concurrent_uploads);
    ~UploadQueueManager();

    UploadQueueManager(const UploadQueueManager&) = delete;
    UploadQueueManager& operator=(const UploadQueueManager&) = delete;

    // Returns a ticket that identifies the item before and after it starts.
    std::string submit(UploadRequest request,
                       Priority priority = Priority::kNormal,
                       UploadOptions options = {},
                       CompletionCallback on_complete = {},
                       ErrorCallback on_error = {});

    // Drops a queued item or cancels its running session. False for unknown
    // or already finished tickets.
    bool cancel(const std::string& ticket, const std::string& reason);

    // Session of a started ticket; forgotten once that session is terminal.
    std::optional<std::string> session_for(const std::string& ticket) const;
    std::vector<UploadQueueItem> queued_items() const;
    QueueStats stats() const;

    void start();
    void stop();

private:
    struct ActiveUpload {
        std::string ticket;
        std::uint64_t file_size = 0;
        CompletionCallback on_complete;
        ErrorCallback on_error;
    };

    void promoter_loop();
    void request_promotion();
    void promote();
    std::optional<UploadQueueItem> take_next_locked();
    void handle_event(const UploadEvent& event);
    void settle(const std::string& session_id, const UploadEvent& event);
    QueueStats stats_locked() const;
    void publish_stats();

    UploadOrchestrator& orchestrator_;
    EventBus& events_;
    const Clock& clock_;
    Logger& logger_;
    std::size_t max_concurrent_uploads_;
    EventBus::SubscriptionId subscription_{0};

    mutable std::mutex mutex_;
    std::condition_variable promote_cv_;
    std::thread promoter_;
    bool promote_pending_{false};
    std::vector<UploadQueueItem> queued_;
    std::map<std::string, ActiveUpload> active_;
    std::map<std::string, std::string> tickets_;
    std::map<std::string, UploadEvent> early_outcomes_;
    std::size_t starting_{0};
    std::uint64_t next_sequence_{0};
    bool running_{false};

    std::size_t completed_{0};
    std::size_t failed_{0};
    std::size_t cancelled_{0};
    std::uint64_t uploaded_bytes_{0};
    double upload_seconds_{0.0};
};

}  // namespace chunkflow::engine
