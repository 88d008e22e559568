#pragma once

#include "upload_error.hpp"
#include "upload_types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

namespace chunkflow::engine {

class Logger;

enum class UploadEventType {
    kSessionCreated,
    kSessionProgress,
    kSessionPaused,
    kSessionResumed,
    kSessionCompleted,
    kSessionFailed,
    kSessionCancelled,
    kChunkStarted,
    kChunkCompleted,
    kChunkFailed,
    kChunkRetry,
    kQueueAdded,
    kQueueStarted,
    kQueueStats,
    kUploadOrphaned,
};

// Wire name, e.g. "session:progress" or "chunk:upload:retry".
std::string_view event_name(UploadEventType type);

struct ChunkEvent {
    std::uint32_t chunk_index = 0;
    std::uint32_t retry_count = 0;
    std::chrono::milliseconds delay{0};
    std::optional<UploadFailure> error;
};

struct QueueEvent {
    std::string ticket;
    std::string file_name;
    Priority priority = Priority::kNormal;
};

using EventPayload = std::variant<std::monostate,
                                  ChunkedUploadProgress,
                                  ChunkEvent,
                                  CompletedUploadResult,
                                  UploadFailure,
                                  QueueEvent,
                                  QueueStats,
                                  OrphanedUpload>;

struct UploadEvent {
    UploadEventType type = UploadEventType::kSessionProgress;
    std::string session_id;
    std::string reason;
    EventPayload payload;
};

// Publish/subscribe channel. A single dispatcher thread delivers events in
// publish order, so each subscriber observes its events FIFO.
class EventBus {
public:
    using SubscriptionId = std::uint64_t;
    using Handler = std::function<void(const UploadEvent&)>;

    explicit EventBus(Logger& logger);
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // An empty session_filter receives every event.
    SubscriptionId subscribe(Handler handler, std::string session_filter = {});
    void unsubscribe(SubscriptionId id);

    void publish(UploadEvent event);

    void start();
    // Delivers everything already published, then joins the dispatcher.
    void stop();
    // Blocks until every event published so far has been delivered. Must not
    // be called from inside a handler.
    void flush();

private:
    struct Subscription {
        SubscriptionId id;
        std::string session_filter;
        std::shared_ptr<Handler> handler;
    };

    void dispatch_loop();
    void deliver(const UploadEvent& event);

    Logger& logger_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<UploadEvent> queue_;
    std::vector<Subscription> subscriptions_;
    SubscriptionId next_id_{1};
    bool running_{false};
    bool stopping_{false};
    bool dispatching_{false};
    std::thread dispatcher_;
};

}  // namespace chunkflow::engine
