#include "upload_queue_manager.hpp"

#include "checksum.hpp"
#include "clock.hpp"
#include "file_source.hpp"
#include "logger.hpp"

#include <algorithm>

namespace chunkflow::engine {

UploadQueueManager::UploadQueueManager(UploadOrchestrator& orchestrator,
                                       EventBus& events,
                                       const Clock& clock,
                                       Logger& logger,
                                       std::size_t max_concurrent_uploads)
    : orchestrator_(orchestrator),
      events_(events),
      clock_(clock),
      logger_(logger),
      max_concurrent_uploads_(std::max<std::size_t>(1, max_concurrent_uploads)) {
    subscription_ = events_.subscribe([this](const UploadEvent& event) { handle_event(event); });
}

UploadQueueManager::~UploadQueueManager() {
    stop();
    events_.unsubscribe(subscription_);
}

std::string UploadQueueManager::submit(UploadRequest request,
                                       Priority priority,
                                       UploadOptions options,
                                       CompletionCallback on_complete,
                                       ErrorCallback on_error) {
    if (!request.source) {
        throw UploadError(UploadErrorCode::kValidationError, "Upload request has no source");
    }
    UploadQueueItem item;
    item.ticket = random_hex_id(8);
    item.request = std::move(request);
    item.priority = priority;
    item.options = std::move(options);
    item.on_complete = std::move(on_complete);
    item.on_error = std::move(on_error);
    item.submitted_at = clock_.now();

    const auto ticket = item.ticket;
    QueueEvent added{ticket, item.request.file_name, priority};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        item.sequence = next_sequence_++;
        queued_.push_back(std::move(item));
    }
    logger_.info("Queued " + added.file_name + " as " + ticket + " (" + std::string(to_string(priority)) + ")");
    UploadEvent event;
    event.type = UploadEventType::kQueueAdded;
    event.payload = std::move(added);
    events_.publish(std::move(event));

    request_promotion();
    publish_stats();
    return ticket;
}

bool UploadQueueManager::cancel(const std::string& ticket, const std::string& reason) {
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto queued = std::find_if(queued_.begin(), queued_.end(),
                                   [&](const UploadQueueItem& item) { return item.ticket == ticket; });
        if (queued != queued_.end()) {
            queued_.erase(queued);
            ++cancelled_;
            logger_.info("Queued item " + ticket + " removed: " + reason);
        } else {
            auto mapped = tickets_.find(ticket);
            if (mapped == tickets_.end() || active_.count(mapped->second) == 0) {
                return false;
            }
            session_id = mapped->second;
        }
    }
    if (session_id.empty()) {
        publish_stats();
        return true;
    }
    orchestrator_.cancel_upload(session_id, reason);
    return true;
}

std::optional<std::string> UploadQueueManager::session_for(const std::string& ticket) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tickets_.find(ticket);
    if (it == tickets_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<UploadQueueItem> UploadQueueManager::queued_items() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto items = queued_;
    std::sort(items.begin(), items.end(), [](const UploadQueueItem& a, const UploadQueueItem& b) {
        if (a.priority != b.priority) {
            return a.priority > b.priority;
        }
        return a.sequence < b.sequence;
    });
    return items;
}

QueueStats UploadQueueManager::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_locked();
}

QueueStats UploadQueueManager::stats_locked() const {
    QueueStats stats;
    stats.active_uploads = active_.size() + starting_;
    stats.queued_uploads = queued_.size();
    stats.completed_uploads = completed_;
    stats.failed_uploads = failed_;
    stats.cancelled_uploads = cancelled_;
    stats.total_items = stats.active_uploads + stats.queued_uploads + completed_ + failed_ + cancelled_;
    stats.total_uploaded_bytes = uploaded_bytes_;
    if (upload_seconds_ > 0.0) {
        stats.average_upload_speed = static_cast<double>(uploaded_bytes_) / upload_seconds_;
    }
    if (stats.average_upload_speed > 0.0) {
        std::uint64_t queued_bytes = 0;
        for (const auto& item : queued_) {
            queued_bytes += item.request.source->size();
        }
        stats.estimated_queue_time = static_cast<double>(queued_bytes) / stats.average_upload_speed;
    }
    return stats;
}

void UploadQueueManager::publish_stats() {
    UploadEvent event;
    event.type = UploadEventType::kQueueStats;
    event.payload = stats();
    events_.publish(std::move(event));
}

void UploadQueueManager::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    promote_pending_ = true;
    promoter_ = std::thread(&UploadQueueManager::promoter_loop, this);
}

void UploadQueueManager::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    promote_cv_.notify_all();
    if (promoter_.joinable()) {
        promoter_.join();
    }
}

void UploadQueueManager::request_promotion() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        promote_pending_ = true;
    }
    promote_cv_.notify_one();
}

void UploadQueueManager::promoter_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        promote_cv_.wait(lock, [this] { return !running_ || promote_pending_; });
        if (!running_) {
            return;
        }
        promote_pending_ = false;
        lock.unlock();
        try {
            promote();
        } catch (const std::exception& ex) {
            logger_.error(std::string("Queue promotion failed: ") + ex.what());
        }
        lock.lock();
    }
}

std::optional<UploadQueueItem> UploadQueueManager::take_next_locked() {
    if (!running_ || queued_.empty() || active_.size() + starting_ >= max_concurrent_uploads_) {
        return std::nullopt;
    }
    auto best = std::min_element(queued_.begin(), queued_.end(),
                                 [](const UploadQueueItem& a, const UploadQueueItem& b) {
                                     if (a.priority != b.priority) {
                                         return a.priority > b.priority;
                                     }
                                     return a.sequence < b.sequence;
                                 });
    UploadQueueItem item = std::move(*best);
    queued_.erase(best);
    ++starting_;
    return item;
}

void UploadQueueManager::promote() {
    while (true) {
        std::optional<UploadQueueItem> item;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            item = take_next_locked();
        }
        if (!item) {
            return;
        }

        std::string session_id;
        std::optional<UploadFailure> failure;
        const auto file_size = item->request.source->size();
        const auto file_name = item->request.file_name;
        try {
            session_id = orchestrator_.start_upload(item->request, item->options);
        } catch (const UploadError& ex) {
            failure = to_failure(ex);
        } catch (const std::exception& ex) {
            failure = UploadFailure{UploadErrorCode::kServerError, ex.what(), false};
        }

        if (failure) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                --starting_;
                ++failed_;
            }
            logger_.error("Queued item " + item->ticket + " could not start: " + failure->message);
            if (item->on_error) {
                item->on_error(*failure);
            }
            publish_stats();
            continue;
        }

        std::optional<UploadEvent> early;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --starting_;
            active_[session_id] = ActiveUpload{item->ticket, file_size, item->on_complete, item->on_error};
            tickets_[item->ticket] = session_id;
            auto it = early_outcomes_.find(session_id);
            if (it != early_outcomes_.end()) {
                early = std::move(it->second);
                early_outcomes_.erase(it);
            }
            if (starting_ == 0) {
                early_outcomes_.clear();
            }
        }

        UploadEvent started;
        started.type = UploadEventType::kQueueStarted;
        started.session_id = session_id;
        started.payload = QueueEvent{item->ticket, file_name, item->priority};
        events_.publish(std::move(started));
        publish_stats();

        if (early) {
            settle(session_id, *early);
        }
    }
}

void UploadQueueManager::handle_event(const UploadEvent& event) {
    if (event.type != UploadEventType::kSessionCompleted && event.type != UploadEventType::kSessionFailed &&
        event.type != UploadEventType::kSessionCancelled) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_.count(event.session_id) == 0) {
            if (starting_ > 0) {
                early_outcomes_[event.session_id] = event;
            }
            return;
        }
    }
    settle(event.session_id, event);
}

void UploadQueueManager::settle(const std::string& session_id, const UploadEvent& event) {
    ActiveUpload active;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(session_id);
        if (it == active_.end()) {
            return;
        }
        active = std::move(it->second);
        active_.erase(it);
        tickets_.erase(active.ticket);
        switch (event.type) {
            case UploadEventType::kSessionCompleted: {
                ++completed_;
                uploaded_bytes_ += active.file_size;
                if (const auto* result = std::get_if<CompletedUploadResult>(&event.payload)) {
                    upload_seconds_ += std::chrono::duration<double>(result->duration).count();
                }
                break;
            }
            case UploadEventType::kSessionCancelled:
                ++cancelled_;
                break;
            default:
                ++failed_;
                break;
        }
    }

    if (event.type == UploadEventType::kSessionCompleted) {
        if (active.on_complete) {
            if (const auto* result = std::get_if<CompletedUploadResult>(&event.payload)) {
                active.on_complete(*result);
            }
        }
    } else if (active.on_error) {
        if (const auto* failure = std::get_if<UploadFailure>(&event.payload)) {
            active.on_error(*failure);
        } else {
            active.on_error(UploadFailure{UploadErrorCode::kServerError, event.reason, false});
        }
    }

    request_promotion();
    publish_stats();
}

}  // namespace chunkflow::engine
