#pragma once

#include "cancellation.hpp"
#include "upload_error.hpp"
#include "upload_types.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace chunkflow::engine {

class FileSource;
class Logger;
class RetryStrategy;
class StorageBackend;
class TaskExecutor;

// Runs one session's chunk transfers on the shared TaskExecutor, at most
// max_concurrent_chunks at a time, each with its own retry budget.
class ChunkWorkerPool : public std::enable_shared_from_this<ChunkWorkerPool> {
public:
    struct Settings {
        std::string upload_id;
        std::size_t max_concurrent_chunks = 3;
        std::chrono::milliseconds chunk_timeout{30000};
    };

    // Invoked on worker threads with no pool lock held.
    struct Callbacks {
        std::function<void(const ChunkMetadata&)> on_started;
        std::function<void(const ChunkMetadata&, std::uint32_t retry, std::chrono::milliseconds delay,
                           const UploadError&)>
            on_retry;
        std::function<void(const ChunkMetadata&, const ChunkUploadResult&)> on_succeeded;
        // Retry budget spent on a retryable error.
        std::function<void(const ChunkMetadata&, const UploadError&, std::uint32_t retries)> on_exhausted;
        // Non-retryable error; the session cannot continue.
        std::function<void(const ChunkMetadata&, const UploadError&)> on_fatal;
        // No task running and nothing left that will be scheduled.
        std::function<void()> on_drained;
    };

    static std::shared_ptr<ChunkWorkerPool> create(TaskExecutor& executor,
                                                   StorageBackend& backend,
                                                   std::shared_ptr<const FileSource> source,
                                                   const RetryStrategy& retry,
                                                   Logger& logger,
                                                   Settings settings,
                                                   Callbacks callbacks);

    void enqueue(std::vector<ChunkMetadata> chunks);

    // Stops scheduling queued chunks; running ones finish. Returns true when
    // nothing was running, in which case on_drained will not fire.
    bool stop_scheduling();

    // stop_scheduling() plus the cancellation signal: pending retries are
    // abandoned and results arriving afterwards are discarded.
    bool cancel();

    std::size_t in_flight() const;
    std::size_t queued() const;

private:
    ChunkWorkerPool(TaskExecutor& executor,
                    StorageBackend& backend,
                    std::shared_ptr<const FileSource> source,
                    const RetryStrategy& retry,
                    Logger& logger,
                    Settings settings,
                    Callbacks callbacks);

    // Returns false when the executor refused a task.
    bool pump_locked();
    void run(const ChunkMetadata& chunk);
    void transfer(const ChunkMetadata& chunk);
    void finish_task();

    TaskExecutor& executor_;
    StorageBackend& backend_;
    std::shared_ptr<const FileSource> source_;
    const RetryStrategy& retry_;
    Logger& logger_;
    Settings settings_;
    Callbacks callbacks_;
    CancellationToken token_;

    mutable std::mutex mutex_;
    std::deque<ChunkMetadata> pending_;
    std::size_t in_flight_{0};
    bool stopped_{false};
};

}  // namespace chunkflow::engine
