#include "chunk_worker_pool.hpp"

#include "checksum.hpp"
#include "file_source.hpp"
#include "logger.hpp"
#include "retry_strategy.hpp"
#include "storage_backend.hpp"
#include "task_executor.hpp"

#include <optional>
#include <stdexcept>

namespace chunkflow::engine {

std::shared_ptr<ChunkWorkerPool> ChunkWorkerPool::create(TaskExecutor& executor,
                                                         StorageBackend& backend,
                                                         std::shared_ptr<const FileSource> source,
                                                         const RetryStrategy& retry,
                                                         Logger& logger,
                                                         Settings settings,
                                                         Callbacks callbacks) {
    if (settings.max_concurrent_chunks == 0) {
        throw std::invalid_argument("max_concurrent_chunks must be > 0");
    }
    return std::shared_ptr<ChunkWorkerPool>(new ChunkWorkerPool(
        executor, backend, std::move(source), retry, logger, std::move(settings), std::move(callbacks)));
}

ChunkWorkerPool::ChunkWorkerPool(TaskExecutor& executor,
                                 StorageBackend& backend,
                                 std::shared_ptr<const FileSource> source,
                                 const RetryStrategy& retry,
                                 Logger& logger,
                                 Settings settings,
                                 Callbacks callbacks)
    : executor_(executor),
      backend_(backend),
      source_(std::move(source)),
      retry_(retry),
      logger_(logger),
      settings_(std::move(settings)),
      callbacks_(std::move(callbacks)) {}

void ChunkWorkerPool::enqueue(std::vector<ChunkMetadata> chunks) {
    bool drained = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& chunk : chunks) {
            pending_.push_back(std::move(chunk));
        }
        drained = !pump_locked() && in_flight_ == 0;
    }
    if (drained && callbacks_.on_drained) {
        callbacks_.on_drained();
    }
}

bool ChunkWorkerPool::stop_scheduling() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
    return in_flight_ == 0;
}

bool ChunkWorkerPool::cancel() {
    const bool idle = stop_scheduling();
    token_.cancel();
    return idle;
}

std::size_t ChunkWorkerPool::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

std::size_t ChunkWorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_ ? 0 : pending_.size();
}

bool ChunkWorkerPool::pump_locked() {
    while (!stopped_ && in_flight_ < settings_.max_concurrent_chunks && !pending_.empty()) {
        auto chunk = std::move(pending_.front());
        pending_.pop_front();
        ++in_flight_;
        try {
            executor_.submit(settings_.upload_id + "/part-" + std::to_string(chunk.chunk_index),
                             [self = shared_from_this(), chunk]() { self->run(chunk); });
        } catch (const std::runtime_error& ex) {
            --in_flight_;
            pending_.push_front(std::move(chunk));
            stopped_ = true;
            logger_.warn("Chunk scheduling stopped for upload " + settings_.upload_id + ": " + ex.what());
            return false;
        }
    }
    return true;
}

void ChunkWorkerPool::run(const ChunkMetadata& chunk) {
    try {
        transfer(chunk);
    } catch (const std::exception& ex) {
        logger_.error("Chunk " + std::to_string(chunk.chunk_index) + " of upload " + settings_.upload_id +
                      " aborted: " + ex.what());
        if (callbacks_.on_fatal && !token_.cancelled()) {
            try {
                callbacks_.on_fatal(chunk, UploadError(UploadErrorCode::kServerError, ex.what()));
            } catch (const std::exception& inner) {
                logger_.error(std::string("Failure handler raised: ") + inner.what());
            }
        }
    }
    finish_task();
}

void ChunkWorkerPool::finish_task() {
    bool drained = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --in_flight_;
        const bool accepted = pump_locked();
        drained = in_flight_ == 0 && (pending_.empty() || stopped_ || !accepted);
    }
    if (drained && callbacks_.on_drained) {
        callbacks_.on_drained();
    }
}

void ChunkWorkerPool::transfer(const ChunkMetadata& chunk) {
    if (token_.cancelled()) {
        return;
    }

    const auto bytes = source_->read(chunk.start_byte, static_cast<std::size_t>(chunk.chunk_size));
    if (bytes.size() != chunk.chunk_size) {
        callbacks_.on_fatal(chunk, UploadError(UploadErrorCode::kValidationError,
                                               "Source ended before chunk " + std::to_string(chunk.chunk_index)));
        return;
    }
    if (!chunk.checksum.empty() && !ChecksumComputer::matches(bytes, chunk.checksum)) {
        callbacks_.on_fatal(chunk, UploadError(UploadErrorCode::kValidationError,
                                               "Source changed since planning at chunk " +
                                                   std::to_string(chunk.chunk_index)));
        return;
    }
    const auto checksum = chunk.checksum.empty() ? ChecksumComputer::compute(bytes) : chunk.checksum;

    if (callbacks_.on_started) {
        callbacks_.on_started(chunk);
    }

    std::uint32_t retries = 0;
    while (!token_.cancelled()) {
        std::optional<PartAck> ack;
        std::optional<UploadError> failure;
        try {
            const auto started = std::chrono::steady_clock::now();
            auto reply = backend_.upload_part(settings_.upload_id, chunk.chunk_index, bytes, checksum,
                                              settings_.chunk_timeout);
            if (std::chrono::steady_clock::now() - started > settings_.chunk_timeout) {
                throw UploadError(UploadErrorCode::kNetworkError,
                                  "Chunk " + std::to_string(chunk.chunk_index) + " timed out");
            }
            if (!reply.checksum.empty() && reply.checksum != checksum) {
                throw UploadError(UploadErrorCode::kChecksumMismatch,
                                  "Backend acknowledged chunk " + std::to_string(chunk.chunk_index) +
                                      " with checksum " + reply.checksum);
            }
            ack = std::move(reply);
        } catch (const UploadError& ex) {
            failure = ex;
        } catch (const std::exception& ex) {
            failure = UploadError(UploadErrorCode::kServerError, ex.what());
        }

        if (ack) {
            if (token_.cancelled()) {
                return;
            }
            ChunkUploadResult result;
            result.chunk_index = chunk.chunk_index;
            result.etag = ack->etag;
            result.checksum = checksum;
            result.uploaded_at = std::chrono::system_clock::now();
            result.success = true;
            result.retry_count = retries;
            callbacks_.on_succeeded(chunk, result);
            return;
        }

        if (token_.cancelled()) {
            return;
        }
        if (!is_retryable(failure->code())) {
            callbacks_.on_fatal(chunk, *failure);
            return;
        }
        if (!retry_.should_retry(failure->code(), retries)) {
            callbacks_.on_exhausted(chunk, *failure, retries);
            return;
        }
        ++retries;
        const auto delay = retry_.delay_before_retry(retries);
        if (callbacks_.on_retry) {
            callbacks_.on_retry(chunk, retries, delay, *failure);
        }
        if (token_.wait_for(delay)) {
            return;
        }
    }
}

}  // namespace chunkflow::engine
