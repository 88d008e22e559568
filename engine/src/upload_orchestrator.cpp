#include "upload_orchestrator.hpp"

#include "checksum.hpp"
#include "chunk_worker_pool.hpp"
#include "clock.hpp"
#include "event_bus.hpp"
#include "file_source.hpp"
#include "logger.hpp"
#include "progress_tracker.hpp"
#include "session_store.hpp"
#include "storage_backend.hpp"
#include "task_executor.hpp"
#include "upload_session.hpp"

#include <algorithm>
#include <condition_variable>
#include <filesystem>
#include <set>

namespace chunkflow::engine {

struct UploadOrchestrator::SessionContext {
    SessionContext(SessionRecord record, double smoothing)
        : progress(record.file_size, smoothing), session(std::move(record)) {}

    mutable std::mutex mutex;
    mutable std::condition_variable settled_cv;
    ProgressTracker progress;
    UploadSession session;
    std::shared_ptr<const FileSource> source;
    std::vector<ChunkMetadata> plan;
    std::shared_ptr<ChunkWorkerPool> pool;
    // Bumped for every launched pool; drains from older pools are ignored.
    std::uint64_t pool_generation = 0;
    std::set<std::uint32_t> failed_chunks;
    bool workers_idle = true;
    bool completion_started = false;
    bool pause_requested = false;
    std::string pause_reason;
};

namespace {

std::string sanitize_file_name(const std::string& name) {
    const auto leaf = std::filesystem::path(name).filename().string();
    if (leaf.empty() || leaf == "." || leaf == "..") {
        throw UploadError(UploadErrorCode::kValidationError, "Invalid file name: " + name);
    }
    return leaf;
}

UploadEvent make_event(UploadEventType type, const std::string& session_id, std::string reason = {}) {
    UploadEvent event;
    event.type = type;
    event.session_id = session_id;
    event.reason = std::move(reason);
    return event;
}

}  // namespace

UploadOrchestrator::UploadOrchestrator(const EngineConfig& config,
                                       SessionStore& store,
                                       StorageBackend& backend,
                                       TaskExecutor& executor,
                                       EventBus& events,
                                       const Clock& clock,
                                       Logger& logger)
    : config_(config),
      store_(store),
      backend_(backend),
      executor_(executor),
      events_(events),
      clock_(clock),
      logger_(logger),
      policy_(config.chunk_size),
      retry_(config.retry),
      resolver_([](const SessionRecord& record) -> std::shared_ptr<const FileSource> {
          if (record.source_path.empty()) {
              return nullptr;
          }
          return std::make_shared<LocalFileSource>(record.source_path);
      }) {}

UploadOrchestrator::~UploadOrchestrator() {
    shutdown();
}

void UploadOrchestrator::set_source_resolver(SourceResolver resolver) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    resolver_ = std::move(resolver);
}

void UploadOrchestrator::validate(const UploadRequest& request, std::uint64_t file_size) const {
    if (request.owner.empty()) {
        throw UploadError(UploadErrorCode::kAuthenticationError, "Upload requires an authenticated owner");
    }
    if (file_size == 0) {
        throw UploadError(UploadErrorCode::kValidationError, "File is empty: " + request.file_name);
    }
    const auto& allowed = config_.mime_types.for_category(request.category);
    if (!allowed.empty() && std::find(allowed.begin(), allowed.end(), request.mime_type) == allowed.end()) {
        throw UploadError(UploadErrorCode::kInvalidFileType,
                          "MIME type " + request.mime_type + " is not allowed for " +
                              std::string(to_string(request.category)));
    }
    const auto limit = config_.max_file_size.for_category(request.category);
    if (file_size > limit) {
        throw UploadError(UploadErrorCode::kFileTooLarge,
                          request.file_name + " is " + std::to_string(file_size) + " bytes, limit is " +
                              std::to_string(limit));
    }
}

std::string UploadOrchestrator::start_upload(UploadRequest request, const UploadOptions& options) {
    if (!request.source) {
        throw UploadError(UploadErrorCode::kValidationError, "Upload request has no source");
    }
    const auto file_size = request.source->size();
    validate(request, file_size);
    const auto file_name = sanitize_file_name(request.file_name);

    const auto chunk_size = options.chunk_size.value_or(policy_.chunk_size_for(request.category, file_size));
    auto plan = ChunkPlanner::plan(*request.source, chunk_size);

    const auto now = clock_.now();
    SessionRecord record;
    record.session_id = random_hex_id();
    record.file_key =
        request.owner + "/" + std::string(to_string(request.category)) + "/" + record.session_id + "/" + file_name;
    record.file_name = file_name;
    record.file_size = file_size;
    record.mime_type = request.mime_type;
    record.category = request.category;
    record.owner = request.owner;
    record.source_path = request.source->path();
    record.chunk_size = chunk_size;
    record.total_chunks = static_cast<std::uint32_t>(plan.size());
    record.status = UploadStatus::kInitializing;
    record.created_at = now;
    record.updated_at = now;
    record.expires_at = now + config_.session_expiry;
    record.metadata = request.metadata;

    try {
        record.upload_id = backend_.initiate(record.file_key, record.mime_type, record.metadata);
    } catch (const UploadError&) {
        throw;
    } catch (const std::exception& ex) {
        throw UploadError(UploadErrorCode::kServerError, std::string("initiate failed: ") + ex.what());
    }

    try {
        store_.insert(record);
    } catch (const std::exception&) {
        abort_remote(record, "session could not be persisted");
        throw;
    }

    auto ctx = std::make_shared<SessionContext>(record, config_.speed_smoothing);
    ctx->source = std::move(request.source);
    ctx->plan = plan;
    {
        std::lock_guard<std::mutex> lock(ctx->mutex);
        ctx->session.transition_to(UploadStatus::kUploading, now);
        persist_status(*ctx);
        ctx->progress.restart(now);
    }
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_[record.session_id] = ctx;
    }

    logger_.info("Session " + record.session_id + " started for " + record.file_key + " (" +
                 std::to_string(file_size) + " bytes, " + std::to_string(plan.size()) + " chunks)");
    events_.publish(make_event(UploadEventType::kSessionCreated, record.session_id));

    launch(ctx, std::move(plan), options.max_concurrent_chunks.value_or(config_.max_concurrent_chunks));
    return record.session_id;
}

void UploadOrchestrator::launch(const ContextPtr& ctx,
                                std::vector<ChunkMetadata> chunks,
                                std::size_t max_concurrent_chunks) {
    std::weak_ptr<SessionContext> weak = ctx;
    ChunkWorkerPool::Callbacks callbacks;
    callbacks.on_started = [this, weak](const ChunkMetadata& chunk) {
        if (auto locked = weak.lock()) {
            on_chunk_started(locked, chunk);
        }
    };
    callbacks.on_retry = [this, weak](const ChunkMetadata& chunk, std::uint32_t retry,
                                      std::chrono::milliseconds delay, const UploadError& error) {
        if (auto locked = weak.lock()) {
            on_chunk_retry(locked, chunk, retry, delay, error);
        }
    };
    callbacks.on_succeeded = [this, weak](const ChunkMetadata& chunk, const ChunkUploadResult& result) {
        if (auto locked = weak.lock()) {
            on_chunk_succeeded(locked, chunk, result);
        }
    };
    callbacks.on_exhausted = [this, weak](const ChunkMetadata& chunk, const UploadError& error,
                                          std::uint32_t retries) {
        if (auto locked = weak.lock()) {
            on_chunk_exhausted(locked, chunk, error, retries);
        }
    };
    callbacks.on_fatal = [this, weak](const ChunkMetadata& chunk, const UploadError& error) {
        if (auto locked = weak.lock()) {
            on_chunk_fatal(locked, chunk, error);
        }
    };

    std::shared_ptr<ChunkWorkerPool> pool;
    {
        std::lock_guard<std::mutex> lock(ctx->mutex);
        if (ctx->session.status() != UploadStatus::kUploading) {
            return;
        }
        const auto generation = ++ctx->pool_generation;
        callbacks.on_drained = [this, weak, generation]() {
            if (auto locked = weak.lock()) {
                on_workers_drained(locked, generation);
            }
        };
        ChunkWorkerPool::Settings settings;
        settings.upload_id = ctx->session.record().upload_id;
        settings.max_concurrent_chunks = std::max<std::size_t>(1, max_concurrent_chunks);
        settings.chunk_timeout = config_.chunk_timeout;
        pool = ChunkWorkerPool::create(executor_, backend_, ctx->source, retry_, logger_, std::move(settings),
                                       std::move(callbacks));
        ctx->pool = pool;
        ctx->workers_idle = false;
    }
    pool->enqueue(std::move(chunks));
}

void UploadOrchestrator::on_chunk_started(const ContextPtr& ctx, const ChunkMetadata& chunk) {
    UploadEvent event = make_event(UploadEventType::kChunkStarted, ctx->session.id());
    event.payload = ChunkEvent{chunk.chunk_index, 0, std::chrono::milliseconds(0), std::nullopt};
    events_.publish(std::move(event));
}

void UploadOrchestrator::on_chunk_retry(const ContextPtr& ctx,
                                        const ChunkMetadata& chunk,
                                        std::uint32_t retry,
                                        std::chrono::milliseconds delay,
                                        const UploadError& error) {
    logger_.warn("Session " + ctx->session.id() + " chunk " + std::to_string(chunk.chunk_index) + " retry " +
                 std::to_string(retry) + " in " + std::to_string(delay.count()) + "ms: " + error.what());
    UploadEvent event = make_event(UploadEventType::kChunkRetry, ctx->session.id());
    event.payload = ChunkEvent{chunk.chunk_index, retry, delay, to_failure(error)};
    events_.publish(std::move(event));
}

void UploadOrchestrator::on_chunk_succeeded(const ContextPtr& ctx,
                                            const ChunkMetadata& chunk,
                                            const ChunkUploadResult& result) {
    bool expired = false;
    bool run_completion = false;
    {
        std::lock_guard<std::mutex> lock(ctx->mutex);
        if (ctx->session.is_terminal()) {
            return;
        }
        const auto now = clock_.now();
        if (ctx->session.is_expired(now)) {
            expired = true;
        } else {
            PersistedChunk persisted{chunk.chunk_index, result.etag, result.checksum, now};
            if (!store_.record_chunk(ctx->session.id(), persisted, now)) {
                logger_.warn("Discarding chunk " + std::to_string(chunk.chunk_index) + " of session " +
                             ctx->session.id() + ": session is no longer active");
                return;
            }
            if (ctx->session.record_chunk(persisted, now)) {
                ctx->progress.record(chunk.chunk_size, now);
            }
            ctx->failed_chunks.erase(chunk.chunk_index);

            UploadEvent event = make_event(UploadEventType::kChunkCompleted, ctx->session.id());
            event.payload = ChunkEvent{chunk.chunk_index, result.retry_count, std::chrono::milliseconds(0),
                                       std::nullopt};
            events_.publish(std::move(event));
            publish_progress_locked(*ctx);

            if (ctx->session.is_complete() && !ctx->completion_started &&
                ctx->session.status() == UploadStatus::kUploading) {
                ctx->completion_started = true;
                run_completion = true;
            }
        }
    }
    if (expired) {
        fail(ctx, UploadError(UploadErrorCode::kSessionExpired, "Session " + ctx->session.id() + " has expired"));
        return;
    }
    if (run_completion) {
        complete(ctx);
    }
}

void UploadOrchestrator::on_chunk_exhausted(const ContextPtr& ctx,
                                            const ChunkMetadata& chunk,
                                            const UploadError& error,
                                            std::uint32_t retries) {
    std::lock_guard<std::mutex> lock(ctx->mutex);
    if (ctx->session.is_terminal()) {
        return;
    }
    ctx->failed_chunks.insert(chunk.chunk_index);
    const UploadError exhausted(UploadErrorCode::kChunkUploadFailed,
                                "Chunk " + std::to_string(chunk.chunk_index) + " failed after " +
                                    std::to_string(retries) + " retries: " + error.what(),
                                true);
    logger_.error("Session " + ctx->session.id() + ": " + exhausted.what());
    UploadEvent event = make_event(UploadEventType::kChunkFailed, ctx->session.id(), exhausted.what());
    event.payload = ChunkEvent{chunk.chunk_index, retries, std::chrono::milliseconds(0), to_failure(exhausted)};
    events_.publish(std::move(event));
}

void UploadOrchestrator::on_chunk_fatal(const ContextPtr& ctx, const ChunkMetadata& chunk, const UploadError& error) {
    UploadEvent event = make_event(UploadEventType::kChunkFailed, ctx->session.id(), error.what());
    event.payload = ChunkEvent{chunk.chunk_index, 0, std::chrono::milliseconds(0), to_failure(error)};
    events_.publish(std::move(event));
    fail(ctx, error);
}

void UploadOrchestrator::on_workers_drained(const ContextPtr& ctx, std::uint64_t generation) {
    std::lock_guard<std::mutex> lock(ctx->mutex);
    if (generation != ctx->pool_generation) {
        return;
    }
    ctx->workers_idle = true;
    if (ctx->session.status() == UploadStatus::kUploading && !ctx->completion_started) {
        std::string reason;
        if (ctx->pause_requested) {
            reason = ctx->pause_reason;
        } else if (!ctx->failed_chunks.empty()) {
            reason = std::to_string(ctx->failed_chunks.size()) + " chunk(s) exhausted their retries";
        } else {
            reason = "chunk scheduling stopped";
        }
        ctx->session.transition_to(UploadStatus::kPaused, clock_.now());
        persist_status(*ctx);
        ctx->pause_requested = false;
        logger_.info("Session " + ctx->session.id() + " paused: " + reason);
        events_.publish(make_event(UploadEventType::kSessionPaused, ctx->session.id(), reason));
    }
    ctx->settled_cv.notify_all();
}

void UploadOrchestrator::complete(const ContextPtr& ctx) {
    std::string upload_id;
    std::vector<CompletedPart> parts;
    {
        std::lock_guard<std::mutex> lock(ctx->mutex);
        upload_id = ctx->session.record().upload_id;
        parts = ctx->session.ordered_parts();
    }

    MultipartResult result;
    std::optional<UploadError> failure;
    try {
        result = backend_.complete_multipart(upload_id, parts);
    } catch (const UploadError& ex) {
        failure = ex;
    } catch (const std::exception& ex) {
        failure = UploadError(UploadErrorCode::kServerError, std::string("complete failed: ") + ex.what());
    }
    if (failure) {
        fail(ctx, *failure);
        return;
    }

    std::lock_guard<std::mutex> lock(ctx->mutex);
    if (ctx->session.is_terminal()) {
        return;
    }
    const auto now = clock_.now();
    ctx->session.transition_to(UploadStatus::kCompleted, now);
    persist_status(*ctx);

    const auto& record = ctx->session.record();
    CompletedUploadResult completed;
    completed.session_id = record.session_id;
    completed.file_key = record.file_key;
    completed.file_name = record.file_name;
    completed.file_size = record.file_size;
    completed.mime_type = record.mime_type;
    completed.url = result.url;
    completed.public_url = result.public_url;
    completed.uploaded_at = now;
    completed.duration = std::chrono::duration_cast<std::chrono::milliseconds>(now - record.created_at);
    if (completed.duration.count() > 0) {
        completed.average_speed = static_cast<double>(record.file_size) * 1000.0 /
                                  static_cast<double>(completed.duration.count());
    }
    completed.metadata = record.metadata;

    logger_.info("Session " + record.session_id + " completed: " + result.url);
    publish_progress_locked(*ctx);
    UploadEvent event = make_event(UploadEventType::kSessionCompleted, record.session_id);
    event.payload = std::move(completed);
    events_.publish(std::move(event));
    ctx->settled_cv.notify_all();
}

void UploadOrchestrator::fail(const ContextPtr& ctx, const UploadError& error) {
    SessionRecord snapshot;
    {
        std::lock_guard<std::mutex> lock(ctx->mutex);
        if (ctx->session.is_terminal()) {
            return;
        }
        if (ctx->pool && ctx->pool->cancel()) {
            ctx->workers_idle = true;
        }
        ctx->session.transition_to(UploadStatus::kFailed, clock_.now());
        persist_status(*ctx);
        snapshot = ctx->session.record();
        ctx->settled_cv.notify_all();
    }
    logger_.error("Session " + snapshot.session_id + " failed [" + std::string(to_string(error.code())) +
                  "]: " + error.what());
    abort_remote(snapshot, error.what());

    UploadEvent event = make_event(UploadEventType::kSessionFailed, snapshot.session_id, error.what());
    event.payload = to_failure(error);
    events_.publish(std::move(event));
}

void UploadOrchestrator::require_active(const ContextPtr& ctx, std::unique_lock<std::mutex>& lock, TimePoint now) {
    try {
        ctx->session.ensure_active(now);
    } catch (const UploadError& ex) {
        if (ex.code() == UploadErrorCode::kSessionExpired) {
            lock.unlock();
            fail(ctx, ex);
        }
        throw;
    }
}

void UploadOrchestrator::abort_remote(const SessionRecord& record, const std::string& reason) {
    if (record.upload_id.empty()) {
        return;
    }
    std::string problem;
    try {
        backend_.abort_multipart(record.upload_id);
        return;
    } catch (const std::exception& ex) {
        problem = ex.what();
    }

    logger_.warn("Abort of upload " + record.upload_id + " for session " + record.session_id +
                 " failed, left for cleanup: " + problem);
    OrphanedUpload orphan{record.upload_id, record.session_id, record.file_key, reason + "; abort: " + problem,
                          clock_.now()};
    try {
        store_.record_orphan(orphan);
    } catch (const std::exception& ex) {
        logger_.error("Could not record orphaned upload " + record.upload_id + ": " + ex.what());
    }
    UploadEvent event = make_event(UploadEventType::kUploadOrphaned, record.session_id, problem);
    event.payload = std::move(orphan);
    events_.publish(std::move(event));
}

SessionResumeInfo UploadOrchestrator::resume_upload(const std::string& session_id) {
    auto ctx = lookup(session_id);
    const auto now = clock_.now();

    std::unique_lock<std::mutex> lock(ctx->mutex);
    require_active(ctx, lock, now);
    if (ctx->session.status() == UploadStatus::kUploading && !ctx->workers_idle) {
        if (ctx->pause_requested) {
            throw UploadError(UploadErrorCode::kInvalidState, "Session " + session_id + " is pausing", true);
        }
        return ctx->session.resume_info(now);
    }

    auto source = resolve_source(*ctx);
    const auto& record = ctx->session.record();
    if (source->size() != record.file_size) {
        throw UploadError(UploadErrorCode::kValidationError,
                          "Source size " + std::to_string(source->size()) + " differs from session size " +
                              std::to_string(record.file_size));
    }
    auto plan = ChunkPlanner::plan(*source, record.chunk_size);
    if (plan.size() != record.total_chunks) {
        throw UploadError(UploadErrorCode::kValidationError,
                          "Recomputed plan has " + std::to_string(plan.size()) + " chunks, session has " +
                              std::to_string(record.total_chunks));
    }
    for (const auto& [index, persisted] : record.chunks) {
        if (!persisted.checksum.empty() && plan[index].checksum != persisted.checksum) {
            throw UploadError(UploadErrorCode::kValidationError,
                              "Source content changed at acknowledged chunk " + std::to_string(index));
        }
    }
    ctx->source = std::move(source);
    ctx->plan = plan;

    if (ctx->session.status() != UploadStatus::kUploading) {
        ctx->session.transition_to(UploadStatus::kUploading, now);
        persist_status(*ctx);
    }
    ctx->failed_chunks.clear();
    ctx->pause_requested = false;
    ctx->progress.restart(now);

    auto info = ctx->session.resume_info(now);
    logger_.info("Session " + session_id + " resumed with " + std::to_string(info.remaining_chunks.size()) +
                 " remaining chunk(s)");
    events_.publish(make_event(UploadEventType::kSessionResumed, session_id));

    if (info.remaining_chunks.empty()) {
        if (ctx->completion_started) {
            return info;
        }
        ctx->completion_started = true;
        lock.unlock();
        complete(ctx);
        return info;
    }

    std::vector<ChunkMetadata> chunks;
    chunks.reserve(info.remaining_chunks.size());
    for (auto index : info.remaining_chunks) {
        chunks.push_back(plan[index]);
    }
    lock.unlock();
    launch(ctx, std::move(chunks), config_.max_concurrent_chunks);
    return info;
}

void UploadOrchestrator::pause_upload(const std::string& session_id) {
    auto ctx = lookup(session_id);
    const auto now = clock_.now();

    std::unique_lock<std::mutex> lock(ctx->mutex);
    require_active(ctx, lock, now);
    if (ctx->session.status() == UploadStatus::kPaused) {
        return;
    }
    if (ctx->session.status() != UploadStatus::kUploading) {
        throw UploadError(UploadErrorCode::kInvalidState,
                          "Session " + session_id + " is " + std::string(to_string(ctx->session.status())));
    }

    ctx->pause_requested = true;
    ctx->pause_reason = "paused by caller";
    const bool idle = !ctx->pool || ctx->pool->stop_scheduling();
    if (idle && !ctx->completion_started) {
        ctx->workers_idle = true;
        ctx->session.transition_to(UploadStatus::kPaused, now);
        persist_status(*ctx);
        ctx->pause_requested = false;
        logger_.info("Session " + session_id + " paused: " + ctx->pause_reason);
        events_.publish(make_event(UploadEventType::kSessionPaused, session_id, ctx->pause_reason));
        ctx->settled_cv.notify_all();
        return;
    }
    ctx->settled_cv.wait(lock, [&] { return ctx->session.status() != UploadStatus::kUploading; });
}

void UploadOrchestrator::cancel_upload(const std::string& session_id, const std::string& reason) {
    auto ctx = lookup(session_id);
    const auto now = clock_.now();

    SessionRecord snapshot;
    {
        std::unique_lock<std::mutex> lock(ctx->mutex);
        if (ctx->completion_started && !ctx->session.is_terminal()) {
            throw UploadError(UploadErrorCode::kInvalidState, "Session " + session_id + " is completing");
        }
        require_active(ctx, lock, now);
        if (!ctx->pool || ctx->pool->cancel()) {
            ctx->workers_idle = true;
        }
        ctx->session.transition_to(UploadStatus::kCancelled, now);
        persist_status(*ctx);
        snapshot = ctx->session.record();
        ctx->settled_cv.notify_all();
    }

    const auto why = reason.empty() ? std::string("cancelled by caller") : reason;
    logger_.info("Session " + session_id + " cancelled: " + why);
    abort_remote(snapshot, why);

    UploadEvent event = make_event(UploadEventType::kSessionCancelled, session_id, why);
    event.payload = UploadFailure{UploadErrorCode::kCancelled, why, false};
    events_.publish(std::move(event));
}

ChunkedUploadProgress UploadOrchestrator::get_progress(const std::string& session_id) const {
    auto ctx = lookup(session_id);
    std::lock_guard<std::mutex> lock(ctx->mutex);
    return progress_locked(*ctx);
}

ChunkedUploadProgress UploadOrchestrator::progress_locked(const SessionContext& ctx) const {
    const auto& record = ctx.session.record();
    ChunkedUploadProgress progress;
    progress.session_id = record.session_id;
    progress.uploaded_bytes = ctx.session.uploaded_bytes();
    progress.total_bytes = record.file_size;
    progress.uploaded_chunks = ctx.session.uploaded_count();
    progress.total_chunks = record.total_chunks;
    progress.percentage = record.file_size == 0 ? 0.0
                                                : 100.0 * static_cast<double>(progress.uploaded_bytes) /
                                                      static_cast<double>(record.file_size);
    progress.speed = ctx.progress.speed();
    progress.estimated_time_remaining = ctx.progress.estimated_seconds_remaining(progress.uploaded_bytes);
    if (ctx.pool && ctx.session.status() == UploadStatus::kUploading) {
        progress.active_chunks = ctx.pool->in_flight();
        progress.queued_chunks = ctx.pool->queued();
    }
    progress.failed_chunks = ctx.failed_chunks.size();
    progress.status = record.status;
    return progress;
}

void UploadOrchestrator::publish_progress_locked(const SessionContext& ctx) {
    UploadEvent event = make_event(UploadEventType::kSessionProgress, ctx.session.id());
    event.payload = progress_locked(ctx);
    events_.publish(std::move(event));
}

void UploadOrchestrator::persist_status(SessionContext& ctx) {
    const auto& record = ctx.session.record();
    if (!store_.update_status(record.session_id, record.status, record.updated_at)) {
        logger_.warn("Session " + record.session_id + " is missing from the store; status " +
                     std::string(to_string(record.status)) + " not persisted");
    }
}

bool UploadOrchestrator::wait(const std::string& session_id, std::chrono::milliseconds timeout) const {
    auto ctx = lookup(session_id);
    std::unique_lock<std::mutex> lock(ctx->mutex);
    return ctx->settled_cv.wait_for(lock, timeout, [&] {
        const auto status = ctx->session.status();
        return ctx->workers_idle && status != UploadStatus::kUploading && status != UploadStatus::kInitializing;
    });
}

std::vector<SessionRecord> UploadOrchestrator::list_sessions() const {
    return store_.load_all();
}

std::vector<OrphanedUpload> UploadOrchestrator::orphans() const {
    return store_.orphans();
}

UploadOrchestrator::ContextPtr UploadOrchestrator::adopt(SessionRecord record) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(record.session_id);
    if (it != sessions_.end()) {
        return it->second;
    }
    auto id = record.session_id;
    auto ctx = std::make_shared<SessionContext>(std::move(record), config_.speed_smoothing);
    sessions_.emplace(std::move(id), ctx);
    return ctx;
}

UploadOrchestrator::ContextPtr UploadOrchestrator::lookup(const std::string& session_id) const {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end()) {
            return it->second;
        }
    }
    auto record = store_.load(session_id);
    if (!record) {
        throw UploadError(UploadErrorCode::kSessionNotFound, "Unknown session " + session_id);
    }
    return adopt(std::move(*record));
}

std::vector<UploadOrchestrator::ContextPtr> UploadOrchestrator::snapshot() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::vector<ContextPtr> contexts;
    contexts.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        contexts.push_back(entry.second);
    }
    return contexts;
}

std::shared_ptr<const FileSource> UploadOrchestrator::resolve_source(SessionContext& ctx) const {
    if (ctx.source) {
        return ctx.source;
    }
    SourceResolver resolver;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        resolver = resolver_;
    }
    std::shared_ptr<const FileSource> source;
    try {
        source = resolver ? resolver(ctx.session.record()) : nullptr;
    } catch (const std::exception& ex) {
        throw UploadError(UploadErrorCode::kValidationError,
                          "Source for session " + ctx.session.id() + " is unavailable: " + ex.what());
    }
    if (!source) {
        throw UploadError(UploadErrorCode::kValidationError,
                          "Source for session " + ctx.session.id() + " is unavailable");
    }
    return source;
}

std::size_t UploadOrchestrator::restore() {
    std::size_t adopted = 0;
    for (auto& record : store_.load_all()) {
        if (is_terminal(record.status)) {
            continue;
        }
        const bool interrupted = record.status == UploadStatus::kUploading;
        if (interrupted) {
            record.status = UploadStatus::kPaused;
            record.updated_at = clock_.now();
            store_.update_status(record.session_id, record.status, record.updated_at);
        }
        const auto id = record.session_id;
        adopt(std::move(record));
        ++adopted;
        if (interrupted) {
            logger_.info("Session " + id + " restored as paused after interruption");
            events_.publish(make_event(UploadEventType::kSessionPaused, id, "interrupted"));
        }
    }
    return adopted;
}

std::size_t UploadOrchestrator::collect_expired() {
    const auto now = clock_.now();

    for (const auto& ctx : snapshot()) {
        bool expired = false;
        {
            std::lock_guard<std::mutex> lock(ctx->mutex);
            expired = !ctx->session.is_terminal() && !ctx->completion_started && ctx->session.is_expired(now);
        }
        if (expired) {
            fail(ctx, UploadError(UploadErrorCode::kSessionExpired, "Session " + ctx->session.id() + " has expired"));
        }
    }

    std::size_t removed = 0;
    for (const auto& record : store_.load_expired(now)) {
        ContextPtr live;
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            auto it = sessions_.find(record.session_id);
            if (it != sessions_.end()) {
                live = it->second;
            }
        }
        if (live) {
            std::lock_guard<std::mutex> lock(live->mutex);
            if (!live->session.is_terminal() || !live->workers_idle) {
                continue;
            }
        }
        if (!is_terminal(record.status)) {
            abort_remote(record, "expired");
        }
        const bool deleted = store_.remove(record.session_id);
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            sessions_.erase(record.session_id);
        }
        if (!deleted) {
            continue;
        }
        logger_.info("Session " + record.session_id + " expired and was removed");
        ++removed;
    }

    for (const auto& orphan : store_.orphans()) {
        try {
            backend_.abort_multipart(orphan.upload_id);
        } catch (const std::exception& ex) {
            logger_.debug("Orphaned upload " + orphan.upload_id + " still not aborted: " + ex.what());
            continue;
        }
        if (store_.remove_orphan(orphan.upload_id)) {
            logger_.info("Orphaned upload " + orphan.upload_id + " aborted");
        }
    }
    return removed;
}

std::size_t UploadOrchestrator::pause_all() {
    std::size_t paused = 0;
    for (const auto& ctx : snapshot()) {
        {
            std::lock_guard<std::mutex> lock(ctx->mutex);
            if (ctx->session.status() != UploadStatus::kUploading) {
                continue;
            }
        }
        try {
            pause_upload(ctx->session.id());
            ++paused;
        } catch (const std::exception& ex) {
            logger_.warn("Could not pause session " + ctx->session.id() + ": " + ex.what());
        }
    }
    return paused;
}

void UploadOrchestrator::shutdown() {
    pause_all();
    for (const auto& ctx : snapshot()) {
        std::unique_lock<std::mutex> lock(ctx->mutex);
        if (ctx->pool && !ctx->workers_idle) {
            ctx->pool->cancel();
        }
        ctx->settled_cv.wait(lock, [&] { return ctx->workers_idle; });
    }
}

}  // namespace chunkflow::engine
