#include "task_executor.hpp"

#include "logger.hpp"

#include <stdexcept>

namespace chunkflow::engine {

TaskExecutor::TaskExecutor(std::size_t worker_count, Logger* logger) : logger_(logger) {
    if (worker_count == 0) {
        throw std::invalid_argument("TaskExecutor needs at least one thread");
    }
    threads_.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        threads_.emplace_back(&TaskExecutor::worker_loop, this);
    }
}

TaskExecutor::~TaskExecutor() {
    shutdown();
}

void TaskExecutor::submit(std::string label, Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_) {
            throw std::runtime_error("TaskExecutor is shutting down, rejected " + label);
        }
        backlog_.push_back(Entry{std::move(label), std::move(task)});
    }
    wakeup_.notify_one();
}

void TaskExecutor::shutdown() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closing_ = true;
        threads.swap(threads_);
    }
    wakeup_.notify_all();
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

ExecutorStats TaskExecutor::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ExecutorStats stats;
    stats.workers = threads_.size();
    stats.busy = busy_;
    stats.pending = backlog_.size();
    stats.finished = finished_;
    stats.crashed = crashed_;
    return stats;
}

void TaskExecutor::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        wakeup_.wait(lock, [this] { return closing_ || !backlog_.empty(); });
        if (backlog_.empty()) {
            return;
        }
        Entry entry = std::move(backlog_.front());
        backlog_.pop_front();
        ++busy_;
        lock.unlock();

        bool crashed = false;
        try {
            entry.run();
        } catch (const std::exception& ex) {
            crashed = true;
            if (logger_) {
                logger_->error("Task " + entry.label + " failed: " + ex.what());
            }
        }

        lock.lock();
        --busy_;
        ++finished_;
        if (crashed) {
            ++crashed_;
        }
    }
}

}  // namespace chunkflow::engine
