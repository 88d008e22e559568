#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace chunkflow::engine {

class Logger;

struct ExecutorStats {
    std::size_t workers = 0;
    std::size_t busy = 0;
    std::size_t pending = 0;
    std::uint64_t finished = 0;
    std::uint64_t crashed = 0;  // tasks that let an exception escape
};

// Fixed set of transfer threads shared by every session; its size is the
// process-wide ceiling on simultaneous part transfers.
class TaskExecutor {
public:
    using Task = std::function<void()>;

    TaskExecutor(std::size_t worker_count, Logger* logger = nullptr);
    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    // The label names the task in log lines. Throws std::runtime_error once
    // shutdown() has begun.
    void submit(std::string label, Task task);

    // Runs what is already queued, then joins every thread.
    void shutdown();

    ExecutorStats stats() const;

private:
    struct Entry {
        std::string label;
        Task run;
    };

    void worker_loop();

    Logger* logger_;
    std::vector<std::thread> threads_;
    std::deque<Entry> backlog_;
    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    std::size_t busy_{0};
    std::uint64_t finished_{0};
    std::uint64_t crashed_{0};
    bool closing_{false};
};

}  // namespace chunkflow::engine
