#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace chunkflow::engine {

// Shared one-shot stop signal. Copies observe the same state.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled = true;
        }
        state_->cv.notify_all();
    }

    bool cancelled() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

    // Sleeps for up to `delay`; returns true if woken by cancel().
    bool wait_for(std::chrono::milliseconds delay) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_for(lock, delay, [this] { return state_->cancelled; });
    }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };

    std::shared_ptr<State> state_;
};

}  // namespace chunkflow::engine
