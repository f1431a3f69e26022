#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

// Shared cancellation flag. Copies observe the same state, so one token can be
// handed to every worker of a batch and to the HTTP transfers they start.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { state_->store(true); }
    bool is_cancelled() const { return state_->load(); }

    // Sleeps up to `duration`, waking early on cancellation.
    // Returns false if cancelled.
    bool sleep_for(std::chrono::milliseconds duration) const {
        auto wake_up_time = std::chrono::steady_clock::now() + duration;
        while (!is_cancelled() && std::chrono::steady_clock::now() < wake_up_time) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                wake_up_time - std::chrono::steady_clock::now());
            std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(50)));
        }
        return !is_cancelled();
    }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};
