#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

// Stop request shared between a background task and its owner.
//
// Work that must never happen after a stop (queue pushes, probe writes) runs
// through run_unless_stopped(): it holds the signal's mutex, so request_stop()
// waits for an in-flight action and no new one starts once it returns.
class StopSignal {
public:
    void request_stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

    bool stop_requested() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stopped_;
    }

    // Sleep up to d. Returns true as soon as a stop is requested.
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> d) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, d, [this] { return stopped_; });
    }

    // Run action unless stopped. Returns false if it was skipped.
    template <typename F>
    bool run_unless_stopped(F&& action) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return false;
        action();
        return true;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = false;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;
};
