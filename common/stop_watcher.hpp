#pragma once

// ============================================================
// stop_watcher.hpp -- Runs a stop action requested by a signal
//
// A signal handler may only store to a lock-free atomic. StopWatcher
// polls that flag on its own thread and runs the stop action there,
// where taking locks and logging is allowed. The action runs at most
// once; destroying the watcher ends the thread.
// ============================================================

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>

class StopWatcher {
public:
    StopWatcher(const std::atomic<bool>& flag, std::function<void()> on_stop,
                std::chrono::milliseconds poll = std::chrono::milliseconds(50))
        : flag_(flag), on_stop_(std::move(on_stop)), poll_(poll)
    {
        thread_ = std::thread([this] { loop(); });
    }

    ~StopWatcher() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            done_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
    }

    StopWatcher(const StopWatcher&) = delete;
    StopWatcher& operator=(const StopWatcher&) = delete;

    // True once the stop action has run
    bool fired() const { return fired_.load(); }

private:
    const std::atomic<bool>& flag_;
    std::function<void()>    on_stop_;
    std::chrono::milliseconds poll_;
    std::atomic<bool>        fired_{false};
    bool                     done_{false};
    std::mutex               mutex_;
    std::condition_variable  cv_;
    std::thread              thread_;

    void loop() {
        std::unique_lock<std::mutex> lk(mutex_);
        while (!done_) {
            if (flag_.load()) {
                lk.unlock();
                if (on_stop_) on_stop_();
                fired_.store(true);
                return;
            }
            cv_.wait_for(lk, poll_, [this] { return done_; });
        }
    }
};
