#pragma once

// ============================================================
// progress.hpp -- Progress callbacks and the event channel
//
// The engine invokes ProgressFn synchronously on the transfer thread.
// Front ends that render on a different thread push events into a
// ProgressChannel from the callback and drain it on their own thread.
// ============================================================

#include "platform.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

// percent is floor(done / total * 100); total == 0 reports 100
using ProgressFn = std::function<void(int percent, u64 done, u64 total)>;

// Lets at most one progress call through per interval
class ProgressThrottle {
public:
    explicit ProgressThrottle(std::chrono::milliseconds interval)
        : interval_(interval), last_(std::chrono::steady_clock::now()) {}

    bool ready() {
        auto now = std::chrono::steady_clock::now();
        if (now - last_ <= interval_) return false;
        last_ = now;
        return true;
    }

private:
    std::chrono::milliseconds             interval_;
    std::chrono::steady_clock::time_point last_;
};

enum class EventKind {
    CONNECTED,
    DISCONNECTED,
    PROGRESS,
    STATUS,
    ERROR_MSG,
};

struct TransferEvent {
    EventKind   kind{EventKind::STATUS};
    std::string peer;
    int         percent{0};
    u64         done{0};
    u64         total{0};
    std::string message;
};

// Multi-producer, single-consumer queue of TransferEvents
class ProgressChannel {
public:
    void push(TransferEvent ev) {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (closed_) return;
            events_.push_back(std::move(ev));
        }
        cv_.notify_one();
    }

    // Wait up to 'timeout' for an event. Returns false on timeout or once
    // the channel is closed and drained.
    bool pop(TransferEvent& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(mutex_);
        cv_.wait_for(lk, timeout, [this] { return closed_ || !events_.empty(); });
        if (events_.empty()) return false;
        out = std::move(events_.front());
        events_.pop_front();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return closed_ && events_.empty();
    }

    // Adapter: a ProgressFn that forwards into this channel
    ProgressFn progress_sink(const std::string& peer) {
        return [this, peer](int pct, u64 done, u64 total) {
            TransferEvent ev;
            ev.kind    = EventKind::PROGRESS;
            ev.peer    = peer;
            ev.percent = pct;
            ev.done    = done;
            ev.total   = total;
            push(std::move(ev));
        };
    }

private:
    mutable std::mutex        mutex_;
    std::condition_variable   cv_;
    std::deque<TransferEvent> events_;
    bool                      closed_{false};
};
