#pragma once

// ============================================================
// retry_controller.hpp -- Bounded retry / reconnect / resume
//
//   ATTEMPTING --ok-------------------------------> SUCCEEDED
//       |  \--framing error----------------------> FAILED
//       |--connection error, attempts left--> RETRYING --> ATTEMPTING
//       \--connection error, none left---------> FAILED
//
// Connection errors: ConnectError, TransportError,
// PrematureCloseError, ResumeMismatchError.
// Framing errors:    MalformedHeaderError, OversizedHeaderError.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/progress.hpp"
#include "../common/transfer_engine.hpp"
#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <string>

class ConnectionManager;
class HistoryLedger;

struct RetryPolicy {
    int max_retries{DEFAULT_MAX_RETRIES};      // total attempts, >= 1
    int retry_delay_ms{DEFAULT_RETRY_DELAY_MS}; // fixed wait, no backoff
};

enum class RetryPhase {
    IDLE,
    ATTEMPTING,
    RETRYING,
    SUCCEEDED,
    FAILED,
};

const char* retry_phase_name(RetryPhase p);

class RetryController {
public:
    using TransitionFn = std::function<void(RetryPhase phase, int attempt)>;

    RetryController(ConnectionManager& conn,
                    const TransferEngine& engine,
                    HistoryLedger& ledger,
                    RetryPolicy policy = RetryPolicy{});

    // Receive one file into 'destination' (extension appended if it has
    // none). Dials the endpoint if the connection is not open yet.
    // Exactly one ledger record is written per call. On failure the last
    // error is re-thrown.
    u64 receive(const std::string& destination, const ProgressFn& on_progress);

    RetryPhase phase() const { return phase_; }

    // Attempts made by the last receive() call
    int attempts() const { return attempts_; }

    // Final path written by the last receive() call
    const std::string& saved_path() const { return saved_path_; }

    void set_transition_hook(TransitionFn fn) { on_transition_ = std::move(fn); }

    // Abort the running receive() from another thread: closes the
    // connection and skips any remaining attempts.
    void cancel();

private:
    // Loop-local retry bookkeeping
    struct RetryState {
        int                attempt{0};
        std::exception_ptr last_error;
        std::string        last_message;
        ResumeState        resume;
    };

    ConnectionManager&    conn_;
    const TransferEngine& engine_;
    HistoryLedger&        ledger_;
    RetryPolicy           policy_;

    RetryPhase   phase_{RetryPhase::IDLE};
    int          attempts_{0};
    std::string  saved_path_;
    TransitionFn on_transition_;

    std::atomic<bool>       cancelled_{false};
    std::mutex              delay_mutex_;
    std::condition_variable delay_cv_;

    void enter(RetryPhase p, int attempt);

    // Retry delay; returns false if cancelled while waiting
    bool wait_before_retry();
    void record_failure(const RetryState& st, const std::string& destination,
                        bool premature_close);
};
