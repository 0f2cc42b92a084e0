// ============================================================
// retry_controller.cpp
// ============================================================

#include "retry_controller.hpp"
#include "../common/connection.hpp"
#include "../common/errors.hpp"
#include "../common/history.hpp"
#include "../common/logger.hpp"
#include <algorithm>
#include <chrono>

const char* retry_phase_name(RetryPhase p) {
    switch (p) {
        case RetryPhase::IDLE:       return "idle";
        case RetryPhase::ATTEMPTING: return "attempting";
        case RetryPhase::RETRYING:   return "retrying";
        case RetryPhase::SUCCEEDED:  return "succeeded";
        case RetryPhase::FAILED:     return "failed";
    }
    return "?";
}

RetryController::RetryController(ConnectionManager& conn,
                                 const TransferEngine& engine,
                                 HistoryLedger& ledger,
                                 RetryPolicy policy)
    : conn_(conn)
    , engine_(engine)
    , ledger_(ledger)
    , policy_(policy)
{}

void RetryController::enter(RetryPhase p, int attempt) {
    phase_ = p;
    LOG_DEBUG(std::string("retry: ") + retry_phase_name(p) +
              " (attempt " + std::to_string(attempt + 1) + ")");
    if (on_transition_) on_transition_(p, attempt);
}

void RetryController::cancel() {
    {
        std::lock_guard<std::mutex> lk(delay_mutex_);
        cancelled_.store(true);
    }
    delay_cv_.notify_all();
    conn_.close();
}

bool RetryController::wait_before_retry() {
    std::unique_lock<std::mutex> lk(delay_mutex_);
    delay_cv_.wait_for(lk, std::chrono::milliseconds(policy_.retry_delay_ms),
                       [this] { return cancelled_.load(); });
    return !cancelled_.load();
}

void RetryController::record_failure(const RetryState& st,
                                     const std::string& destination,
                                     bool premature_close)
{
    const ResumeState& rs = st.resume;
    std::string name = rs.have_header ? rs.header.name : "unknown";
    std::string path = rs.have_header ? rs.dest_path   : destination;
    std::string peer = conn_.endpoint().str();

    Logger::get().transfer_error("Error receiving file from " + peer + ": " + st.last_message);

    if (premature_close && rs.have_header && rs.accumulated > 0) {
        ledger_.record(HistoryRecord::incomplete(name, peer, rs.accumulated, rs.header.size,
                                                 st.last_message, path));
    } else {
        ledger_.record(HistoryRecord::failed(name, peer, rs.have_header ? rs.header.size : 0,
                                             st.last_message, path));
    }
}

u64 RetryController::receive(const std::string& destination, const ProgressFn& on_progress) {
    RetryState st;
    attempts_   = 0;
    saved_path_.clear();

    const int max_attempts = std::max(1, policy_.max_retries);
    bool last_was_premature = false;

    for (st.attempt = 0; st.attempt < max_attempts; ++st.attempt) {
        enter(RetryPhase::ATTEMPTING, st.attempt);
        attempts_ = st.attempt + 1;

        TransferSession session;
        session.attempt = st.attempt;
        session.peer    = conn_.endpoint().str();

        try {
            if (cancelled_.load()) {
                throw ConnectError("Transfer cancelled");
            }
            // Reuse the caller's connection for the first attempt; every
            // retry re-dials the same endpoint.
            Stream* stream = conn_.stream();
            if (st.attempt > 0 || !stream) {
                stream = &conn_.open();
                // cancel() may have run while the dial was in flight and
                // found nothing to close
                if (cancelled_.load()) {
                    conn_.close();
                    throw ConnectError("Transfer cancelled");
                }
            }

            u64 n = engine_.receive(*stream, destination, st.resume, session, on_progress);

            saved_path_ = session.path;
            enter(RetryPhase::SUCCEEDED, st.attempt);
            ledger_.record(HistoryRecord::complete(session.header.name, session.peer,
                                                   n, session.path));
            return n;
        } catch (const HeaderError& e) {
            // Resending will not fix a protocol mismatch
            st.last_error   = std::current_exception();
            st.last_message = e.what();
            conn_.close();
            saved_path_ = st.resume.have_header ? st.resume.dest_path : destination;
            enter(RetryPhase::FAILED, st.attempt);
            record_failure(st, destination, false);
            throw;
        } catch (const TransferError& e) {
            st.last_error      = std::current_exception();
            st.last_message    = e.what();
            last_was_premature = dynamic_cast<const PrematureCloseError*>(&e) != nullptr;
            conn_.close();

            if (cancelled_.load()) {
                LOG_WARN("Transfer cancelled: " + st.last_message);
                break;
            }
            if (st.attempt + 1 < max_attempts) {
                LOG_WARN("Attempt " + std::to_string(st.attempt + 1) + " failed: " +
                         st.last_message + "; retrying in " +
                         std::to_string(policy_.retry_delay_ms) + " ms (resume at byte " +
                         std::to_string(st.resume.accumulated) + ")");
                enter(RetryPhase::RETRYING, st.attempt);
                if (!wait_before_retry()) {
                    LOG_WARN("Transfer cancelled while waiting to retry");
                    break;
                }
            }
        } catch (const std::exception& e) {
            // Local I/O (destination not writable, disk full): not retried
            st.last_error   = std::current_exception();
            st.last_message = e.what();
            conn_.close();
            saved_path_ = st.resume.have_header ? st.resume.dest_path : destination;
            enter(RetryPhase::FAILED, st.attempt);
            record_failure(st, destination, false);
            throw;
        }
    }

    saved_path_ = st.resume.have_header ? st.resume.dest_path : destination;
    enter(RetryPhase::FAILED, attempts_ - 1);
    record_failure(st, destination, last_was_premature);
    std::rethrow_exception(st.last_error);
}
