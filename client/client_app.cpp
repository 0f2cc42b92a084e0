// ============================================================
// client_app.cpp -- filedrop client: connect to server, receive
// ============================================================

#include "client_app.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <filesystem>

namespace fs = std::filesystem;

// A directory destination gets a timestamped name; anything else is
// used as given.
static std::string choose_destination(const std::string& dst) {
    std::error_code ec;
    if (fs::is_directory(dst, ec)) {
        return file_io::auto_destination(dst);
    }
    return dst;
}

ClientApp::ClientApp(ClientConfig config, ProgressChannel* events)
    : config_(std::move(config))
    , events_(events)
    , destination_(choose_destination(config_.dst))
    , conn_(Endpoint{config_.server_ip, config_.server_port})
    , retry_(conn_, engine_, history_, config_.retry)
{
    conn_.set_recv_timeout_ms(config_.recv_timeout_ms);
    LOG_INFO("ClientApp: destination=" + destination_ +
             " server=" + conn_.endpoint().str() +
             " attempts=" + std::to_string(config_.retry.max_retries));

    retry_.set_transition_hook([this](RetryPhase phase, int attempt) {
        if (phase == RetryPhase::RETRYING) {
            emit(EventKind::STATUS, "Connection lost, retrying in " +
                 std::to_string(config_.retry.retry_delay_ms) + " ms (attempt " +
                 std::to_string(attempt + 2) + "/" +
                 std::to_string(config_.retry.max_retries) + ")");
        }
    });
}

ClientApp::~ClientApp() {
    stop();
}

void ClientApp::stop() {
    retry_.cancel();
}

void ClientApp::emit(EventKind kind, const std::string& msg) {
    if (!events_) return;
    TransferEvent ev;
    ev.kind    = kind;
    ev.peer    = conn_.endpoint().str();
    ev.message = msg;
    events_->push(std::move(ev));
}

// ---------------------------------------------------------------
// run
// ---------------------------------------------------------------

int ClientApp::run() {
    LOG_INFO("Connecting to server " + conn_.endpoint().str() + " ...");
    emit(EventKind::CONNECTED, "connecting");

    ProgressFn on_progress;
    if (events_) on_progress = events_->progress_sink(conn_.endpoint().str());

    int rc = 0;
    try {
        u64 n = retry_.receive(destination_, on_progress);
        LOG_INFO("Received " + utils::format_bytes(n) + " into " + retry_.saved_path() +
                 " after " + std::to_string(retry_.attempts()) + " attempt(s)");
    } catch (const std::exception& e) {
        LOG_ERROR("Transfer failed after " + std::to_string(retry_.attempts()) +
                  " attempt(s): " + e.what());
        emit(EventKind::ERROR_MSG, e.what());
        rc = 2;
    }

    conn_.close();
    emit(EventKind::DISCONNECTED, rc == 0 ? "done" : "failed");
    return rc;
}
