#pragma once

// ============================================================
// client_app.hpp -- filedrop client: connects to the server,
//   receives one file with reconnect-and-resume support
// ============================================================

#include "../common/platform.hpp"
#include "../common/connection.hpp"
#include "../common/history.hpp"
#include "../common/progress.hpp"
#include "../common/transfer_engine.hpp"
#include "retry_controller.hpp"
#include <string>
#include <atomic>

struct ClientConfig {
    std::string dst;             // file path, or a directory for an auto name
    std::string server_ip;
    u16         server_port{DEFAULT_PORT};
    RetryPolicy retry;
    int         recv_timeout_ms{0};   // 0 = block until the server closes
};

class ClientApp {
public:
    // 'events' (optional) receives connect/progress/error notifications
    // for a presentation thread.
    explicit ClientApp(ClientConfig config, ProgressChannel* events = nullptr);
    ~ClientApp();

    // Receive one file. Returns 0 on success, 2 when the transfer failed
    // (the failure is in history()).
    int run();

    // Cancel the transfer from another thread. Not async-signal-safe;
    // signal handlers go through a StopWatcher.
    void stop();

    // Path chosen for the file (extension appended once the header is known)
    const std::string& destination() const { return destination_; }
    const std::string& saved_path() const { return retry_.saved_path(); }

    HistoryLedger& history() { return history_; }

private:
    ClientConfig      config_;
    ProgressChannel*  events_;
    std::string       destination_;

    HistoryLedger     history_;
    TransferEngine    engine_;
    ConnectionManager conn_;
    RetryController   retry_;

    void emit(EventKind kind, const std::string& msg);
};
