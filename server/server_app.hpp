#pragma once

// ============================================================
// server_app.hpp -- filedrop server: serves one file to every client
//
// Concurrency model:
//   accept_loop()  → accepts one socket at a time, registers it in
//                    the PeerRegistry and spawns a peer thread.
//   peer threads   → wait until a source file is selected, stream it
//                    with TransferEngine::send, record the outcome in
//                    the HistoryLedger, then remove themselves.
// The accept loop never blocks on a transfer.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/socket.hpp"
#include "../common/progress.hpp"
#include "../common/history.hpp"
#include "../common/transfer_engine.hpp"
#include "peer_registry.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>

struct ServerConfig {
    std::string file_path;      // empty: peers wait for select_file()
    std::string listen_ip{"0.0.0.0"};
    u16         listen_port{DEFAULT_PORT};   // 0 picks an ephemeral port
    size_t      chunk_size{CHUNK_SIZE};
    int         max_clients{0};  // stop accepting after N clients (0=unlimited)
};

class ServerApp {
public:
    // 'events' (optional) receives connect/disconnect/progress/error
    // notifications for a presentation thread.
    explicit ServerApp(ServerConfig config, ProgressChannel* events = nullptr);
    ~ServerApp();

    // Bind, listen and spawn the accept thread; returns immediately.
    // Throws std::runtime_error if the address cannot be bound.
    void start();

    // Block until the accept loop has ended and every peer thread is done
    void wait();

    // start() + wait(). Returns 0.
    int run();

    // Close the listening socket and every peer stream. Safe to call
    // from another thread; idempotent. Takes locks and logs, so a signal
    // handler must not call it directly.
    void stop();

    // Change the file served to connections accepted from now on, and
    // release peers waiting for a first selection.
    void select_file(const std::string& path);

    // Bound port (useful with listen_port = 0)
    u16 port() const { return bound_port_.load(); }

    HistoryLedger& history() { return history_; }
    PeerRegistry&  peers()   { return peers_; }

    // Peer threads not yet joined (finished ones are reaped on accept)
    size_t peer_thread_count();

private:
    ServerConfig           config_;
    ProgressChannel*       events_;
    TransferEngine         engine_;
    TcpSocket              listen_sock_;
    std::atomic<bool>      running_{false};
    std::atomic<u16>       bound_port_{0};

    PeerRegistry           peers_;
    HistoryLedger          history_;

    // Source file selection
    std::string             file_path_;
    std::mutex              file_mutex_;
    std::condition_variable file_cv_;

    std::thread                accept_thread_;
    std::map<u64, std::thread> peer_threads_;     // keyed by peer id
    std::vector<u64>           finished_peers_;   // done, not yet joined
    std::mutex                 peer_threads_mutex_;

    void accept_loop();

    // Join and forget peer threads that have finished
    void cleanup_threads();
    void mark_finished(u64 id);

    // Transfer thread for one accepted connection
    void serve_peer(u64 id, std::shared_ptr<TcpSocket> sock, std::string addr);

    // Block until a file is selected; false if stopped first
    bool wait_for_file(std::string& path_out);

    void emit(EventKind kind, const std::string& peer, const std::string& msg);
};
