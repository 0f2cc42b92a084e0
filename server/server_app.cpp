// ============================================================
// server_app.cpp -- filedrop server implementation
// ============================================================

#include "server_app.hpp"
#include "../common/protocol_io.hpp"
#include "../common/file_io.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;

ServerApp::ServerApp(ServerConfig config, ProgressChannel* events)
    : config_(std::move(config))
    , events_(events)
    , engine_(config_.chunk_size)
    , file_path_(config_.file_path)
{}

ServerApp::~ServerApp() {
    stop();
    wait();
}

void ServerApp::start() {
    listen_sock_.bind_and_listen(config_.listen_ip, config_.listen_port);
    bound_port_.store(listen_sock_.local_port());
    running_.store(true);

    LOG_INFO("Server listening on " + config_.listen_ip + ":" +
             std::to_string(bound_port_.load()));
    {
        std::lock_guard<std::mutex> lk(file_mutex_);
        if (file_path_.empty()) {
            LOG_INFO("No file selected yet; clients will wait");
        } else {
            LOG_INFO("Serving " + file_path_ + " (" +
                     utils::format_bytes(file_io::get_file_size(file_path_)) + ")");
        }
    }

    accept_thread_ = std::thread([this] { accept_loop(); });
}

void ServerApp::wait() {
    if (accept_thread_.joinable()) accept_thread_.join();

    // Peer threads are only spawned by the accept loop, so the map is
    // final once it has ended.
    std::map<u64, std::thread> threads;
    {
        std::lock_guard<std::mutex> lk(peer_threads_mutex_);
        threads.swap(peer_threads_);
        finished_peers_.clear();
    }
    for (auto& kv : threads) {
        if (kv.second.joinable()) kv.second.join();
    }
}

size_t ServerApp::peer_thread_count() {
    std::lock_guard<std::mutex> lk(peer_threads_mutex_);
    return peer_threads_.size();
}

void ServerApp::mark_finished(u64 id) {
    std::lock_guard<std::mutex> lk(peer_threads_mutex_);
    finished_peers_.push_back(id);
}

void ServerApp::cleanup_threads() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lk(peer_threads_mutex_);
        for (u64 id : finished_peers_) {
            auto it = peer_threads_.find(id);
            if (it == peer_threads_.end()) continue;
            done.push_back(std::move(it->second));
            peer_threads_.erase(it);
        }
        finished_peers_.clear();
    }
    // A marked thread has at most its teardown left to run
    for (auto& t : done) {
        if (t.joinable()) t.join();
    }
}

int ServerApp::run() {
    start();
    wait();
    return 0;
}

void ServerApp::stop() {
    {
        // Under file_mutex_ so a peer between its predicate check and
        // its wait cannot miss the notify below
        std::lock_guard<std::mutex> lk(file_mutex_);
        if (!running_.exchange(false)) return;
    }
    LOG_INFO("Shutting down server");
    listen_sock_.close();
    peers_.close_all();
    file_cv_.notify_all();
}

void ServerApp::select_file(const std::string& path) {
    {
        std::lock_guard<std::mutex> lk(file_mutex_);
        file_path_ = path;
    }
    LOG_INFO("File selected: " + path);
    file_cv_.notify_all();
}

bool ServerApp::wait_for_file(std::string& path_out) {
    std::unique_lock<std::mutex> lk(file_mutex_);
    file_cv_.wait(lk, [this] { return !file_path_.empty() || !running_.load(); });
    if (!running_.load()) return false;
    path_out = file_path_;
    return true;
}

void ServerApp::emit(EventKind kind, const std::string& peer, const std::string& msg) {
    if (!events_) return;
    TransferEvent ev;
    ev.kind    = kind;
    ev.peer    = peer;
    ev.message = msg;
    events_->push(std::move(ev));
}

// ---------------------------------------------------------------
// accept_loop
//   Pure accept() loop: register the socket, spawn its transfer
//   thread, go back to accept().
// ---------------------------------------------------------------
void ServerApp::accept_loop() {
    int accepted = 0;
    while (running_.load()) {
        std::shared_ptr<TcpSocket> sock;
        try {
            sock = std::make_shared<TcpSocket>(listen_sock_.accept());
        } catch (const std::exception& e) {
            if (!running_.load()) break;
            LOG_ERROR("Error accepting connection: " + std::string(e.what()));
            // Avoid spinning on a persistent error (e.g. EMFILE)
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }

        cleanup_threads();

        std::string addr = sock->peer_addr();
        u64 id = peers_.add(sock, addr);
        LOG_INFO("Accepted connection from " + addr);
        emit(EventKind::CONNECTED, addr, "connected");

        {
            std::lock_guard<std::mutex> lk(peer_threads_mutex_);
            peer_threads_.emplace(id, std::thread(
                [this, id, sock, addr]() { serve_peer(id, sock, addr); }));
        }

        ++accepted;
        if (config_.max_clients > 0 && accepted >= config_.max_clients) {
            LOG_INFO("Client limit reached; no longer accepting connections");
            break;
        }
    }
}

// ---------------------------------------------------------------
// serve_peer
// ---------------------------------------------------------------
void ServerApp::serve_peer(u64 id, std::shared_ptr<TcpSocket> sock, std::string addr) {
    std::string path;
    if (!wait_for_file(path)) {
        mark_finished(id);
        peers_.remove(id);
        sock->close();
        emit(EventKind::DISCONNECTED, addr, "server stopped");
        return;
    }

    const std::string name = fs::path(path).filename().string();
    u64 size = 0;

    // Tracks bytes on the wire; forwards only percent changes since
    // send() reports after every chunk
    u64 sent = 0;
    int last_pct = -1;
    ProgressFn sink;
    if (events_) sink = events_->progress_sink(addr);
    ProgressFn on_progress = [&sent, &last_pct, sink](int pct, u64 done, u64 total) {
        sent = done;
        if (!sink || pct == last_pct) return;
        last_pct = pct;
        sink(pct, done, total);
    };

    try {
        file_io::FileReader reader(path);
        size = reader.size();
        TransferHeader hdr = proto::make_header(name, size);

        LOG_INFO("Sending '" + name + "' (" + utils::format_bytes(size) + ") to " + addr);
        SendResult res = engine_.send(*sock, hdr, reader, on_progress);

        if (res.complete) {
            history_.record(HistoryRecord::complete(name, addr, res.bytes_sent, path));
            LOG_INFO("File '" + name + "' sent successfully to " + addr);
        } else {
            history_.record(HistoryRecord::incomplete(name, addr, res.bytes_sent, size,
                                                      "source file ended early", path));
        }
    } catch (const TransportError& e) {
        // Peer went away mid-transfer
        std::string msg = e.what();
        Logger::get().transfer_error("Error sending '" + name + "' to " + addr + ": " + msg);
        history_.record(HistoryRecord::incomplete(name, addr, sent, size, msg, path));
        emit(EventKind::ERROR_MSG, addr, msg);
    } catch (const std::exception& e) {
        std::string msg = e.what();
        Logger::get().transfer_error("Error sending '" + name + "' to " + addr + ": " + msg);
        history_.record(HistoryRecord::failed(name, addr, size, msg, path));
        emit(EventKind::ERROR_MSG, addr, msg);
    }

    mark_finished(id);
    peers_.remove(id);
    sock->close();
    LOG_INFO("Client " + addr + " disconnected");
    emit(EventKind::DISCONNECTED, addr, "disconnected");
}
