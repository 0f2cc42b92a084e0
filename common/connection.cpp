// ============================================================
// connection.cpp
// ============================================================

#include "connection.hpp"
#include "errors.hpp"
#include "logger.hpp"

ConnectionManager::ConnectionManager(Endpoint ep)
    : endpoint_(std::move(ep))
{}

ConnectionManager::~ConnectionManager() {
    close();
}

std::unique_ptr<Stream> ConnectionManager::dial(const Endpoint& ep) {
    auto sock = std::make_unique<TcpSocket>();
    sock->connect(ep.ip, ep.port);
    if (recv_timeout_ms_ > 0) sock->set_recv_timeout_ms(recv_timeout_ms_);
    return sock;
}

Stream& ConnectionManager::open() {
    close();

    std::unique_ptr<Stream> s;
    try {
        s = dial(endpoint_);
    } catch (const ConnectError& e) {
        LOG_ERROR("Failed to connect to " + endpoint_.str() + ": " + e.what());
        throw;
    }
    if (!s) {
        throw ConnectError("Failed to connect to " + endpoint_.str());
    }

    std::lock_guard<std::mutex> lk(mutex_);
    stream_ = std::move(s);
    open_   = true;
    LOG_INFO("Connected to server at " + endpoint_.str() +
             " (local " + stream_->local_addr() + ")");
    return *stream_;
}

void ConnectionManager::close() noexcept {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!open_) return;
    open_ = false;
    // The Stream object stays alive until the next open() or destruction,
    // so a transfer thread still holding a reference sees a closed socket
    // instead of freed memory.
    try {
        stream_->close();
    } catch (const std::exception& e) {
        LOG_DEBUG(std::string("close: ") + e.what());
    }
    LOG_INFO("Disconnected from " + endpoint_.str());
}

bool ConnectionManager::is_open() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return open_;
}

Stream* ConnectionManager::stream() {
    std::lock_guard<std::mutex> lk(mutex_);
    return open_ ? stream_.get() : nullptr;
}

std::string ConnectionManager::local_addr() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return open_ ? stream_->local_addr() : "unknown";
}

std::string ConnectionManager::peer_addr() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return open_ ? stream_->peer_addr() : endpoint_.str();
}
