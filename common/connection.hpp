#pragma once

// ============================================================
// connection.hpp -- Dial / re-dial / close one endpoint
// ============================================================

#include "platform.hpp"
#include "socket.hpp"
#include <memory>
#include <mutex>
#include <string>

struct Endpoint {
    std::string ip;
    u16         port{0};

    std::string str() const { return ip + ":" + std::to_string(port); }
};

// Owns the current stream to one endpoint. The endpoint is kept after a
// close so the retry loop can re-dial it.
class ConnectionManager {
public:
    explicit ConnectionManager(Endpoint ep);
    virtual ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Dial the endpoint, replacing (and closing) any previous stream.
    // Throws ConnectError.
    Stream& open();

    // Release the current stream. Idempotent, never throws; may be called
    // from another thread to cancel a transfer blocked on the stream.
    void close() noexcept;

    bool is_open() const;

    // Current stream; nullptr when closed
    Stream* stream();

    const Endpoint& endpoint() const { return endpoint_; }
    std::string local_addr() const;
    std::string peer_addr() const;

    // 0 = block forever (applied to every stream dialed afterwards)
    void set_recv_timeout_ms(int ms) { recv_timeout_ms_ = ms; }

protected:
    // Create a connected stream; overridden in tests
    virtual std::unique_ptr<Stream> dial(const Endpoint& ep);

private:
    Endpoint                endpoint_;
    int                     recv_timeout_ms_{0};
    mutable std::mutex      mutex_;
    std::unique_ptr<Stream> stream_;
    bool                    open_{false};
};
