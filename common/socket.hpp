#pragma once

// ============================================================
// socket.hpp -- Byte stream interface + RAII TCP socket
// ============================================================

#include "platform.hpp"
#include <string>
#include <atomic>

// Connected duplex byte stream. The transfer engine only talks to this
// interface, so tests can feed it scripted data.
class Stream {
public:
    virtual ~Stream() = default;

    // Read up to 'len' bytes. Returns 0 when the peer closed the stream.
    // Throws TransportError on a socket failure.
    virtual size_t read_some(void* buf, size_t len) = 0;

    // Send exactly 'len' bytes; throws TransportError on error
    virtual void send_all(const void* buf, size_t len) = 0;

    // Release the descriptor. Idempotent; safe to call from another
    // thread to unblock a pending read or write.
    virtual void close() = 0;

    virtual std::string peer_addr() const = 0;
    virtual std::string local_addr() const { return "local"; }
};

class TcpSocket : public Stream {
public:
    TcpSocket();
    explicit TcpSocket(socket_t fd);
    ~TcpSocket() override;

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: connect to remote; throws ConnectError
    void connect(const std::string& ip, u16 port);

    // Server: bind + listen. Port 0 picks an ephemeral port (see local_port()).
    void bind_and_listen(const std::string& ip, u16 port, int backlog = 5);

    // Accept one connection (blocking); throws TransportError
    TcpSocket accept();

    size_t read_some(void* buf, size_t len) override;
    void send_all(const void* buf, size_t len) override;

    // Apply TCP tuning for bulk transfer
    void tune();

    bool is_valid() const { return fd_.load() != INVALID_SOCKET_VAL; }
    socket_t native() const { return fd_.load(); }

    void close() override;

    std::string peer_addr() const override;
    std::string local_addr() const override;
    u16 local_port() const;

    // Set receive timeout in milliseconds (0 = infinite)
    void set_recv_timeout_ms(int ms);

private:
    std::atomic<socket_t> fd_{INVALID_SOCKET_VAL};

    void apply_socket_opts();
};
