// ============================================================
// socket.cpp -- TcpSocket implementation
// ============================================================

#include "socket.hpp"
#include "errors.hpp"
#include <cstring>
#include <string>
#include <algorithm>
#include <climits>

// Buffer size for SO_SNDBUF / SO_RCVBUF = 256 KB
static constexpr int SOCKET_BUF_SIZE = 256 * 1024;

#ifdef _WIN32
using sock_len_t = int;
#else
using sock_len_t = socklen_t;
#endif

static std::string format_addr(const sockaddr_in& addr) {
    char buf[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf))) {
        return std::string(buf) + ":" + std::to_string(ntohs(addr.sin_port));
    }
    return "unknown";
}

TcpSocket::TcpSocket() {
    socket_t fd = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd == INVALID_SOCKET_VAL) {
        throw ConnectError("socket() failed: " + socket_error_str(last_socket_error()));
    }
    fd_.store(fd);
    apply_socket_opts();
}

TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {
    if (fd != INVALID_SOCKET_VAL) {
        apply_socket_opts();
    }
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept
    : fd_(o.fd_.exchange(INVALID_SOCKET_VAL)) {}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_.store(o.fd_.exchange(INVALID_SOCKET_VAL));
    }
    return *this;
}

void TcpSocket::apply_socket_opts() {
    int on = 1;
    setsockopt(fd_.load(), SOL_SOCKET, SO_REUSEADDR,
               reinterpret_cast<const char*>(&on), sizeof(on));
}

void TcpSocket::tune() {
    socket_t fd = fd_.load();
    int nodelay = 1;
    int keepalive = 1;
    int sndbuf = SOCKET_BUF_SIZE;
    int rcvbuf = SOCKET_BUF_SIZE;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY,  reinterpret_cast<const char*>(&nodelay),   sizeof(nodelay));
    setsockopt(fd, SOL_SOCKET,  SO_KEEPALIVE, reinterpret_cast<const char*>(&keepalive), sizeof(keepalive));
    setsockopt(fd, SOL_SOCKET,  SO_SNDBUF,    reinterpret_cast<const char*>(&sndbuf),    sizeof(sndbuf));
    setsockopt(fd, SOL_SOCKET,  SO_RCVBUF,    reinterpret_cast<const char*>(&rcvbuf),    sizeof(rcvbuf));
}

void TcpSocket::connect(const std::string& ip, u16 port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw ConnectError("Invalid IP address: " + ip);
    }
    if (::connect(fd_.load(), (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw ConnectError("connect() to " + ip + ":" + std::to_string(port) +
                           " failed: " + socket_error_str(last_socket_error()));
    }
    tune();
}

void TcpSocket::bind_and_listen(const std::string& ip, u16 port, int backlog) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid listen address: " + ip);
    }
    if (::bind(fd_.load(), (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("bind() failed: " + socket_error_str(last_socket_error()));
    }
    if (::listen(fd_.load(), backlog) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("listen() failed: " + socket_error_str(last_socket_error()));
    }
}

TcpSocket TcpSocket::accept() {
    sockaddr_in peer{};
    sock_len_t peer_len = sizeof(peer);
    socket_t client = ::accept(fd_.load(), (sockaddr*)&peer, &peer_len);
    if (client == INVALID_SOCKET_VAL) {
        throw TransportError("accept() failed: " + socket_error_str(last_socket_error()));
    }
    TcpSocket s(client);
    s.tune();
    return s;
}

size_t TcpSocket::read_some(void* buf, size_t len) {
    for (;;) {
        socket_t fd = fd_.load();
        if (fd == INVALID_SOCKET_VAL) {
            throw TransportError("recv() on closed socket");
        }
#ifdef _WIN32
        int received = ::recv(fd, static_cast<char*>(buf), (int)std::min(len, (size_t)INT_MAX), 0);
#else
        ssize_t received = ::recv(fd, buf, len, 0);
#endif
        if (received >= 0) return static_cast<size_t>(received);

        int err = last_socket_error();
        if (interrupted(err)) continue;
        if (would_block(err)) {
            throw TransportError("recv() timed out");
        }
        throw TransportError("recv() failed: " + socket_error_str(err));
    }
}

void TcpSocket::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
        socket_t fd = fd_.load();
        if (fd == INVALID_SOCKET_VAL) {
            throw TransportError("send() on closed socket");
        }
#ifdef _WIN32
        int sent = ::send(fd, p, (int)std::min(remaining, (size_t)INT_MAX), 0);
#else
        ssize_t sent = ::send(fd, p, remaining, MSG_NOSIGNAL);
#endif
        if (sent == 0) {
            throw TransportError("Connection closed during send");
        }
        if (sent < 0) {
            int err = last_socket_error();
            if (interrupted(err)) continue;
            throw TransportError("send() failed: " + socket_error_str(err));
        }
        p += sent;
        remaining -= static_cast<size_t>(sent);
    }
}

void TcpSocket::close() {
    socket_t fd = fd_.exchange(INVALID_SOCKET_VAL);
    if (fd != INVALID_SOCKET_VAL) {
        // shutdown() first so a thread blocked in recv/send/accept wakes up
        ::shutdown(fd, SHUTDOWN_BOTH);
        CLOSE_SOCKET(fd);
    }
}

std::string TcpSocket::peer_addr() const {
    sockaddr_in peer{};
    sock_len_t len = sizeof(peer);
    if (getpeername(fd_.load(), (sockaddr*)&peer, &len) == 0) {
        return format_addr(peer);
    }
    return "unknown";
}

std::string TcpSocket::local_addr() const {
    sockaddr_in self{};
    sock_len_t len = sizeof(self);
    if (getsockname(fd_.load(), (sockaddr*)&self, &len) == 0) {
        return format_addr(self);
    }
    return "unknown";
}

u16 TcpSocket::local_port() const {
    sockaddr_in self{};
    sock_len_t len = sizeof(self);
    if (getsockname(fd_.load(), (sockaddr*)&self, &len) == 0) {
        return ntohs(self.sin_port);
    }
    return 0;
}

void TcpSocket::set_recv_timeout_ms(int ms) {
#ifdef _WIN32
    DWORD timeout = (DWORD)ms;
    setsockopt(fd_.load(), SOL_SOCKET, SO_RCVTIMEO, (const char*)&timeout, sizeof(timeout));
#else
    struct timeval tv;
    tv.tv_sec  = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    setsockopt(fd_.load(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
#endif
}
