#include "platform/linux/tcp_connection.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

TcpConnection::~TcpConnection() {
    close();
}

TcpConnection::TcpConnection(TcpConnection&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

TcpConnection& TcpConnection::operator=(TcpConnection&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Result<TcpConnection> TcpConnection::open(const std::string& host, uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* addrs = nullptr;
    auto service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &addrs);
    if (rc != 0) {
        return make_error(ErrorKind::Connection,
                          std::format("cannot resolve {}: {}", host, ::gai_strerror(rc)));
    }

    std::string last_error = "no address";
    int fd = -1;
    for (addrinfo* ai = addrs; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;

        last_error = std::strerror(errno);
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(addrs);

    if (fd < 0) {
        return make_error(ErrorKind::Connection,
                          std::format("connect to {}:{} failed: {}", host, port, last_error));
    }
    return TcpConnection(fd);
}

Result<void> TcpConnection::send_all(std::string_view data) {
    if (fd_ < 0) return make_error(ErrorKind::Transport, "send on closed connection");

    size_t total = 0;
    while (total < data.size()) {
        ssize_t n = ::send(fd_, data.data() + total, data.size() - total, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_error(ErrorKind::Transport,
                              std::string("send() failed: ") + std::strerror(errno));
        }
        total += static_cast<size_t>(n);
    }
    return {};
}

Result<void> TcpConnection::shutdown_write() {
    if (fd_ < 0) return make_error(ErrorKind::Transport, "shutdown on closed connection");
    if (::shutdown(fd_, SHUT_WR) < 0) {
        return make_error(ErrorKind::Transport,
                          std::string("shutdown() failed: ") + std::strerror(errno));
    }
    return {};
}

Result<size_t> TcpConnection::recv_some(char* buf, size_t max_bytes) {
    if (fd_ < 0) return make_error(ErrorKind::Transport, "recv on closed connection");

    while (true) {
        ssize_t n = ::recv(fd_, buf, max_bytes, 0);
        if (n >= 0) return static_cast<size_t>(n);
        if (errno == EINTR) continue;
        return make_error(ErrorKind::Transport,
                          std::string("recv() failed: ") + std::strerror(errno));
    }
}

bool TcpConnection::peer_closed() {
    if (fd_ < 0) return true;
    char byte;
    ssize_t n = ::recv(fd_, &byte, 1, MSG_PEEK | MSG_DONTWAIT);
    return n == 0;
}

void TcpConnection::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}
