#pragma once

#include "error.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// One blocking TCP stream. Closed on destruction.
class TcpConnection {
public:
    TcpConnection() = default;
    ~TcpConnection();

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;
    TcpConnection(TcpConnection&& other) noexcept;
    TcpConnection& operator=(TcpConnection&& other) noexcept;

    // Resolves host (IPv4, IPv6 or name) and connects to the first address
    // that accepts. Failure is a ConnectionError.
    static Result<TcpConnection> open(const std::string& host, uint16_t port);

    Result<void> send_all(std::string_view data);

    // Half-close: no more data will be written on this connection.
    Result<void> shutdown_write();

    // One recv() of at most max_bytes. Returns 0 bytes once the peer closed.
    Result<size_t> recv_some(char* buf, size_t max_bytes);

    // True if the peer has closed its write side and nothing is left to read.
    // Never blocks.
    bool peer_closed();

    void close();
    bool is_open() const { return fd_ >= 0; }

private:
    explicit TcpConnection(int fd) : fd_(fd) {}

    int fd_ = -1;
};
