#include "socket_transport.hpp"

#include "platform/linux/tcp_connection.hpp"

#include <format>
#include <vector>

SocketTransport::SocketTransport(std::string host, uint16_t port, RetryPolicy retry,
                                 Framing framing, DiagnosticsSink diagnostics)
    : host_(std::move(host)), port_(port), retry_(retry), framing_(framing),
      diagnostics_(std::move(diagnostics)) {}

Result<TransactResult> SocketTransport::transact(const std::string& payload,
                                                 const ReadLimits& limits) {
    if (limits.buffer_size == 0 || limits.max_size == 0) {
        return make_error(ErrorKind::Usage, "buffer size and max data size must be positive");
    }
    if (limits.read_buffer_size() > ReadLimits::MAX_BUFFER_SIZE) {
        return make_error(ErrorKind::Usage,
                          std::format("read buffer of {} bytes exceeds the {} byte limit",
                                      limits.read_buffer_size(), ReadLimits::MAX_BUFFER_SIZE));
    }

    auto conn = with_retry(retry_, [this] { return TcpConnection::open(host_, port_); });
    if (!conn) return std::unexpected(conn.error());

    std::string request = payload;
    if (framing_ == Framing::NewlineDelimited) request += '\n';

    if (auto sent = conn->send_all(request); !sent) return std::unexpected(sent.error());
    if (auto shut = conn->shutdown_write(); !shut) return std::unexpected(shut.error());

    TransactResult result;
    result.complete = false;
    std::vector<char> buf(limits.read_buffer_size());
    size_t max_rounds = limits.max_rounds();

    while (result.rounds < max_rounds) {
        auto n = conn->recv_some(buf.data(), buf.size());
        if (!n) return std::unexpected(n.error());
        ++result.rounds;

        if (*n == 0) {
            result.complete = true;
            break;
        }

        result.data.append(buf.data(), *n);

        if (framing_ == Framing::NewlineDelimited) {
            auto pos = result.data.find('\n');
            if (pos != std::string::npos) {
                result.data.resize(pos);
                result.complete = true;
                break;
            }
        }
    }

    if (!result.complete && conn->peer_closed()) {
        result.complete = true;
    }
    if (!result.complete && diagnostics_) {
        diagnostics_(std::format("warning: response from {}:{} truncated at {} bytes after {} reads",
                                 host_, port_, result.data.size(), result.rounds));
    }

    conn->close();
    return result;
}

bool SocketTransport::port_in_use() const {
    return TcpConnection::open(host_, port_).has_value();
}
