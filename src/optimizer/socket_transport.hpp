#pragma once

#include "diagnostics.hpp"
#include "error.hpp"
#include "retry.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>

enum class Framing {
    // End of message only when the peer closes (what generated servers speak).
    CloseDelimited,
    // Requests end with '\n'; a '\n' in the response also ends it.
    NewlineDelimited,
};

struct ReadLimits {
    // Largest single read buffer transact() will allocate.
    static constexpr size_t MAX_BUFFER_SIZE = size_t{64} << 20;

    size_t buffer_size = 4096;
    size_t max_size = 1048576;

    // ceil(max_size / buffer_size), without overflow. Precondition: buffer_size > 0.
    size_t max_rounds() const {
        return max_size / buffer_size + (max_size % buffer_size != 0 ? 1 : 0);
    }

    // A buffer larger than max_size could never be filled.
    size_t read_buffer_size() const { return std::min(buffer_size, max_size); }
};

struct TransactResult {
    std::string data;
    // False when the round cap was reached before the end of the message.
    bool complete = true;
    size_t rounds = 0;
};

// Runs transactions against one server: every transact() opens a fresh
// connection (with retry), writes, half-closes, reads and closes.
class SocketTransport {
public:
    SocketTransport(std::string host, uint16_t port, RetryPolicy retry,
                    Framing framing = Framing::CloseDelimited,
                    DiagnosticsSink diagnostics = stderr_sink());

    Result<TransactResult> transact(const std::string& payload, const ReadLimits& limits = {});

    // Single connect attempt, no retry.
    bool port_in_use() const;

    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }

private:
    std::string host_;
    uint16_t port_;
    RetryPolicy retry_;
    Framing framing_;
    DiagnosticsSink diagnostics_;
};
