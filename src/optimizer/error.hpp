#pragma once

#include <expected>
#include <utility>
#include <string>
#include <string_view>

enum class ErrorKind {
    Config,          // bad/missing descriptor, ambiguous construction
    PortUnavailable, // target port already occupied at start()
    Connection,      // retry budget exhausted while connecting
    Transport,       // socket I/O failure mid-transaction
    Protocol,        // response is not a complete JSON document
    Usage,           // operation not allowed in the current state / bad arguments
    Launch,          // child process could not be spawned
};

struct Error {
    ErrorKind kind;
    std::string message;
};

template <class T>
using Result = std::expected<T, Error>;

std::string_view to_string(ErrorKind kind);

// "<KindName>: <message>"
std::string format_error(const Error& err);

inline std::unexpected<Error> make_error(ErrorKind kind, std::string message) {
    return std::unexpected(Error{kind, std::move(message)});
}
