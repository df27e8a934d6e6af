#include "error.hpp"

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Config: return "ConfigError";
        case ErrorKind::PortUnavailable: return "PortUnavailableError";
        case ErrorKind::Connection: return "ConnectionError";
        case ErrorKind::Transport: return "TransportError";
        case ErrorKind::Protocol: return "ProtocolError";
        case ErrorKind::Usage: return "UsageError";
        case ErrorKind::Launch: return "LaunchError";
    }
    return "UnknownError";
}

std::string format_error(const Error& err) {
    return std::string(to_string(err.kind)) + ": " + err.message;
}
