#include "diagnostics.hpp"

#include <print>

DiagnosticsSink stderr_sink() {
    return [](std::string_view msg) {
        std::println(stderr, "[optimizer-tcp] {}", msg);
    };
}
