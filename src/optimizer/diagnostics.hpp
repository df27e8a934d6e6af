#pragma once

#include <functional>
#include <string_view>

// Receives warnings and (when verbose) progress messages.
using DiagnosticsSink = std::function<void(std::string_view)>;

// Prints "[optimizer-tcp] <msg>" to stderr.
DiagnosticsSink stderr_sink();
