#pragma once

#include "error.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct RunRequest {
    std::vector<double> parameter;
    std::optional<std::vector<double>> initial_guess;
    std::optional<std::vector<double>> initial_lagrange_multipliers;
    std::optional<double> initial_penalty;
};

namespace codec {

// {"Ping":1}
std::string encode_ping();

// {"Kill":1}
std::string encode_kill();

// {"Run":{"parameter":[...], ...}} with the optional fields appended, when
// present, in the order initial_guess, initial_lagrange_multipliers,
// initial_penalty. Empty parameter or non-finite values are a UsageError.
Result<std::string> encode_run(const RunRequest& request);

// Parses one complete JSON document. Anything else is a ProtocolError.
Result<nlohmann::json> decode(std::string_view data);

} // namespace codec
