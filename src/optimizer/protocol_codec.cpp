#include "protocol_codec.hpp"

#include <cmath>
#include <format>

// ordered_json keeps fields in insertion order on the wire.
using ordered_json = nlohmann::ordered_json;

namespace codec {

namespace {

Result<ordered_json> to_array(const char* field, const std::vector<double>& values) {
    ordered_json arr = ordered_json::array();
    for (size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) {
            return make_error(ErrorKind::Usage,
                              std::format("{}[{}] is not a finite number", field, i));
        }
        arr.push_back(values[i]);
    }
    return arr;
}

} // namespace

std::string encode_ping() {
    return ordered_json{{"Ping", 1}}.dump();
}

std::string encode_kill() {
    return ordered_json{{"Kill", 1}}.dump();
}

Result<std::string> encode_run(const RunRequest& request) {
    if (request.parameter.empty()) {
        return make_error(ErrorKind::Usage, "parameter vector must not be empty");
    }

    ordered_json run = ordered_json::object();

    auto param = to_array("parameter", request.parameter);
    if (!param) return std::unexpected(param.error());
    run["parameter"] = std::move(*param);

    if (request.initial_guess) {
        auto guess = to_array("initial_guess", *request.initial_guess);
        if (!guess) return std::unexpected(guess.error());
        run["initial_guess"] = std::move(*guess);
    }

    if (request.initial_lagrange_multipliers) {
        auto y = to_array("initial_lagrange_multipliers", *request.initial_lagrange_multipliers);
        if (!y) return std::unexpected(y.error());
        run["initial_lagrange_multipliers"] = std::move(*y);
    }

    if (request.initial_penalty) {
        if (!std::isfinite(*request.initial_penalty)) {
            return make_error(ErrorKind::Usage, "initial_penalty is not a finite number");
        }
        run["initial_penalty"] = *request.initial_penalty;
    }

    ordered_json msg = ordered_json::object();
    msg["Run"] = std::move(run);
    return msg.dump();
}

Result<nlohmann::json> decode(std::string_view data) {
    if (data.empty()) {
        return make_error(ErrorKind::Protocol, "empty response");
    }
    try {
        return nlohmann::json::parse(data);
    } catch (const nlohmann::json::exception& e) {
        return make_error(ErrorKind::Protocol, std::string("malformed response: ") + e.what());
    }
}

} // namespace codec
