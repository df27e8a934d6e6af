#pragma once

#include "error.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Successful solve. Fields the server did not send stay empty.
struct SolverStatus {
    std::string exit_status;
    std::optional<uint64_t> num_outer_iterations;
    std::optional<uint64_t> num_inner_iterations;
    std::optional<double> last_problem_norm_fpr;
    std::optional<double> f1_infeasibility;
    std::optional<double> delta_y_norm_over_c;
    std::optional<double> f2_norm;
    std::optional<double> solve_time_ms;
    std::optional<double> penalty;
    std::vector<double> solution;
    std::vector<double> lagrange_multipliers;
    std::optional<double> cost;
};

// Server-side failure, sent as {"type":"Error","code":..,"message":..}.
struct SolverError {
    int code = 0;
    std::string message;
};

class SolverResponse {
public:
    // Wraps a decoded Run reply. Fails with ProtocolError if the document is
    // not an object or a known field has the wrong type.
    static Result<SolverResponse> from_json(nlohmann::json doc);

    bool is_ok() const { return std::holds_alternative<SolverStatus>(value_); }

    // Precondition: is_ok() / !is_ok() respectively.
    const SolverStatus& status() const { return std::get<SolverStatus>(value_); }
    const SolverError& error() const { return std::get<SolverError>(value_); }

    const std::variant<SolverStatus, SolverError>& get() const { return value_; }

    // The full top-level document as received.
    const nlohmann::json& raw() const { return raw_; }

private:
    SolverResponse(nlohmann::json raw, std::variant<SolverStatus, SolverError> value)
        : raw_(std::move(raw)), value_(std::move(value)) {}

    nlohmann::json raw_;
    std::variant<SolverStatus, SolverError> value_;
};
