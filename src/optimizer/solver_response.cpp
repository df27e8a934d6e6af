#include "solver_response.hpp"

using json = nlohmann::json;

namespace {

template <class T>
void read_optional(const json& j, const char* key, std::optional<T>& out) {
    if (j.contains(key) && !j[key].is_null()) out = j[key].get<T>();
}

template <class T>
void read_value(const json& j, const char* key, T& out) {
    if (j.contains(key) && !j[key].is_null()) out = j[key].get<T>();
}

} // namespace

Result<SolverResponse> SolverResponse::from_json(json doc) {
    if (!doc.is_object()) {
        return make_error(ErrorKind::Protocol, "solver response is not a JSON object");
    }

    try {
        if (doc.value("type", "") == "Error") {
            SolverError err;
            read_value(doc, "code", err.code);
            read_value(doc, "message", err.message);
            return SolverResponse(std::move(doc), std::move(err));
        }

        SolverStatus st;
        read_value(doc, "exit_status", st.exit_status);
        read_optional(doc, "num_outer_iterations", st.num_outer_iterations);
        read_optional(doc, "num_inner_iterations", st.num_inner_iterations);
        read_optional(doc, "last_problem_norm_fpr", st.last_problem_norm_fpr);
        read_optional(doc, "f1_infeasibility", st.f1_infeasibility);
        read_optional(doc, "delta_y_norm_over_c", st.delta_y_norm_over_c);
        read_optional(doc, "f2_norm", st.f2_norm);
        read_optional(doc, "solve_time_ms", st.solve_time_ms);
        read_optional(doc, "penalty", st.penalty);
        read_value(doc, "solution", st.solution);
        read_value(doc, "lagrange_multipliers", st.lagrange_multipliers);
        read_optional(doc, "cost", st.cost);
        return SolverResponse(std::move(doc), std::move(st));

    } catch (const json::exception& e) {
        return make_error(ErrorKind::Protocol, std::string("unexpected solver response: ") + e.what());
    }
}
