// Stand-in for a generated tcp_iface_<name> server. Started from inside the
// tcp_iface_ directory, it reads ../optimizer.yml for its address and serves
// Ping, Run and Kill until killed.

#include "descriptor.hpp"
#include "stub_server.hpp"

#include <atomic>
#include <chrono>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <thread>

using json = nlohmann::json;

static std::string handle(const std::string& request, std::atomic<bool>& killed) {
    json req;
    try {
        req = json::parse(request);
    } catch (const json::exception& e) {
        return json{{"type", "Error"}, {"code", 1000}, {"message", e.what()}}.dump();
    }

    if (req.contains("Ping")) {
        return json{{"Pong", req["Ping"]}}.dump();
    }

    if (req.contains("Kill")) {
        killed = true;
        return {};
    }

    if (req.contains("Run")) {
        auto& run = req["Run"];
        auto p = run.value("parameter", std::vector<double>{});
        return json{
            {"exit_status", "Converged"},
            {"num_outer_iterations", 1},
            {"num_inner_iterations", 3},
            {"last_problem_norm_fpr", 1e-6},
            {"f1_infeasibility", 0.0},
            {"f2_norm", 0.0},
            {"solve_time_ms", 0.1},
            {"penalty", run.value("initial_penalty", 1.0)},
            {"solution", p},
            {"lagrange_multipliers", json::array()},
            {"cost", 0.0},
        }.dump();
    }

    return json{{"type", "Error"}, {"code", 1001}, {"message", "unknown request"}}.dump();
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg != "--release" && arg != "-q") {
            std::println(stderr, "stub: ignoring argument {}", arg);
        }
    }

    auto desc = OptimizerDescriptor::load("..");
    if (!desc) {
        std::println(stderr, "stub: {}", format_error(desc.error()));
        return 2;
    }

    std::atomic<bool> killed{false};
    StubServer server([&killed](const std::string& req) { return handle(req, killed); });
    if (!server.start(desc->tcp.ip, desc->tcp.port)) {
        std::println(stderr, "stub: cannot listen on {}:{}", desc->tcp.ip, desc->tcp.port);
        return 3;
    }

    while (!killed) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    server.stop();
    return 0;
}
