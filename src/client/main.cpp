#include "cli_args.hpp"
#include "optimizer_client.hpp"

#include <cstdlib>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;
using cli::parse_double;
using cli::parse_size;
using cli::parse_vector;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} (--path DIR | --host HOST --port PORT) [options] <command> [p1,p2,...]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  ping                    Check that the server answers");
    std::println(stderr, "  start                   Launch the local server and wait for it");
    std::println(stderr, "  call P                  Solve for parameter vector P (comma separated)");
    std::println(stderr, "  run P                   start, call P, kill");
    std::println(stderr, "  kill                    Ask the server to shut down");
    std::println(stderr, "Options:");
    std::println(stderr, "  --guess X               Initial guess (comma separated)");
    std::println(stderr, "  --y Y                   Initial Lagrange multipliers (comma separated)");
    std::println(stderr, "  --penalty C             Initial penalty");
    std::println(stderr, "  --buffer-len N          Read buffer size (default 4096)");
    std::println(stderr, "  --max-data-size N       Maximum response size (default 1048576)");
    std::println(stderr, "  --toolchain-version V   Warn if the server was generated by another version");
    std::println(stderr, "  -v, --verbose           Log progress to stderr");
}

static json status_to_json(const SolverResponse& resp) {
    if (!resp.is_ok()) {
        auto& e = resp.error();
        return {{"type", "Error"}, {"code", e.code}, {"message", e.message}};
    }
    return resp.raw();
}

static int fail(const Error& err) {
    std::println(stderr, "{}", format_error(err));
    return 1;
}

int main(int argc, char* argv[]) {
    ConnectionRequest request;
    ClientOptions options;
    CallOptions call_opts;
    std::string command;
    std::string params_arg;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--path" && has_value) {
            request.optimizer_path = argv[++i];
        } else if (arg == "--host" && has_value) {
            request.host = argv[++i];
        } else if (arg == "--port" && has_value) {
            auto port = parse_size(argv[++i]);
            if (!port || *port == 0 || *port > 65535) {
                std::println(stderr, "Invalid port: {}", argv[i]);
                return 1;
            }
            request.port = static_cast<uint16_t>(*port);
        } else if (arg == "--guess" && has_value) {
            call_opts.initial_guess = parse_vector(argv[++i]);
            if (!call_opts.initial_guess) {
                std::println(stderr, "Invalid --guess: {}", argv[i]);
                return 1;
            }
        } else if (arg == "--y" && has_value) {
            call_opts.initial_y = parse_vector(argv[++i]);
            if (!call_opts.initial_y) {
                std::println(stderr, "Invalid --y: {}", argv[i]);
                return 1;
            }
        } else if (arg == "--penalty" && has_value) {
            call_opts.initial_penalty = parse_double(argv[++i]);
            if (!call_opts.initial_penalty) {
                std::println(stderr, "Invalid --penalty: {}", argv[i]);
                return 1;
            }
        } else if (arg == "--buffer-len" && has_value) {
            auto n = parse_size(argv[++i]);
            if (!n) {
                std::println(stderr, "Invalid --buffer-len: {}", argv[i]);
                return 1;
            }
            call_opts.buffer_len = *n;
        } else if (arg == "--max-data-size" && has_value) {
            auto n = parse_size(argv[++i]);
            if (!n) {
                std::println(stderr, "Invalid --max-data-size: {}", argv[i]);
                return 1;
            }
            call_opts.max_data_size = *n;
        } else if (arg == "--toolchain-version" && has_value) {
            options.toolchain_version = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (command.empty()) {
            command = arg;
        } else if (params_arg.empty()) {
            params_arg = arg;
        } else {
            std::println(stderr, "Unexpected argument: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    if (command.empty()) {
        usage(argv[0]);
        return 1;
    }

    std::vector<double> params;
    if (command == "call" || command == "run") {
        auto p = parse_vector(params_arg);
        if (!p || p->empty()) {
            std::println(stderr, "{} needs a parameter vector, e.g. 1.0,2.0", command);
            return 1;
        }
        params = std::move(*p);
    }

    auto client = OptimizerClient::create(request, std::move(options));
    if (!client) return fail(client.error());

    if (command == "ping") {
        auto ack = client->ping();
        if (!ack) return fail(ack.error());
        std::println("{}", ack->dump());
    } else if (command == "start") {
        if (auto r = client->start(); !r) return fail(r.error());
        std::println("Server running at {}:{}", client->details().host, client->details().port);
    } else if (command == "call") {
        auto resp = client->call(params, call_opts);
        if (!resp) return fail(resp.error());
        std::println("{}", status_to_json(*resp).dump(2));
        if (!resp->is_ok()) return 1;
    } else if (command == "run") {
        if (auto r = client->start(); !r) return fail(r.error());
        auto resp = client->call(params, call_opts);
        auto killed = client->kill();
        if (!resp) return fail(resp.error());
        std::println("{}", status_to_json(*resp).dump(2));
        if (!killed) return fail(killed.error());
        if (!resp->is_ok()) return 1;
    } else if (command == "kill") {
        if (auto r = client->kill(); !r) return fail(r.error());
        std::println("OK");
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    return 0;
}
