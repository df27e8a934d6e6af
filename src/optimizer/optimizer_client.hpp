#pragma once

#include "connection_details.hpp"
#include "diagnostics.hpp"
#include "error.hpp"
#include "platform/process_launcher.hpp"
#include "process_supervisor.hpp"
#include "protocol_codec.hpp"
#include "retry.hpp"
#include "socket_transport.hpp"
#include "solver_response.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

enum class ClientState { Unstarted, Running, Stopped };

struct ClientOptions {
    RetryPolicy retry;
    std::chrono::milliseconds settle_delay{2000};
    std::vector<std::string> launch_command = {"cargo", "run", "-q"};
    // Generator version of the caller; compared against build.opengen_version.
    std::string toolchain_version;
    Framing framing = Framing::CloseDelimited;
    bool verbose = false;
    // nullptr: fork/exec.
    std::shared_ptr<ProcessLauncher> launcher;
    // nullptr: stderr.
    DiagnosticsSink diagnostics;
};

struct CallOptions {
    std::optional<std::vector<double>> initial_guess;
    std::optional<std::vector<double>> initial_y;
    std::optional<double> initial_penalty;
    size_t buffer_len = 4096;
    size_t max_data_size = 1048576;
};

// Client for the TCP interface of a generated parametric optimizer. Every
// operation runs over its own connection.
class OptimizerClient {
public:
    static Result<OptimizerClient> create(const ConnectionRequest& request, ClientOptions options = {});

    OptimizerClient(OptimizerClient&&) = default;
    OptimizerClient& operator=(OptimizerClient&&) = default;
    OptimizerClient(const OptimizerClient&) = delete;
    OptimizerClient& operator=(const OptimizerClient&) = delete;

    // Launches the local server and waits until it answers a ping.
    Result<void> start();

    Result<nlohmann::json> ping();

    Result<SolverResponse> call(std::vector<double> parameters, const CallOptions& opts = {});

    // Asks the server to shut down. Does not wait for the process to exit.
    Result<void> kill();

    ClientState state() const { return state_; }
    const ConnectionDetails& details() const { return details_; }
    const std::optional<std::string>& version_warning() const { return version_warning_; }

private:
    OptimizerClient(ConnectionDetails details, std::optional<std::string> version_warning,
                    ClientOptions options);

    void log(const std::string& msg);

    ConnectionDetails details_;
    std::optional<std::string> version_warning_;
    ClientOptions options_;
    SocketTransport transport_;
    ProcessSupervisor supervisor_;
    ClientState state_ = ClientState::Unstarted;
};
