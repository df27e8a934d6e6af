#include "optimizer_client.hpp"

#include "platform/linux/fork_exec_launcher.hpp"

#include <format>
#include <thread>

static ClientOptions with_defaults(ClientOptions options) {
    if (!options.launcher) options.launcher = std::make_shared<ForkExecLauncher>();
    if (!options.diagnostics) options.diagnostics = stderr_sink();
    return options;
}

Result<OptimizerClient> OptimizerClient::create(const ConnectionRequest& request,
                                                ClientOptions options) {
    options = with_defaults(std::move(options));

    if (options.verbose && request.optimizer_path) {
        options.diagnostics("loading TCP/IP details from " + request.optimizer_path->string());
    }

    auto res = resolve_connection(request, options.toolchain_version);
    if (!res) return std::unexpected(res.error());

    if (res->version_warning) {
        options.diagnostics("warning: " + *res->version_warning);
    }

    return OptimizerClient(std::move(res->details), std::move(res->version_warning),
                           std::move(options));
}

OptimizerClient::OptimizerClient(ConnectionDetails details,
                                 std::optional<std::string> version_warning,
                                 ClientOptions options)
    : details_(std::move(details)),
      version_warning_(std::move(version_warning)),
      options_(std::move(options)),
      transport_(details_.host, details_.port, options_.retry, options_.framing,
                 options_.diagnostics),
      supervisor_(options_.launcher, options_.diagnostics, options_.verbose) {
    log(std::format("TCP/IP details: {}:{}", details_.host, details_.port));
}

Result<void> OptimizerClient::start() {
    auto* local = details_.local();
    if (!local) {
        return make_error(ErrorKind::Usage,
                          "no local launch configuration: cannot start a remote server");
    }
    if (state_ == ClientState::Running) {
        return make_error(ErrorKind::Usage, "server already started by this client");
    }
    if (state_ == ClientState::Stopped) {
        return make_error(ErrorKind::Usage, "client is stopped; create a new client to restart");
    }

    if (transport_.port_in_use()) {
        return make_error(ErrorKind::PortUnavailable,
                          std::format("port {} not available", details_.port));
    }

    log(std::format("starting TCP/IP server at {}:{} (in a detached thread)",
                    details_.host, details_.port));

    auto spawned = supervisor_.launch(build_launch_spec(*local, options_.launch_command));
    if (auto r = spawned.get(); !r) {
        return std::unexpected(r.error());
    }

    log("waiting for server to start");
    std::this_thread::sleep_for(options_.settle_delay);

    auto ack = ping();
    if (!ack) return std::unexpected(ack.error());

    state_ = ClientState::Running;
    return {};
}

Result<nlohmann::json> OptimizerClient::ping() {
    auto resp = transport_.transact(codec::encode_ping());
    if (!resp) return std::unexpected(resp.error());
    if (!resp->complete) {
        return make_error(ErrorKind::Protocol,
                          std::format("ping response incomplete: read cap of {} reads reached after {} bytes",
                                      resp->rounds, resp->data.size()));
    }
    return codec::decode(resp->data);
}

Result<SolverResponse> OptimizerClient::call(std::vector<double> parameters,
                                             const CallOptions& opts) {
    RunRequest request{
        .parameter = std::move(parameters),
        .initial_guess = opts.initial_guess,
        .initial_lagrange_multipliers = opts.initial_y,
        .initial_penalty = opts.initial_penalty,
    };

    auto payload = codec::encode_run(request);
    if (!payload) return std::unexpected(payload.error());

    log("sending request to TCP/IP server");
    auto resp = transport_.transact(*payload, ReadLimits{
        .buffer_size = opts.buffer_len,
        .max_size = opts.max_data_size,
    });
    if (!resp) return std::unexpected(resp.error());

    if (!resp->complete) {
        return make_error(ErrorKind::Protocol,
                          std::format("response incomplete: read cap of {} reads reached after {} bytes "
                                      "(buffer_len {}, max_data_size {})",
                                      resp->rounds, resp->data.size(),
                                      opts.buffer_len, opts.max_data_size));
    }

    auto doc = codec::decode(resp->data);
    if (!doc) return std::unexpected(doc.error());
    return SolverResponse::from_json(std::move(*doc));
}

Result<void> OptimizerClient::kill() {
    log("killing server");
    auto resp = transport_.transact(codec::encode_kill());
    if (!resp) return std::unexpected(resp.error());
    state_ = ClientState::Stopped;
    return {};
}

void OptimizerClient::log(const std::string& msg) {
    if (options_.verbose) options_.diagnostics(msg);
}
