#include "process_supervisor.hpp"

#include <format>
#include <thread>

LaunchSpec build_launch_spec(const LocalSource& local, const std::vector<std::string>& base_command) {
    LaunchSpec spec;
    spec.argv = base_command;
    if (local.build.build_mode == BuildMode::Release) {
        spec.argv.emplace_back("--release");
    }
    spec.working_dir = tcp_iface_directory(local);
    return spec;
}

ProcessSupervisor::ProcessSupervisor(std::shared_ptr<ProcessLauncher> launcher,
                                     DiagnosticsSink diagnostics, bool verbose)
    : launcher_(std::move(launcher)), diagnostics_(std::move(diagnostics)), verbose_(verbose) {}

std::future<Result<void>> ProcessSupervisor::launch(LaunchSpec spec) {
    std::promise<Result<void>> spawned;
    auto future = spawned.get_future();

    std::thread([launcher = launcher_, diagnostics = diagnostics_, verbose = verbose_,
                 spec = std::move(spec), spawned = std::move(spawned)]() mutable {
        auto pid = launcher->spawn(spec);
        if (!pid) {
            spawned.set_value(std::unexpected(pid.error()));
            return;
        }
        spawned.set_value({});

        if (verbose && diagnostics) {
            diagnostics(std::format("server process {} started in {}", *pid, spec.working_dir.string()));
        }

        int code = launcher->wait(*pid);
        if (code != 0 && diagnostics) {
            diagnostics(std::format("warning: server process {} exited with code {}", *pid, code));
        } else if (verbose && diagnostics) {
            diagnostics(std::format("server process {} exited", *pid));
        }
    }).detach();

    return future;
}
