#pragma once

#include "connection_details.hpp"
#include "diagnostics.hpp"
#include "error.hpp"
#include "platform/process_launcher.hpp"

#include <future>
#include <memory>
#include <string>
#include <vector>

// base_command plus "--release" for release builds, run in the optimizer's
// tcp_iface_<name> directory.
LaunchSpec build_launch_spec(const LocalSource& local, const std::vector<std::string>& base_command);

class ProcessSupervisor {
public:
    ProcessSupervisor(std::shared_ptr<ProcessLauncher> launcher, DiagnosticsSink diagnostics,
                      bool verbose = false);

    // Spawns the child from a detached background thread. The future becomes
    // ready as soon as the spawn result is known; the thread then waits for
    // the child to exit and reports abnormal exits to the diagnostics sink.
    std::future<Result<void>> launch(LaunchSpec spec);

private:
    std::shared_ptr<ProcessLauncher> launcher_;
    DiagnosticsSink diagnostics_;
    bool verbose_;
};
