#pragma once

#include "platform/process_launcher.hpp"

class ForkExecLauncher : public ProcessLauncher {
public:
    Result<pid_t> spawn(const LaunchSpec& spec) override;
    int wait(pid_t pid) override;
};
