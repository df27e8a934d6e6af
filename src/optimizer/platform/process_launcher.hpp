#pragma once

#include "error.hpp"

#include <filesystem>
#include <string>
#include <sys/types.h>
#include <vector>

struct LaunchSpec {
    std::vector<std::string> argv;
    std::filesystem::path working_dir;
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // Starts the child. Returns once it is known whether exec succeeded.
    virtual Result<pid_t> spawn(const LaunchSpec& spec) = 0;

    // Blocks until the child exits. Returns its exit code, or -1 if it did not
    // exit normally.
    virtual int wait(pid_t pid) = 0;
};
