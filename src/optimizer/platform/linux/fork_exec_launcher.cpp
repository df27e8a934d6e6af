#include "platform/linux/fork_exec_launcher.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// Child-side failure report: which step failed and its errno.
struct ExecFailure {
    int step; // 0 = chdir, 1 = exec
    int err;
};

} // namespace

Result<pid_t> ForkExecLauncher::spawn(const LaunchSpec& spec) {
    if (spec.argv.empty()) {
        return make_error(ErrorKind::Launch, "empty launch command");
    }

    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (auto& a : spec.argv) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    std::string cwd = spec.working_dir.string();

    // The write end is close-on-exec: a successful exec closes it and the
    // parent reads EOF, a failed chdir/exec writes an ExecFailure first.
    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) < 0) {
        return make_error(ErrorKind::Launch, std::string("pipe2() failed: ") + std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return make_error(ErrorKind::Launch, std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::close(pipefd[0]);
        ExecFailure failure{};
        if (!cwd.empty() && ::chdir(cwd.c_str()) < 0) {
            failure = {0, errno};
        } else {
            ::execvp(argv[0], argv.data());
            failure = {1, errno};
        }
        [[maybe_unused]] auto n = ::write(pipefd[1], &failure, sizeof(failure));
        ::_exit(127);
    }

    ::close(pipefd[1]);
    ExecFailure failure{};
    ssize_t n;
    while ((n = ::read(pipefd[0], &failure, sizeof(failure))) < 0 && errno == EINTR) {}
    ::close(pipefd[0]);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
        if (failure.step == 0) {
            return make_error(ErrorKind::Launch,
                              std::format("cannot enter {}: {}", cwd, std::strerror(failure.err)));
        }
        return make_error(ErrorKind::Launch,
                          std::format("cannot execute {}: {}", spec.argv[0], std::strerror(failure.err)));
    }

    return pid;
}

int ForkExecLauncher::wait(pid_t pid) {
    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}
