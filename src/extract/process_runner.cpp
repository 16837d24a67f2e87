#include "extract/process_runner.hpp"

#include "io/fd.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace driverfetch {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void ExecChild(const std::vector<char*>& args, int err_fd) {
    const int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::dup2(devnull, STDOUT_FILENO);
        ::dup2(devnull, STDERR_FILENO);
        if (devnull > STDERR_FILENO) ::close(devnull);
    }

    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGTERM, SIG_DFL);

    ::execv(args[0], args.data());

    const int err = errno;
    ssize_t n = ::write(err_fd, &err, sizeof(err));
    (void)n;
    ::_exit(127);
}

void KillAndReap(pid_t pid) {
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
}

} // namespace

std::string JoinCommandLine(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out.push_back(' ');
        out += a;
    }
    return out;
}

std::shared_ptr<const IProcessRunner> PosixProcessRunner::Default() {
    static const std::shared_ptr<const IProcessRunner> kDefault = std::make_shared<PosixProcessRunner>();
    return kDefault;
}

Result PosixProcessRunner::Run(const std::vector<std::string>& argv,
                               std::chrono::seconds timeout,
                               int& exit_code) const {
    exit_code = -1;
    if (argv.empty()) return Result::Fail(EINVAL, "empty command line");

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    // Reports exec failures; closed by exec on success.
    int pipe_fds[2];
    if (::pipe2(pipe_fds, O_CLOEXEC) != 0) {
        return Result::Fail(errno, std::string("pipe2 failed: ") + std::strerror(errno));
    }
    Fd err_read(pipe_fds[0]);
    Fd err_write(pipe_fds[1]);

    LogDebug("exec: %s", JoinCommandLine(argv).c_str());

    const pid_t pid = ::fork();
    if (pid < 0) {
        return Result::Fail(errno, std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        ExecChild(args, err_write.Get());
    }

    err_write.Close();

    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(err_read.Get(), &exec_errno, sizeof(exec_errno));
    } while (n == -1 && errno == EINTR && !CancelRequested());
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        return Result::Fail(exec_errno, "cannot run " + argv[0] + ": " + std::strerror(exec_errno));
    }

    // Saturated: a timeout past the clock's range means no deadline.
    const auto now = std::chrono::steady_clock::now();
    const auto headroom =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::time_point::max() - now);
    std::chrono::steady_clock::time_point deadline = now;
    if (timeout >= headroom) {
        deadline = std::chrono::steady_clock::time_point::max();
    } else if (timeout > std::chrono::seconds::zero()) {
        deadline = now + timeout;
    }
    while (true) {
        int status = 0;
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            if (WIFEXITED(status)) {
                exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                exit_code = 128 + WTERMSIG(status);
            }
            LogDebug("exit %d: %s", exit_code, argv[0].c_str());
            return Result::Ok();
        }
        if (r == -1 && errno != EINTR) {
            const int err = errno;
            return Result::Fail(err, std::string("waitpid failed: ") + std::strerror(err));
        }

        if (CancelRequested()) {
            KillAndReap(pid);
            return Result::Fail(kErrCancelled, "interrupted");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            KillAndReap(pid);
            return Result::Fail(ETIMEDOUT,
                                argv[0] + " timed out after " + std::to_string(timeout.count()) + "s");
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

} // namespace driverfetch
