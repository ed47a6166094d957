#include "process.h"
#include "../utils/log.h"
#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>

namespace textexpander {

namespace {

constexpr int kExitCommandNotFound = 127;
constexpr int kExitSignalBase = 128;
constexpr size_t kIoBufferSize = 4096;
constexpr std::chrono::milliseconds kReapInterval{5};

using Clock = std::chrono::steady_clock;

std::string errnoMessage(int error) {
    return std::system_error(error, std::generic_category()).what();
}

void closeIfOpen(int& fd) {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

int remainingMs(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

void killAndReap(pid_t pid) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

[[noreturn]] void execChild(const std::vector<char*>& args, int outputFd, int errorFd) {
    // Own process group so a timeout can kill grandchildren too
    ::setpgid(0, 0);

    int devNull = ::open("/dev/null", O_RDWR);
    if (devNull != -1) {
        ::dup2(devNull, STDIN_FILENO);
        ::dup2(devNull, STDERR_FILENO);
    }
    ::dup2(outputFd, STDOUT_FILENO);

    ::execvp(args[0], args.data());

    int error = errno;
    ssize_t ignored = ::write(errorFd, &error, sizeof(error));
    (void)ignored;
    _exit(kExitCommandNotFound);
}

} // namespace

int ProcessRunner::statusToExitCode(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return kExitSignalBase + WTERMSIG(status);
    }
    return kExitCommandNotFound;
}

CommandResult ProcessRunner::runShell(const std::string& cmd, std::chrono::milliseconds timeout) {
    return run({"sh", "-c", cmd}, timeout);
}

CommandResult ProcessRunner::run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        return CommandResult::SpawnFailed("empty command line");
    }

    // Built before fork: only async-signal-safe calls in the child
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    std::array<int, 2> outputPipe = {-1, -1};
    std::array<int, 2> errorPipe = {-1, -1};
    if (::pipe2(outputPipe.data(), O_CLOEXEC) != 0) {
        return CommandResult::SpawnFailed("pipe: " + errnoMessage(errno));
    }
    if (::pipe2(errorPipe.data(), O_CLOEXEC) != 0) {
        int error = errno;
        closeIfOpen(outputPipe[0]);
        closeIfOpen(outputPipe[1]);
        return CommandResult::SpawnFailed("pipe: " + errnoMessage(error));
    }

    const Clock::time_point deadline = Clock::now() + timeout;

    pid_t pid = ::fork();
    if (pid < 0) {
        int error = errno;
        closeIfOpen(outputPipe[0]);
        closeIfOpen(outputPipe[1]);
        closeIfOpen(errorPipe[0]);
        closeIfOpen(errorPipe[1]);
        return CommandResult::SpawnFailed("fork: " + errnoMessage(error));
    }

    if (pid == 0) {
        execChild(args, outputPipe[1], errorPipe[1]);
    }

    ::setpgid(pid, pid);
    closeIfOpen(outputPipe[1]);
    closeIfOpen(errorPipe[1]);

    // The error pipe closes on a successful exec, or carries errno
    int execError = 0;
    ssize_t got;
    do {
        got = ::read(errorPipe[0], &execError, sizeof(execError));
    } while (got < 0 && errno == EINTR);
    closeIfOpen(errorPipe[0]);

    if (got == static_cast<ssize_t>(sizeof(execError))) {
        closeIfOpen(outputPipe[0]);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        return CommandResult::SpawnFailed(argv[0] + ": " + errnoMessage(execError));
    }

    std::string output;
    std::array<char, kIoBufferSize> buffer{};
    bool timedOut = false;

    while (true) {
        int waitMs = remainingMs(deadline);
        if (waitMs == 0) {
            timedOut = true;
            break;
        }

        struct pollfd pfd = {outputPipe[0], POLLIN, 0};
        int ready = ::poll(&pfd, 1, waitMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            utils::warnLog("poll on child output failed: " + errnoMessage(errno));
            break;
        }
        if (ready == 0) {
            timedOut = true;
            break;
        }

        ssize_t bytesRead = ::read(outputPipe[0], buffer.data(), buffer.size());
        if (bytesRead < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            break;
        }
        if (bytesRead == 0) {
            break;  // EOF
        }
        if (output.size() < kMaxOutputBytes) {
            size_t room = kMaxOutputBytes - output.size();
            output.append(buffer.data(), std::min(room, static_cast<size_t>(bytesRead)));
        }
    }
    closeIfOpen(outputPipe[0]);

    if (timedOut) {
        killAndReap(pid);
        return CommandResult::TimedOut(output);
    }

    // stdout is closed but the child may still be running
    int status = 0;
    while (true) {
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            break;
        }
        if (done < 0 && errno != EINTR) {
            return CommandResult::SpawnFailed("waitpid: " + errnoMessage(errno));
        }
        if (remainingMs(deadline) == 0) {
            killAndReap(pid);
            return CommandResult::TimedOut(output);
        }
        std::this_thread::sleep_for(kReapInterval);
    }

    return CommandResult::Exited(statusToExitCode(status), output);
}

} // namespace textexpander
