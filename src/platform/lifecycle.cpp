#include "lifecycle.h"
#include "../utils/log.h"
#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace textexpander {
namespace lifecycle {

namespace {

volatile sig_atomic_t g_stop = 0;
volatile sig_atomic_t g_reload = 0;

void onSignal(int sig) {
    if (sig == SIGHUP) {
        g_reload = 1;
    } else {
        g_stop = 1;
    }
}

Result install(int sig) {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = onSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    if (::sigaction(sig, &action, nullptr) != 0) {
        utils::errorLog(std::string("sigaction failed: ") + std::strerror(errno));
        return Result::ErrorProcess;
    }
    return Result::Success;
}

} // namespace

Result installSignalHandlers() {
    for (int sig : {SIGHUP, SIGINT, SIGTERM}) {
        Result result = install(sig);
        if (result != Result::Success) {
            return result;
        }
    }
    return Result::Success;
}

bool stopRequested() {
    return g_stop != 0;
}

bool consumeReloadRequest() {
    if (g_reload == 0) {
        return false;
    }
    g_reload = 0;
    return true;
}

Result daemonize() {
    pid_t pid = ::fork();
    if (pid < 0) {
        utils::errorLog(std::string("fork failed: ") + std::strerror(errno));
        return Result::ErrorProcess;
    }
    if (pid > 0) {
        _exit(EXIT_SUCCESS);
    }

    if (::setsid() < 0) {
        utils::errorLog(std::string("setsid failed: ") + std::strerror(errno));
        return Result::ErrorProcess;
    }

    // Second fork: never reacquire a controlling terminal
    pid = ::fork();
    if (pid < 0) {
        utils::errorLog(std::string("fork failed: ") + std::strerror(errno));
        return Result::ErrorProcess;
    }
    if (pid > 0) {
        _exit(EXIT_SUCCESS);
    }

    ::umask(022);
    if (::chdir("/") != 0) {
        utils::warnLog(std::string("chdir(\"/\") failed: ") + std::strerror(errno));
    }

    int devNull = ::open("/dev/null", O_RDWR);
    if (devNull < 0) {
        utils::errorLog(std::string("Cannot open /dev/null: ") + std::strerror(errno));
        return Result::ErrorProcess;
    }
    ::dup2(devNull, STDIN_FILENO);
    ::dup2(devNull, STDOUT_FILENO);
    ::dup2(devNull, STDERR_FILENO);
    if (devNull > STDERR_FILENO) {
        ::close(devNull);
    }

    return Result::Success;
}

} // namespace lifecycle
} // namespace textexpander
