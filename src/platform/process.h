#ifndef TEXTEXPANDER_PROCESS_H
#define TEXTEXPANDER_PROCESS_H

#include <textexpander/capabilities.h>
#include <chrono>
#include <string>
#include <vector>

namespace textexpander {

// Runs external programs with captured stdout and a hard deadline.
// On timeout the whole process group is killed; the child is always reaped.
class ProcessRunner {
public:
    static constexpr size_t kMaxOutputBytes = 1024 * 1024;

    static CommandResult run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

    // sh -c cmd
    static CommandResult runShell(const std::string& cmd, std::chrono::milliseconds timeout);

    static int statusToExitCode(int status);
};

} // namespace textexpander

#endif // TEXTEXPANDER_PROCESS_H
