#ifndef TEXTEXPANDER_CAPABILITIES_H
#define TEXTEXPANDER_CAPABILITIES_H

#include <chrono>
#include <string>

namespace textexpander {

using Timestamp = std::chrono::system_clock::time_point;

// Outcome of an external command
enum class CommandStatus {
    Success = 0,       // Exited with status 0
    NonZeroExit = 1,   // Exited with a non-zero status or was killed by a signal
    TimedOut = 2,      // Killed after the timeout elapsed
    SpawnFailed = 3    // Could not be started at all
};

struct CommandResult {
    CommandStatus status = CommandStatus::SpawnFailed;
    int exitStatus = -1;
    std::string output;     // Captured standard output
    std::string message;    // Human readable failure reason

    bool ok() const { return status == CommandStatus::Success; }

    static CommandResult Success(const std::string& out) {
        CommandResult result;
        result.status = CommandStatus::Success;
        result.exitStatus = 0;
        result.output = out;
        return result;
    }

    static CommandResult Exited(int status, const std::string& out) {
        CommandResult result;
        result.status = status == 0 ? CommandStatus::Success : CommandStatus::NonZeroExit;
        result.exitStatus = status;
        result.output = out;
        return result;
    }

    static CommandResult TimedOut(const std::string& out) {
        CommandResult result;
        result.status = CommandStatus::TimedOut;
        result.output = out;
        result.message = "timed out";
        return result;
    }

    static CommandResult SpawnFailed(const std::string& why) {
        CommandResult result;
        result.status = CommandStatus::SpawnFailed;
        result.message = why;
        return result;
    }
};

struct ClipboardResult {
    bool available = false;
    std::string text;
    std::string message;

    static ClipboardResult Text(const std::string& content) {
        ClipboardResult result;
        result.available = true;
        result.text = content;
        return result;
    }

    static ClipboardResult Unavailable(const std::string& why) {
        ClipboardResult result;
        result.message = why;
        return result;
    }
};

// The only points where variable resolution touches the outside world.
// Implementations may block; runCommand must honour the timeout.
class Capabilities {
public:
    virtual ~Capabilities() = default;

    virtual Timestamp currentTime() = 0;
    virtual CommandResult runCommand(const std::string& cmd, std::chrono::milliseconds timeout) = 0;
    virtual ClipboardResult readClipboard() = 0;
};

} // namespace textexpander

#endif // TEXTEXPANDER_CAPABILITIES_H
