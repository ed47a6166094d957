#include "output_sink.h"
#include "process.h"
#include "../utils/log.h"
#include "../utils/utf8.h"
#include <cstdlib>

namespace textexpander {

namespace {

const char kDefaultWaylandDisplay[] = "wayland-1";

std::string envOrEmpty(const char* name) {
    const char* value = std::getenv(name);
    return value ? value : std::string();
}

} // namespace

SessionEnvironment SessionEnvironment::fromEnvironment() {
    SessionEnvironment env;
    env.sudoUser = envOrEmpty("SUDO_USER");
    env.sudoUid = envOrEmpty("SUDO_UID");
    env.runtimeDir = envOrEmpty("XDG_RUNTIME_DIR");
    env.waylandDisplay = envOrEmpty("WAYLAND_DISPLAY");
    return env;
}

std::vector<std::pair<std::string, std::string>> SessionEnvironment::sessionVariables() const {
    std::string runtime = runtimeDir;
    if (runtime.empty()) {
        runtime = "/run/user/" + (sudoUid.empty() ? std::string("1000") : sudoUid);
    }
    std::string display = waylandDisplay.empty() ? kDefaultWaylandDisplay : waylandDisplay;

    return {
        {"XDG_RUNTIME_DIR", runtime},
        {"WAYLAND_DISPLAY", display},
        {"USER", sudoUser},
    };
}

WtypeSink::WtypeSink(const SessionEnvironment& session, std::chrono::milliseconds timeout)
    : session_(session)
    , timeout_(timeout) {
}

std::vector<std::string> WtypeSink::buildCommand(const Instruction& instruction,
                                                 const SessionEnvironment& session) {
    std::vector<std::string> argv;
    if (!instruction.isEdit() || (instruction.deleteCount == 0 && instruction.insertText.empty())) {
        return argv;
    }

    // Root cannot reach the user's compositor; run wtype as the user
    if (session.underSudo()) {
        argv = {"sudo", "-u", session.sudoUser, "env"};
        for (const auto& var : session.sessionVariables()) {
            argv.push_back(var.first + "=" + var.second);
        }
    }

    argv.push_back("wtype");
    for (size_t i = 0; i < instruction.deleteCount; ++i) {
        argv.push_back("-k");
        argv.push_back("BackSpace");
    }
    if (!instruction.insertText.empty()) {
        argv.push_back("--");
        argv.push_back(instruction.insertText);
    }
    return argv;
}

Result WtypeSink::apply(const Instruction& instruction) {
    std::vector<std::string> argv = buildCommand(instruction, session_);
    if (argv.empty()) {
        return Result::Success;
    }

    CommandResult result = ProcessRunner::run(argv, timeout_);
    if (!result.ok()) {
        std::string reason = result.message.empty()
            ? "exit status " + std::to_string(result.exitStatus)
            : result.message;
        utils::errorLog("wtype failed: " + reason);
        return Result::ErrorInjection;
    }

    utils::debugLog("Typed " + std::to_string(instruction.deleteCount) + " backspaces and " +
                    std::to_string(utils::utf8CharCount(instruction.insertText)) + " characters");
    return Result::Success;
}

StdoutSink::StdoutSink(std::ostream& stream)
    : stream_(stream) {
}

std::string StdoutSink::format(const Instruction& instruction) {
    return "EDIT " + std::to_string(instruction.deleteCount) + " \"" +
           utils::escapeForDisplay(instruction.insertText) + "\"";
}

Result StdoutSink::apply(const Instruction& instruction) {
    if (!instruction.isEdit()) {
        return Result::Success;
    }
    stream_ << format(instruction) << std::endl;
    return stream_ ? Result::Success : Result::ErrorInjection;
}

} // namespace textexpander
