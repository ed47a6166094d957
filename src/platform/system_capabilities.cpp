#include "system_capabilities.h"
#include "process.h"

namespace textexpander {

SystemCapabilities::SystemCapabilities(const std::string& clipboardCommand,
                                       std::chrono::milliseconds clipboardTimeout)
    : clipboardCommand_(clipboardCommand)
    , clipboardTimeout_(clipboardTimeout) {
}

Timestamp SystemCapabilities::currentTime() {
    return std::chrono::system_clock::now();
}

CommandResult SystemCapabilities::runCommand(const std::string& cmd, std::chrono::milliseconds timeout) {
    return ProcessRunner::runShell(cmd, timeout);
}

ClipboardResult SystemCapabilities::readClipboard() {
    if (clipboardCommand_.empty()) {
        return ClipboardResult::Unavailable("no clipboard command configured");
    }

    CommandResult result = ProcessRunner::runShell(clipboardCommand_, clipboardTimeout_);
    switch (result.status) {
        case CommandStatus::Success:
            return ClipboardResult::Text(result.output);
        case CommandStatus::NonZeroExit:
            // wl-paste exits non-zero when nothing has been copied
            return ClipboardResult::Unavailable(clipboardCommand_ + " exited with status " +
                                                std::to_string(result.exitStatus));
        case CommandStatus::TimedOut:
            return ClipboardResult::Unavailable(clipboardCommand_ + " timed out");
        case CommandStatus::SpawnFailed:
            return ClipboardResult::Unavailable(result.message);
    }
    return ClipboardResult::Unavailable("unknown clipboard failure");
}

} // namespace textexpander
