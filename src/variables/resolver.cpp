#include <textexpander/variables.h>
#include <cstring>
#include <ctime>
#include <vector>

namespace textexpander {

namespace {

// Conversions accepted by glibc strftime
const char kDateConversions[] = "aAbBcCdDeFgGhHIjklmMnpPrRsStTuUVwWxXyYzZ%";
const char kDateFlags[] = "_-0^#";

constexpr size_t kInitialDateBuffer = 128;
constexpr size_t kMaxDateBuffer = 4096;

} // namespace

VariableResolver::VariableResolver(Capabilities& capabilities, std::chrono::milliseconds commandTimeout)
    : capabilities_(capabilities)
    , commandTimeout_(commandTimeout) {
}

ResolveResult VariableResolver::resolve(const VariableDef& var) {
    switch (var.kind) {
        case VariableKind::Echo:
            return resolveEcho(var);
        case VariableKind::Date:
            return resolveDate(var);
        case VariableKind::Shell:
            return resolveShell(var);
        case VariableKind::Clipboard:
            return resolveClipboard(var);
    }

    return ResolveResult::Failure(ResolveError::InvalidFormat, "unknown variable kind");
}

ResolveResult VariableResolver::resolveEcho(const VariableDef& var) {
    if (var.params.hasEcho) {
        return ResolveResult::Value(var.params.echo);
    }
    if (var.params.hasFormat) {
        return ResolveResult::Value(var.params.format);
    }
    return ResolveResult::Value(std::string());
}

ResolveResult VariableResolver::resolveDate(const VariableDef& var) {
    const std::string pattern = var.params.hasFormat ? var.params.format : kDefaultDateFormat;

    if (!isValidDateFormat(pattern)) {
        return ResolveResult::Failure(ResolveError::InvalidFormat,
                                      "invalid date format '" + pattern + "'");
    }
    if (pattern.empty()) {
        return ResolveResult::Value(std::string());
    }

    std::time_t seconds = std::chrono::system_clock::to_time_t(capabilities_.currentTime());
    std::tm local{};
    if (localtime_r(&seconds, &local) == nullptr) {
        return ResolveResult::Failure(ResolveError::InvalidFormat, "time is not representable");
    }

    // strftime returns 0 both for "too small" and for empty output
    for (size_t size = kInitialDateBuffer; size <= kMaxDateBuffer; size *= 2) {
        std::vector<char> buffer(size);
        size_t written = std::strftime(buffer.data(), buffer.size(), pattern.c_str(), &local);
        if (written > 0) {
            return ResolveResult::Value(std::string(buffer.data(), written));
        }
    }

    return ResolveResult::Failure(ResolveError::InvalidFormat,
                                  "date format '" + pattern + "' produced no output");
}

ResolveResult VariableResolver::resolveShell(const VariableDef& var) {
    if (!var.params.hasCmd || var.params.cmd.empty()) {
        return ResolveResult::CommandFailure(-1, false, "shell variable has no cmd");
    }

    CommandResult result = capabilities_.runCommand(var.params.cmd, commandTimeout_);

    switch (result.status) {
        case CommandStatus::Success:
            return ResolveResult::Value(trimTrailingWhitespace(result.output));
        case CommandStatus::NonZeroExit:
            return ResolveResult::CommandFailure(result.exitStatus, false,
                "command exited with status " + std::to_string(result.exitStatus));
        case CommandStatus::TimedOut:
            return ResolveResult::CommandFailure(-1, true,
                "command timed out after " + std::to_string(commandTimeout_.count()) + " ms");
        case CommandStatus::SpawnFailed:
            return ResolveResult::CommandFailure(-1, false, "command could not start: " + result.message);
    }

    return ResolveResult::CommandFailure(-1, false, "unknown command status");
}

ResolveResult VariableResolver::resolveClipboard(const VariableDef& var) {
    (void)var;

    ClipboardResult result = capabilities_.readClipboard();
    if (!result.available) {
        return ResolveResult::Failure(ResolveError::ClipboardUnavailable,
            result.message.empty() ? "clipboard unavailable" : result.message);
    }
    if (result.text.empty()) {
        return ResolveResult::Failure(ResolveError::ClipboardUnavailable, "clipboard is empty");
    }

    return ResolveResult::Value(result.text);
}

bool VariableResolver::isValidDateFormat(const std::string& pattern) {
    size_t i = 0;

    while (i < pattern.size()) {
        if (pattern[i] != '%') {
            i++;
            continue;
        }

        i++;
        // Optional flags, field width, then an E or O modifier
        while (i < pattern.size() && pattern[i] != '\0' && std::strchr(kDateFlags, pattern[i]) != nullptr) i++;
        while (i < pattern.size() && pattern[i] >= '0' && pattern[i] <= '9') i++;
        if (i < pattern.size() && (pattern[i] == 'E' || pattern[i] == 'O')) i++;

        if (i >= pattern.size()) {
            return false;  // Dangling '%'
        }
        if (pattern[i] == '\0' || std::strchr(kDateConversions, pattern[i]) == nullptr) {
            return false;
        }
        i++;
    }

    return true;
}

std::string VariableResolver::trimTrailingWhitespace(const std::string& text) {
    size_t end = text.find_last_not_of(" \t\r\n\f\v");
    if (end == std::string::npos) {
        return std::string();
    }
    return text.substr(0, end + 1);
}

} // namespace textexpander
