#ifndef TEXTEXPANDER_TYPES_H
#define TEXTEXPANDER_TYPES_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Export macro for shared library builds
#define TEXTEXPANDER_API __attribute__((visibility("default")))

namespace textexpander {

// Error codes for the outer layers (loader, daemon, platform glue)
enum class Result {
    Success = 0,
    ErrorInvalidParameter = -1,
    ErrorFileNotFound = -2,
    ErrorInvalidFormat = -3,
    ErrorNoRules = -4,
    ErrorDeviceAccess = -5,
    ErrorInjection = -6,
    ErrorProcess = -7
};

// How overlapping triggers are resolved when one is a prefix of another
enum class MatchPolicy {
    PreferLongest,  // Hold a trigger while a longer one can still complete
    Immediate       // Fire the longest suffix match at once
};

// Variable kinds understood by the resolver
enum class VariableKind {
    Echo,
    Date,
    Shell,
    Clipboard
};

// Kind-specific parameters. Only the fields relevant to the kind are read.
struct VariableParams {
    std::string format;     // Date pattern, or Echo literal
    std::string echo;       // Echo literal (takes precedence over format)
    std::string cmd;        // Shell command line
    bool hasFormat = false;
    bool hasEcho = false;
    bool hasCmd = false;

    void setFormat(const std::string& value) { format = value; hasFormat = true; }
    void setEcho(const std::string& value) { echo = value; hasEcho = true; }
    void setCmd(const std::string& value) { cmd = value; hasCmd = true; }
};

// A named variable, either local to a rule or global
struct VariableDef {
    std::string name;
    VariableKind kind;
    VariableParams params;

    VariableDef() : kind(VariableKind::Echo) {}
    VariableDef(const std::string& n, VariableKind k) : name(n), kind(k) {}
    VariableDef(const std::string& n, VariableKind k, const VariableParams& p)
        : name(n), kind(k), params(p) {}

    static VariableDef Echo(const std::string& name, const std::string& text) {
        VariableDef def(name, VariableKind::Echo);
        def.params.setEcho(text);
        return def;
    }

    static VariableDef Date(const std::string& name, const std::string& format) {
        VariableDef def(name, VariableKind::Date);
        def.params.setFormat(format);
        return def;
    }

    static VariableDef Shell(const std::string& name, const std::string& cmd) {
        VariableDef def(name, VariableKind::Shell);
        def.params.setCmd(cmd);
        return def;
    }

    static VariableDef Clipboard(const std::string& name) {
        return VariableDef(name, VariableKind::Clipboard);
    }
};

// Global variables have the same shape, only their scope differs
using GlobalVar = VariableDef;

// One expansion rule: several triggers may share a template
struct Rule {
    std::vector<std::string> triggers;   // UTF-8, case-sensitive
    std::string replace;                 // Template with {{name}} placeholders
    std::vector<VariableDef> vars;       // Ordered, names unique within the rule

    Rule() = default;
    Rule(const std::string& trigger, const std::string& replacement)
        : triggers{trigger}, replace(replacement) {}
    Rule(const std::vector<std::string>& trigs, const std::string& replacement,
         const std::vector<VariableDef>& variables = {})
        : triggers(trigs), replace(replacement), vars(variables) {}

    const VariableDef* findVar(const std::string& name) const {
        for (const auto& var : vars) {
            if (var.name == name) return &var;
        }
        return nullptr;
    }
};

// Per-variable resolution failures (never fatal for an expansion)
enum class ResolveError {
    None = 0,
    InvalidFormat,
    CommandFailed,
    ClipboardUnavailable
};

struct ResolveResult {
    ResolveError error = ResolveError::None;
    std::string value;
    int exitStatus = 0;      // CommandFailed: child exit status, -1 if none
    bool timedOut = false;   // CommandFailed: killed after the timeout
    std::string message;

    bool ok() const { return error == ResolveError::None; }

    static ResolveResult Value(const std::string& text) {
        ResolveResult result;
        result.value = text;
        return result;
    }

    static ResolveResult Failure(ResolveError err, const std::string& why) {
        ResolveResult result;
        result.error = err;
        result.message = why;
        return result;
    }

    static ResolveResult CommandFailure(int status, bool timeout, const std::string& why) {
        ResolveResult result = Failure(ResolveError::CommandFailed, why);
        result.exitStatus = status;
        result.timedOut = timeout;
        return result;
    }
};

// Input event kinds consumed by the engine
enum class InputEventType {
    Character = 0,
    Reset = 1,
    Backspace = 2
};

struct InputEvent {
    InputEventType type;
    char32_t character;

    InputEvent() : type(InputEventType::Reset), character(0) {}
    InputEvent(InputEventType t, char32_t ch) : type(t), character(ch) {}

    static InputEvent Character(char32_t ch) { return InputEvent(InputEventType::Character, ch); }
    // typed is what the key itself put into the document (Enter, Tab), 0 if nothing
    static InputEvent Reset(char32_t typed = 0) { return InputEvent(InputEventType::Reset, typed); }
    static InputEvent Backspace() { return InputEvent(InputEventType::Backspace, 0); }
};

// Instruction for the output sink
enum class InstructionType {
    NoOp = 0,
    Edit = 1
};

struct Instruction {
    InstructionType type = InstructionType::NoOp;
    size_t deleteCount = 0;     // Code points to erase before the cursor
    std::string insertText;     // UTF-8 text to type afterwards

    Instruction() = default;

    bool isEdit() const { return type == InstructionType::Edit; }

    static Instruction NoOp() {
        return Instruction();
    }

    static Instruction Edit(size_t count, const std::string& text) {
        Instruction out;
        out.type = InstructionType::Edit;
        out.deleteCount = count;
        out.insertText = text;
        return out;
    }

    bool operator==(const Instruction& other) const {
        return type == other.type &&
               deleteCount == other.deleteCount &&
               insertText == other.insertText;
    }
};

// Helper functions
inline std::string resultToString(Result result) {
    switch (result) {
        case Result::Success: return "Success";
        case Result::ErrorInvalidParameter: return "Invalid parameter";
        case Result::ErrorFileNotFound: return "File not found";
        case Result::ErrorInvalidFormat: return "Invalid format";
        case Result::ErrorNoRules: return "No rules loaded";
        case Result::ErrorDeviceAccess: return "Device access failure";
        case Result::ErrorInjection: return "Text injection failure";
        case Result::ErrorProcess: return "Process failure";
        default: return "Unknown error";
    }
}

inline std::string resolveErrorToString(ResolveError error) {
    switch (error) {
        case ResolveError::None: return "None";
        case ResolveError::InvalidFormat: return "InvalidFormat";
        case ResolveError::CommandFailed: return "CommandFailed";
        case ResolveError::ClipboardUnavailable: return "ClipboardUnavailable";
        default: return "Unknown";
    }
}

inline std::string variableKindToString(VariableKind kind) {
    switch (kind) {
        case VariableKind::Echo: return "echo";
        case VariableKind::Date: return "date";
        case VariableKind::Shell: return "shell";
        case VariableKind::Clipboard: return "clipboard";
        default: return "unknown";
    }
}

inline std::string matchPolicyToString(MatchPolicy policy) {
    switch (policy) {
        case MatchPolicy::PreferLongest: return "longest";
        case MatchPolicy::Immediate: return "immediate";
        default: return "unknown";
    }
}

} // namespace textexpander

#endif // TEXTEXPANDER_TYPES_H
