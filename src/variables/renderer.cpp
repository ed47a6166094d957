#include <textexpander/variables.h>
#include "../utils/log.h"
#include <unordered_map>

namespace textexpander {

namespace {

const char kOpen[] = "{{";
const char kClose[] = "}}";

std::string trimSpaces(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return std::string();
    }
    size_t end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

std::string describeFailure(const std::string& name, const VariableDef& var, const ResolveResult& result) {
    std::string message = "Variable '" + name + "' (" + variableKindToString(var.kind) + ") failed: " +
                          resolveErrorToString(result.error);
    if (result.error == ResolveError::CommandFailed) {
        message += result.timedOut ? " [timeout]" : " [exit " + std::to_string(result.exitStatus) + "]";
    }
    if (!result.message.empty()) {
        message += " - " + result.message;
    }
    return message + "; substituting empty text";
}

} // namespace

TemplateRenderer::TemplateRenderer(VariableResolver& resolver)
    : resolver_(resolver) {
}

std::vector<Placeholder> TemplateRenderer::findPlaceholders(const std::string& templ) {
    std::vector<Placeholder> placeholders;
    size_t pos = 0;

    while (pos < templ.size()) {
        size_t open = templ.find(kOpen, pos);
        if (open == std::string::npos) {
            break;
        }

        size_t close = templ.find(kClose, open + 2);
        if (close == std::string::npos) {
            break;  // Unterminated, the rest is literal
        }

        // Not nested: a later "{{" before the close starts the real placeholder
        size_t inner = templ.find(kOpen, open + 2);
        if (inner != std::string::npos && inner < close) {
            pos = inner;
            continue;
        }

        std::string name = trimSpaces(templ.substr(open + 2, close - open - 2));
        if (!name.empty()) {
            placeholders.push_back(Placeholder{open, close + 2 - open, name});
        }
        pos = close + 2;
    }

    return placeholders;
}

std::string TemplateRenderer::render(const std::string& templ,
                                     const std::vector<VariableDef>& localVars,
                                     const RuleSet& rules) {
    std::vector<Placeholder> placeholders = findPlaceholders(templ);
    if (placeholders.empty()) {
        return templ;
    }

    // Values for this render only; global vars are never cached across renders
    std::unordered_map<std::string, std::string> resolved;

    std::string output;
    output.reserve(templ.size());
    size_t copied = 0;

    for (const auto& placeholder : placeholders) {
        output.append(templ, copied, placeholder.start - copied);
        copied = placeholder.start + placeholder.length;

        auto cached = resolved.find(placeholder.name);
        if (cached != resolved.end()) {
            output += cached->second;
            continue;
        }

        const VariableDef* var = nullptr;
        for (const auto& local : localVars) {
            if (local.name == placeholder.name) {
                var = &local;
                break;
            }
        }
        if (!var) {
            var = rules.findGlobal(placeholder.name);
        }

        std::string value;
        if (!var) {
            utils::debugLog("Undefined variable '" + placeholder.name + "', substituting empty text");
        } else {
            ResolveResult result = resolver_.resolve(*var);
            if (result.ok()) {
                value = result.value;
            } else {
                utils::warnLog(describeFailure(placeholder.name, *var, result));
            }
        }

        // Inserted literally, never scanned again
        output += value;
        resolved.emplace(placeholder.name, value);
    }

    output.append(templ, copied, std::string::npos);
    return output;
}

} // namespace textexpander
