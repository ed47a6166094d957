#ifndef TEXTEXPANDER_VARIABLES_H
#define TEXTEXPANDER_VARIABLES_H

#include "types.h"
#include "capabilities.h"
#include "rule_set.h"
#include <chrono>
#include <string>
#include <vector>

namespace textexpander {

// Resolves a single variable definition through the capability interface
class TEXTEXPANDER_API VariableResolver {
public:
    static constexpr const char* kDefaultDateFormat = "%Y-%m-%d";

    VariableResolver(Capabilities& capabilities, std::chrono::milliseconds commandTimeout);

    ResolveResult resolve(const VariableDef& var);

    // Dangling '%' or an unknown conversion makes a pattern invalid
    static bool isValidDateFormat(const std::string& pattern);
    static std::string trimTrailingWhitespace(const std::string& text);

    std::chrono::milliseconds commandTimeout() const { return commandTimeout_; }

private:
    ResolveResult resolveEcho(const VariableDef& var);
    ResolveResult resolveDate(const VariableDef& var);
    ResolveResult resolveShell(const VariableDef& var);
    ResolveResult resolveClipboard(const VariableDef& var);

    Capabilities& capabilities_;
    std::chrono::milliseconds commandTimeout_;
};

// A {{name}} occurrence in a template
struct Placeholder {
    size_t start;    // Byte offset of the opening "{{"
    size_t length;   // Byte length including both brace pairs
    std::string name;
};

// Expands {{name}} placeholders; each name is resolved at most once per render
class TEXTEXPANDER_API TemplateRenderer {
public:
    explicit TemplateRenderer(VariableResolver& resolver);

    std::string render(const std::string& templ,
                       const std::vector<VariableDef>& localVars,
                       const RuleSet& rules);

    static std::vector<Placeholder> findPlaceholders(const std::string& templ);

private:
    VariableResolver& resolver_;
};

} // namespace textexpander

#endif // TEXTEXPANDER_VARIABLES_H
