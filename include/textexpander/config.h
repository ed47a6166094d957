#ifndef TEXTEXPANDER_CONFIG_H
#define TEXTEXPANDER_CONFIG_H

#include "types.h"
#include "rule_set.h"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace textexpander {

// Output of the espanso-compatible YAML loader
struct LoadedConfig {
    std::vector<Rule> rules;
    std::vector<GlobalVar> globals;
    std::vector<std::string> files;     // Files loaded successfully, in load order
    std::vector<std::string> failures;  // Files that could not be parsed
    size_t skippedMatches = 0;
    size_t skippedVars = 0;

    size_t triggerCount() const {
        size_t count = 0;
        for (const auto& rule : rules) count += rule.triggers.size();
        return count;
    }
};

class TEXTEXPANDER_API ConfigLoader {
public:
    // Recursively loads *.yml / *.yaml below dir, in sorted path order
    static Result loadDirectory(const std::string& dir, LoadedConfig& out);

    static Result loadFile(const std::string& path, LoadedConfig& out);

    static Result loadString(const std::string& yaml, LoadedConfig& out,
                             const std::string& origin = "<memory>");

    static std::shared_ptr<const RuleSet> buildRuleSet(const LoadedConfig& config);

    // $HOME/.config/text_expander, honouring SUDO_USER
    static std::string defaultConfigDirectory();

    static bool parseVariableKind(const std::string& name, VariableKind& kind);
};

// Command line options of the daemon
struct DaemonOptions {
    std::string configDir;
    bool daemonize = false;
    bool verbose = false;
    bool readStdin = false;
    bool showHelp = false;
    bool showVersion = false;
    std::chrono::milliseconds commandTimeout{2000};
    MatchPolicy policy = MatchPolicy::PreferLongest;
    std::string clipboardCommand = "wl-paste -n";
};

class TEXTEXPANDER_API OptionParser {
public:
    static Result parse(int argc, const char* const* argv, DaemonOptions& options, std::string& error);
    static bool parsePolicy(const std::string& text, MatchPolicy& policy);
    static std::string usage(const std::string& program);
};

} // namespace textexpander

#endif // TEXTEXPANDER_CONFIG_H
