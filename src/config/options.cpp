#include <textexpander/config.h>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace textexpander {

namespace {

bool parseMilliseconds(const std::string& text, std::chrono::milliseconds& out) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0' || value <= 0) {
        return false;
    }
    out = std::chrono::milliseconds(value);
    return true;
}

} // namespace

bool OptionParser::parsePolicy(const std::string& text, MatchPolicy& policy) {
    if (text == "longest") {
        policy = MatchPolicy::PreferLongest;
        return true;
    }
    if (text == "immediate") {
        policy = MatchPolicy::Immediate;
        return true;
    }
    return false;
}

Result OptionParser::parse(int argc, const char* const* argv, DaemonOptions& options, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        // Options that take a value
        auto nextValue = [&](std::string& value) -> bool {
            if (i + 1 >= argc) {
                error = "option " + arg + " requires a value";
                return false;
            }
            value = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
        } else if (arg == "--version") {
            options.showVersion = true;
        } else if (arg == "-d" || arg == "--daemon") {
            options.daemonize = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--stdin") {
            options.readStdin = true;
        } else if (arg == "-c" || arg == "--config") {
            if (!nextValue(options.configDir)) return Result::ErrorInvalidParameter;
        } else if (arg == "--timeout") {
            std::string value;
            if (!nextValue(value)) return Result::ErrorInvalidParameter;
            if (!parseMilliseconds(value, options.commandTimeout)) {
                error = "invalid timeout '" + value + "', expected a positive number of milliseconds";
                return Result::ErrorInvalidParameter;
            }
        } else if (arg == "--policy") {
            std::string value;
            if (!nextValue(value)) return Result::ErrorInvalidParameter;
            if (!parsePolicy(value, options.policy)) {
                error = "invalid policy '" + value + "', expected 'longest' or 'immediate'";
                return Result::ErrorInvalidParameter;
            }
        } else if (arg == "--clipboard-cmd") {
            if (!nextValue(options.clipboardCommand)) return Result::ErrorInvalidParameter;
        } else {
            error = "unknown option '" + arg + "'";
            return Result::ErrorInvalidParameter;
        }
    }

    if (options.daemonize && options.readStdin) {
        error = "--daemon and --stdin cannot be combined";
        return Result::ErrorInvalidParameter;
    }

    return Result::Success;
}

std::string OptionParser::usage(const std::string& program) {
    std::ostringstream ss;
    ss << "Usage: " << program << " [options]\n"
       << "\n"
       << "Expands espanso-style triggers while you type.\n"
       << "\n"
       << "Options:\n"
       << "  -c, --config DIR       Rule directory (default ~/.config/text_expander)\n"
       << "  -d, --daemon           Run in the background\n"
       << "  -v, --verbose          Enable debug logging\n"
       << "      --timeout MS       Shell variable timeout (default 2000)\n"
       << "      --policy POLICY    Overlapping triggers: longest (default) or immediate\n"
       << "      --clipboard-cmd C  Clipboard read command (default \"wl-paste -n\")\n"
       << "      --stdin            Read text from stdin and print edits instead of typing\n"
       << "  -h, --help             Show this help\n"
       << "      --version          Show the version\n"
       << "\n"
       << "Send SIGHUP to reload the rules.\n";
    return ss.str();
}

} // namespace textexpander
