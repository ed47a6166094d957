#include <textexpander/config.h>
#include "../utils/log.h"
#include "../utils/utf8.h"
#include <yaml-cpp/yaml.h>
#include <pwd.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <unordered_set>

namespace textexpander {

namespace fs = std::filesystem;

namespace {

// Match keys of espanso features this engine does not implement
const char* const kUnsupportedMatchKeys[] = {
    "regex", "form", "markdown", "html", "image_path"
};

bool readScalar(const YAML::Node& node, std::string& out) {
    if (!node || !node.IsScalar()) {
        return false;
    }
    out = node.as<std::string>();
    return true;
}

bool parseVar(const YAML::Node& node, const std::string& origin, VariableDef& var) {
    if (!node.IsMap()) {
        utils::warnLog(origin + ": variable entry is not a mapping, skipped");
        return false;
    }

    std::string name;
    std::string type;
    if (!readScalar(node["name"], name) || name.empty()) {
        utils::warnLog(origin + ": variable without a name, skipped");
        return false;
    }
    if (!readScalar(node["type"], type)) {
        utils::warnLog(origin + ": variable '" + name + "' has no type, skipped");
        return false;
    }

    VariableKind kind;
    if (!ConfigLoader::parseVariableKind(type, kind)) {
        utils::warnLog(origin + ": variable '" + name + "' has unsupported type '" + type + "', skipped");
        return false;
    }

    var = VariableDef(name, kind);

    const YAML::Node params = node["params"];
    if (params && params.IsMap()) {
        std::string value;
        if (readScalar(params["format"], value)) var.params.setFormat(value);
        if (readScalar(params["echo"], value)) var.params.setEcho(value);
        if (readScalar(params["cmd"], value)) var.params.setCmd(value);
    }

    return true;
}

void parseVars(const YAML::Node& node, const std::string& origin,
               std::vector<VariableDef>& vars, LoadedConfig& out) {
    if (!node) {
        return;
    }
    if (!node.IsSequence()) {
        utils::warnLog(origin + ": 'vars' is not a list, ignored");
        return;
    }

    std::unordered_set<std::string> seen;
    for (const auto& item : node) {
        VariableDef var;
        if (!parseVar(item, origin, var)) {
            out.skippedVars++;
            continue;
        }
        if (!seen.insert(var.name).second) {
            utils::warnLog(origin + ": duplicate variable '" + var.name + "', keeping the first");
            out.skippedVars++;
            continue;
        }
        vars.push_back(var);
    }
}

bool parseMatch(const YAML::Node& node, const std::string& origin, Rule& rule, LoadedConfig& out) {
    if (!node.IsMap()) {
        utils::warnLog(origin + ": match entry is not a mapping, skipped");
        return false;
    }

    auto addTrigger = [&](const std::string& trigger) {
        if (trigger.empty()) {
            utils::warnLog(origin + ": empty trigger skipped");
            return;
        }
        if (!utils::isValidUtf8(trigger)) {
            utils::warnLog(origin + ": trigger is not valid UTF-8, skipped");
            return;
        }
        rule.triggers.push_back(trigger);
    };

    std::string trigger;
    if (readScalar(node["trigger"], trigger)) {
        addTrigger(trigger);
    }

    const YAML::Node triggers = node["triggers"];
    if (triggers && triggers.IsSequence()) {
        for (const auto& item : triggers) {
            if (readScalar(item, trigger)) {
                addTrigger(trigger);
            }
        }
    }

    if (!readScalar(node["replace"], rule.replace)) {
        std::string reason = "no replace text";
        for (const char* key : kUnsupportedMatchKeys) {
            if (node[key]) {
                reason = std::string("unsupported '") + key + "' match";
                break;
            }
        }
        utils::debugLog(origin + ": skipping match (" + reason + ")");
        return false;
    }

    if (rule.triggers.empty()) {
        utils::debugLog(origin + ": skipping match without a trigger");
        return false;
    }

    parseVars(node["vars"], origin, rule.vars, out);
    return true;
}

Result parseDocument(const YAML::Node& root, const std::string& origin, LoadedConfig& out) {
    if (!root || root.IsNull()) {
        return Result::Success;  // Empty file
    }
    if (!root.IsMap()) {
        utils::errorLog(origin + ": top level is not a mapping");
        return Result::ErrorInvalidFormat;
    }

    parseVars(root["global_vars"], origin, out.globals, out);

    const YAML::Node matches = root["matches"];
    if (matches) {
        if (!matches.IsSequence()) {
            utils::errorLog(origin + ": 'matches' is not a list");
            return Result::ErrorInvalidFormat;
        }
        for (const auto& item : matches) {
            Rule rule;
            if (parseMatch(item, origin, rule, out)) {
                out.rules.push_back(std::move(rule));
            } else {
                out.skippedMatches++;
            }
        }
    }

    return Result::Success;
}

// Parses into a scratch config so a failing file contributes nothing
template <typename LoadFn>
Result loadInto(LoadFn load, const std::string& origin, LoadedConfig& out) {
    LoadedConfig scratch;
    Result result;

    try {
        YAML::Node root = load();
        result = parseDocument(root, origin, scratch);
    } catch (const YAML::Exception& e) {
        utils::errorLog("Failed to parse " + origin + ": " + e.what());
        result = Result::ErrorInvalidFormat;
    }

    if (result != Result::Success) {
        out.failures.push_back(origin);
        return result;
    }

    size_t triggerCount = scratch.triggerCount();
    if (triggerCount > 0) {
        utils::infoLog("Loaded " + std::to_string(triggerCount) + " triggers from " + origin);
    }

    for (auto& rule : scratch.rules) out.rules.push_back(std::move(rule));
    for (auto& var : scratch.globals) out.globals.push_back(std::move(var));
    out.skippedMatches += scratch.skippedMatches;
    out.skippedVars += scratch.skippedVars;
    out.files.push_back(origin);
    return Result::Success;
}

bool isYamlFile(const fs::path& path) {
    const std::string ext = path.extension().string();
    return ext == ".yml" || ext == ".yaml";
}

} // namespace

bool ConfigLoader::parseVariableKind(const std::string& name, VariableKind& kind) {
    if (name == "echo") { kind = VariableKind::Echo; return true; }
    if (name == "date") { kind = VariableKind::Date; return true; }
    if (name == "shell") { kind = VariableKind::Shell; return true; }
    if (name == "clipboard") { kind = VariableKind::Clipboard; return true; }
    return false;
}

Result ConfigLoader::loadString(const std::string& yaml, LoadedConfig& out, const std::string& origin) {
    return loadInto([&yaml]() { return YAML::Load(yaml); }, origin, out);
}

Result ConfigLoader::loadFile(const std::string& path, LoadedConfig& out) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        utils::errorLog("Config file not found: " + path);
        out.failures.push_back(path);
        return Result::ErrorFileNotFound;
    }

    return loadInto([&path]() { return YAML::LoadFile(path); }, path, out);
}

Result ConfigLoader::loadDirectory(const std::string& dir, LoadedConfig& out) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        utils::errorLog("Config directory not found: " + dir);
        return Result::ErrorFileNotFound;
    }

    std::vector<fs::path> files;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec) && isYamlFile(it->path())) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        utils::warnLog("Error while scanning " + dir + ": " + ec.message());
    }

    // Sorted so that first-loaded-wins does not depend on directory order
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        // Failures are logged and recorded; the remaining files still load
        Result result = loadFile(file.string(), out);
        if (result != Result::Success) {
            utils::warnLog("Skipped " + file.string() + ": " + resultToString(result));
        }
    }

    return Result::Success;
}

std::shared_ptr<const RuleSet> ConfigLoader::buildRuleSet(const LoadedConfig& config) {
    return std::make_shared<const RuleSet>(config.rules, config.globals);
}

std::string ConfigLoader::defaultConfigDirectory() {
    std::string home;

    // Running under sudo: use the invoking user's home, not root's
    const char* sudoUser = std::getenv("SUDO_USER");
    if (sudoUser && *sudoUser) {
        if (const struct passwd* entry = getpwnam(sudoUser)) {
            if (entry->pw_dir) home = entry->pw_dir;
        }
    }
    if (home.empty()) {
        const char* envHome = std::getenv("HOME");
        home = envHome && *envHome ? envHome : "/tmp";
    }

    return (fs::path(home) / ".config" / "text_expander").string();
}

} // namespace textexpander
