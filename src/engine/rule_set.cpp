#include <textexpander/rule_set.h>
#include "../utils/log.h"
#include "../utils/utf8.h"
#include <atomic>

namespace textexpander {

RuleSet::RuleSet() = default;

RuleSet::RuleSet(std::vector<Rule> rules, std::vector<GlobalVar> globals)
    : rules_(std::move(rules))
    , globals_(std::move(globals)) {
    for (size_t i = 0; i < globals_.size(); ++i) {
        if (!globalsByName_.emplace(globals_[i].name, i).second) {
            utils::warnLog("Duplicate global variable '" + globals_[i].name +
                           "', keeping the first definition");
        }
    }

    buildIndex();
}

void RuleSet::buildIndex() {
    for (size_t ruleIndex = 0; ruleIndex < rules_.size(); ++ruleIndex) {
        for (const auto& trigger : rules_[ruleIndex].triggers) {
            std::u32string codepoints = utils::utf8ToUtf32(trigger);
            if (codepoints.empty()) {
                utils::warnLog("Ignoring empty trigger in rule " + std::to_string(ruleIndex));
                continue;
            }

            int entry = static_cast<int>(entries_.size());
            if (index_.insert(codepoints, entry)) {
                entries_.emplace_back(trigger, codepoints, ruleIndex);
                continue;
            }

            // First-loaded wins
            int existing = index_.entryAt(index_.nodeFor(codepoints));
            size_t keptRule = entries_[static_cast<size_t>(existing)].ruleIndex;
            if (keptRule == ruleIndex) {
                utils::debugLog("Trigger '" + trigger + "' listed twice in rule " +
                                std::to_string(ruleIndex));
                continue;
            }

            conflicts_.push_back(ConfigConflict{trigger, keptRule, ruleIndex});
            utils::warnLog("Config conflict: trigger '" + trigger + "' is defined by rules " +
                           std::to_string(keptRule) + " and " + std::to_string(ruleIndex) +
                           ", keeping rule " + std::to_string(keptRule));
        }
    }
}

const GlobalVar* RuleSet::findGlobal(const std::string& name) const {
    auto it = globalsByName_.find(name);
    if (it == globalsByName_.end()) {
        return nullptr;
    }
    return &globals_[it->second];
}

RuleSetHandle::RuleSetHandle()
    : current_(std::make_shared<const RuleSet>()) {
}

RuleSetHandle::RuleSetHandle(std::shared_ptr<const RuleSet> initial)
    : current_(initial ? std::move(initial) : std::make_shared<const RuleSet>()) {
}

std::shared_ptr<const RuleSet> RuleSetHandle::load() const {
    return std::atomic_load(&current_);
}

void RuleSetHandle::store(std::shared_ptr<const RuleSet> next) {
    if (!next) {
        next = std::make_shared<const RuleSet>();
    }
    std::atomic_store(&current_, std::move(next));
}

} // namespace textexpander
