#include <textexpander/engine.h>
#include <textexpander/variables.h>
#include "../utils/log.h"
#include "../utils/utf8.h"

namespace textexpander {

ExpansionEngine::ExpansionEngine(std::shared_ptr<RuleSetHandle> handle, Capabilities& capabilities,
                                 const EngineOptions& options)
    : handle_(handle ? std::move(handle) : std::make_shared<RuleSetHandle>())
    , capabilities_(capabilities)
    , options_(options)
    , resolver_(std::make_unique<VariableResolver>(capabilities_, options.commandTimeout))
    , renderer_(std::make_unique<TemplateRenderer>(*resolver_))
    , matcher_(std::make_unique<TriggerMatcher>(handle_->load(), options.policy)) {
}

ExpansionEngine::ExpansionEngine(std::shared_ptr<const RuleSet> rules, Capabilities& capabilities,
                                 const EngineOptions& options)
    : ExpansionEngine(std::make_shared<RuleSetHandle>(std::move(rules)), capabilities, options) {
}

ExpansionEngine::~ExpansionEngine() = default;

void ExpansionEngine::syncRuleSet() {
    std::shared_ptr<const RuleSet> current = handle_->load();
    if (current == matcher_->ruleSet()) {
        return;
    }

    // A new rule set invalidates whatever was typed against the old one
    matcher_ = std::make_unique<TriggerMatcher>(current, options_.policy);
    utils::infoLog("Switched to a rule set with " + std::to_string(current->triggerCount()) +
                   " triggers");
}

std::optional<Instruction> ExpansionEngine::onCharacter(char32_t ch) {
    syncRuleSet();

    std::optional<MatchEvent> event = matcher_->observe(ch);
    if (!event) {
        return std::nullopt;
    }

    return expand(*event);
}

// The matcher resets itself when it fires
Instruction ExpansionEngine::expand(const MatchEvent& event) {
    // Keeps the rule set alive for the rule pointers
    std::shared_ptr<const RuleSet> snapshot = matcher_->ruleSet();

    utils::debugLog("Trigger '" + event.trigger + "' completed, erasing " +
                    std::to_string(event.deleteCount()) + " characters");

    std::string text = renderer_->render(event.rule->replace, event.rule->vars, *snapshot);
    text += renderTrailing(event, *snapshot);

    return Instruction::Edit(event.deleteCount(), text);
}

std::string ExpansionEngine::renderTrailing(const MatchEvent& event, const RuleSet& snapshot) {
    if (event.chained.empty()) {
        return event.trailing;
    }

    std::u32string trailing = utils::utf8ToUtf32(event.trailing);
    std::string text;
    size_t pos = 0;

    for (const ChainedMatch& match : event.chained) {
        if (match.offset < pos || match.offset + match.length > trailing.size()) {
            utils::warnLog("Ignoring chained trigger '" + match.trigger + "' outside the trailing text");
            continue;
        }
        utils::debugLog("Trigger '" + match.trigger + "' completed inside trailing text");
        text += utils::utf32ToUtf8(trailing.substr(pos, match.offset - pos));
        text += renderer_->render(match.rule->replace, match.rule->vars, snapshot);
        pos = match.offset + match.length;
    }

    text += utils::utf32ToUtf8(trailing.substr(pos));
    return text;
}

std::optional<Instruction> ExpansionEngine::onReset(char32_t typed) {
    syncRuleSet();

    std::optional<MatchEvent> event = matcher_->boundary(typed);
    if (!event) {
        return std::nullopt;
    }

    return expand(*event);
}

void ExpansionEngine::onBackspace() {
    syncRuleSet();
    matcher_->backspace();
}

Instruction ExpansionEngine::onEvent(const InputEvent& event) {
    switch (event.type) {
        case InputEventType::Character: {
            std::optional<Instruction> instruction = onCharacter(event.character);
            return instruction ? *instruction : Instruction::NoOp();
        }
        case InputEventType::Reset: {
            std::optional<Instruction> instruction = onReset(event.character);
            return instruction ? *instruction : Instruction::NoOp();
        }
        case InputEventType::Backspace:
            onBackspace();
            break;
    }

    return Instruction::NoOp();
}

std::shared_ptr<const RuleSet> ExpansionEngine::ruleSet() const {
    return handle_->load();
}

} // namespace textexpander
