#include <textexpander/engine.h>
#include "../utils/log.h"
#include "../utils/utf8.h"
#include <algorithm>

namespace textexpander {

TriggerMatcher::TriggerMatcher(std::shared_ptr<const RuleSet> rules, MatchPolicy policy)
    : rules_(rules ? std::move(rules) : std::make_shared<const RuleSet>())
    , policy_(policy)
    , state_(std::max<size_t>(rules_->maxTriggerLength(), 1)) {
}

std::optional<MatchEvent> TriggerMatcher::observe(char32_t ch) {
    state_.push(ch);

    if (rules_->empty()) {
        return std::nullopt;
    }

    const TriggerIndex& index = rules_->index();

    // Span of the held trigger plus everything typed after it
    size_t heldSpan = 0;
    if (hold_) {
        hold_->trailing.push_back(ch);
        hold_->cursor = index.advance(hold_->cursor, ch);
        heldSpan = rules_->trigger(hold_->entry).length() + hold_->trailing.size();
    }

    int candidate = index.longestSuffix(state_);
    size_t candidateLength = candidate == TriggerIndex::kNoEntry
        ? 0 : rules_->trigger(candidate).length();

    // A candidate shorter than the held span cannot replace the hold
    if (hold_ && candidateLength < heldSpan) {
        if (hold_->cursor != TriggerIndex::kNoNode) {
            return std::nullopt;
        }
        // No longer trigger can complete any more: the held one wins
        Hold held = *hold_;
        return fire(held.entry, held.trailing);
    }

    if (candidate == TriggerIndex::kNoEntry) {
        return std::nullopt;
    }

    return acceptCandidate(candidate);
}

std::optional<MatchEvent> TriggerMatcher::acceptCandidate(int entry) {
    const TriggerIndex& index = rules_->index();
    const TriggerEntry& trigger = rules_->trigger(entry);

    if (policy_ == MatchPolicy::PreferLongest) {
        int node = index.nodeFor(trigger.codepoints);
        if (index.hasContinuation(node)) {
            hold_ = Hold{entry, node, std::u32string()};
            utils::debugLog("Holding trigger '" + trigger.trigger + "' for a longer match");
            return std::nullopt;
        }
    }

    return fire(entry, std::u32string());
}

std::optional<MatchEvent> TriggerMatcher::fire(int entry, const std::u32string& trailing) {
    const TriggerEntry& trigger = rules_->trigger(entry);

    MatchEvent event;
    event.rule = &rules_->rule(trigger.ruleIndex);
    event.ruleIndex = trigger.ruleIndex;
    event.trigger = trigger.trigger;
    event.triggerLength = trigger.length();
    event.trailing = utils::utf32ToUtf8(trailing);
    event.trailingLength = trailing.size();
    event.endPosition = state_.size() >= trailing.size() ? state_.size() - trailing.size() : 0;

    reset();

    // The trailing text is still in the document: it may complete or start other triggers
    for (size_t i = 0; i < trailing.size(); ++i) {
        std::optional<MatchEvent> inner = observe(trailing[i]);
        if (!inner) {
            continue;
        }

        size_t start = i + 1 - inner->deleteCount();
        ChainedMatch match;
        match.rule = inner->rule;
        match.ruleIndex = inner->ruleIndex;
        match.trigger = inner->trigger;
        match.offset = start;
        match.length = inner->triggerLength;
        event.chained.push_back(match);

        for (ChainedMatch nested : inner->chained) {
            nested.offset += start + inner->triggerLength;
            event.chained.push_back(nested);
        }
    }

    return event;
}

std::optional<MatchEvent> TriggerMatcher::boundary(char32_t typed) {
    if (!hold_ || typed == 0) {
        // Keys that move the cursor leave nothing safe to erase
        reset();
        return std::nullopt;
    }

    Hold held = *hold_;
    held.trailing.push_back(typed);
    state_.push(typed);

    std::optional<MatchEvent> event = fire(held.entry, held.trailing);
    reset();
    return event;
}

void TriggerMatcher::reset() {
    state_.clear();
    hold_.reset();
}

void TriggerMatcher::backspace() {
    state_.popBack();

    if (!hold_) {
        return;
    }

    if (hold_->trailing.empty()) {
        // The held trigger itself lost a character
        hold_.reset();
        return;
    }

    const TriggerIndex& index = rules_->index();
    hold_->trailing.pop_back();
    hold_->cursor = index.walk(index.nodeFor(rules_->trigger(hold_->entry).codepoints),
                               hold_->trailing);
}

} // namespace textexpander
