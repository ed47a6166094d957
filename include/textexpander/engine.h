#ifndef TEXTEXPANDER_ENGINE_H
#define TEXTEXPANDER_ENGINE_H

#include "types.h"
#include "capabilities.h"
#include "rule_set.h"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace textexpander {

class TemplateRenderer;
class VariableResolver;

constexpr std::chrono::milliseconds kDefaultCommandTimeout{2000};

// Bounded ring buffer of the most recently typed code points
class MatchState {
public:
    explicit MatchState(size_t capacity = 1);

    void push(char32_t ch);
    void popBack();
    void clear();

    // offset 0 is the newest character
    char32_t fromEnd(size_t offset) const;

    size_t size() const { return size_; }
    size_t capacity() const { return ring_.size(); }
    bool empty() const { return size_ == 0; }

    std::u32string contents() const;

private:
    std::vector<char32_t> ring_;
    size_t head_;   // Index of the oldest character
    size_t size_;
};

// A trigger completed inside the trailing text of a flushed hold
struct ChainedMatch {
    const Rule* rule = nullptr;
    size_t ruleIndex = 0;
    std::string trigger;
    size_t offset = 0;   // Code points into MatchEvent::trailing
    size_t length = 0;   // Code points
};

// A completed trigger
struct MatchEvent {
    const Rule* rule = nullptr;
    size_t ruleIndex = 0;
    std::string trigger;         // UTF-8
    size_t triggerLength = 0;    // Code points
    std::string trailing;        // Typed after a held trigger (UTF-8)
    size_t trailingLength = 0;   // Code points
    size_t endPosition = 0;      // Buffer position just past the trigger
    std::vector<ChainedMatch> chained;   // Ordered, non-overlapping

    // Characters the output sink must erase
    size_t deleteCount() const { return triggerLength + trailingLength; }
};

// Detects trigger completion over the live character stream
class TriggerMatcher {
public:
    explicit TriggerMatcher(std::shared_ptr<const RuleSet> rules,
                            MatchPolicy policy = MatchPolicy::PreferLongest);

    std::optional<MatchEvent> observe(char32_t ch);

    // Ends the current context. A held trigger fires when the boundary key
    // typed a character, which then belongs to its trailing text.
    std::optional<MatchEvent> boundary(char32_t typed);

    void reset();
    void backspace();

    bool hasHeldMatch() const { return hold_.has_value(); }
    const MatchState& state() const { return state_; }
    const std::shared_ptr<const RuleSet>& ruleSet() const { return rules_; }
    MatchPolicy policy() const { return policy_; }

private:
    // A trigger waiting for a longer one that shares its prefix
    struct Hold {
        int entry;                 // TriggerIndex entry of the held trigger
        int cursor;                // Forward trie node after trigger + trailing
        std::u32string trailing;   // Typed since the hold started
    };

    std::optional<MatchEvent> fire(int entry, const std::u32string& trailing);
    std::optional<MatchEvent> acceptCandidate(int entry);

    std::shared_ptr<const RuleSet> rules_;
    MatchPolicy policy_;
    MatchState state_;
    std::optional<Hold> hold_;
};

struct EngineOptions {
    MatchPolicy policy = MatchPolicy::PreferLongest;
    std::chrono::milliseconds commandTimeout = kDefaultCommandTimeout;
};

// Top-level driver: one more character in, optionally one edit out
class TEXTEXPANDER_API ExpansionEngine {
public:
    ExpansionEngine(std::shared_ptr<RuleSetHandle> handle, Capabilities& capabilities,
                    const EngineOptions& options = EngineOptions());
    ExpansionEngine(std::shared_ptr<const RuleSet> rules, Capabilities& capabilities,
                    const EngineOptions& options = EngineOptions());
    ~ExpansionEngine();

    ExpansionEngine(const ExpansionEngine&) = delete;
    ExpansionEngine& operator=(const ExpansionEngine&) = delete;

    std::optional<Instruction> onCharacter(char32_t ch);
    std::optional<Instruction> onReset(char32_t typed = 0);
    void onBackspace();

    // Dispatches any input event; never fails, NoOp when nothing fired
    Instruction onEvent(const InputEvent& event);

    std::shared_ptr<const RuleSet> ruleSet() const;
    const TriggerMatcher& matcher() const { return *matcher_; }
    const EngineOptions& options() const { return options_; }

private:
    void syncRuleSet();
    Instruction expand(const MatchEvent& event);
    std::string renderTrailing(const MatchEvent& event, const RuleSet& snapshot);

    std::shared_ptr<RuleSetHandle> handle_;
    Capabilities& capabilities_;
    EngineOptions options_;
    std::unique_ptr<VariableResolver> resolver_;
    std::unique_ptr<TemplateRenderer> renderer_;
    std::unique_ptr<TriggerMatcher> matcher_;
};

} // namespace textexpander

#endif // TEXTEXPANDER_ENGINE_H
