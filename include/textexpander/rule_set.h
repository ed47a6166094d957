#ifndef TEXTEXPANDER_RULE_SET_H
#define TEXTEXPANDER_RULE_SET_H

#include "types.h"
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace textexpander {

class MatchState;

// Two tries over the same trigger set. The reverse trie finds the longest
// trigger ending at the newest buffered character; the forward trie tells
// whether a longer trigger can still grow out of a shorter one.
class TriggerIndex {
public:
    static constexpr int kNoNode = -1;
    static constexpr int kNoEntry = -1;

    TriggerIndex();

    // Returns false when the trigger is empty or already indexed
    bool insert(const std::u32string& trigger, int entry);

    // Longest indexed trigger that is a suffix of the buffer, or kNoEntry.
    // Walks at most min(buffer size, longest trigger) characters.
    int longestSuffix(const MatchState& buffer) const;

    // Forward trie navigation
    int root() const { return 0; }
    int advance(int node, char32_t ch) const;
    int walk(int node, const std::u32string& text) const;
    int entryAt(int node) const;
    bool hasContinuation(int node) const;
    int nodeFor(const std::u32string& trigger) const;

    size_t size() const { return count_; }
    size_t maxLength() const { return maxLength_; }

private:
    struct Node {
        std::map<char32_t, int> children;
        int entry = kNoEntry;
    };

    static int child(const std::vector<Node>& trie, int node, char32_t ch);
    static int addChild(std::vector<Node>& trie, int node, char32_t ch);

    std::vector<Node> forward_;
    std::vector<Node> reverse_;
    size_t count_;
    size_t maxLength_;
};

// One indexed trigger
struct TriggerEntry {
    std::string trigger;        // UTF-8
    std::u32string codepoints;
    size_t ruleIndex;

    TriggerEntry() : ruleIndex(0) {}
    TriggerEntry(const std::string& t, const std::u32string& cps, size_t rule)
        : trigger(t), codepoints(cps), ruleIndex(rule) {}

    size_t length() const { return codepoints.size(); }
};

// A trigger registered by more than one rule. The earlier rule keeps it.
struct ConfigConflict {
    std::string trigger;
    size_t keptRule;
    size_t droppedRule;
};

// Immutable collection of rules and global variables for one session
class TEXTEXPANDER_API RuleSet {
public:
    RuleSet();
    RuleSet(std::vector<Rule> rules, std::vector<GlobalVar> globals);

    RuleSet(const RuleSet&) = delete;
    RuleSet& operator=(const RuleSet&) = delete;

    const std::vector<Rule>& rules() const { return rules_; }
    const Rule& rule(size_t index) const { return rules_.at(index); }

    const std::vector<GlobalVar>& globals() const { return globals_; }
    const GlobalVar* findGlobal(const std::string& name) const;

    const TriggerIndex& index() const { return index_; }
    const std::vector<TriggerEntry>& triggers() const { return entries_; }
    const TriggerEntry& trigger(int entry) const { return entries_.at(static_cast<size_t>(entry)); }
    const std::vector<ConfigConflict>& conflicts() const { return conflicts_; }

    size_t triggerCount() const { return entries_.size(); }
    size_t maxTriggerLength() const { return index_.maxLength(); }
    bool empty() const { return entries_.empty(); }

private:
    void buildIndex();

    std::vector<Rule> rules_;
    std::vector<GlobalVar> globals_;
    std::unordered_map<std::string, size_t> globalsByName_;
    std::vector<TriggerEntry> entries_;
    std::vector<ConfigConflict> conflicts_;
    TriggerIndex index_;
};

// Single swap point for hot reload. Readers take a snapshot with load();
// a reload stores a fully built RuleSet in one atomic replace.
class TEXTEXPANDER_API RuleSetHandle {
public:
    RuleSetHandle();
    explicit RuleSetHandle(std::shared_ptr<const RuleSet> initial);

    RuleSetHandle(const RuleSetHandle&) = delete;
    RuleSetHandle& operator=(const RuleSetHandle&) = delete;

    std::shared_ptr<const RuleSet> load() const;
    void store(std::shared_ptr<const RuleSet> next);

private:
    std::shared_ptr<const RuleSet> current_;
};

} // namespace textexpander

#endif // TEXTEXPANDER_RULE_SET_H
