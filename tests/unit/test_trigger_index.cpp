#include <gtest/gtest.h>
#include <textexpander/rule_set.h>
#include <textexpander/engine.h>
#include "../common/test_utils.h"

using namespace textexpander;
using namespace textexpander_test;

namespace {

MatchState bufferOf(const std::u32string& text) {
    MatchState state(16);
    for (char32_t ch : text) {
        state.push(ch);
    }
    return state;
}

} // namespace

TEST(TriggerIndexTest, InsertRejectsEmptyAndDuplicates) {
    TriggerIndex index;
    EXPECT_TRUE(index.insert(U":a", 0));
    EXPECT_FALSE(index.insert(U":a", 1));
    EXPECT_FALSE(index.insert(U"", 2));
    EXPECT_EQ(1u, index.size());
    EXPECT_EQ(2u, index.maxLength());
}

TEST(TriggerIndexTest, LongestSuffixPrefersDeeperTrigger) {
    TriggerIndex index;
    index.insert(U"b", 0);
    index.insert(U":ab", 1);
    index.insert(U"ab", 2);

    EXPECT_EQ(1, index.longestSuffix(bufferOf(U"x:ab")));
    EXPECT_EQ(2, index.longestSuffix(bufferOf(U"xab")));
    EXPECT_EQ(0, index.longestSuffix(bufferOf(U"b")));
    EXPECT_EQ(TriggerIndex::kNoEntry, index.longestSuffix(bufferOf(U"ba")));
    EXPECT_EQ(TriggerIndex::kNoEntry, index.longestSuffix(bufferOf(U"")));
}

TEST(TriggerIndexTest, ForwardNavigation) {
    TriggerIndex index;
    index.insert(U":a", 0);
    index.insert(U":abc", 1);

    int node = index.nodeFor(U":a");
    ASSERT_NE(TriggerIndex::kNoNode, node);
    EXPECT_EQ(0, index.entryAt(node));
    EXPECT_TRUE(index.hasContinuation(node));

    int longer = index.walk(node, U"bc");
    EXPECT_EQ(1, index.entryAt(longer));
    EXPECT_FALSE(index.hasContinuation(longer));

    int partial = index.advance(node, U'b');
    EXPECT_EQ(TriggerIndex::kNoEntry, index.entryAt(partial));
    EXPECT_TRUE(index.hasContinuation(partial));

    EXPECT_EQ(TriggerIndex::kNoNode, index.advance(node, U'x'));
    EXPECT_EQ(TriggerIndex::kNoNode, index.nodeFor(U"zz"));
    EXPECT_FALSE(index.hasContinuation(TriggerIndex::kNoNode));
}

TEST(TriggerIndexTest, MultiByteTriggers) {
    TriggerIndex index;
    index.insert(U"→x", 0);
    EXPECT_EQ(0, index.longestSuffix(bufferOf(U"a→x")));
    EXPECT_EQ(2u, index.maxLength());
}

TEST(RuleSetTest, FirstLoadedTriggerWins) {
    std::vector<Rule> rules = {
        makeRule({":dup"}, "first"),
        makeRule({":dup", ":other"}, "second"),
    };
    RuleSet set(rules, {});

    EXPECT_EQ(2u, set.triggerCount());
    ASSERT_EQ(1u, set.conflicts().size());
    EXPECT_EQ(":dup", set.conflicts()[0].trigger);
    EXPECT_EQ(0u, set.conflicts()[0].keptRule);
    EXPECT_EQ(1u, set.conflicts()[0].droppedRule);

    int entry = set.index().entryAt(set.index().nodeFor(U":dup"));
    EXPECT_EQ(0u, set.trigger(entry).ruleIndex);
}

TEST(RuleSetTest, TriggerRepeatedWithinOneRuleIsNotAConflict) {
    RuleSet set({makeRule({":x", ":x"}, "X")}, {});
    EXPECT_EQ(1u, set.triggerCount());
    EXPECT_TRUE(set.conflicts().empty());
}

TEST(RuleSetTest, EmptyTriggersAreIgnored) {
    RuleSet set({makeRule({"", ":ok"}, "ok")}, {});
    EXPECT_EQ(1u, set.triggerCount());
    EXPECT_EQ(":ok", set.triggers()[0].trigger);
}

TEST(RuleSetTest, GlobalLookupKeepsFirstDefinition) {
    RuleSet set({}, {VariableDef::Echo("me", "first"), VariableDef::Echo("me", "second")});
    ASSERT_NE(nullptr, set.findGlobal("me"));
    EXPECT_EQ("first", set.findGlobal("me")->params.echo);
    EXPECT_EQ(nullptr, set.findGlobal("missing"));
    EXPECT_TRUE(set.empty());
}

TEST(RuleSetTest, MaxTriggerLengthCountsCodePoints) {
    auto set = makeRuleSet({{":a", "A"}, {u8":日本語", "ja"}});
    EXPECT_EQ(4u, set->maxTriggerLength());
}

TEST(RuleSetHandleTest, StoreReplacesSnapshot) {
    auto first = makeRuleSet({{":a", "A"}});
    RuleSetHandle handle(first);
    std::shared_ptr<const RuleSet> snapshot = handle.load();
    EXPECT_EQ(first, snapshot);

    auto second = makeRuleSet({{":b", "B"}, {":c", "C"}});
    handle.store(second);
    EXPECT_EQ(second, handle.load());

    // Old snapshots stay valid
    EXPECT_EQ(1u, snapshot->triggerCount());

    handle.store(nullptr);
    ASSERT_NE(nullptr, handle.load());
    EXPECT_TRUE(handle.load()->empty());
}
