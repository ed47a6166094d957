#include <gtest/gtest.h>
#include <textexpander/textexpander.h>
#include "../common/test_utils.h"

using namespace textexpander;
using namespace textexpander_test;

class ExpansionEngineTest : public ::testing::Test {
protected:
    std::unique_ptr<ExpansionEngine> engineFor(std::vector<Rule> rules,
                                               std::vector<GlobalVar> globals = {},
                                               const EngineOptions& options = EngineOptions()) {
        auto set = std::make_shared<const RuleSet>(std::move(rules), std::move(globals));
        return std::make_unique<ExpansionEngine>(set, caps, options);
    }

    FakeCapabilities caps;
};

TEST_F(ExpansionEngineTest, StaticExpansion) {
    auto engine = engineFor({makeRule({":sig"}, "Best regards,\nJohn")});
    EXPECT_TRUE(typeText(*engine, "hi :si").empty());

    std::optional<Instruction> edit = engine->onCharacter(U'g');
    ASSERT_TRUE(edit);
    EXPECT_EQ(Instruction::Edit(4, "Best regards,\nJohn"), *edit);
}

TEST_F(ExpansionEngineTest, RetypingTriggerFiresAgain) {
    auto engine = engineFor({makeRule({":sig"}, "Best regards")});
    auto edits = typeText(*engine, ":sig:sig");
    ASSERT_EQ(2u, edits.size());
    EXPECT_EQ(edits[0], edits[1]);
}

TEST_F(ExpansionEngineTest, NoExpansionWithoutTrigger) {
    auto engine = engineFor({makeRule({":sig"}, "Best regards")});
    EXPECT_TRUE(typeText(*engine, "signature :si g").empty());
}

TEST_F(ExpansionEngineTest, DateVariable) {
    caps.now = localTime(2024, 3, 1);
    auto engine = engineFor({makeRule({":date"}, "{{date}}", {VariableDef::Date("date", "%Y")})});
    auto edits = typeText(*engine, ":date");
    ASSERT_EQ(1u, edits.size());
    EXPECT_EQ(Instruction::Edit(5, "2024"), edits[0]);
}

TEST_F(ExpansionEngineTest, ShellVariableIsTrimmed) {
    caps.setCommandResult("whoami", CommandResult::Success("alice\n"));
    auto engine = engineFor({makeRule({":me"}, "I am {{user}}.", {VariableDef::Shell("user", "whoami")})});
    auto edits = typeText(*engine, ":me");
    ASSERT_EQ(1u, edits.size());
    EXPECT_EQ("I am alice.", edits[0].insertText);
}

TEST_F(ExpansionEngineTest, ShellReferencedTwiceRunsOnce) {
    caps.setCommandResult("uuidgen", CommandResult::Success("1234\n"));
    auto engine = engineFor({makeRule({":id"}, "{{u}}/{{u}}", {VariableDef::Shell("u", "uuidgen")})});
    auto edits = typeText(*engine, ":id");
    ASSERT_EQ(1u, edits.size());
    EXPECT_EQ("1234/1234", edits[0].insertText);
    EXPECT_EQ(1, caps.callCount("uuidgen"));
}

TEST_F(ExpansionEngineTest, NonZeroShellExitSubstitutesEmpty) {
    caps.setCommandResult("false", CommandResult::Exited(1, ""));
    auto engine = engineFor({makeRule({":f"}, "a{{v}}b", {VariableDef::Shell("v", "false")})});
    auto edits = typeText(*engine, ":f");
    ASSERT_EQ(1u, edits.size());
    EXPECT_EQ(Instruction::Edit(2, "ab"), edits[0]);

    // The buffer was reset even though a variable failed
    EXPECT_TRUE(engine->matcher().state().empty());
}

TEST_F(ExpansionEngineTest, UndefinedPlaceholderIsEmpty) {
    auto engine = engineFor({makeRule({":u"}, "<{{nobody}}>")});
    auto edits = typeText(*engine, ":u");
    ASSERT_EQ(1u, edits.size());
    EXPECT_EQ("<>", edits[0].insertText);
}

TEST_F(ExpansionEngineTest, FailedShellStillExpands) {
    caps.setCommandResult("slow", CommandResult::TimedOut(""));
    LogCapture logs(utils::LogLevel::Warning);

    auto engine = engineFor({makeRule({":x"}, "[{{out}}]", {VariableDef::Shell("out", "slow")})});
    auto edits = typeText(*engine, ":x");
    ASSERT_EQ(1u, edits.size());
    EXPECT_EQ(Instruction::Edit(2, "[]"), edits[0]);
    EXPECT_TRUE(logs.contains(utils::LogLevel::Warning, "timeout"));
}

TEST_F(ExpansionEngineTest, CommandTimeoutIsForwarded) {
    caps.setCommandResult("true", CommandResult::Success(""));
    EngineOptions options;
    options.commandTimeout = std::chrono::milliseconds(300);

    auto engine = engineFor({makeRule({":t"}, "{{v}}", {VariableDef::Shell("v", "true")})}, {}, options);
    typeText(*engine, ":t");
    EXPECT_EQ(std::chrono::milliseconds(300), caps.lastTimeout);
}

TEST_F(ExpansionEngineTest, GlobalVariable) {
    auto engine = engineFor({makeRule({":name"}, "Regards, {{me}}")}, {VariableDef::Echo("me", "Tester")});
    auto edits = typeText(*engine, ":name");
    ASSERT_EQ(1u, edits.size());
    EXPECT_EQ("Regards, Tester", edits[0].insertText);
}

TEST_F(ExpansionEngineTest, ClipboardVariable) {
    caps.clipboard = ClipboardResult::Text("pasted");
    auto engine = engineFor({makeRule({":clip"}, "<{{c}}>", {VariableDef::Clipboard("c")})});
    auto edits = typeText(*engine, ":clip");
    ASSERT_EQ(1u, edits.size());
    EXPECT_EQ("<pasted>", edits[0].insertText);
    EXPECT_EQ(1, caps.clipboardReads);
}

TEST_F(ExpansionEngineTest, SeveralTriggersShareOneRule) {
    auto engine = engineFor({makeRule({":hello", ":hi"}, "Hello!")});
    auto edits = typeText(*engine, ":hi :hello");
    ASSERT_EQ(2u, edits.size());
    EXPECT_EQ(Instruction::Edit(3, "Hello!"), edits[0]);
    EXPECT_EQ(Instruction::Edit(6, "Hello!"), edits[1]);
}

TEST_F(ExpansionEngineTest, HeldTriggerCarriesTrailingText) {
    auto engine = engineFor({makeRule({":a"}, "alpha"), makeRule({":ab"}, "alphabet")});
    auto edits = typeText(*engine, ":a ");
    ASSERT_EQ(1u, edits.size());
    EXPECT_EQ(Instruction::Edit(3, "alpha "), edits[0]);

    edits = typeText(*engine, ":ab");
    ASSERT_EQ(1u, edits.size());
    EXPECT_EQ(Instruction::Edit(3, "alphabet"), edits[0]);
}

TEST_F(ExpansionEngineTest, TextAfterFlushedTriggerCanExpand) {
    auto engine = engineFor({makeRule({":a"}, "A"), makeRule({":ab"}, "AB"), makeRule({":b"}, "B")});
    auto edits = typeText(*engine, ":a:b");
    ASSERT_EQ(2u, edits.size());
    EXPECT_EQ(Instruction::Edit(3, "A:"), edits[0]);
    EXPECT_EQ(Instruction::Edit(2, "B"), edits[1]);
}

TEST_F(ExpansionEngineTest, FlushRendersTriggerInTrailingText) {
    caps.now = localTime(2024, 3, 1);
    auto engine = engineFor({makeRule({":a"}, "A"), makeRule({":ab"}, "AB"),
                             makeRule({"z"}, "[{{y}}]", {VariableDef::Date("y", "%Y")})});
    auto edits = typeText(*engine, ":az");
    ASSERT_EQ(1u, edits.size());
    EXPECT_EQ(Instruction::Edit(3, "A[2024]"), edits[0]);
}

TEST_F(ExpansionEngineTest, EnterExpandsHeldTrigger) {
    auto engine = engineFor({makeRule({":a"}, "alpha"), makeRule({":ab"}, "alphabet")});
    typeText(*engine, ":a");
    EXPECT_EQ(Instruction::Edit(3, "alpha\n"), engine->onEvent(InputEvent::Reset(U'\n')));
    EXPECT_TRUE(engine->matcher().state().empty());

    typeText(*engine, ":a");
    EXPECT_EQ(Instruction::Edit(3, "alpha\t"), engine->onEvent(InputEvent::Reset(U'\t')));
}

TEST_F(ExpansionEngineTest, CursorMoveDropsHeldTrigger) {
    auto engine = engineFor({makeRule({":a"}, "alpha"), makeRule({":ab"}, "alphabet")});
    typeText(*engine, ":a");
    EXPECT_EQ(Instruction::NoOp(), engine->onEvent(InputEvent::Reset()));
    EXPECT_TRUE(typeText(*engine, "b").empty());
}

TEST_F(ExpansionEngineTest, ImmediatePolicy) {
    EngineOptions options;
    options.policy = MatchPolicy::Immediate;
    auto engine = engineFor({makeRule({":a"}, "alpha"), makeRule({":ab"}, "alphabet")}, {}, options);

    auto edits = typeText(*engine, ":ab");
    ASSERT_EQ(1u, edits.size());
    EXPECT_EQ(Instruction::Edit(2, "alpha"), edits[0]);
}

TEST_F(ExpansionEngineTest, ResetAndBackspaceEvents) {
    auto engine = engineFor({makeRule({":sig"}, "Best regards")});

    typeText(*engine, ":si");
    EXPECT_EQ(Instruction::NoOp(), engine->onEvent(InputEvent::Reset()));
    EXPECT_TRUE(typeText(*engine, "g").empty());

    typeText(*engine, ":sx");
    EXPECT_EQ(Instruction::NoOp(), engine->onEvent(InputEvent::Backspace()));
    EXPECT_EQ(Instruction::NoOp(), engine->onEvent(InputEvent::Character(U'i')));
    EXPECT_EQ(Instruction::Edit(4, "Best regards"), engine->onEvent(InputEvent::Character(U'g')));
}

TEST_F(ExpansionEngineTest, UnicodeReplacement) {
    auto engine = engineFor({makeRule({":shrug"}, u8"¯\\_(ツ)_/¯")});
    auto edits = typeText(*engine, ":shrug");
    ASSERT_EQ(1u, edits.size());
    EXPECT_EQ(u8"¯\\_(ツ)_/¯", edits[0].insertText);
}

TEST_F(ExpansionEngineTest, EmptyRuleSet) {
    ExpansionEngine engine(std::shared_ptr<const RuleSet>(), caps);
    EXPECT_TRUE(typeText(engine, ":sig hello").empty());
    EXPECT_TRUE(engine.ruleSet()->empty());
}

TEST_F(ExpansionEngineTest, ReloadSwapsRulesAndResetsBuffer) {
    auto handle = std::make_shared<RuleSetHandle>(makeRuleSet({{":old", "old"}}));
    ExpansionEngine engine(handle, caps);

    typeText(engine, ":ne");
    handle->store(makeRuleSet({{":new", "new"}}));

    // Characters typed before the swap do not count towards the new rules
    EXPECT_TRUE(typeText(engine, "w").empty());

    auto edits = typeText(engine, ":new");
    ASSERT_EQ(1u, edits.size());
    EXPECT_EQ("new", edits[0].insertText);
    EXPECT_TRUE(typeText(engine, ":old").empty());
}

TEST_F(ExpansionEngineTest, SnapshotOutlivesReloadDuringExpansion) {
    auto handle = std::make_shared<RuleSetHandle>(makeRuleSet({{":a", "first"}}));
    ExpansionEngine engine(handle, caps);

    std::shared_ptr<const RuleSet> before = engine.ruleSet();
    handle->store(makeRuleSet({{":b", "second"}}));
    EXPECT_EQ(1u, before->triggerCount());
    EXPECT_EQ(":a", before->triggers()[0].trigger);

    auto edits = typeText(engine, ":b");
    ASSERT_EQ(1u, edits.size());
    EXPECT_EQ("second", edits[0].insertText);
}
