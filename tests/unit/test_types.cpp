#include <gtest/gtest.h>
#include <textexpander/types.h>

using namespace textexpander;

TEST(TypesTest, InstructionHelpers) {
    auto noop = Instruction::NoOp();
    EXPECT_EQ(InstructionType::NoOp, noop.type);
    EXPECT_FALSE(noop.isEdit());
    EXPECT_EQ(0u, noop.deleteCount);

    auto edit = Instruction::Edit(4, "Best regards");
    EXPECT_EQ(InstructionType::Edit, edit.type);
    EXPECT_TRUE(edit.isEdit());
    EXPECT_EQ(4u, edit.deleteCount);
    EXPECT_EQ("Best regards", edit.insertText);

    EXPECT_EQ(Instruction::Edit(4, "Best regards"), edit);
    EXPECT_FALSE(Instruction::Edit(3, "Best regards") == edit);
}

TEST(TypesTest, VariableFactories) {
    auto echo = VariableDef::Echo("name", "Alice");
    EXPECT_EQ(VariableKind::Echo, echo.kind);
    EXPECT_TRUE(echo.params.hasEcho);
    EXPECT_EQ("Alice", echo.params.echo);
    EXPECT_FALSE(echo.params.hasFormat);

    auto date = VariableDef::Date("today", "%d/%m");
    EXPECT_EQ(VariableKind::Date, date.kind);
    EXPECT_TRUE(date.params.hasFormat);
    EXPECT_EQ("%d/%m", date.params.format);

    auto shell = VariableDef::Shell("out", "echo hi");
    EXPECT_EQ(VariableKind::Shell, shell.kind);
    EXPECT_TRUE(shell.params.hasCmd);

    auto clip = VariableDef::Clipboard("clip");
    EXPECT_EQ(VariableKind::Clipboard, clip.kind);
    EXPECT_FALSE(clip.params.hasCmd);
}

TEST(TypesTest, RuleFindVar) {
    Rule rule({":sig", ":s"}, "{{name}}", {VariableDef::Echo("name", "Bob")});
    ASSERT_NE(nullptr, rule.findVar("name"));
    EXPECT_EQ("Bob", rule.findVar("name")->params.echo);
    EXPECT_EQ(nullptr, rule.findVar("other"));
    EXPECT_EQ(2u, rule.triggers.size());
}

TEST(TypesTest, ResolveResultHelpers) {
    auto value = ResolveResult::Value("x");
    EXPECT_TRUE(value.ok());
    EXPECT_EQ("x", value.value);

    auto failure = ResolveResult::CommandFailure(3, false, "exit 3");
    EXPECT_FALSE(failure.ok());
    EXPECT_EQ(ResolveError::CommandFailed, failure.error);
    EXPECT_EQ(3, failure.exitStatus);
    EXPECT_FALSE(failure.timedOut);

    auto timeout = ResolveResult::CommandFailure(-1, true, "slow");
    EXPECT_TRUE(timeout.timedOut);
}

TEST(TypesTest, InputEventFactories) {
    auto ch = InputEvent::Character(U'a');
    EXPECT_EQ(InputEventType::Character, ch.type);
    EXPECT_EQ(U'a', ch.character);
    EXPECT_EQ(InputEventType::Reset, InputEvent::Reset().type);
    EXPECT_EQ(0u, InputEvent::Reset().character);
    EXPECT_EQ(U'\n', InputEvent::Reset(U'\n').character);
    EXPECT_EQ(InputEventType::Backspace, InputEvent::Backspace().type);
}

TEST(TypesTest, StringHelpers) {
    EXPECT_EQ("Success", resultToString(Result::Success));
    EXPECT_EQ("No rules loaded", resultToString(Result::ErrorNoRules));
    EXPECT_EQ("CommandFailed", resolveErrorToString(ResolveError::CommandFailed));
    EXPECT_EQ("shell", variableKindToString(VariableKind::Shell));
    EXPECT_EQ("longest", matchPolicyToString(MatchPolicy::PreferLongest));
    EXPECT_EQ("immediate", matchPolicyToString(MatchPolicy::Immediate));
}
