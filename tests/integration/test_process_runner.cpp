#include <gtest/gtest.h>
#include "../../src/platform/process.h"
#include "../../src/platform/system_capabilities.h"
#include <chrono>

using namespace textexpander;
using std::chrono::milliseconds;

namespace {

constexpr milliseconds kGenerous{5000};

} // namespace

TEST(ProcessRunnerTest, CapturesStdout) {
    CommandResult result = ProcessRunner::runShell("echo hello; printf 'two\\n'", kGenerous);
    EXPECT_EQ(CommandStatus::Success, result.status);
    EXPECT_EQ(0, result.exitStatus);
    EXPECT_EQ("hello\ntwo\n", result.output);
}

TEST(ProcessRunnerTest, StderrIsNotCaptured) {
    CommandResult result = ProcessRunner::runShell("echo out; echo err >&2", kGenerous);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ("out\n", result.output);
}

TEST(ProcessRunnerTest, StdinIsEmpty) {
    CommandResult result = ProcessRunner::runShell("cat", kGenerous);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ("", result.output);
}

TEST(ProcessRunnerTest, NonZeroExit) {
    CommandResult result = ProcessRunner::runShell("echo partial; exit 3", kGenerous);
    EXPECT_EQ(CommandStatus::NonZeroExit, result.status);
    EXPECT_EQ(3, result.exitStatus);
    EXPECT_EQ("partial\n", result.output);
}

TEST(ProcessRunnerTest, KilledBySignal) {
    CommandResult result = ProcessRunner::runShell("kill -9 $$", kGenerous);
    EXPECT_EQ(CommandStatus::NonZeroExit, result.status);
    EXPECT_EQ(128 + 9, result.exitStatus);
}

TEST(ProcessRunnerTest, TimeoutKillsCommand) {
    auto start = std::chrono::steady_clock::now();
    CommandResult result = ProcessRunner::runShell("sleep 10", milliseconds(200));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(CommandStatus::TimedOut, result.status);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(ProcessRunnerTest, TimeoutKillsBackgroundChildrenToo) {
    auto start = std::chrono::steady_clock::now();
    CommandResult result = ProcessRunner::runShell("sleep 10 & echo started; wait", milliseconds(300));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(CommandStatus::TimedOut, result.status);
    EXPECT_EQ("started\n", result.output);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(ProcessRunnerTest, ChildClosingStdoutEarlyIsStillTimed) {
    CommandResult result = ProcessRunner::runShell("exec >&-; sleep 10", milliseconds(300));
    EXPECT_EQ(CommandStatus::TimedOut, result.status);
}

TEST(ProcessRunnerTest, MissingProgram) {
    CommandResult result = ProcessRunner::run({"/nonexistent/program", "arg"}, kGenerous);
    EXPECT_EQ(CommandStatus::SpawnFailed, result.status);
    EXPECT_NE(std::string::npos, result.message.find("/nonexistent/program"));
}

TEST(ProcessRunnerTest, EmptyArgv) {
    EXPECT_EQ(CommandStatus::SpawnFailed, ProcessRunner::run({}, kGenerous).status);
}

TEST(ProcessRunnerTest, ArgumentsAreNotShellExpanded) {
    CommandResult result = ProcessRunner::run({"printf", "%s", "$HOME *"}, kGenerous);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ("$HOME *", result.output);
}

TEST(SystemCapabilitiesTest, RunCommandUsesShell) {
    SystemCapabilities caps;
    CommandResult result = caps.runCommand("echo $((1 + 2))", kGenerous);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ("3\n", result.output);
}

TEST(SystemCapabilitiesTest, ClipboardFromCommand) {
    SystemCapabilities caps("printf 'copied\\n'");
    ClipboardResult clip = caps.readClipboard();
    EXPECT_TRUE(clip.available);
    EXPECT_EQ("copied\n", clip.text);
}

TEST(SystemCapabilitiesTest, ClipboardFailures) {
    SystemCapabilities failing("exit 1");
    EXPECT_FALSE(failing.readClipboard().available);

    SystemCapabilities none("");
    EXPECT_FALSE(none.readClipboard().available);

    SystemCapabilities slow("sleep 10", milliseconds(100));
    ClipboardResult clip = slow.readClipboard();
    EXPECT_FALSE(clip.available);
    EXPECT_NE(std::string::npos, clip.message.find("timed out"));
}

TEST(SystemCapabilitiesTest, ClockIsCurrent) {
    SystemCapabilities caps;
    auto before = std::chrono::system_clock::now();
    auto now = caps.currentTime();
    EXPECT_GE(now, before);
}
