/**
 * @file test_external_tool_runner.cpp
 * @brief Unit tests for the external tool runner
 */

#include <gtest/gtest.h>
#include <lanscope/core/external_tool_runner.hpp>

#include <chrono>
#include <string>

using namespace lanscope::core;
using namespace std::chrono_literals;

class ExternalToolRunnerTest : public ::testing::Test {
protected:
    ExternalToolRunner runner_;
};

TEST_F(ExternalToolRunnerTest, CapturesStdout) {
    ToolOutput out = runner_.execute("echo", {"hello", "lan"}, 5s);
    EXPECT_EQ(out.outcome, ToolOutcome::Completed);
    EXPECT_EQ(out.text, "hello lan\n");
    EXPECT_EQ(out.exitCode, 0);
}

TEST_F(ExternalToolRunnerTest, CapturesStderrAndExitCode) {
    ToolOutput out = runner_.execute("sh", {"-c", "echo oops 1>&2; exit 3"}, 5s);
    EXPECT_EQ(out.outcome, ToolOutcome::Completed);
    EXPECT_EQ(out.text, "oops\n");
    EXPECT_EQ(out.exitCode, 3);
}

TEST_F(ExternalToolRunnerTest, SilentCommandReturnsNoOutputSentinel) {
    EXPECT_EQ(runner_.run("true", {}, 5s), kNoOutput);
}

TEST_F(ExternalToolRunnerTest, TimeoutIsHonored) {
    auto start = std::chrono::steady_clock::now();
    std::string text = runner_.run("sleep", {"1"}, 500ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(text, "Timed out after 500ms: sleep");
    EXPECT_TRUE(isTimeoutMessage(text));
    EXPECT_GE(elapsed, 490ms);
    EXPECT_LT(elapsed, 900ms);
}

TEST_F(ExternalToolRunnerTest, TimedOutExecuteKeepsPartialOutput) {
    ToolOutput out = runner_.execute("sh", {"-c", "echo partial; sleep 2"}, 300ms);
    EXPECT_EQ(out.outcome, ToolOutcome::TimedOut);
    EXPECT_EQ(out.text, "partial\n");
}

TEST_F(ExternalToolRunnerTest, BackgroundChildHoldingPipeDoesNotDelayCompletion) {
    auto start = std::chrono::steady_clock::now();
    ToolOutput out = runner_.execute("sh", {"-c", "echo hi; sleep 5 &"}, 4s);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(out.outcome, ToolOutcome::Completed);
    EXPECT_NE(out.text.find("hi"), std::string::npos) << out.text;
    EXPECT_EQ(out.exitCode, 0);
    EXPECT_LT(elapsed, 2s);
}

TEST_F(ExternalToolRunnerTest, OutputWrittenJustBeforeExitIsKept) {
    ToolOutput out = runner_.execute("sh", {"-c", "sleep 0.1; printf 'a%.0s' $(seq 1 20000)"}, 5s);
    EXPECT_EQ(out.outcome, ToolOutcome::Completed);
    EXPECT_EQ(out.text.size(), 20000u);
}

TEST_F(ExternalToolRunnerTest, MissingBinaryIsReportedAsText) {
    ToolOutput out = runner_.execute("lanscope-no-such-tool", {}, 1s);
    EXPECT_EQ(out.outcome, ToolOutcome::SpawnFailed);

    std::string text = runner_.run("lanscope-no-such-tool", {}, 1s);
    EXPECT_TRUE(isSpawnError(text)) << text;
    EXPECT_FALSE(isTimeoutMessage(text));
}

TEST(ToolMessageTest, SentinelsAreRecognized) {
    EXPECT_EQ(timeoutMessage("dns-sd", 10000ms), "Timed out after 10000ms: dns-sd");
    EXPECT_TRUE(isTimeoutMessage(timeoutMessage("dns-sd", 2000ms)));
    EXPECT_FALSE(isTimeoutMessage("Add 3 6 local. _hap._tcp."));
    EXPECT_TRUE(isSpawnError("Error: Failed to launch dns-sd: No such file or directory"));
    EXPECT_FALSE(isSpawnError("No output"));
}
