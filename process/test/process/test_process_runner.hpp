#pragma once

#include <process/process_runner.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace Test
{
    class ProcessRunnerTests : public ::testing::Test
    {
      protected:
        std::expected<ProcessResult, std::string> shell(std::string const& script)
        {
            return runner_->run("sh", {"-c", script});
        }

      protected:
        std::shared_ptr<ProcessRunner> runner_{makeDefaultProcessRunner()};
    };

    TEST_F(ProcessRunnerTests, CapturesStdoutAndZeroExitCode)
    {
        const auto result = shell("echo hello");
        ASSERT_TRUE(result.has_value()) << result.error();
        EXPECT_EQ(result->exitCode, 0);
        EXPECT_EQ(result->standardOutput, "hello\n");
        EXPECT_TRUE(result->standardError.empty());
    }

    TEST_F(ProcessRunnerTests, ReportsNonZeroExitCode)
    {
        const auto result = shell("exit 3");
        ASSERT_TRUE(result.has_value()) << result.error();
        EXPECT_EQ(result->exitCode, 3);
    }

    TEST_F(ProcessRunnerTests, CapturesMultiLineStderr)
    {
        const auto result = shell("printf 'one\\ntwo\\nthree\\n' >&2; exit 1");
        ASSERT_TRUE(result.has_value()) << result.error();
        EXPECT_EQ(result->exitCode, 1);
        EXPECT_EQ(result->standardError, "one\ntwo\nthree\n");
    }

    TEST_F(ProcessRunnerTests, SeparatesStdoutFromStderr)
    {
        const auto result = shell("echo out; echo err >&2");
        ASSERT_TRUE(result.has_value()) << result.error();
        EXPECT_EQ(result->standardOutput, "out\n");
        EXPECT_EQ(result->standardError, "err\n");
    }

    TEST_F(ProcessRunnerTests, LargeOutputOnBothStreamsDoesNotDeadlock)
    {
        const auto result =
            shell("head -c 1048576 /dev/zero | tr '\\000' o; head -c 1048576 /dev/zero | tr '\\000' e >&2");
        ASSERT_TRUE(result.has_value()) << result.error();
        EXPECT_EQ(result->exitCode, 0);
        EXPECT_EQ(result->standardOutput.size(), 1048576u);
        EXPECT_EQ(result->standardError.size(), 1048576u);
        EXPECT_EQ(result->standardError.find_first_not_of('e'), std::string::npos);
    }

    TEST_F(ProcessRunnerTests, StdinIsClosedForTheChild)
    {
        const auto result = runner_->run("cat", {});
        ASSERT_TRUE(result.has_value()) << result.error();
        EXPECT_EQ(result->exitCode, 0);
        EXPECT_TRUE(result->standardOutput.empty());
    }

    TEST_F(ProcessRunnerTests, ArgumentsArePassedVerbatim)
    {
        const auto result = runner_->run("printf", {"%s|", "with space", "semi;colon", "$HOME"});
        ASSERT_TRUE(result.has_value()) << result.error();
        EXPECT_EQ(result->standardOutput, "with space|semi;colon|$HOME|");
    }

    TEST_F(ProcessRunnerTests, MissingExecutableIsAnError)
    {
        const auto result = runner_->run("net-scp-no-such-executable", {});
        EXPECT_FALSE(result.has_value());
    }

    TEST_F(ProcessRunnerTests, MissingAbsolutePathIsAnError)
    {
        const auto result = runner_->run("/nonexistent/net-scp/bin", {});
        EXPECT_FALSE(result.has_value());
    }
}
