#pragma once

#include <secure_copy/remote_size_query.hpp>
#include <process/mocks/process_runner_mock.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <limits>
#include <memory>
#include <string>

using namespace std::string_literals;

namespace SecureCopy::Test
{
    class RemoteSizeQueryTests : public ::testing::Test
    {
      protected:
        void respondWith(int exitCode, std::string standardOutput, std::string standardError = {})
        {
            EXPECT_CALL(*runner_, run("ssh", ::testing::_))
                .WillOnce(::testing::Return(ProcessResult{
                    .exitCode = exitCode,
                    .standardOutput = std::move(standardOutput),
                    .standardError = std::move(standardError),
                }));
        }

      protected:
        std::shared_ptr<::testing::StrictMock<::Test::ProcessRunnerMock>> runner_{
            std::make_shared<::testing::StrictMock<::Test::ProcessRunnerMock>>()};
        SessionState session_{.host = "example.org", .user = "bob", .cwd = std::nullopt, .interactive = false};
        RemoteSizeQuery query_{runner_};
    };

    TEST(ParseByteCountTests, AcceptsLeadingDigitRun)
    {
        EXPECT_EQ(parseByteCount("1234"), 1234u);
        EXPECT_EQ(parseByteCount("   77"), 77u);
        EXPECT_EQ(parseByteCount("\t5 /home/bob/file.txt"), 5u);
        EXPECT_EQ(parseByteCount("0"), 0u);
        EXPECT_EQ(parseByteCount("12abc"), 12u);
    }

    TEST(ParseByteCountTests, RejectsOutputWithoutLeadingDigits)
    {
        EXPECT_FALSE(parseByteCount("").has_value());
        EXPECT_FALSE(parseByteCount("   ").has_value());
        EXPECT_FALSE(parseByteCount("wc: file: No such file").has_value());
        EXPECT_FALSE(parseByteCount("-1").has_value());
    }

    TEST(ParseByteCountTests, RejectsOverflow)
    {
        EXPECT_FALSE(parseByteCount(std::to_string(std::numeric_limits<std::uintmax_t>::max()) + "0").has_value());
    }

    TEST_F(RemoteSizeQueryTests, BuildsSshWcCommandForTarget)
    {
        EXPECT_THAT(
            query_.buildArguments(session_, "/srv/data.bin"),
            ::testing::ElementsAre("bob@example.org", "wc", "-c", "/srv/data.bin"));
    }

    TEST_F(RemoteSizeQueryTests, SshOptionsPrecedeTarget)
    {
        RemoteSizeQuery query{runner_, "ssh", {"-p", "2222"}};
        session_.user = std::nullopt;
        EXPECT_THAT(
            query.buildArguments(session_, "/a"), ::testing::ElementsAre("-p", "2222", "example.org", "wc", "-c", "/a"));
    }

    TEST_F(RemoteSizeQueryTests, PathWithSpaceBecomesOneShellWord)
    {
        const auto arguments = query_.buildArguments(session_, "/srv/my file.txt");
        ASSERT_EQ(arguments.size(), 4u);
        EXPECT_EQ(arguments.back(), "'/srv/my file.txt'");
    }

    TEST_F(RemoteSizeQueryTests, MetacharactersAreNotInjected)
    {
        const auto arguments = query_.buildArguments(session_, "a; rm -rf ~");
        EXPECT_EQ(arguments.back(), "'a; rm -rf ~'");
    }

    TEST_F(RemoteSizeQueryTests, RelativePathIsResolvedAgainstCwd)
    {
        session_.cwd = "/home/bob";
        EXPECT_EQ(query_.buildArguments(session_, "file.txt").back(), "/home/bob/file.txt");
        EXPECT_EQ(query_.buildArguments(session_, "/abs.txt").back(), "/abs.txt");
    }

    TEST_F(RemoteSizeQueryTests, ParsesByteCount)
    {
        respondWith(0, "4096 /srv/data.bin\n");
        const auto result = query_.query(session_, "/srv/data.bin");
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(*result, 4096u);
    }

    TEST_F(RemoteSizeQueryTests, ZeroByteFileIsNotAFailure)
    {
        respondWith(0, "0\n");
        const auto result = query_.query(session_, "/srv/empty");
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(*result, 0u);
    }

    TEST_F(RemoteSizeQueryTests, OnlyFirstLineIsParsed)
    {
        respondWith(0, "garbage\n12\n");
        const auto result = query_.query(session_, "/srv/a");
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, SizeQueryErrorType::UnparsableRemoteOutput);
        EXPECT_EQ(result.error().message, "unparsable output from remote wc: garbage");
    }

    TEST_F(RemoteSizeQueryTests, EmptyOutputIsUnparsable)
    {
        respondWith(0, "");
        const auto result = query_.query(session_, "/srv/a");
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, SizeQueryErrorType::UnparsableRemoteOutput);
    }

    TEST_F(RemoteSizeQueryTests, NonzeroExitCarriesDrainedStderr)
    {
        respondWith(1, "", "wc: /srv/missing: No such file or directory\nsecond line\n");
        const auto result = query_.query(session_, "/srv/missing");
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, SizeQueryErrorType::TransportFailure);
        EXPECT_EQ(result.error().message, "wc: /srv/missing: No such file or directory\nsecond line");
    }

    TEST_F(RemoteSizeQueryTests, NonzeroExitWithoutStderrReportsStatus)
    {
        respondWith(255, "");
        const auto result = query_.query(session_, "/srv/a");
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().message, "wc exited with status 255");
    }

    TEST_F(RemoteSizeQueryTests, SpawnFailureIsReportedAsValue)
    {
        EXPECT_CALL(*runner_, run).WillOnce(::testing::Return(std::unexpected("Executable not found in PATH: ssh"s)));
        const auto result = query_.query(session_, "/srv/a");
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, SizeQueryErrorType::SpawnFailure);
    }

    TEST_F(RemoteSizeQueryTests, UsesConfiguredSshExecutable)
    {
        RemoteSizeQuery query{runner_, "/usr/local/bin/ssh"};
        EXPECT_CALL(*runner_, run("/usr/local/bin/ssh", ::testing::_))
            .WillOnce(::testing::Return(ProcessResult{.exitCode = 0, .standardOutput = "3\n", .standardError = {}}));
        EXPECT_EQ(query.query(session_, "/a").value(), 3u);
    }
}
