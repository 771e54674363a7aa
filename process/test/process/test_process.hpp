#pragma once

#include <process/process.hpp>

#include <boost/asio/io_context.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <string>

namespace Test
{
    TEST(ProcessTests, WrittenInputIsEchoedBack)
    {
        boost::asio::io_context context;
        auto process = std::make_shared<Process>(context);
        ASSERT_TRUE(process->spawn("cat", {}).has_value());
        EXPECT_TRUE(process->running());
        EXPECT_GT(process->pid(), 0);

        std::string output;
        process->startReading(
            [&output](std::string_view data) {
                output.append(data);
                return true;
            },
            [](std::string_view) {
                return true;
            });

        process->write("echo me\n");
        process->closeStdin();
        context.run();

        EXPECT_EQ(process->waitForExit(), 0);
        EXPECT_EQ(output, "echo me\n");
        EXPECT_EQ(process->exitCode(), 0);
        EXPECT_FALSE(process->running());
    }

    TEST(ProcessTests, TerminateStopsALongRunningChild)
    {
        boost::asio::io_context context;
        auto process = std::make_shared<Process>(context);
        ASSERT_TRUE(process->spawn("sleep", {"30"}).has_value());

        process->terminate();
        process->waitForExit();
        EXPECT_FALSE(process->running());
    }

    TEST(ProcessTests, ExitCodeIsEmptyBeforeExit)
    {
        boost::asio::io_context context;
        auto process = std::make_shared<Process>(context);
        EXPECT_FALSE(process->exitCode().has_value());
    }
}
