#pragma once

#include <process/process_runner.hpp>

#include <gmock/gmock.h>

#include <expected>
#include <string>
#include <vector>

namespace Test
{
    class ProcessRunnerMock : public ProcessRunner
    {
      public:
        MOCK_METHOD(
            (std::expected<ProcessResult, std::string>),
            run,
            (std::string const& executable, std::vector<std::string> const& arguments),
            (override));
    };
}
