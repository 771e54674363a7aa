#pragma once

#include <expected>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Everything a finished child left behind.
 */
struct ProcessResult
{
    int exitCode{0};
    std::string standardOutput{};
    std::string standardError{};
};

/**
 * @brief Runs a command to completion. One call spawns at most one child.
 */
class ProcessRunner
{
  public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Spawns the executable, drains its output streams and waits for it to exit.
     *
     * @param executable Executable name (searched in PATH) or path.
     * @param arguments Arguments, not including the program name.
     * @return std::expected<ProcessResult, std::string> The result, or why the child could not be started.
     */
    virtual std::expected<ProcessResult, std::string>
    run(std::string const& executable, std::vector<std::string> const& arguments) = 0;
};

/**
 * @brief Runs children through boost::process with three pipes.
 * stdin is closed right after spawning, stdout and stderr are read concurrently until EOF.
 */
class BoostProcessRunner : public ProcessRunner
{
  public:
    std::expected<ProcessResult, std::string>
    run(std::string const& executable, std::vector<std::string> const& arguments) override;
};

std::shared_ptr<ProcessRunner> makeDefaultProcessRunner();
