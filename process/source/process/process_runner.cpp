#include <process/process_runner.hpp>
#include <process/process.hpp>

#include <log/log.hpp>

#include <boost/asio/io_context.hpp>

std::expected<ProcessResult, std::string>
BoostProcessRunner::run(std::string const& executable, std::vector<std::string> const& arguments)
{
    boost::asio::io_context context;
    ProcessResult result{};

    {
        auto process = std::make_shared<Process>(context);
        if (auto spawned = process->spawn(executable, arguments); !spawned)
            return std::unexpected(spawned.error());

        process->closeStdin();
        process->startReading(
            [&result](std::string_view data) {
                result.standardOutput.append(data);
                return true;
            },
            [&result](std::string_view data) {
                result.standardError.append(data);
                return true;
            });

        // Returns once both output pipes reached EOF.
        context.run();

        const auto exitCode = process->waitForExit();
        if (!exitCode)
            return std::unexpected("Could not collect exit status of '" + executable + "'.");
        result.exitCode = *exitCode;
    }

    Log::trace(
        "'{}' exited with {}, {} bytes on stdout, {} bytes on stderr.",
        executable,
        result.exitCode,
        result.standardOutput.size(),
        result.standardError.size());
    return result;
}

std::shared_ptr<ProcessRunner> makeDefaultProcessRunner()
{
    return std::make_shared<BoostProcessRunner>();
}
