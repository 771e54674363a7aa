#include <secure_copy/transfer_runner.hpp>

#include <log/log.hpp>

#include <stdexcept>

namespace SecureCopy
{
    TransferRunner::TransferRunner(std::shared_ptr<ProcessRunner> processRunner, ConfirmationPrompt confirm)
        : processRunner_{std::move(processRunner)}
        , confirm_{std::move(confirm)}
    {
        if (!processRunner_)
            throw std::invalid_argument("TransferRunner requires a process runner.");
    }

    TransferOutcome TransferRunner::run(CommandInvocation const& invocation, TransferMode mode) const
    {
        if (mode == TransferMode::Interactive && !confirmInvocation(invocation, confirm_))
        {
            Log::info("User declined '{}'.", invocation.render());
            return TransferOutcome::failed(TransferErrorType::UserDeclined, "User declined");
        }

        Log::debug("Running '{}'.", invocation.render());
        const auto result = processRunner_->run(invocation.executable(), invocation.childArguments());
        if (!result)
        {
            Log::error("Could not run '{}': {}", invocation.render(), result.error());
            return TransferOutcome::failed(TransferErrorType::SpawnFailure, result.error());
        }

        if (result->exitCode == 0)
            return TransferOutcome::succeeded();

        auto message = result->standardError;
        if (message.empty())
            message = invocation.executable() + " exited with status " + std::to_string(result->exitCode);

        Log::error("'{}' failed with status {}: {}", invocation.render(), result->exitCode, message);
        return TransferOutcome::failed(TransferErrorType::TransportFailure, std::move(message));
    }
}
