#include <secure_copy/scp.hpp>
#include <secure_copy/command_builder.hpp>
#include <secure_copy/session.hpp>
#include <secure_copy/transfer_runner.hpp>

namespace SecureCopy
{
    namespace Detail
    {
        TransferOutcome copy(TransferRequest const& request, CopyContext const& context, Session const* session)
        {
            auto options = context.options;
            if (session != nullptr)
                options.useDefaultsFrom(session->transportOptions());
            options.useDefaultsFrom(Persistence::TransportOptions::defaults());

            // Session callers fold their interactive setting into the request.
            const bool interactive = request.interactive || (session == nullptr && options.interactive.value_or(false));
            const auto mode = interactive ? TransferMode::Interactive : TransferMode::Batch;

            auto processRunner = context.processRunner;
            if (!processRunner)
                processRunner = session != nullptr ? session->processRunner() : makeDefaultProcessRunner();

            auto confirm = context.confirm;
            if (!confirm)
                confirm = session != nullptr ? session->confirmationPrompt() : makeTerminalConfirmation();

            const auto invocation = buildCopyCommand(request.source, request.destination, mode, *options.scpExecutable);
            return TransferRunner{std::move(processRunner), std::move(confirm)}.run(invocation, mode);
        }
    }

    TransferOutcome
    scp(std::string const& source, std::string const& destination, bool interactive, CopyContext const& context)
    {
        return Detail::copy(
            TransferRequest{.source = source, .destination = destination, .interactive = interactive}, context, nullptr);
    }

    TransferOutcome iscp(std::string const& source, std::string const& destination, CopyContext const& context)
    {
        return scp(source, destination, true, context);
    }
}
