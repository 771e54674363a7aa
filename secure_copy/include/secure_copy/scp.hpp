#pragma once

#include <secure_copy/confirmation_gate.hpp>
#include <secure_copy/locality.hpp>
#include <secure_copy/transfer_outcome.hpp>
#include <persistence/state/transport_options.hpp>
#include <process/process_runner.hpp>

#include <memory>
#include <string>

namespace SecureCopy
{
    class Session;

    /**
     * @brief Per-call overrides. Unset members fall back to the session (if any) and then to the defaults.
     */
    struct CopyContext
    {
        Persistence::TransportOptions options{};
        std::shared_ptr<ProcessRunner> processRunner{};
        ConfirmationPrompt confirm{};
    };

    struct TransferRequest
    {
        EndpointSpec source;
        EndpointSpec destination;
        bool interactive{false};
    };

    /**
     * @brief Copies source to destination with scp in batch mode (-pqB, plus -r where applicable).
     * Either side may be a local path or [user@]host:path.
     */
    TransferOutcome scp(
        std::string const& source,
        std::string const& destination,
        bool interactive = false,
        CopyContext const& context = {});

    /**
     * @brief Shows the scp command, asks for confirmation and runs it without -q and -B,
     * so scp may ask for a password on the terminal.
     */
    TransferOutcome iscp(std::string const& source, std::string const& destination, CopyContext const& context = {});

    namespace Detail
    {
        /**
         * @brief The single copy implementation behind the free functions and the Session methods.
         *
         * @param request What to copy.
         * @param context Per-call overrides.
         * @param session The session to take options, runner and prompt from, nullptr for free calls.
         */
        TransferOutcome copy(TransferRequest const& request, CopyContext const& context, Session const* session);
    }
}
