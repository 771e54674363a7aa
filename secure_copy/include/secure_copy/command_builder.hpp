#pragma once

#include <secure_copy/locality.hpp>

#include <string>
#include <vector>

namespace SecureCopy
{
    enum class TransferMode
    {
        // Quiet, never prompts. The transport fails instead of asking for a password.
        Batch,
        // The operator confirms first, the transport may prompt on the terminal.
        Interactive
    };

    /**
     * @brief A fully formed scp command line: [executable, flags, source, destination].
     */
    struct CommandInvocation
    {
        std::vector<std::string> arguments{};
        std::string flags{};

        std::string const& executable() const;

        /**
         * @brief The arguments without the executable.
         */
        std::vector<std::string> childArguments() const;

        /**
         * @brief The command line joined by single spaces, for display.
         */
        std::string render() const;
    };

    /**
     * @brief Decides the flag set for copying source to destination.
     *
     * -p always. -r unless the source is a local path that is not a directory, some scp implementations
     * choke on -r for single files. Remote sources always get -r since their type is unknown here.
     * Batch mode adds -q and -B.
     */
    std::string selectCopyFlags(EndpointSpec const& source, TransferMode mode);

    CommandInvocation buildCopyCommand(
        EndpointSpec const& source,
        EndpointSpec const& destination,
        TransferMode mode,
        std::string const& executable = "scp");
}
