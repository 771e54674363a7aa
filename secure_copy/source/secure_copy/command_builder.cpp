#include <secure_copy/command_builder.hpp>

namespace SecureCopy
{
    std::string const& CommandInvocation::executable() const
    {
        return arguments.front();
    }

    std::vector<std::string> CommandInvocation::childArguments() const
    {
        if (arguments.empty())
            return {};
        return {arguments.begin() + 1, arguments.end()};
    }

    std::string CommandInvocation::render() const
    {
        std::string rendered;
        for (auto const& argument : arguments)
        {
            if (!rendered.empty())
                rendered.push_back(' ');
            rendered += argument;
        }
        return rendered;
    }

    std::string selectCopyFlags(EndpointSpec const& source, TransferMode mode)
    {
        std::string flags = "-p";
        if (source.isRemote() || isDirectory(source.str()))
            flags.push_back('r');
        if (mode == TransferMode::Batch)
            flags += "qB";
        return flags;
    }

    CommandInvocation buildCopyCommand(
        EndpointSpec const& source,
        EndpointSpec const& destination,
        TransferMode mode,
        std::string const& executable)
    {
        CommandInvocation invocation{};
        invocation.flags = selectCopyFlags(source, mode);
        invocation.arguments = {executable, invocation.flags, source.str(), destination.str()};
        return invocation;
    }
}
