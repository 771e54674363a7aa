#include <secure_copy/confirmation_gate.hpp>

#include <log/log.hpp>

#include <iostream>
#include <string>

namespace SecureCopy
{
    bool isApproval(std::string_view answer)
    {
        return !answer.empty() && (answer.front() == 'y' || answer.front() == 'Y');
    }

    ConfirmationPrompt makeTerminalConfirmation(std::istream& in, std::ostream& out)
    {
        return [&in, &out](std::string const& renderedCommand) {
            out << renderedCommand << '\n' << "Proceed [y/N]:" << std::flush;

            std::string answer;
            if (!std::getline(in, answer))
                return false;
            return isApproval(answer);
        };
    }

    ConfirmationPrompt makeTerminalConfirmation()
    {
        return makeTerminalConfirmation(std::cin, std::cout);
    }

    bool confirmInvocation(CommandInvocation const& invocation, ConfirmationPrompt const& prompt)
    {
        if (!prompt)
        {
            Log::warn("No confirmation prompt available, declining '{}'.", invocation.render());
            return false;
        }
        return prompt(invocation.render());
    }
}
