#pragma once

#include <secure_copy/command_builder.hpp>

#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>

namespace SecureCopy
{
    /**
     * @brief Shown the rendered command line, returns true if it may run.
     */
    using ConfirmationPrompt = std::function<bool(std::string const& renderedCommand)>;

    /**
     * @brief An answer starting with y or Y approves, anything else (including nothing) declines.
     */
    bool isApproval(std::string_view answer);

    /**
     * @brief Prints the command and "Proceed [y/N]:" to out and reads one line from in.
     *
     * The streams must outlive the returned prompt.
     */
    ConfirmationPrompt makeTerminalConfirmation(std::istream& in, std::ostream& out);

    /**
     * @brief Terminal confirmation on std::cin and std::cout.
     */
    ConfirmationPrompt makeTerminalConfirmation();

    /**
     * @brief Asks the prompt about the invocation. A missing prompt declines.
     */
    bool confirmInvocation(CommandInvocation const& invocation, ConfirmationPrompt const& prompt);
}
