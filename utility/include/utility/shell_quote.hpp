#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace Utility
{
    /**
     * @brief Turns the input into exactly one word for a POSIX shell.
     *
     * Strings made only of characters the shell does not interpret are returned unchanged.
     * Everything else is wrapped in single quotes, embedded single quotes become '\''.
     * The empty string becomes ''.
     *
     * @param raw The unquoted argument.
     * @return std::string The quoted argument.
     */
    std::string shellQuote(std::string_view raw);

    /**
     * @brief Quotes every argument and joins them with single spaces.
     */
    std::string shellQuoteJoined(std::vector<std::string> const& arguments);
}
