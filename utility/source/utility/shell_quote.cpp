#include <utility/shell_quote.hpp>

#include <algorithm>
#include <cctype>

namespace Utility
{
    namespace
    {
        bool isShellSafe(char c)
        {
            if (std::isalnum(static_cast<unsigned char>(c)))
                return true;

            switch (c)
            {
                case '_':
                case '%':
                case '+':
                case ',':
                case '-':
                case '.':
                case '/':
                case ':':
                case '=':
                case '@':
                case '^':
                    return true;
                default:
                    return false;
            }
        }
    }

    std::string shellQuote(std::string_view raw)
    {
        if (raw.empty())
            return "''";

        if (std::all_of(raw.begin(), raw.end(), isShellSafe))
            return std::string{raw};

        std::string quoted;
        quoted.reserve(raw.size() + 2);
        quoted.push_back('\'');
        for (auto c : raw)
        {
            if (c == '\'')
                quoted += "'\\''";
            else
                quoted.push_back(c);
        }
        quoted.push_back('\'');
        return quoted;
    }

    std::string shellQuoteJoined(std::vector<std::string> const& arguments)
    {
        std::string joined;
        for (auto const& argument : arguments)
        {
            if (!joined.empty())
                joined.push_back(' ');
            joined += shellQuote(argument);
        }
        return joined;
    }
}
