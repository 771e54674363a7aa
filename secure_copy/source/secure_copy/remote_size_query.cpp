#include <secure_copy/remote_size_query.hpp>

#include <log/log.hpp>
#include <utility/shell_quote.hpp>

#include <cctype>
#include <charconv>
#include <stdexcept>

namespace SecureCopy
{
    namespace
    {
        std::string firstLine(std::string_view text)
        {
            const auto newline = text.find('\n');
            if (newline != std::string_view::npos)
                text = text.substr(0, newline);
            return std::string{text};
        }

        std::string stripTrailingNewlines(std::string text)
        {
            while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
                text.pop_back();
            return text;
        }
    }

    std::optional<std::uintmax_t> parseByteCount(std::string_view line)
    {
        std::size_t begin = 0;
        while (begin < line.size() && std::isspace(static_cast<unsigned char>(line[begin])))
            ++begin;

        std::size_t end = begin;
        while (end < line.size() && std::isdigit(static_cast<unsigned char>(line[end])))
            ++end;

        if (end == begin)
            return std::nullopt;

        std::uintmax_t value = 0;
        const auto [ptr, ec] = std::from_chars(line.data() + begin, line.data() + end, value);
        if (ec != std::errc{} || ptr != line.data() + end)
            return std::nullopt;
        return value;
    }

    RemoteSizeQuery::RemoteSizeQuery(
        std::shared_ptr<ProcessRunner> processRunner,
        std::string sshExecutable,
        std::vector<std::string> sshOptions)
        : processRunner_{std::move(processRunner)}
        , sshExecutable_{std::move(sshExecutable)}
        , sshOptions_{std::move(sshOptions)}
    {
        if (!processRunner_)
            throw std::invalid_argument("RemoteSizeQuery requires a process runner.");
    }

    std::vector<std::string>
    RemoteSizeQuery::buildArguments(SessionState const& session, std::string const& remotePath) const
    {
        std::vector<std::string> arguments = sshOptions_;
        arguments.push_back(session.target());
        arguments.push_back("wc");
        arguments.push_back("-c");
        arguments.push_back(Utility::shellQuote(session.resolve(remotePath)));
        return arguments;
    }

    SizeResult RemoteSizeQuery::query(SessionState const& session, std::string const& remotePath) const
    {
        const auto arguments = buildArguments(session, remotePath);
        Log::debug("Querying remote size: {} {}", sshExecutable_, Utility::shellQuoteJoined(arguments));

        const auto result = processRunner_->run(sshExecutable_, arguments);
        if (!result)
        {
            Log::warn("Could not run {} for size query: {}", sshExecutable_, result.error());
            return std::unexpected(SizeQueryError{SizeQueryErrorType::SpawnFailure, result.error()});
        }

        if (result->exitCode != 0)
        {
            auto message = stripTrailingNewlines(result->standardError);
            if (message.empty())
                message = "wc exited with status " + std::to_string(result->exitCode);
            Log::warn("Size query for '{}' on {} failed: {}", remotePath, session.host, message);
            return std::unexpected(SizeQueryError{SizeQueryErrorType::TransportFailure, std::move(message)});
        }

        const auto line = firstLine(result->standardOutput);
        if (const auto bytes = parseByteCount(line); bytes)
            return *bytes;

        Log::warn("Unparsable size query output for '{}': {}", remotePath, line);
        return std::unexpected(
            SizeQueryError{SizeQueryErrorType::UnparsableRemoteOutput, "unparsable output from remote wc: " + line});
    }
}
