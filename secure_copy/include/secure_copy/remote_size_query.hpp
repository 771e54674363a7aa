#pragma once

#include <secure_copy/session_state.hpp>
#include <process/process_runner.hpp>

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace SecureCopy
{
    enum class SizeQueryErrorType
    {
        SpawnFailure,
        TransportFailure,
        UnparsableRemoteOutput,
    };

    struct SizeQueryError
    {
        SizeQueryErrorType type;
        std::string message;
    };

    /**
     * @brief Bytes on success, 0 included. Failure is only ever signaled through the error alternative.
     */
    using SizeResult = std::expected<std::uintmax_t, SizeQueryError>;

    /**
     * @brief Parses the leading digit run of a "wc -c" output line.
     *
     * Leading whitespace is skipped and anything after the digits is ignored ("1234 file.txt" is 1234).
     *
     * @return std::optional<std::uintmax_t> nullopt if there are no digits or they overflow.
     */
    std::optional<std::uintmax_t> parseByteCount(std::string_view line);

    /**
     * @brief Determines remote file sizes by running "wc -c" through ssh.
     */
    class RemoteSizeQuery
    {
      public:
        RemoteSizeQuery(
            std::shared_ptr<ProcessRunner> processRunner,
            std::string sshExecutable = "ssh",
            std::vector<std::string> sshOptions = {});

        /**
         * @brief The ssh arguments used to count the bytes of path, not including the executable.
         * The path is shell quoted, the remote shell sees exactly one argument for it.
         */
        std::vector<std::string> buildArguments(SessionState const& session, std::string const& remotePath) const;

        /**
         * @brief Queries the size of remotePath, resolved against the session cwd if relative.
         */
        SizeResult query(SessionState const& session, std::string const& remotePath) const;

      private:
        std::shared_ptr<ProcessRunner> processRunner_;
        std::string sshExecutable_;
        std::vector<std::string> sshOptions_;
    };
}
