#pragma once

#include <secure_copy/confirmation_gate.hpp>
#include <secure_copy/remote_size_query.hpp>
#include <secure_copy/scp.hpp>
#include <secure_copy/session_state.hpp>
#include <secure_copy/transfer_outcome.hpp>
#include <persistence/state/transport_options.hpp>
#include <process/process_runner.hpp>

#include <memory>
#include <optional>
#include <string>

namespace SecureCopy
{
    struct SessionOptions
    {
        std::string host{};
        std::optional<std::string> user{std::nullopt};
        bool interactive{false};
        std::optional<std::string> cwd{std::nullopt};
        Persistence::TransportOptions transport{};
    };

    /**
     * @brief Remembers host, user and remote working directory for a series of copies, in the style of an ftp client.
     *
     * Not thread safe. Operations block until the spawned scp or ssh exits and report failures as values.
     */
    class Session
    {
      public:
        /**
         * @throws std::invalid_argument If host is empty.
         */
        explicit Session(std::string host, std::string user = {});

        /**
         * @throws std::invalid_argument If options.host is empty.
         */
        explicit Session(SessionOptions options);

        /**
         * @brief Sets the user, an empty user leaves the current one in place.
         * No connection is made, authentication is left to scp and ssh.
         */
        bool login(std::string const& user = {});

        /**
         * @brief Sets the remote working directory used for relative paths. Empty means "/".
         */
        void cwd(std::string const& path = {});

        /**
         * @brief Downloads remote, relative to cwd, to local. local defaults to the basename of remote.
         */
        TransferOutcome get(std::string const& remote, std::string const& local = {}) const;

        /**
         * @brief Uploads local to remote, relative to cwd. remote defaults to the basename of local.
         */
        TransferOutcome put(std::string const& local, std::string const& remote = {}) const;

        /**
         * @brief Size in bytes of the remote file, relative to cwd.
         */
        SizeResult size(std::string const& file) const;

        /**
         * @brief Copies between arbitrary endpoints using this session's settings.
         */
        TransferOutcome scp(std::string const& source, std::string const& destination) const;

        /**
         * @brief Like scp, but confirms first and lets the transport prompt, regardless of the interactive setting.
         */
        TransferOutcome iscp(std::string const& source, std::string const& destination) const;

        // Compatibility with ftp style clients, scp has no transfer modes or connections.
        bool binary() const;
        void quit() const;

        void setInteractive(bool interactive);
        void setProcessRunner(std::shared_ptr<ProcessRunner> processRunner);
        void setConfirmationPrompt(ConfirmationPrompt confirm);

        std::string const& host() const;
        std::optional<std::string> const& user() const;
        std::optional<std::string> const& workingDirectory() const;
        bool interactive() const;
        SessionState const& state() const;

        /**
         * @brief The transport options of this session merged over the defaults.
         */
        Persistence::TransportOptions transportOptions() const;

        std::shared_ptr<ProcessRunner> processRunner() const;
        ConfirmationPrompt confirmationPrompt() const;

      private:
        SessionState state_;
        Persistence::TransportOptions transport_;
        std::shared_ptr<ProcessRunner> processRunner_;
        ConfirmationPrompt confirm_;
    };
}
