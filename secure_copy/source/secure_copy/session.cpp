#include <secure_copy/session.hpp>

#include <log/log.hpp>
#include <utility/remote_path.hpp>

#include <stdexcept>

namespace SecureCopy
{
    Session::Session(std::string host, std::string user)
        : Session{SessionOptions{
              .host = std::move(host),
              .user = user.empty() ? std::nullopt : std::optional<std::string>{std::move(user)},
          }}
    {}

    Session::Session(SessionOptions options)
        : state_{
              .host = std::move(options.host),
              .user = std::move(options.user),
              .cwd = std::move(options.cwd),
              .interactive = options.interactive || options.transport.interactive.value_or(false),
          }
        , transport_{std::move(options.transport)}
        , processRunner_{}
        , confirm_{}
    {
        if (state_.host.empty())
            throw std::invalid_argument("Session requires a host.");
        if (state_.user && state_.user->empty())
            state_.user = std::nullopt;

        if (transport_.logLevel)
            Log::setLevel(Log::levelFromString(*transport_.logLevel));
    }

    bool Session::login(std::string const& user)
    {
        if (!user.empty())
            state_.user = user;
        return true;
    }

    void Session::cwd(std::string const& path)
    {
        state_.cwd = path.empty() ? std::string{"/"} : path;
    }

    TransferOutcome Session::get(std::string const& remote, std::string const& local) const
    {
        const auto resolvedRemote = state_.resolve(remote);
        const auto localPath = local.empty() ? Utility::baseName(resolvedRemote) : local;

        return Detail::copy(
            TransferRequest{
                .source = EndpointSpec::remote(state_.host, state_.user, resolvedRemote),
                .destination = localPath,
                .interactive = state_.interactive,
            },
            {},
            this);
    }

    TransferOutcome Session::put(std::string const& local, std::string const& remote) const
    {
        const auto remotePath = state_.resolve(remote.empty() ? Utility::baseName(local) : remote);
        const auto destination = EndpointSpec::remote(state_.host, state_.user, remotePath);

        Log::info("scp {} {}", local, destination.str());
        return Detail::copy(
            TransferRequest{
                .source = local,
                .destination = destination,
                .interactive = state_.interactive,
            },
            {},
            this);
    }

    SizeResult Session::size(std::string const& file) const
    {
        const auto options = transportOptions();
        return RemoteSizeQuery{processRunner(), *options.sshExecutable, *options.sshOptions}.query(state_, file);
    }

    TransferOutcome Session::scp(std::string const& source, std::string const& destination) const
    {
        return Detail::copy(
            TransferRequest{.source = source, .destination = destination, .interactive = state_.interactive}, {}, this);
    }

    TransferOutcome Session::iscp(std::string const& source, std::string const& destination) const
    {
        return Detail::copy(TransferRequest{.source = source, .destination = destination, .interactive = true}, {}, this);
    }

    bool Session::binary() const
    {
        return true;
    }

    void Session::quit() const
    {}

    void Session::setInteractive(bool interactive)
    {
        state_.interactive = interactive;
    }

    void Session::setProcessRunner(std::shared_ptr<ProcessRunner> processRunner)
    {
        processRunner_ = std::move(processRunner);
    }

    void Session::setConfirmationPrompt(ConfirmationPrompt confirm)
    {
        confirm_ = std::move(confirm);
    }

    std::string const& Session::host() const
    {
        return state_.host;
    }

    std::optional<std::string> const& Session::user() const
    {
        return state_.user;
    }

    std::optional<std::string> const& Session::workingDirectory() const
    {
        return state_.cwd;
    }

    bool Session::interactive() const
    {
        return state_.interactive;
    }

    SessionState const& Session::state() const
    {
        return state_;
    }

    Persistence::TransportOptions Session::transportOptions() const
    {
        auto options = transport_;
        options.useDefaultsFrom(Persistence::TransportOptions::defaults());
        return options;
    }

    std::shared_ptr<ProcessRunner> Session::processRunner() const
    {
        if (processRunner_)
            return processRunner_;
        return makeDefaultProcessRunner();
    }

    ConfirmationPrompt Session::confirmationPrompt() const
    {
        if (confirm_)
            return confirm_;
        return makeTerminalConfirmation();
    }
}
