#include <secure_copy/locality.hpp>

#include <filesystem>
#include <system_error>
#include <utility>

namespace SecureCopy
{
    bool isLocal(std::string_view path)
    {
        const auto colon = path.find(':');
        // "host:" needs at least one character before the colon, and a slash in front of it makes it a local path.
        if (colon == std::string_view::npos || colon == 0)
            return true;
        return path.substr(0, colon).find('/') != std::string_view::npos;
    }

    bool isDirectory(std::string const& path)
    {
        std::error_code ec;
        return std::filesystem::is_directory(path, ec);
    }

    EndpointSpec::EndpointSpec(std::string spec)
        : spec_{std::move(spec)}
        , isRemote_{!isLocal(spec_)}
    {}
    EndpointSpec::EndpointSpec(char const* spec)
        : EndpointSpec{std::string{spec}}
    {}

    EndpointSpec
    EndpointSpec::remote(std::string const& host, std::optional<std::string> const& user, std::string const& path)
    {
        return EndpointSpec{remoteTarget(host, user) + ":" + path};
    }

    bool EndpointSpec::isRemote() const
    {
        return isRemote_;
    }

    std::string const& EndpointSpec::str() const
    {
        return spec_;
    }

    std::string remoteTarget(std::string const& host, std::optional<std::string> const& user)
    {
        if (user && !user->empty())
            return *user + "@" + host;
        return host;
    }
}
