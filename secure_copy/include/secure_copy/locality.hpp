#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace SecureCopy
{
    /**
     * @brief True unless the path starts with "host:", i.e. one or more non-colon characters and a colon.
     * A colon preceded by a slash ("./a:b") does not make a host prefix.
     * A pure string test, the filesystem is not consulted.
     */
    bool isLocal(std::string_view path);

    /**
     * @brief Whether a local path names an existing directory. Errors count as "not a directory".
     */
    bool isDirectory(std::string const& path);

    /**
     * @brief Either a local path or [user@]host:path.
     */
    class EndpointSpec
    {
      public:
        EndpointSpec(std::string spec);
        EndpointSpec(char const* spec);

        /**
         * @brief Builds [user@]host:path.
         */
        static EndpointSpec
        remote(std::string const& host, std::optional<std::string> const& user, std::string const& path);

        bool isRemote() const;
        std::string const& str() const;

      private:
        std::string spec_;
        bool isRemote_;
    };

    /**
     * @brief [user@]host, the target argument for ssh.
     */
    std::string remoteTarget(std::string const& host, std::optional<std::string> const& user);
}
