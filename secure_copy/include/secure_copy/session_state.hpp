#pragma once

#include <optional>
#include <string>

namespace SecureCopy
{
    /**
     * @brief Host, user and remote working directory of a session.
     */
    struct SessionState
    {
        std::string host{};
        std::optional<std::string> user{std::nullopt};
        // Unset until cwd() is called, relative paths are then left to the remote login directory.
        std::optional<std::string> cwd{std::nullopt};
        bool interactive{false};

        /**
         * @brief [user@]host
         */
        std::string target() const;

        /**
         * @brief Prefixes relative paths with cwd, if one is set.
         */
        std::string resolve(std::string const& path) const;
    };
}
