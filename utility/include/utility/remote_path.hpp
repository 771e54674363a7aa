#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace Utility
{
    /**
     * @brief Last component of a slash separated path. Trailing slashes are ignored, "/" stays "/".
     */
    std::string baseName(std::string_view path);

    bool isAbsolutePath(std::string_view path);

    /**
     * @brief Prefixes a relative path with the working directory.
     *
     * Absolute paths and paths resolved without a (non-empty) working directory are returned as is.
     *
     * @param workingDirectory The remote working directory, if one was set.
     * @param path The path to resolve.
     * @return std::string
     */
    std::string resolveAgainst(std::optional<std::string> const& workingDirectory, std::string_view path);
}
