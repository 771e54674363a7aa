#include <utility/remote_path.hpp>

namespace Utility
{
    std::string baseName(std::string_view path)
    {
        while (path.size() > 1 && path.back() == '/')
            path.remove_suffix(1);

        if (path == "/")
            return std::string{path};

        const auto lastSlash = path.rfind('/');
        if (lastSlash == std::string_view::npos)
            return std::string{path};
        return std::string{path.substr(lastSlash + 1)};
    }

    bool isAbsolutePath(std::string_view path)
    {
        return !path.empty() && path.front() == '/';
    }

    std::string resolveAgainst(std::optional<std::string> const& workingDirectory, std::string_view path)
    {
        if (!workingDirectory || workingDirectory->empty() || isAbsolutePath(path))
            return std::string{path};

        std::string resolved = *workingDirectory;
        if (resolved.back() != '/')
            resolved.push_back('/');
        resolved.append(path);
        return resolved;
    }
}
