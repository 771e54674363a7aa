#include <utility/temporary_directory.hpp>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace Utility
{
    TemporaryDirectory::TemporaryDirectory(std::string_view prefix)
        : path_{}
    {
        std::string pattern{(std::filesystem::temp_directory_path() / (std::string{prefix} + "_XXXXXX")).string()};
        if (mkdtemp(pattern.data()) == nullptr || !std::filesystem::is_directory(pattern))
            throw std::runtime_error(std::string{"Could not setup temporary directory: "} + pattern);
        path_ = pattern;
    }
    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code error;
        std::filesystem::remove_all(path_, error);
    }

    std::filesystem::path const& TemporaryDirectory::path() const
    {
        return path_;
    }

    std::filesystem::path
    TemporaryDirectory::createFile(std::filesystem::path const& relative, std::string_view content) const
    {
        const auto file = path_ / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream writer{file, std::ios_base::binary};
        if (!writer)
            throw std::runtime_error("Could not create file: " + file.string());
        writer.write(content.data(), static_cast<std::streamsize>(content.size()));
        return file;
    }

    std::filesystem::path TemporaryDirectory::createDirectory(std::filesystem::path const& relative) const
    {
        const auto directory = path_ / relative;
        std::filesystem::create_directories(directory);
        return directory;
    }
}
