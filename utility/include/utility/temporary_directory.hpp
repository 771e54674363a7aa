#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace Utility
{
    /**
     * @brief A uniquely named directory below the system temp path, removed with everything in it on destruction.
     */
    class TemporaryDirectory
    {
      public:
        explicit TemporaryDirectory(std::string_view prefix = "net_scp");
        ~TemporaryDirectory();

        TemporaryDirectory(TemporaryDirectory const&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory const&) = delete;

        TemporaryDirectory(TemporaryDirectory&&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

        std::filesystem::path const& path() const;

        std::filesystem::path createFile(std::filesystem::path const& relative, std::string_view content = {}) const;
        std::filesystem::path createDirectory(std::filesystem::path const& relative) const;

      private:
        std::filesystem::path path_;
    };
}
