#pragma once

#include <persistence/state_core.hpp>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Persistence
{
    /**
     * @brief Settings for the external scp and ssh executables.
     *
     * Every member is optional so that per-call options can be layered over per-session options,
     * which in turn are layered over defaults() with useDefaultsFrom.
     */
    struct TransportOptions
    {
        std::optional<std::string> scpExecutable{std::nullopt};
        std::optional<std::string> sshExecutable{std::nullopt};
        // Inserted between the ssh executable and the target host, e.g. {"-p", "2222"}.
        std::optional<std::vector<std::string>> sshOptions{std::nullopt};
        std::optional<bool> interactive{std::nullopt};
        std::optional<std::string> logLevel{std::nullopt};

        void useDefaultsFrom(TransportOptions const& other);

        /**
         * @brief scp, ssh, no extra ssh options, batch mode, info logging.
         */
        static TransportOptions defaults();
    };
    void to_json(nlohmann::json& j, TransportOptions const& options);
    void from_json(nlohmann::json const& j, TransportOptions& options);

    /**
     * @brief Reads options from a JSON file. Comments are permitted.
     *
     * @param path The file to read.
     * @return std::expected<TransportOptions, std::string> The options, or why they could not be read.
     */
    std::expected<TransportOptions, std::string> loadTransportOptions(std::filesystem::path const& path);

    /**
     * @brief Writes options as indented JSON, creating parent directories as needed.
     */
    std::expected<void, std::string> saveTransportOptions(
        std::filesystem::path const& path,
        TransportOptions const& options);
}
