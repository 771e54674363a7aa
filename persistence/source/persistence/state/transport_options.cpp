#include <persistence/state/transport_options.hpp>

#include <log/log.hpp>

#include <fstream>

namespace Persistence
{
    void TransportOptions::useDefaultsFrom(TransportOptions const& other)
    {
        if (!scpExecutable.has_value())
            scpExecutable = other.scpExecutable;
        if (!sshExecutable.has_value())
            sshExecutable = other.sshExecutable;
        if (!sshOptions.has_value())
            sshOptions = other.sshOptions;
        if (!interactive.has_value())
            interactive = other.interactive;
        if (!logLevel.has_value())
            logLevel = other.logLevel;
    }

    TransportOptions TransportOptions::defaults()
    {
        return TransportOptions{
            .scpExecutable = "scp",
            .sshExecutable = "ssh",
            .sshOptions = std::vector<std::string>{},
            .interactive = false,
            .logLevel = "info",
        };
    }

    void to_json(nlohmann::json& j, TransportOptions const& options)
    {
        j = nlohmann::json::object();
        NET_SCP_TO_JSON_OPTIONAL(j, options, scpExecutable);
        NET_SCP_TO_JSON_OPTIONAL(j, options, sshExecutable);
        NET_SCP_TO_JSON_OPTIONAL(j, options, sshOptions);
        NET_SCP_TO_JSON_OPTIONAL(j, options, interactive);
        NET_SCP_TO_JSON_OPTIONAL(j, options, logLevel);
    }
    void from_json(nlohmann::json const& j, TransportOptions& options)
    {
        NET_SCP_FROM_JSON_OPTIONAL(j, options, scpExecutable);
        NET_SCP_FROM_JSON_OPTIONAL(j, options, sshExecutable);
        NET_SCP_FROM_JSON_OPTIONAL(j, options, sshOptions);
        NET_SCP_FROM_JSON_OPTIONAL(j, options, interactive);
        NET_SCP_FROM_JSON_OPTIONAL(j, options, logLevel);
    }

    std::expected<TransportOptions, std::string> loadTransportOptions(std::filesystem::path const& path)
    {
        std::ifstream reader{path, std::ios_base::binary};
        if (!reader.good())
            return std::unexpected("Cannot open options file: " + path.string());

        try
        {
            const auto json = nlohmann::json::parse(reader, nullptr, true, true);
            if (!json.is_object())
                return std::unexpected("Options file does not contain a JSON object: " + path.string());
            return json.get<TransportOptions>();
        }
        catch (std::exception const& e)
        {
            Log::error("Failed to parse options file '{}': {}", path.string(), e.what());
            return std::unexpected("Failed to parse options file '" + path.string() + "': " + e.what());
        }
    }

    std::expected<void, std::string> saveTransportOptions(
        std::filesystem::path const& path,
        TransportOptions const& options)
    {
        std::error_code ec;
        if (path.has_parent_path())
            std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
            return std::unexpected("Cannot create directory for options file: " + ec.message());

        std::ofstream writer{path, std::ios_base::binary};
        if (!writer.good())
            return std::unexpected("Cannot write options file: " + path.string());

        writer << nlohmann::json(options).dump(4);
        return {};
    }
}
