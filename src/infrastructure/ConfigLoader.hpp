/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving the client configuration (settings.json).
 *
 * Keeps the JSON handling of the settings file in one place so the entry
 * point only deals with ClientSettings values.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace genclient::infrastructure {

/**
 * @struct ClientSettings
 * @brief Everything needed to construct a GenerationClient.
 */
struct ClientSettings {
    std::string endpoint = "http://localhost:11434";
    std::string model = "qwen2.5:7b";
    int timeoutSeconds = 300;
};

class ConfigLoader {
public:
    /** @brief <config home>/genclient/settings.json */
    static std::filesystem::path DefaultPath();

    /**
     * @brief Reads 'endpoint', 'model' and 'timeout_seconds' from a settings file.
     * @param path Settings file to read.
     * @param defaults Values kept for keys the file does not set.
     * @return std::nullopt if the file is missing, unreadable or malformed.
     */
    static std::optional<ClientSettings> Load(const std::filesystem::path& path,
                                              const ClientSettings& defaults = {});

    /** @brief Parses a timeout given as whole seconds; rejects trailing characters such as "30s". */
    static std::optional<int> ParseTimeoutSeconds(const std::string& text);

    /**
     * @brief Writes the settings, preserving unrelated keys of an existing file.
     * @return false if the file could not be written.
     */
    static bool Save(const std::filesystem::path& path, const ClientSettings& settings);
};

} // namespace genclient::infrastructure
