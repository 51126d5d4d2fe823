/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>

namespace genclient::infrastructure {

namespace fs = std::filesystem;

fs::path ConfigLoader::DefaultPath() {
    return PathUtils::GetAppConfigDir() / "settings.json";
}

std::optional<ClientSettings> ConfigLoader::Load(const fs::path& path, const ClientSettings& defaults) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            std::cerr << "[ConfigLoader] Cannot access " << path << ": " << ec.message() << std::endl;
        }
        return std::nullopt;
    }

    try {
        std::ifstream f(path);
        if (!f) {
            std::cerr << "[ConfigLoader] Cannot open " << path << std::endl;
            return std::nullopt;
        }
        nlohmann::json j;
        f >> j;
        if (!j.is_object()) {
            std::cerr << "[ConfigLoader] " << path << " is not a JSON object" << std::endl;
            return std::nullopt;
        }

        ClientSettings settings = defaults;
        settings.endpoint = j.value("endpoint", settings.endpoint);
        settings.model = j.value("model", settings.model);
        settings.timeoutSeconds = j.value("timeout_seconds", settings.timeoutSeconds);
        return settings;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
    }

    return std::nullopt;
}

std::optional<int> ConfigLoader::ParseTimeoutSeconds(const std::string& text) {
    size_t consumed = 0;
    int seconds = 0;
    try {
        seconds = std::stoi(text, &consumed);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
    if (consumed != text.size()) {
        return std::nullopt;
    }
    return seconds;
}

bool ConfigLoader::Save(const fs::path& path, const ClientSettings& settings) {
    nlohmann::json j = nlohmann::json::object();

    // Load existing to preserve other settings
    std::error_code ec;
    if (fs::exists(path, ec)) {
        std::ifstream f(path);
        auto existing = nlohmann::json::parse(f, nullptr, false);
        if (!existing.is_discarded() && existing.is_object()) {
            j = std::move(existing);
        } else {
            std::cerr << "[ConfigLoader] Replacing unreadable " << path << std::endl;
        }
    }

    j["endpoint"] = settings.endpoint;
    j["model"] = settings.model;
    j["timeout_seconds"] = settings.timeoutSeconds;

    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            std::cerr << "[ConfigLoader] Cannot create " << path.parent_path() << ": " << ec.message() << std::endl;
            return false;
        }
    }

    std::ofstream f(path);
    if (!f) {
        std::cerr << "[ConfigLoader] Cannot write " << path << std::endl;
        return false;
    }
    f << j.dump(4) << std::endl;
    return static_cast<bool>(f);
}

} // namespace genclient::infrastructure
