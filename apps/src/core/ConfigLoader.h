#pragma once

#include "core/ManagerError.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace BjornManager {

/**
 * @brief Loads configuration files with multi-path search and .local override support.
 *
 * Search order (first match wins):
 * 1. Explicit config directory (if set via setConfigDir)
 * 2. ./config/ (CWD - for development)
 * 3. ~/.config/bjorn-manager/ (user overrides)
 * 4. /etc/bjorn-manager/ (system defaults)
 *
 * At each location, checks for .local version first (e.g., manager.json.local),
 * then falls back to base file (e.g., manager.json). The .local file is a complete
 * replacement, not a merge.
 */
class ConfigLoader {
public:
    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    template <typename T>
    static Outcome<T> load(const std::string& filename);

    // Like load(), but a missing file yields a default-constructed T. Broken files are
    // still errors.
    template <typename T>
    static Outcome<T> loadOrDefault(const std::string& filename);

    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();

    static std::filesystem::path userConfigDir();

private:
    static std::optional<std::string> explicitConfigDir_;
    static Outcome<nlohmann::json> loadJson(const std::string& filename);
    static Outcome<nlohmann::json> tryLoadJson(const std::filesystem::path& path);
};

template <typename T>
Outcome<T> ConfigLoader::load(const std::string& filename)
{
    auto jsonResult = loadJson(filename);
    if (jsonResult.isError()) {
        return Outcome<T>::error(jsonResult.errorValue());
    }

    try {
        T config;
        // Use unqualified call to enable ADL (argument-dependent lookup).
        from_json(jsonResult.value(), config);
        return Outcome<T>::okay(config);
    }
    catch (const std::exception& e) {
        return fail<T>(ErrorKind::Config, "Failed to parse " + filename + ": " + e.what());
    }
}

template <typename T>
Outcome<T> ConfigLoader::loadOrDefault(const std::string& filename)
{
    if (!findConfigFile(filename).has_value()) {
        return Outcome<T>::okay(T{});
    }
    return load<T>(filename);
}

} // namespace BjornManager
