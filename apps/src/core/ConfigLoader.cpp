#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include <cstdlib>
#include <fstream>

namespace BjornManager {

std::optional<std::string> ConfigLoader::explicitConfigDir_ = std::nullopt;

void ConfigLoader::setConfigDir(const std::string& path)
{
    explicitConfigDir_ = path;
}

void ConfigLoader::clearConfigDir()
{
    explicitConfigDir_ = std::nullopt;
}

std::filesystem::path ConfigLoader::userConfigDir()
{
    namespace fs = std::filesystem;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "bjorn-manager";
    }
    if (const char* home = std::getenv("HOME")) {
        return fs::path(home) / ".config" / "bjorn-manager";
    }
    return fs::current_path() / "config";
}

std::vector<std::filesystem::path> ConfigLoader::getSearchPaths()
{
    namespace fs = std::filesystem;
    std::vector<fs::path> paths;
    if (explicitConfigDir_.has_value()) {
        paths.emplace_back(explicitConfigDir_.value());
    }

    std::error_code cwdError;
    const auto cwd = fs::current_path(cwdError);
    if (!cwdError) {
        paths.push_back(cwd / "config");
    }

    paths.push_back(userConfigDir());
    paths.emplace_back("/etc/bjorn-manager");
    return paths;
}

std::optional<std::filesystem::path> ConfigLoader::findConfigFile(const std::string& filename)
{
    namespace fs = std::filesystem;
    for (const auto& dir : getSearchPaths()) {
        // A .local file replaces its sibling entirely.
        for (const auto& candidate : { dir / (filename + ".local"), dir / filename }) {
            std::error_code statError;
            if (fs::is_regular_file(candidate, statError)) {
                return candidate;
            }
        }
    }
    return std::nullopt;
}

Outcome<nlohmann::json> ConfigLoader::tryLoadJson(const std::filesystem::path& path)
{
    const auto reject = [&path](const std::string& what) {
        LOG_ERROR(Config, "{}: {}", path.string(), what);
        return fail<nlohmann::json>(ErrorKind::Config, path.string() + ": " + what);
    };

    std::error_code sizeError;
    const auto size = std::filesystem::file_size(path, sizeError);
    if (sizeError) {
        return reject(sizeError.message());
    }
    if (size == 0) {
        return reject("file is empty");
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return reject("cannot open");
    }

    try {
        return Outcome<nlohmann::json>::okay(nlohmann::json::parse(file));
    }
    catch (const nlohmann::json::exception& e) {
        return reject(e.what());
    }
}

Outcome<nlohmann::json> ConfigLoader::loadJson(const std::string& filename)
{
    const auto path = findConfigFile(filename);
    if (!path.has_value()) {
        LOG_DEBUG(Config, "No {} in any search path", filename);
        return fail<nlohmann::json>(ErrorKind::Config, "Config file not found: " + filename);
    }

    LOG_INFO(Config, "Loading {}", path->string());
    return tryLoadJson(path.value());
}

} // namespace BjornManager
