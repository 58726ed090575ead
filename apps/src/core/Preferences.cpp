#include "core/Preferences.h"
#include "core/ConfigLoader.h"
#include "core/JsonStrict.h"
#include "core/LoggingChannels.h"
#include <fstream>

namespace BjornManager {

void from_json(const nlohmann::json& j, Preferences& preferences)
{
    JsonStrict::requireObject(j, "Preferences", { "language", "default_key_path" });

    preferences = Preferences{};
    JsonStrict::readOptional(j, "language", preferences.language);
    std::string keyPath;
    JsonStrict::readOptional(j, "default_key_path", keyPath);
    if (!keyPath.empty()) {
        preferences.defaultKeyPath = keyPath;
    }
}

void to_json(nlohmann::json& j, const Preferences& preferences)
{
    j = nlohmann::json{ { "language", preferences.language } };
    if (preferences.defaultKeyPath.has_value()) {
        j["default_key_path"] = preferences.defaultKeyPath.value();
    }
}

PreferencesStore::PreferencesStore()
    : PreferencesStore(ConfigLoader::userConfigDir() / "preferences.json")
{}

PreferencesStore::PreferencesStore(std::filesystem::path path) : path_(std::move(path))
{}

Outcome<Preferences> PreferencesStore::load() const
{
    std::error_code error;
    if (!std::filesystem::exists(path_, error)) {
        return Outcome<Preferences>::okay(Preferences{});
    }

    try {
        std::ifstream file(path_);
        if (!file.is_open()) {
            return fail<Preferences>(ErrorKind::Config, "Cannot open " + path_.string());
        }
        Preferences preferences = nlohmann::json::parse(file).get<Preferences>();
        return Outcome<Preferences>::okay(preferences);
    }
    catch (const std::exception& e) {
        LOG_WARN(Config, "Failed to read preferences {}: {}", path_.string(), e.what());
        return fail<Preferences>(
            ErrorKind::Config, "Invalid preferences " + path_.string() + ": " + e.what());
    }
}

VoidOutcome PreferencesStore::save(const Preferences& preferences) const
{
    namespace fs = std::filesystem;

    std::error_code error;
    fs::create_directories(path_.parent_path(), error);
    if (error) {
        return failVoid(
            ErrorKind::Config,
            "Cannot create " + path_.parent_path().string() + ": " + error.message());
    }

    // Written beside the target, then renamed into place.
    const fs::path tempPath = path_.string() + ".tmp";
    {
        std::ofstream file(tempPath, std::ios::trunc);
        if (!file.is_open()) {
            return failVoid(ErrorKind::Config, "Cannot write " + tempPath.string());
        }
        file << nlohmann::json(preferences).dump(4) << "\n";
        if (!file.good()) {
            return failVoid(ErrorKind::Config, "Failed writing " + tempPath.string());
        }
    }

    fs::rename(tempPath, path_, error);
    if (error) {
        return failVoid(
            ErrorKind::Config, "Cannot replace " + path_.string() + ": " + error.message());
    }

    LOG_DEBUG(Config, "Saved preferences to {}", path_.string());
    return okayVoid();
}

} // namespace BjornManager
