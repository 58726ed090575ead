#pragma once

#include "core/ManagerError.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace BjornManager {

// Operator preferences kept between runs. Read by the front-end; the core only consumes
// defaultKeyPath as a connect credential override.
struct Preferences {
    std::string language = "en";
    std::optional<std::string> defaultKeyPath;
};

void from_json(const nlohmann::json& j, Preferences& preferences);
void to_json(nlohmann::json& j, const Preferences& preferences);

class PreferencesStore {
public:
    // Defaults to <user config dir>/preferences.json.
    PreferencesStore();
    explicit PreferencesStore(std::filesystem::path path);

    // A missing file yields defaults; an unreadable or malformed file is a Config error.
    Outcome<Preferences> load() const;
    VoidOutcome save(const Preferences& preferences) const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace BjornManager
