#include "discovery/AliasStore.h"
#include "core/JsonStrict.h"
#include "core/LoggingChannels.h"
#include "discovery/AliasRegistry.h"
#include <fstream>
#include <nlohmann/json.hpp>

namespace BjornManager {
namespace Discovery {

AliasStore::AliasStore(std::filesystem::path path) : path_(std::move(path))
{}

Outcome<AliasSnapshot> AliasStore::load() const
{
    std::error_code error;
    if (!std::filesystem::exists(path_, error)) {
        return Outcome<AliasSnapshot>::okay(AliasSnapshot{});
    }

    try {
        std::ifstream file(path_);
        if (!file.is_open()) {
            return fail<AliasSnapshot>(ErrorKind::Config, "Cannot open " + path_.string());
        }
        const auto j = nlohmann::json::parse(file);
        JsonStrict::requireObject(j, "AliasStore", { "high_water_mark", "aliases" });

        AliasSnapshot snapshot;
        JsonStrict::readOptional(j, "high_water_mark", snapshot.highWaterMark);
        std::map<std::string, int> raw;
        JsonStrict::readOptional(j, "aliases", raw);
        for (const auto& [identity, number] : raw) {
            if (number <= 0) {
                return fail<AliasSnapshot>(
                    ErrorKind::Config, "Alias for '" + identity + "' must be positive");
            }
            snapshot.aliases.emplace(identity, Alias{ number });
        }
        return Outcome<AliasSnapshot>::okay(snapshot);
    }
    catch (const std::exception& e) {
        return fail<AliasSnapshot>(
            ErrorKind::Config, "Invalid alias store " + path_.string() + ": " + e.what());
    }
}

VoidOutcome AliasStore::save(const AliasSnapshot& snapshot) const
{
    namespace fs = std::filesystem;

    nlohmann::json aliases = nlohmann::json::object();
    for (const auto& [identity, alias] : snapshot.aliases) {
        aliases[identity] = alias.get();
    }
    const nlohmann::json j = { { "high_water_mark", snapshot.highWaterMark },
                               { "aliases", aliases } };

    std::error_code error;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), error);
        if (error) {
            return failVoid(ErrorKind::Config, "Cannot create directory: " + error.message());
        }
    }

    const fs::path tempPath = path_.string() + ".tmp";
    {
        std::ofstream file(tempPath, std::ios::trunc);
        if (!file.is_open()) {
            return failVoid(ErrorKind::Config, "Cannot write " + tempPath.string());
        }
        file << j.dump(2) << "\n";
        if (!file.good()) {
            return failVoid(ErrorKind::Config, "Failed writing " + tempPath.string());
        }
    }
    fs::rename(tempPath, path_, error);
    if (error) {
        return failVoid(
            ErrorKind::Config, "Cannot replace " + path_.string() + ": " + error.message());
    }
    return okayVoid();
}

VoidOutcome AliasStore::seedRegistry(AliasRegistry& registry) const
{
    auto snapshot = load();
    if (snapshot.isError()) {
        return VoidOutcome::error(snapshot.errorValue());
    }
    registry.seed(snapshot.value().aliases, snapshot.value().highWaterMark);
    LOG_INFO(
        Discovery,
        "Seeded {} alias(es) from {}, high-water mark {}",
        snapshot.value().aliases.size(),
        path_.string(),
        registry.highWaterMark());
    return okayVoid();
}

VoidOutcome AliasStore::saveRegistry(const AliasRegistry& registry) const
{
    AliasSnapshot snapshot;
    snapshot.highWaterMark = registry.highWaterMark();
    snapshot.aliases = registry.mappings();
    return save(snapshot);
}

} // namespace Discovery
} // namespace BjornManager
