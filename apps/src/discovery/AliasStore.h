#pragma once

#include "core/DeviceTypes.h"
#include "core/ManagerError.h"
#include <filesystem>
#include <map>

namespace BjornManager {
namespace Discovery {

class AliasRegistry;

struct AliasSnapshot {
    int highWaterMark = 0;
    std::map<DeviceIdentity, Alias> aliases;
};

// aliases.json: {"high_water_mark": 3, "aliases": {"bjorn": 1, "bjorn-2": 3}}
class AliasStore {
public:
    explicit AliasStore(std::filesystem::path path);

    // A missing file is an empty snapshot.
    Outcome<AliasSnapshot> load() const;
    VoidOutcome save(const AliasSnapshot& snapshot) const;

    VoidOutcome seedRegistry(AliasRegistry& registry) const;
    VoidOutcome saveRegistry(const AliasRegistry& registry) const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace Discovery
} // namespace BjornManager
