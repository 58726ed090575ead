#include "discovery/AliasRegistry.h"
#include "core/Assert.h"
#include <algorithm>

namespace BjornManager {
namespace Discovery {

AliasRegistry::AliasRegistry(int highWaterMark) : highWaterMark_(std::max(highWaterMark, 0))
{}

AliasRegistry::Allocation AliasRegistry::allocate(const DeviceIdentity& identity)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = aliases_.find(identity);
    if (it != aliases_.end()) {
        return { it->second, false };
    }

    const Alias alias{ ++highWaterMark_ };
    BJORN_ASSERT(alias.isAssigned(), "Allocated aliases start at 1");
    aliases_.emplace(identity, alias);
    return { alias, true };
}

std::optional<Alias> AliasRegistry::find(const DeviceIdentity& identity) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = aliases_.find(identity);
    if (it == aliases_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Alias> AliasRegistry::transfer(
    const DeviceIdentity& from, const DeviceIdentity& to)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (from == to || aliases_.count(to) != 0) {
        return std::nullopt;
    }
    auto it = aliases_.find(from);
    if (it == aliases_.end()) {
        return std::nullopt;
    }
    const Alias alias = it->second;
    aliases_.erase(it);
    aliases_.emplace(to, alias);
    return alias;
}

void AliasRegistry::seed(const std::map<DeviceIdentity, Alias>& mappings, int highWaterMark)
{
    std::lock_guard<std::mutex> lock(mutex_);
    aliases_ = mappings;
    highWaterMark_ = std::max(highWaterMark, 0);
    for (const auto& [identity, alias] : aliases_) {
        highWaterMark_ = std::max(highWaterMark_, alias.get());
    }
}

int AliasRegistry::highWaterMark() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return highWaterMark_;
}

std::map<DeviceIdentity, Alias> AliasRegistry::mappings() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return aliases_;
}

} // namespace Discovery
} // namespace BjornManager
