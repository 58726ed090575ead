#pragma once

#include "core/DeviceTypes.h"
#include <map>
#include <mutex>
#include <optional>

namespace BjornManager {
namespace Discovery {

/**
 * @brief Assigns each device identity a sequential alias, once.
 *
 * allocate() returns the existing alias for a known identity, otherwise the high-water
 * mark plus one. Aliases are never reused, even after an identity is forgotten by the
 * directory. Thread-safe.
 */
class AliasRegistry {
public:
    explicit AliasRegistry(int highWaterMark = 0);

    struct Allocation {
        Alias alias;
        bool isNew = false;
    };

    Allocation allocate(const DeviceIdentity& identity);
    std::optional<Alias> find(const DeviceIdentity& identity) const;

    // Hands the alias of `from` to `to` when `to` has none yet. Returns the moved alias.
    std::optional<Alias> transfer(const DeviceIdentity& from, const DeviceIdentity& to);

    // Replaces the contents with stored mappings. The high-water mark becomes the larger of
    // the one given and the largest stored alias.
    void seed(const std::map<DeviceIdentity, Alias>& mappings, int highWaterMark);

    int highWaterMark() const;
    std::map<DeviceIdentity, Alias> mappings() const;

private:
    mutable std::mutex mutex_;
    std::map<DeviceIdentity, Alias> aliases_;
    int highWaterMark_ = 0;
};

} // namespace Discovery
} // namespace BjornManager
