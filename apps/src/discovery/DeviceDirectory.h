#pragma once

#include "core/DeviceTypes.h"
#include "core/ManagerConfig.h"
#include "discovery/AliasRegistry.h"
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace BjornManager {
namespace Discovery {

enum class SightingOutcome {
    NewDevice,   // First sighting of this identity.
    NewEndpoint, // Known identity, address not seen for it before.
    Revived,     // Known identity that had gone stale is seen again.
    Refreshed,   // Known identity and address; timestamp updated only.
};

const char* toString(SightingOutcome outcome);

struct GoneDevice {
    DeviceIdentity identity;
    Alias alias;
    bool removed = false;
};

struct SightingResult {
    SightingOutcome outcome = SightingOutcome::Refreshed;
    DeviceRecord record;
    Endpoint endpoint;
    // Address-keyed record folded into this one when its address got a name.
    std::optional<GoneDevice> absorbed;
};

/**
 * @brief Authoritative in-memory registry of devices and their endpoints.
 *
 * One record per identity; endpoints keyed by address. An address belongs to at most
 * one identity: if a different identity is sighted on it, the endpoint moves. A record
 * keyed by its own address (unnamed device) that loses that address is erased, and a
 * new identity taking the address inherits its alias.
 * Every method takes the directory lock; returned records are copies.
 */
class DeviceDirectory {
public:
    explicit DeviceDirectory(AliasRegistry& aliases);

    SightingResult recordSighting(
        const DeviceIdentity& identity,
        const std::string& address,
        InterfaceClass interfaceClass,
        SteadyClock::time_point now);

    std::optional<DeviceIdentity> identityForAddress(const std::string& address) const;

    // Marks endpoints not refreshed within staleTimeout as stale. Returns the devices whose
    // last fresh endpoint went stale in this pass. With GonePolicy::Remove they are erased.
    std::vector<GoneDevice> sweepStale(
        SteadyClock::time_point now, std::chrono::milliseconds staleTimeout, GonePolicy policy);

    // Returns true when the record-level flag flipped.
    bool setWebUiReachable(const std::string& address, bool reachable);

    std::optional<DeviceRecord> find(const DeviceIdentity& identity) const;

    // Resolves "bjorn", "bjorn.local", or an alias number like "1" / "Bjorn 1".
    std::optional<DeviceRecord> lookup(const std::string& nameOrAlias) const;

    // Fresh endpoint to connect to, preferring USB, then Bluetooth, then LAN.
    std::optional<Endpoint> preferredEndpoint(const DeviceIdentity& identity) const;

    std::vector<DeviceRecord> snapshot() const;
    std::vector<std::string> knownAddresses() const;
    size_t size() const;

    bool remove(const DeviceIdentity& identity);
    void clear();

private:
    mutable std::mutex mutex_;
    AliasRegistry& aliases_;
    std::map<DeviceIdentity, DeviceRecord> records_;
    std::map<std::string, DeviceIdentity> addressIndex_;
};

} // namespace Discovery
} // namespace BjornManager
