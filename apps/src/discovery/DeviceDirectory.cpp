#include "discovery/DeviceDirectory.h"
#include "core/LoggingChannels.h"
#include "discovery/HostnamePolicy.h"
#include <algorithm>
#include <cctype>

namespace BjornManager {
namespace Discovery {

namespace {

int interfacePreference(InterfaceClass interfaceClass)
{
    switch (interfaceClass) {
        case InterfaceClass::Usb:
            return 0;
        case InterfaceClass::Bluetooth:
            return 1;
        case InterfaceClass::Lan:
            return 2;
    }
    return 3;
}

std::optional<int> parseAliasNumber(const std::string& text)
{
    std::string digits = normalizeHost(text);
    if (digits.rfind("bjorn ", 0) == 0) {
        digits = digits.substr(6);
    }
    if (digits.empty() || digits.size() > 6
        || !std::all_of(digits.begin(), digits.end(), [](unsigned char c) {
               return std::isdigit(c) != 0;
           })) {
        return std::nullopt;
    }
    return std::stoi(digits);
}

void refreshFreshness(DeviceRecord& record)
{
    const bool anyFresh = std::any_of(
        record.endpoints.begin(), record.endpoints.end(), [](const auto& entry) {
            return !entry.second.stale;
        });
    record.freshness = anyFresh ? Freshness::Fresh : Freshness::Stale;
}

bool recomputeWebUi(DeviceRecord& record)
{
    const bool before = record.webUiReachable;
    record.webUiReachable = std::any_of(
        record.endpoints.begin(), record.endpoints.end(), [](const auto& entry) {
            return entry.second.webUiReachable;
        });
    return before != record.webUiReachable;
}

} // namespace

const char* toString(SightingOutcome outcome)
{
    switch (outcome) {
        case SightingOutcome::NewDevice:
            return "NewDevice";
        case SightingOutcome::NewEndpoint:
            return "NewEndpoint";
        case SightingOutcome::Revived:
            return "Revived";
        case SightingOutcome::Refreshed:
            return "Refreshed";
    }
    return "Unknown";
}

DeviceDirectory::DeviceDirectory(AliasRegistry& aliases) : aliases_(aliases)
{}

SightingResult DeviceDirectory::recordSighting(
    const DeviceIdentity& identity,
    const std::string& address,
    InterfaceClass interfaceClass,
    SteadyClock::time_point now)
{
    std::lock_guard<std::mutex> lock(mutex_);

    SightingResult result;

    // Address reuse (DHCP, re-plugged gadget): the endpoint follows the newest identity.
    auto owner = addressIndex_.find(address);
    if (owner != addressIndex_.end() && owner->second != identity) {
        auto previous = records_.find(owner->second);
        if (previous != records_.end()) {
            LOG_INFO(
                Discovery,
                "Address {} moved from '{}' to '{}'",
                address,
                owner->second,
                identity);
            DeviceRecord& moved = previous->second;
            moved.endpoints.erase(address);
            if (moved.identity == address && moved.endpoints.empty()) {
                // The unnamed device now has a name.
                result.absorbed = GoneDevice{ moved.identity, moved.alias, true };
                if (records_.count(identity) == 0) {
                    aliases_.transfer(moved.identity, identity);
                }
                records_.erase(previous);
            }
            else {
                refreshFreshness(moved);
                recomputeWebUi(moved);
            }
        }
        addressIndex_.erase(owner);
    }

    auto it = records_.find(identity);
    if (it == records_.end()) {
        DeviceRecord record;
        record.identity = identity;
        record.alias = aliases_.allocate(identity).alias;
        it = records_.emplace(identity, std::move(record)).first;
        result.outcome = SightingOutcome::NewDevice;
    }
    else if (it->second.freshness == Freshness::Stale) {
        result.outcome = SightingOutcome::Revived;
    }
    else if (it->second.endpoints.count(address) == 0) {
        result.outcome = SightingOutcome::NewEndpoint;
    }
    else {
        result.outcome = SightingOutcome::Refreshed;
    }

    DeviceRecord& record = it->second;
    Endpoint& endpoint = record.endpoints[address];
    endpoint.address = address;
    endpoint.interfaceClass = interfaceClass;
    endpoint.lastSeen = now;
    endpoint.stale = false;
    record.freshness = Freshness::Fresh;
    addressIndex_[address] = identity;

    result.record = record;
    result.endpoint = endpoint;
    return result;
}

std::optional<DeviceIdentity> DeviceDirectory::identityForAddress(const std::string& address) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = addressIndex_.find(address);
    if (it == addressIndex_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<GoneDevice> DeviceDirectory::sweepStale(
    SteadyClock::time_point now, std::chrono::milliseconds staleTimeout, GonePolicy policy)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<GoneDevice> gone;

    for (auto it = records_.begin(); it != records_.end();) {
        DeviceRecord& record = it->second;
        if (record.freshness == Freshness::Stale) {
            ++it;
            continue;
        }

        for (auto& [address, endpoint] : record.endpoints) {
            if (!endpoint.stale && now - endpoint.lastSeen > staleTimeout) {
                endpoint.stale = true;
                LOG_DEBUG(Discovery, "Endpoint {} of '{}' went stale", address, record.identity);
            }
        }
        refreshFreshness(record);
        if (record.freshness == Freshness::Fresh) {
            ++it;
            continue;
        }

        GoneDevice device{ record.identity, record.alias, policy == GonePolicy::Remove };
        gone.push_back(device);

        if (policy == GonePolicy::Remove) {
            for (const auto& [address, endpoint] : record.endpoints) {
                addressIndex_.erase(address);
            }
            it = records_.erase(it);
        }
        else {
            ++it;
        }
    }
    return gone;
}

bool DeviceDirectory::setWebUiReachable(const std::string& address, bool reachable)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto owner = addressIndex_.find(address);
    if (owner == addressIndex_.end()) {
        return false;
    }
    auto it = records_.find(owner->second);
    if (it == records_.end()) {
        return false;
    }
    auto endpoint = it->second.endpoints.find(address);
    if (endpoint == it->second.endpoints.end()) {
        return false;
    }
    endpoint->second.webUiReachable = reachable;
    return recomputeWebUi(it->second);
}

std::optional<DeviceRecord> DeviceDirectory::find(const DeviceIdentity& identity) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(identity);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<DeviceRecord> DeviceDirectory::lookup(const std::string& nameOrAlias) const
{
    const auto aliasNumber = parseAliasNumber(nameOrAlias);
    const std::string identity = normalizeHost(nameOrAlias);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(identity);
    if (it != records_.end()) {
        return it->second;
    }
    if (aliasNumber.has_value()) {
        for (const auto& [key, record] : records_) {
            if (record.alias.get() == aliasNumber.value()) {
                return record;
            }
        }
    }
    return std::nullopt;
}

std::optional<Endpoint> DeviceDirectory::preferredEndpoint(const DeviceIdentity& identity) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(identity);
    if (it == records_.end()) {
        return std::nullopt;
    }

    std::optional<Endpoint> best;
    for (const auto& [address, endpoint] : it->second.endpoints) {
        if (!best.has_value()) {
            best = endpoint;
            continue;
        }
        if (best->stale != endpoint.stale) {
            if (best->stale) {
                best = endpoint;
            }
            continue;
        }
        if (interfacePreference(endpoint.interfaceClass)
            < interfacePreference(best->interfaceClass)) {
            best = endpoint;
        }
    }
    return best;
}

std::vector<DeviceRecord> DeviceDirectory::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceRecord> records;
    records.reserve(records_.size());
    for (const auto& [identity, record] : records_) {
        records.push_back(record);
    }
    std::sort(records.begin(), records.end(), [](const DeviceRecord& a, const DeviceRecord& b) {
        return a.alias < b.alias;
    });
    return records;
}

std::vector<std::string> DeviceDirectory::knownAddresses() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> addresses;
    addresses.reserve(addressIndex_.size());
    for (const auto& [address, identity] : addressIndex_) {
        addresses.push_back(address);
    }
    return addresses;
}

size_t DeviceDirectory::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

bool DeviceDirectory::remove(const DeviceIdentity& identity)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(identity);
    if (it == records_.end()) {
        return false;
    }
    for (const auto& [address, endpoint] : it->second.endpoints) {
        addressIndex_.erase(address);
    }
    records_.erase(it);
    return true;
}

void DeviceDirectory::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    addressIndex_.clear();
}

} // namespace Discovery
} // namespace BjornManager
