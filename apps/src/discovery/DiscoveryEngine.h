#pragma once

#include "core/DeviceTypes.h"
#include "core/ManagerConfig.h"
#include "core/ManagerError.h"
#include "discovery/AliasRegistry.h"
#include "discovery/DeviceDirectory.h"
#include "discovery/DiscoverySource.h"
#include "discovery/NetworkInterfaces.h"
#include "events/EventSink.h"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace BjornManager {
namespace Discovery {

class AliasStore;

/**
 * @brief Merges sightings from every discovery source into one device directory.
 *
 * Sources call onSighting()/onWebUiStatus() from their own threads. Reconciliation
 * (identity resolution, directory mutation, event publication) runs in one critical
 * section so events leave in the same order the directory changed.
 *
 * deviceGone is always published when a device's last endpoint goes stale; whether the
 * record is also removed is GonePolicy, and whether the UI hides it is up to the UI.
 */
class DiscoveryEngine : public SightingSink {
public:
    using SourceList = std::vector<std::unique_ptr<DiscoverySourceInterface>>;
    using SourceFactory =
        std::function<SourceList(const DiscoveryConfig& config, const LocalNetworkInfo& local)>;
    using ReverseResolver = std::function<std::optional<std::string>(const std::string&)>;

    struct Dependencies {
        SourceFactory sourceFactory;
        ReverseResolver reverseResolver;
        std::function<LocalNetworkInfo()> localNetwork;
        std::function<SteadyClock::time_point()> clock;
        // Optional; saved after every new alias.
        AliasStore* aliasStore = nullptr;
        // Tests drive sweepNow() by hand.
        bool runSweepThread = true;
    };

    // mDNS browser, range prober and liveness poller on the real network.
    static Dependencies defaultDependencies();
    static SourceList createDefaultSources(
        const DiscoveryConfig& config, const LocalNetworkInfo& local);

    DiscoveryEngine(Events::EventSink& events, Dependencies dependencies);
    ~DiscoveryEngine() override;

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    // No-op while running. Config error for an unparseable range; Discovery error only if
    // no source at all could be started.
    VoidOutcome start(const DiscoveryConfig& config);
    void stop();

    // Stops, forgets every device, then starts again with the last config. Alias mappings
    // survive so a device keeps its number.
    VoidOutcome reset();

    bool isRunning() const;

    // SightingSink.
    void onSighting(const Sighting& sighting) override;
    void onWebUiStatus(const std::string& address, bool reachable) override;
    std::vector<std::string> knownAddresses() const override;

    // One stale pass; publishes deviceGone for each device that went fully stale.
    std::vector<GoneDevice> sweepNow();

    std::vector<DeviceRecord> snapshot() const;
    std::optional<DeviceRecord> find(const DeviceIdentity& identity) const;
    std::optional<DeviceRecord> lookup(const std::string& nameOrAlias) const;
    std::optional<Endpoint> preferredEndpoint(const DeviceIdentity& identity) const;

    std::vector<SourceKind> activeSources() const;

    AliasRegistry& aliases() { return aliases_; }

private:
    struct Context;

    std::optional<DeviceIdentity> resolveIdentity(const Context& context, const Sighting& sighting);
    std::shared_ptr<const Context> currentContext() const;
    void sweepLoop();
    void persistAliases();

    Events::EventSink& events_;
    Dependencies deps_;

    AliasRegistry aliases_;
    DeviceDirectory directory_;

    mutable std::mutex contextMutex_;
    std::shared_ptr<const Context> context_;

    std::mutex reconcileMutex_;

    mutable std::mutex lifecycleMutex_;
    std::optional<DiscoveryConfig> lastConfig_;
    SourceList sources_;
    std::vector<SourceKind> activeSources_;
    std::atomic<bool> running_{ false };

    std::thread sweepThread_;
    std::mutex sweepMutex_;
    std::condition_variable sweepCv_;
    bool sweepStop_ = false;
};

} // namespace Discovery
} // namespace BjornManager
