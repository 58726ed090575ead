#include "discovery/DiscoveryEngine.h"
#include "core/LoggingChannels.h"
#include "discovery/AddressClassifier.h"
#include "discovery/AliasStore.h"
#include "discovery/HostnamePolicy.h"
#include "discovery/InfrastructureFilter.h"
#include "discovery/LivenessPoller.h"
#include "discovery/MdnsBrowser.h"
#include "discovery/RangeProber.h"
#include "discovery/TcpProbe.h"

namespace BjornManager {
namespace Discovery {

struct DiscoveryEngine::Context {
    DiscoveryConfig config;
    HostnamePolicy naming;
    AddressClassifier classifier;
    InfrastructureFilter infrastructure;
};

DiscoveryEngine::Dependencies DiscoveryEngine::defaultDependencies()
{
    Dependencies deps;
    deps.sourceFactory = &DiscoveryEngine::createDefaultSources;
    deps.reverseResolver = reverseLookup;
    deps.localNetwork = probeLocalNetwork;
    deps.clock = [] { return SteadyClock::now(); };
    return deps;
}

DiscoveryEngine::SourceList DiscoveryEngine::createDefaultSources(
    const DiscoveryConfig& config, const LocalNetworkInfo& local)
{
    SourceList sources;
    sources.push_back(std::make_unique<MdnsBrowser>(config.mdnsServiceTypes));

    RangeProber::Settings probe;
    if (config.scanGatewaySubnet && local.defaultSubnet.has_value()) {
        probe.networks.push_back(local.defaultSubnet.value());
    }
    for (const auto& range : { config.usbRange, config.bluetoothRange }) {
        if (auto network = Ipv4Network::parse(range)) {
            probe.networks.push_back(network.value());
        }
    }
    probe.port = config.loginPort;
    probe.timeoutMs = config.probeTimeoutMs;
    probe.workers = config.probeWorkers;
    probe.interval = std::chrono::seconds(config.probeIntervalSeconds);
    sources.push_back(std::make_unique<RangeProber>(probe));

    LivenessPoller::Settings poll;
    poll.port = config.webUiPort;
    poll.timeoutMs = config.pollTimeoutMs;
    poll.interval = std::chrono::seconds(config.pollIntervalSeconds);
    sources.push_back(std::make_unique<LivenessPoller>(poll));

    return sources;
}

DiscoveryEngine::DiscoveryEngine(Events::EventSink& events, Dependencies dependencies)
    : events_(events), deps_(std::move(dependencies)), directory_(aliases_)
{
    if (!deps_.sourceFactory) {
        deps_.sourceFactory = &DiscoveryEngine::createDefaultSources;
    }
    if (!deps_.localNetwork) {
        deps_.localNetwork = [] { return LocalNetworkInfo{}; };
    }
    if (!deps_.clock) {
        deps_.clock = [] { return SteadyClock::now(); };
    }

    if (deps_.aliasStore) {
        auto seeded = deps_.aliasStore->seedRegistry(aliases_);
        if (seeded.isError()) {
            LOG_WARN(Discovery, "Ignoring alias store: {}", seeded.errorValue().message);
        }
    }
}

DiscoveryEngine::~DiscoveryEngine()
{
    stop();
}

VoidOutcome DiscoveryEngine::start(const DiscoveryConfig& config)
{
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (running_) {
        LOG_DEBUG(Discovery, "Discovery already running");
        return okayVoid();
    }

    const auto usb = Ipv4Network::parse(config.usbRange);
    if (!usb.has_value()) {
        return failVoid(ErrorKind::Config, "Invalid USB range '" + config.usbRange + "'");
    }
    const auto bluetooth = Ipv4Network::parse(config.bluetoothRange);
    if (!bluetooth.has_value()) {
        return failVoid(
            ErrorKind::Config, "Invalid Bluetooth range '" + config.bluetoothRange + "'");
    }

    const LocalNetworkInfo local = deps_.localNetwork();
    auto context = std::make_shared<Context>(Context{
        config,
        HostnamePolicy(config.hostnamePrefix),
        AddressClassifier(usb.value(), bluetooth.value()),
        InfrastructureFilter::fromLocalNetwork(local, config.ignoredAddresses),
    });
    LOG_INFO(
        Discovery,
        "Starting discovery: prefix '{}', {} ignored address(es)",
        config.hostnamePrefix,
        context->infrastructure.addresses().size());

    {
        std::lock_guard<std::mutex> contextLock(contextMutex_);
        context_ = context;
    }
    lastConfig_ = config;

    sources_ = deps_.sourceFactory(config, local);
    activeSources_.clear();
    for (auto& source : sources_) {
        auto result = source->start(*this);
        if (result.isError()) {
            LOG_WARN(
                Discovery,
                "Source {} disabled: {}",
                toString(source->kind()),
                result.errorValue().message);
            continue;
        }
        activeSources_.push_back(source->kind());
    }

    if (activeSources_.empty()) {
        sources_.clear();
        std::lock_guard<std::mutex> contextLock(contextMutex_);
        context_.reset();
        return failVoid(ErrorKind::Discovery, "No discovery source could be started");
    }

    if (deps_.runSweepThread) {
        {
            std::lock_guard<std::mutex> sweepLock(sweepMutex_);
            sweepStop_ = false;
        }
        sweepThread_ = std::thread([this] { sweepLoop(); });
    }

    running_ = true;
    return okayVoid();
}

void DiscoveryEngine::stop()
{
    std::lock_guard<std::mutex> lock(lifecycleMutex_);

    {
        std::lock_guard<std::mutex> sweepLock(sweepMutex_);
        sweepStop_ = true;
    }
    sweepCv_.notify_all();
    if (sweepThread_.joinable()) {
        sweepThread_.join();
    }

    // Sources may still call back while stopping; the context stays valid until they are gone.
    for (auto& source : sources_) {
        source->stop();
    }
    sources_.clear();
    activeSources_.clear();

    if (running_) {
        LOG_INFO(Discovery, "Discovery stopped");
    }
    running_ = false;
}

VoidOutcome DiscoveryEngine::reset()
{
    stop();
    {
        std::lock_guard<std::mutex> lock(reconcileMutex_);
        directory_.clear();
    }
    LOG_INFO(Discovery, "Device directory cleared");

    std::optional<DiscoveryConfig> config;
    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        config = lastConfig_;
    }
    if (!config.has_value()) {
        return okayVoid();
    }
    return start(config.value());
}

bool DiscoveryEngine::isRunning() const
{
    return running_;
}

std::shared_ptr<const DiscoveryEngine::Context> DiscoveryEngine::currentContext() const
{
    std::lock_guard<std::mutex> lock(contextMutex_);
    return context_;
}

std::optional<DeviceIdentity> DiscoveryEngine::resolveIdentity(
    const Context& context, const Sighting& sighting)
{
    std::string name = sighting.hostname;
    if (name.empty()) {
        if (auto known = directory_.identityForAddress(sighting.address)) {
            return known;
        }
        if (deps_.reverseResolver) {
            name = deps_.reverseResolver(sighting.address).value_or("");
        }
    }

    const std::string normalized = normalizeHost(name);
    if (!name.empty() && (context.naming.matches(name) || context.naming.matches(normalized))) {
        return normalized;
    }

    if (context.config.strictNaming) {
        LOG_TRACE(
            Discovery,
            "Dropping {} sighting {} ('{}'): name does not match",
            toString(sighting.source),
            sighting.address,
            name);
        return std::nullopt;
    }
    return sighting.address;
}

void DiscoveryEngine::onSighting(const Sighting& sighting)
{
    const auto context = currentContext();
    if (!context) {
        return;
    }
    if (sighting.address.empty() || context->infrastructure.isIgnored(sighting.address)) {
        LOG_TRACE(Discovery, "Ignoring infrastructure address {}", sighting.address);
        return;
    }

    // Reverse DNS can block; it runs before the critical section.
    const auto identity = resolveIdentity(*context, sighting);
    if (!identity.has_value()) {
        return;
    }
    const InterfaceClass interfaceClass = context->classifier.classify(sighting.address);

    bool newAlias = false;
    {
        std::lock_guard<std::mutex> lock(reconcileMutex_);
        const SightingResult result = directory_.recordSighting(
            identity.value(), sighting.address, interfaceClass, deps_.clock());

        if (result.absorbed.has_value()) {
            const GoneDevice& absorbed = result.absorbed.value();
            LOG_INFO(
                Discovery,
                "{} at {} is '{}'",
                displayLabel(absorbed.alias),
                sighting.address,
                result.record.identity);
            events_.publish(Events::DeviceGone{
                .identity = absorbed.identity,
                .alias = absorbed.alias,
                .removed = true,
            });
            newAlias = true;
        }

        const Events::EndpointInfo endpoint{ sighting.address, interfaceClass };
        switch (result.outcome) {
            case SightingOutcome::NewDevice:
                LOG_INFO(
                    Discovery,
                    "Found '{}' as {} at {} ({}, via {})",
                    result.record.identity,
                    displayLabel(result.record.alias),
                    sighting.address,
                    toString(interfaceClass),
                    toString(sighting.source));
                events_.publish(Events::DeviceFound{
                    .identity = result.record.identity,
                    .alias = result.record.alias,
                    .label = displayLabel(result.record.alias),
                    .endpoint = endpoint,
                });
                newAlias = true;
                break;
            case SightingOutcome::NewEndpoint:
            case SightingOutcome::Revived:
                LOG_INFO(
                    Discovery,
                    "'{}' {} at {} ({})",
                    result.record.identity,
                    result.outcome == SightingOutcome::Revived ? "is back" : "also seen",
                    sighting.address,
                    toString(interfaceClass));
                events_.publish(Events::DeviceUpdated{
                    .identity = result.record.identity,
                    .alias = result.record.alias,
                    .label = displayLabel(result.record.alias, interfaceClass),
                    .endpoint = endpoint,
                });
                break;
            case SightingOutcome::Refreshed:
                break;
        }
    }

    if (newAlias) {
        persistAliases();
    }
}

void DiscoveryEngine::onWebUiStatus(const std::string& address, bool reachable)
{
    std::lock_guard<std::mutex> lock(reconcileMutex_);
    if (!directory_.setWebUiReachable(address, reachable)) {
        return;
    }
    const auto identity = directory_.identityForAddress(address);
    if (!identity.has_value()) {
        return;
    }
    LOG_INFO(
        Discovery,
        "Web UI of '{}' {} at {}",
        identity.value(),
        reachable ? "reachable" : "unreachable",
        address);
    events_.publish(Events::WebUiStatusChanged{
        .identity = identity.value(),
        .address = address,
        .reachable = reachable,
    });
}

std::vector<std::string> DiscoveryEngine::knownAddresses() const
{
    return directory_.knownAddresses();
}

std::vector<GoneDevice> DiscoveryEngine::sweepNow()
{
    const auto context = currentContext();
    const DiscoveryConfig config = context ? context->config : DiscoveryConfig{};

    std::lock_guard<std::mutex> lock(reconcileMutex_);
    auto gone = directory_.sweepStale(
        deps_.clock(), std::chrono::seconds(config.staleTimeoutSeconds), config.gonePolicy);
    for (const auto& device : gone) {
        LOG_INFO(
            Discovery,
            "'{}' ({}) gone{}",
            device.identity,
            displayLabel(device.alias),
            device.removed ? ", removed" : "");
        events_.publish(Events::DeviceGone{
            .identity = device.identity,
            .alias = device.alias,
            .removed = device.removed,
        });
    }
    return gone;
}

void DiscoveryEngine::sweepLoop()
{
    while (true) {
        const auto context = currentContext();
        const auto interval =
            std::chrono::seconds(context ? context->config.sweepIntervalSeconds : 5);
        {
            std::unique_lock<std::mutex> lock(sweepMutex_);
            if (sweepCv_.wait_for(lock, interval, [this] { return sweepStop_; })) {
                return;
            }
        }
        sweepNow();
    }
}

void DiscoveryEngine::persistAliases()
{
    if (!deps_.aliasStore) {
        return;
    }
    auto saved = deps_.aliasStore->saveRegistry(aliases_);
    if (saved.isError()) {
        LOG_WARN(Discovery, "Could not save aliases: {}", saved.errorValue().message);
    }
}

std::vector<DeviceRecord> DiscoveryEngine::snapshot() const
{
    return directory_.snapshot();
}

std::optional<DeviceRecord> DiscoveryEngine::find(const DeviceIdentity& identity) const
{
    return directory_.find(identity);
}

std::optional<DeviceRecord> DiscoveryEngine::lookup(const std::string& nameOrAlias) const
{
    return directory_.lookup(nameOrAlias);
}

std::optional<Endpoint> DiscoveryEngine::preferredEndpoint(const DeviceIdentity& identity) const
{
    return directory_.preferredEndpoint(identity);
}

std::vector<SourceKind> DiscoveryEngine::activeSources() const
{
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    return activeSources_;
}

} // namespace Discovery
} // namespace BjornManager
