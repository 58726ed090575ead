#include "discovery/AliasStore.h"
#include "discovery/DiscoveryEngine.h"
#include "events/tests/RecordingEventSink.h"
#include <filesystem>
#include <gtest/gtest.h>
#include <map>
#include <mutex>
#include <unistd.h>

using namespace BjornManager;
using namespace BjornManager::Discovery;
using namespace std::chrono_literals;
using BjornManager::Events::Testing::RecordingEventSink;

namespace {

class FakeSource : public DiscoverySourceInterface {
public:
    FakeSource(SourceKind kind, bool failStart) : kind_(kind), failStart_(failStart) {}

    SourceKind kind() const override { return kind_; }

    VoidOutcome start(SightingSink& sink) override
    {
        ++startCount;
        if (failStart_) {
            return failVoid(ErrorKind::Discovery, "library unavailable");
        }
        sink_ = &sink;
        running_ = true;
        return okayVoid();
    }

    void stop() override
    {
        running_ = false;
        sink_ = nullptr;
    }

    bool isRunning() const override { return running_; }

    void emit(const std::string& hostname, const std::string& address)
    {
        ASSERT_NE(sink_, nullptr);
        sink_->onSighting(Sighting{ hostname, address, kind_ });
    }

    SightingSink* sink() const { return sink_; }

    int startCount = 0;

private:
    SourceKind kind_;
    bool failStart_;
    SightingSink* sink_ = nullptr;
    bool running_ = false;
};

} // namespace

class DiscoveryEngineTest : public ::testing::Test {
protected:
    DiscoveryEngine::Dependencies makeDependencies()
    {
        DiscoveryEngine::Dependencies deps;
        deps.sourceFactory = [this](const DiscoveryConfig&, const LocalNetworkInfo&) {
            DiscoveryEngine::SourceList sources;
            auto mdns = std::make_unique<FakeSource>(SourceKind::Mdns, failMdns_);
            auto probe = std::make_unique<FakeSource>(SourceKind::RangeProbe, false);
            auto poll = std::make_unique<FakeSource>(SourceKind::LivenessPoll, false);
            mdns_ = mdns.get();
            probe_ = probe.get();
            poll_ = poll.get();
            sources.push_back(std::move(mdns));
            sources.push_back(std::move(probe));
            sources.push_back(std::move(poll));
            return sources;
        };
        deps.reverseResolver = [this](const std::string& address) -> std::optional<std::string> {
            auto it = reverseNames_.find(address);
            if (it == reverseNames_.end()) {
                return std::nullopt;
            }
            return it->second;
        };
        deps.localNetwork = [] {
            LocalNetworkInfo local;
            local.gateways = { "192.168.1.254" };
            local.localAddresses = { "192.168.1.10" };
            return local;
        };
        deps.clock = [this] { return now_; };
        deps.runSweepThread = false;
        return deps;
    }

    std::unique_ptr<DiscoveryEngine> makeEngine()
    {
        return std::make_unique<DiscoveryEngine>(events_, makeDependencies());
    }

    RecordingEventSink events_;
    DiscoveryConfig config_;
    SteadyClock::time_point now_ = SteadyClock::time_point{} + 1h;
    std::map<std::string, std::string> reverseNames_;
    bool failMdns_ = false;

    FakeSource* mdns_ = nullptr;
    FakeSource* probe_ = nullptr;
    FakeSource* poll_ = nullptr;
};

TEST_F(DiscoveryEngineTest, LanThenUsbSightingsMergeIntoOneDevice)
{
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(config_).isValue());

    mdns_->emit("bjorn.local", "192.168.1.20");
    probe_->emit("", "192.168.1.20");
    now_ += 10s;
    mdns_->emit("bjorn.local", "172.20.2.5");

    const auto records = engine->snapshot();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].identity, "bjorn");
    EXPECT_EQ(records[0].alias, Alias{ 1 });
    ASSERT_EQ(records[0].endpoints.size(), 2u);
    EXPECT_EQ(records[0].endpoints.at("192.168.1.20").interfaceClass, InterfaceClass::Lan);
    EXPECT_EQ(records[0].endpoints.at("172.20.2.5").interfaceClass, InterfaceClass::Usb);

    EXPECT_EQ(events_.names(), (std::vector<std::string>{ "deviceFound", "deviceUpdated" }));
    const auto found = events_.last<Events::DeviceFound>();
    EXPECT_EQ(found.label, "Bjorn 1");
    EXPECT_EQ(found.endpoint.address, "192.168.1.20");
    const auto updated = events_.last<Events::DeviceUpdated>();
    EXPECT_EQ(updated.label, "Bjorn 1 (USB)");
    EXPECT_EQ(updated.endpoint.interfaceClass, InterfaceClass::Usb);
}

TEST_F(DiscoveryEngineTest, InfrastructureAddressesAreRejected)
{
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(config_).isValue());

    mdns_->emit("bjorn.local", "192.168.1.254");
    mdns_->emit("bjorn.local", "192.168.1.10");
    mdns_->emit("bjorn.local", "192.168.1.1");

    EXPECT_TRUE(engine->snapshot().empty());
    EXPECT_TRUE(events_.events().empty());
}

TEST_F(DiscoveryEngineTest, NamesOutsideConventionAreDroppedInStrictMode)
{
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(config_).isValue());

    mdns_->emit("raspberrypi.local", "192.168.1.30");
    probe_->emit("", "192.168.1.31");

    EXPECT_TRUE(engine->snapshot().empty());
}

TEST_F(DiscoveryEngineTest, ProbeSightingResolvesNameByReverseLookup)
{
    reverseNames_["172.20.1.7"] = "Bjorn-Desk.home.";
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(config_).isValue());

    probe_->emit("", "172.20.1.7");

    auto record = engine->find("bjorn-desk");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->endpoints.at("172.20.1.7").interfaceClass, InterfaceClass::Bluetooth);
}

TEST_F(DiscoveryEngineTest, NonStrictModeKeysUnnamedAddressByAddress)
{
    config_.strictNaming = false;
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(config_).isValue());

    probe_->emit("", "172.20.2.9");

    EXPECT_TRUE(engine->find("172.20.2.9").has_value());
}

TEST_F(DiscoveryEngineTest, NamingAnAddressKeyedDeviceLeavesOneRecord)
{
    config_.strictNaming = false;
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(config_).isValue());

    probe_->emit("", "172.20.2.9");
    now_ += 5s;
    mdns_->emit("bjorn.local", "172.20.2.9");

    const auto records = engine->snapshot();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].identity, "bjorn");
    EXPECT_EQ(records[0].alias, Alias{ 1 });
    EXPECT_EQ(records[0].endpoints.size(), 1u);

    EXPECT_EQ(
        events_.names(),
        (std::vector<std::string>{ "deviceFound", "deviceGone", "deviceFound" }));
    const auto gone = events_.last<Events::DeviceGone>();
    EXPECT_EQ(gone.identity, "172.20.2.9");
    EXPECT_TRUE(gone.removed);
    EXPECT_EQ(events_.last<Events::DeviceFound>().identity, "bjorn");

    now_ += 200s;
    const auto swept = engine->sweepNow();
    ASSERT_EQ(swept.size(), 1u);
    EXPECT_EQ(swept[0].identity, "bjorn");
}

TEST_F(DiscoveryEngineTest, FailingSourceDoesNotStopTheOthers)
{
    failMdns_ = true;
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(config_).isValue());

    EXPECT_EQ(
        engine->activeSources(),
        (std::vector<SourceKind>{ SourceKind::RangeProbe, SourceKind::LivenessPoll }));

    reverseNames_["192.168.1.40"] = "bjorn";
    probe_->emit("", "192.168.1.40");
    EXPECT_EQ(engine->snapshot().size(), 1u);
}

TEST_F(DiscoveryEngineTest, StartIsIdempotentWhileRunning)
{
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(config_).isValue());
    FakeSource* firstProbe = probe_;

    ASSERT_TRUE(engine->start(config_).isValue());
    EXPECT_EQ(probe_, firstProbe);
    EXPECT_EQ(probe_->startCount, 1);
    EXPECT_TRUE(engine->isRunning());

    engine->stop();
    EXPECT_FALSE(engine->isRunning());
}

TEST_F(DiscoveryEngineTest, InvalidRangeIsConfigError)
{
    config_.usbRange = "172.20.2.0/99";
    auto engine = makeEngine();

    auto result = engine->start(config_);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, ErrorKind::Config);
    EXPECT_FALSE(engine->isRunning());
}

TEST_F(DiscoveryEngineTest, DeviceGoneIsPublishedButRecordKeptByDefault)
{
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(config_).isValue());
    mdns_->emit("bjorn.local", "192.168.1.20");

    now_ += 91s;
    auto gone = engine->sweepNow();
    ASSERT_EQ(gone.size(), 1u);

    const auto event = events_.last<Events::DeviceGone>();
    EXPECT_EQ(event.identity, "bjorn");
    EXPECT_FALSE(event.removed);
    ASSERT_TRUE(engine->find("bjorn").has_value());
    EXPECT_EQ(engine->find("bjorn")->freshness, Freshness::Stale);

    // Seen again: the card is updated, not re-created.
    mdns_->emit("bjorn.local", "192.168.1.20");
    EXPECT_EQ(events_.names().back(), "deviceUpdated");
}

TEST_F(DiscoveryEngineTest, RemovePolicyDeletesRecordButKeepsAlias)
{
    config_.gonePolicy = GonePolicy::Remove;
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(config_).isValue());
    mdns_->emit("bjorn.local", "192.168.1.20");
    mdns_->emit("bjorn-2.local", "192.168.1.21");

    now_ += 91s;
    mdns_->emit("bjorn-2.local", "192.168.1.21");
    engine->sweepNow();
    EXPECT_FALSE(engine->find("bjorn").has_value());
    EXPECT_TRUE(events_.last<Events::DeviceGone>().removed);

    mdns_->emit("bjorn.local", "192.168.1.20");
    const auto found = events_.last<Events::DeviceFound>();
    EXPECT_EQ(found.identity, "bjorn");
    EXPECT_EQ(found.alias, Alias{ 1 });
}

TEST_F(DiscoveryEngineTest, WebUiStatusIsPublishedOnlyOnChange)
{
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(config_).isValue());
    mdns_->emit("bjorn.local", "192.168.1.20");

    EXPECT_EQ(engine->knownAddresses(), std::vector<std::string>{ "192.168.1.20" });
    poll_->sink()->onWebUiStatus("192.168.1.20", true);
    poll_->sink()->onWebUiStatus("192.168.1.20", true);
    poll_->sink()->onWebUiStatus("192.168.1.99", true);

    EXPECT_EQ(events_.names(), (std::vector<std::string>{ "deviceFound", "webUiStatusChanged" }));
    EXPECT_TRUE(events_.last<Events::WebUiStatusChanged>().reachable);
    EXPECT_TRUE(engine->find("bjorn")->webUiReachable);
}

TEST_F(DiscoveryEngineTest, ResetForgetsDevicesButNotAliases)
{
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(config_).isValue());
    mdns_->emit("bjorn.local", "192.168.1.20");

    ASSERT_TRUE(engine->reset().isValue());
    EXPECT_TRUE(engine->isRunning());
    EXPECT_TRUE(engine->snapshot().empty());

    mdns_->emit("bjorn-2.local", "192.168.1.21");
    mdns_->emit("bjorn.local", "192.168.1.20");
    EXPECT_EQ(engine->find("bjorn-2")->alias, Alias{ 2 });
    EXPECT_EQ(engine->find("bjorn")->alias, Alias{ 1 });
}

TEST_F(DiscoveryEngineTest, NewAliasesArePersisted)
{
    const auto dir = std::filesystem::temp_directory_path()
        / ("bjorn_engine_aliases_" + std::to_string(getpid()));
    std::filesystem::remove_all(dir);
    AliasStore store(dir / "aliases.json");

    {
        auto deps = makeDependencies();
        deps.aliasStore = &store;
        DiscoveryEngine engine(events_, deps);
        ASSERT_TRUE(engine.start(config_).isValue());
        mdns_->emit("bjorn-a.local", "192.168.1.20");
        mdns_->emit("bjorn-b.local", "192.168.1.21");
    }

    auto deps = makeDependencies();
    deps.aliasStore = &store;
    DiscoveryEngine restarted(events_, deps);
    EXPECT_EQ(restarted.aliases().find("bjorn-b"), Alias{ 2 });
    EXPECT_EQ(restarted.aliases().highWaterMark(), 2);

    std::filesystem::remove_all(dir);
}
