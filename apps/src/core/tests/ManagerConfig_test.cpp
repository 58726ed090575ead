#include "core/ManagerConfig.h"
#include <gtest/gtest.h>

using namespace BjornManager;

TEST(ManagerConfigTest, EmptyObjectYieldsDefaults)
{
    const ManagerConfig config = nlohmann::json::object().get<ManagerConfig>();

    EXPECT_EQ(config.discovery.loginPort, 22);
    EXPECT_EQ(config.discovery.webUiPort, 8000);
    EXPECT_EQ(config.discovery.usbRange, "172.20.2.0/24");
    EXPECT_EQ(config.discovery.bluetoothRange, "172.20.1.0/24");
    EXPECT_EQ(config.discovery.probeWorkers, 24);
    EXPECT_EQ(config.discovery.staleTimeoutSeconds, 90);
    EXPECT_EQ(config.discovery.gonePolicy, GonePolicy::Keep);
    EXPECT_EQ(config.session.keyNames.front(), "id_ed25519");
    EXPECT_EQ(config.session.hostKeyPolicy, HostKeyPolicy::KnownHosts);
    EXPECT_FALSE(config.session.acceptUnknownHosts);
    EXPECT_EQ(config.install.remoteHome, "/home/bjorn");
    EXPECT_EQ(config.install.failureContextLines, 20);
}

TEST(ManagerConfigTest, ParsesEnumeratedPolicies)
{
    const auto j = nlohmann::json::parse(R"({
        "discovery": {"gone_policy": "remove", "strict_naming": false},
        "session": {"host_key_policy": "accept-any", "accept_unknown_hosts": true}
    })");
    const ManagerConfig config = j.get<ManagerConfig>();

    EXPECT_EQ(config.discovery.gonePolicy, GonePolicy::Remove);
    EXPECT_FALSE(config.discovery.strictNaming);
    EXPECT_EQ(config.session.hostKeyPolicy, HostKeyPolicy::AcceptAny);
    EXPECT_TRUE(config.session.acceptUnknownHosts);
}

TEST(ManagerConfigTest, UnknownTopLevelFieldThrows)
{
    const auto j = nlohmann::json::parse(R"({"discovery": {}, "telemetry": {}})");
    EXPECT_THROW(j.get<ManagerConfig>(), std::runtime_error);
}

TEST(ManagerConfigTest, InvalidGonePolicyThrows)
{
    const auto j = nlohmann::json::parse(R"({"discovery": {"gone_policy": "prune"}})");
    EXPECT_THROW(j.get<ManagerConfig>(), std::runtime_error);
}

TEST(ManagerConfigTest, NonPositiveWorkerCountThrows)
{
    const auto j = nlohmann::json::parse(R"({"discovery": {"probe_workers": 0}})");
    EXPECT_THROW(j.get<ManagerConfig>(), std::runtime_error);
}

TEST(ManagerConfigTest, SerializedConfigParsesBack)
{
    ManagerConfig original;
    original.discovery.ignoredAddresses = { "192.168.7.1" };
    original.install.serviceUnit = "pager.service";

    const ManagerConfig parsed = nlohmann::json(original).get<ManagerConfig>();

    EXPECT_EQ(parsed.discovery.ignoredAddresses, original.discovery.ignoredAddresses);
    EXPECT_EQ(parsed.install.serviceUnit, "pager.service");
}
