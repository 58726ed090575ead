#include "discovery/DeviceDirectory.h"
#include <gtest/gtest.h>

using namespace BjornManager;
using namespace BjornManager::Discovery;
using namespace std::chrono_literals;

class DeviceDirectoryTest : public ::testing::Test {
protected:
    AliasRegistry aliases_;
    DeviceDirectory directory_{ aliases_ };
    SteadyClock::time_point t0_ = SteadyClock::time_point{} + 1h;
};

TEST_F(DeviceDirectoryTest, SecondAddressOfSameIdentityIsNewEndpoint)
{
    auto first = directory_.recordSighting("bjorn", "192.168.1.20", InterfaceClass::Lan, t0_);
    EXPECT_EQ(first.outcome, SightingOutcome::NewDevice);
    EXPECT_EQ(first.record.alias, Alias{ 1 });

    auto refresh = directory_.recordSighting("bjorn", "192.168.1.20", InterfaceClass::Lan, t0_);
    EXPECT_EQ(refresh.outcome, SightingOutcome::Refreshed);

    auto usb = directory_.recordSighting("bjorn", "172.20.2.5", InterfaceClass::Usb, t0_ + 1s);
    EXPECT_EQ(usb.outcome, SightingOutcome::NewEndpoint);
    EXPECT_EQ(usb.record.endpoints.size(), 2u);
    EXPECT_EQ(directory_.size(), 1u);
}

TEST_F(DeviceDirectoryTest, ReusedAddressMovesToNewIdentity)
{
    directory_.recordSighting("bjorn", "192.168.1.20", InterfaceClass::Lan, t0_);
    directory_.recordSighting("bjorn", "172.20.2.5", InterfaceClass::Usb, t0_);
    directory_.recordSighting("bjorn-2", "192.168.1.20", InterfaceClass::Lan, t0_);

    EXPECT_EQ(directory_.identityForAddress("192.168.1.20"), "bjorn-2");
    auto original = directory_.find("bjorn");
    ASSERT_TRUE(original.has_value());
    EXPECT_EQ(original->endpoints.size(), 1u);
    EXPECT_EQ(original->endpoints.count("172.20.2.5"), 1u);
}

TEST_F(DeviceDirectoryTest, NamedSightingAbsorbsAddressKeyedRecord)
{
    auto unnamed =
        directory_.recordSighting("172.20.2.9", "172.20.2.9", InterfaceClass::Usb, t0_);
    ASSERT_EQ(unnamed.outcome, SightingOutcome::NewDevice);
    EXPECT_FALSE(unnamed.absorbed.has_value());

    auto named = directory_.recordSighting("bjorn", "172.20.2.9", InterfaceClass::Usb, t0_ + 5s);
    EXPECT_EQ(named.outcome, SightingOutcome::NewDevice);
    ASSERT_TRUE(named.absorbed.has_value());
    EXPECT_EQ(named.absorbed->identity, "172.20.2.9");
    EXPECT_TRUE(named.absorbed->removed);
    EXPECT_EQ(named.record.alias, Alias{ 1 });

    EXPECT_EQ(directory_.size(), 1u);
    EXPECT_FALSE(directory_.find("172.20.2.9").has_value());
    EXPECT_EQ(directory_.identityForAddress("172.20.2.9"), "bjorn");
    EXPECT_FALSE(aliases_.find("172.20.2.9").has_value());

    EXPECT_TRUE(directory_.sweepStale(t0_ + 10s, 90s, GonePolicy::Remove).empty());
    auto gone = directory_.sweepStale(t0_ + 200s, 90s, GonePolicy::Remove);
    ASSERT_EQ(gone.size(), 1u);
    EXPECT_EQ(gone[0].identity, "bjorn");
    EXPECT_EQ(directory_.size(), 0u);
}

TEST_F(DeviceDirectoryTest, AbsorbedRecordKeepsNamedDeviceAlias)
{
    directory_.recordSighting("bjorn", "192.168.1.20", InterfaceClass::Lan, t0_);
    directory_.recordSighting("172.20.2.9", "172.20.2.9", InterfaceClass::Usb, t0_);

    auto named = directory_.recordSighting("bjorn", "172.20.2.9", InterfaceClass::Usb, t0_ + 1s);

    EXPECT_EQ(named.outcome, SightingOutcome::NewEndpoint);
    ASSERT_TRUE(named.absorbed.has_value());
    EXPECT_EQ(named.absorbed->alias, Alias{ 2 });
    EXPECT_EQ(named.record.alias, Alias{ 1 });
    EXPECT_EQ(named.record.endpoints.size(), 2u);
    EXPECT_EQ(directory_.size(), 1u);
}

TEST_F(DeviceDirectoryTest, SweepReportsDeviceOnceWhenLastEndpointGoesStale)
{
    directory_.recordSighting("bjorn", "192.168.1.20", InterfaceClass::Lan, t0_);
    directory_.recordSighting("bjorn", "172.20.2.5", InterfaceClass::Usb, t0_ + 60s);

    EXPECT_TRUE(directory_.sweepStale(t0_ + 100s, 90s, GonePolicy::Keep).empty());
    EXPECT_TRUE(directory_.find("bjorn")->endpoints.at("192.168.1.20").stale);
    EXPECT_EQ(directory_.find("bjorn")->freshness, Freshness::Fresh);

    auto gone = directory_.sweepStale(t0_ + 200s, 90s, GonePolicy::Keep);
    ASSERT_EQ(gone.size(), 1u);
    EXPECT_EQ(gone[0].identity, "bjorn");
    EXPECT_FALSE(gone[0].removed);
    EXPECT_EQ(directory_.find("bjorn")->freshness, Freshness::Stale);

    EXPECT_TRUE(directory_.sweepStale(t0_ + 300s, 90s, GonePolicy::Keep).empty());
}

TEST_F(DeviceDirectoryTest, StaleDeviceSeenAgainIsRevived)
{
    directory_.recordSighting("bjorn", "192.168.1.20", InterfaceClass::Lan, t0_);
    directory_.sweepStale(t0_ + 100s, 90s, GonePolicy::Keep);

    auto revived =
        directory_.recordSighting("bjorn", "192.168.1.20", InterfaceClass::Lan, t0_ + 101s);
    EXPECT_EQ(revived.outcome, SightingOutcome::Revived);
    EXPECT_EQ(revived.record.freshness, Freshness::Fresh);
}

TEST_F(DeviceDirectoryTest, RemovePolicyKeepsAliasForReturningDevice)
{
    directory_.recordSighting("bjorn", "192.168.1.20", InterfaceClass::Lan, t0_);
    directory_.recordSighting("bjorn-2", "192.168.1.21", InterfaceClass::Lan, t0_ + 95s);

    auto gone = directory_.sweepStale(t0_ + 100s, 90s, GonePolicy::Remove);
    ASSERT_EQ(gone.size(), 1u);
    EXPECT_TRUE(gone[0].removed);
    EXPECT_FALSE(directory_.find("bjorn").has_value());
    EXPECT_FALSE(directory_.identityForAddress("192.168.1.20").has_value());

    auto back =
        directory_.recordSighting("bjorn", "192.168.1.20", InterfaceClass::Lan, t0_ + 120s);
    EXPECT_EQ(back.outcome, SightingOutcome::NewDevice);
    EXPECT_EQ(back.record.alias, Alias{ 1 });
}

TEST_F(DeviceDirectoryTest, WebUiFlagReportsOnlyFlips)
{
    directory_.recordSighting("bjorn", "192.168.1.20", InterfaceClass::Lan, t0_);
    directory_.recordSighting("bjorn", "172.20.2.5", InterfaceClass::Usb, t0_);

    EXPECT_TRUE(directory_.setWebUiReachable("192.168.1.20", true));
    EXPECT_FALSE(directory_.setWebUiReachable("172.20.2.5", true));
    EXPECT_FALSE(directory_.setWebUiReachable("192.168.1.20", false));
    EXPECT_TRUE(directory_.setWebUiReachable("172.20.2.5", false));
    EXPECT_FALSE(directory_.setWebUiReachable("10.9.9.9", true));
}

TEST_F(DeviceDirectoryTest, LookupAcceptsNameOrAlias)
{
    directory_.recordSighting("bjorn", "192.168.1.20", InterfaceClass::Lan, t0_);
    directory_.recordSighting("bjorn-2", "192.168.1.21", InterfaceClass::Lan, t0_);

    EXPECT_EQ(directory_.lookup("bjorn.local")->identity, "bjorn");
    EXPECT_EQ(directory_.lookup("2")->identity, "bjorn-2");
    EXPECT_EQ(directory_.lookup("Bjorn 1")->identity, "bjorn");
    EXPECT_FALSE(directory_.lookup("7").has_value());
    EXPECT_FALSE(directory_.lookup("printer").has_value());
}

TEST_F(DeviceDirectoryTest, PreferredEndpointFavoursFreshUsb)
{
    directory_.recordSighting("bjorn", "192.168.1.20", InterfaceClass::Lan, t0_ + 50s);
    directory_.recordSighting("bjorn", "172.20.1.4", InterfaceClass::Bluetooth, t0_ + 50s);
    directory_.recordSighting("bjorn", "172.20.2.5", InterfaceClass::Usb, t0_);

    EXPECT_EQ(directory_.preferredEndpoint("bjorn")->address, "172.20.2.5");

    // USB endpoint goes stale; the fresh Bluetooth link wins over LAN.
    directory_.sweepStale(t0_ + 100s, 90s, GonePolicy::Keep);
    EXPECT_EQ(directory_.preferredEndpoint("bjorn")->address, "172.20.1.4");
}

TEST_F(DeviceDirectoryTest, SnapshotIsOrderedByAlias)
{
    directory_.recordSighting("zeta", "10.0.0.30", InterfaceClass::Lan, t0_);
    directory_.recordSighting("alpha", "10.0.0.31", InterfaceClass::Lan, t0_);

    auto records = directory_.snapshot();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].identity, "zeta");
    EXPECT_EQ(records[1].identity, "alpha");
}
