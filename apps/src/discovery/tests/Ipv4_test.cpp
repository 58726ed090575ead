#include "discovery/AddressClassifier.h"
#include "discovery/Ipv4.h"
#include <gtest/gtest.h>

using namespace BjornManager;
using namespace BjornManager::Discovery;

TEST(Ipv4Test, ParsesDottedQuadOnly)
{
    auto address = Ipv4Address::parse("172.20.2.5");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->toString(), "172.20.2.5");
    EXPECT_EQ(address->value(), 0xAC140205u);

    EXPECT_FALSE(Ipv4Address::parse("").has_value());
    EXPECT_FALSE(Ipv4Address::parse("bjorn.local").has_value());
    EXPECT_FALSE(Ipv4Address::parse("10.0.0").has_value());
    EXPECT_FALSE(Ipv4Address::parse("10.0.0.256").has_value());
    EXPECT_FALSE(Ipv4Address::parse("10.0.0.1.2").has_value());
}

TEST(Ipv4Test, NetworkParseClearsHostBits)
{
    auto network = Ipv4Network::parse("192.168.1.77/24");
    ASSERT_TRUE(network.has_value());
    EXPECT_EQ(network->toString(), "192.168.1.0/24");
    EXPECT_EQ(network->prefixLength(), 24);
    EXPECT_EQ(network->mask(), 0xFFFFFF00u);

    EXPECT_EQ(Ipv4Network::parse("192.168.1.9").value().prefixLength(), 32);
    EXPECT_FALSE(Ipv4Network::parse("192.168.1.0/33").has_value());
}

TEST(Ipv4Test, ContainsChecksMembership)
{
    auto network = Ipv4Network::parse("172.20.2.0/24").value();
    EXPECT_TRUE(network.contains("172.20.2.1"));
    EXPECT_TRUE(network.contains("172.20.2.255"));
    EXPECT_FALSE(network.contains("172.20.1.5"));
    EXPECT_FALSE(network.contains("not-an-address"));
}

TEST(Ipv4Test, HostsExcludeNetworkAndBroadcast)
{
    auto hosts = Ipv4Network::parse("10.1.2.0/30").value().hosts();
    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(hosts[0].toString(), "10.1.2.1");
    EXPECT_EQ(hosts[1].toString(), "10.1.2.2");

    EXPECT_EQ(Ipv4Network::parse("172.20.1.0/24").value().hosts().size(), 254u);
}

TEST(Ipv4Test, FromAddressAndMask)
{
    auto network = Ipv4Network::fromAddressAndMask(
        Ipv4Address::parse("192.168.50.12").value(), Ipv4Address::parse("255.255.255.0").value());
    ASSERT_TRUE(network.has_value());
    EXPECT_EQ(network->toString(), "192.168.50.0/24");
}

TEST(AddressClassifierTest, TagsByRangeMembershipOnly)
{
    AddressClassifier classifier(
        Ipv4Network::parse("172.20.2.0/24").value(), Ipv4Network::parse("172.20.1.0/24").value());

    EXPECT_EQ(classifier.classify("172.20.2.5"), InterfaceClass::Usb);
    EXPECT_EQ(classifier.classify("172.20.1.9"), InterfaceClass::Bluetooth);
    EXPECT_EQ(classifier.classify("192.168.1.20"), InterfaceClass::Lan);
    EXPECT_EQ(classifier.classify("garbage"), InterfaceClass::Lan);
}
