#pragma once

#include "discovery/Ipv4.h"
#include <optional>
#include <string>
#include <vector>

namespace BjornManager {
namespace Discovery {

struct RouteEntry {
    std::string interfaceName;
    Ipv4Address destination;
    Ipv4Address gateway;
    Ipv4Address mask;
    unsigned int flags = 0;

    bool isDefault() const { return destination.value() == 0 && mask.value() == 0; }
    bool hasGateway() const { return gateway.value() != 0; }
};

// Parses the text of /proc/net/route. Malformed rows are skipped.
std::vector<RouteEntry> parseRouteTable(const std::string& text);

struct LocalNetworkInfo {
    // Every gateway named in the routing table, default route first.
    std::vector<std::string> gateways;
    std::vector<std::string> localAddresses;
    // Subnet of the interface carrying the default route.
    std::optional<Ipv4Network> defaultSubnet;
};

// Subnets wider than this are narrowed to the /24 around the interface address.
constexpr int kWidestScannedPrefix = 22;

// Reads /proc/net/route and getifaddrs(). Missing pieces are left empty.
LocalNetworkInfo probeLocalNetwork();

} // namespace Discovery
} // namespace BjornManager
