#include "discovery/NetworkInterfaces.h"
#include "core/LoggingChannels.h"
#include <algorithm>
#include <arpa/inet.h>
#include <fstream>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <sstream>

namespace BjornManager {
namespace Discovery {

namespace {

// /proc/net/route prints addresses as host-endian hex of the network-order value.
std::optional<Ipv4Address> parseRouteHex(const std::string& hex)
{
    if (hex.size() != 8) {
        return std::nullopt;
    }
    uint32_t raw = 0;
    try {
        raw = static_cast<uint32_t>(std::stoul(hex, nullptr, 16));
    }
    catch (const std::exception&) {
        return std::nullopt;
    }
    in_addr addr;
    addr.s_addr = raw;
    return Ipv4Address(ntohl(addr.s_addr));
}

Ipv4Address fromSockaddr(const sockaddr* sa)
{
    const auto* sin = reinterpret_cast<const sockaddr_in*>(sa);
    return Ipv4Address(ntohl(sin->sin_addr.s_addr));
}

std::string readFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        return "";
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

std::vector<RouteEntry> parseRouteTable(const std::string& text)
{
    std::vector<RouteEntry> routes;
    std::istringstream stream(text);
    std::string line;

    // Header: Iface Destination Gateway Flags RefCnt Use Metric Mask ...
    std::getline(stream, line);
    while (std::getline(stream, line)) {
        std::istringstream row(line);
        std::string iface, destination, gateway, flags, refCnt, use, metric, mask;
        if (!(row >> iface >> destination >> gateway >> flags >> refCnt >> use >> metric >> mask)) {
            continue;
        }

        const auto dest = parseRouteHex(destination);
        const auto gw = parseRouteHex(gateway);
        const auto msk = parseRouteHex(mask);
        if (!dest || !gw || !msk) {
            continue;
        }

        RouteEntry entry;
        entry.interfaceName = iface;
        entry.destination = dest.value();
        entry.gateway = gw.value();
        entry.mask = msk.value();
        try {
            entry.flags = static_cast<unsigned int>(std::stoul(flags, nullptr, 16));
        }
        catch (const std::exception&) {
            continue;
        }
        routes.push_back(entry);
    }
    return routes;
}

LocalNetworkInfo probeLocalNetwork()
{
    LocalNetworkInfo info;

    const auto routes = parseRouteTable(readFile("/proc/net/route"));
    std::string defaultInterface;
    for (const auto& route : routes) {
        if (route.isDefault() && route.hasGateway() && defaultInterface.empty()) {
            defaultInterface = route.interfaceName;
            info.gateways.insert(info.gateways.begin(), route.gateway.toString());
        }
        else if (route.hasGateway()) {
            info.gateways.push_back(route.gateway.toString());
        }
    }
    info.gateways.erase(
        std::unique(info.gateways.begin(), info.gateways.end()), info.gateways.end());

    ifaddrs* addrs = nullptr;
    if (getifaddrs(&addrs) != 0) {
        LOG_WARN(Discovery, "getifaddrs failed, local addresses unknown");
        return info;
    }

    for (ifaddrs* ifa = addrs; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        const Ipv4Address address = fromSockaddr(ifa->ifa_addr);
        info.localAddresses.push_back(address.toString());

        if (!info.defaultSubnet.has_value() && ifa->ifa_netmask
            && defaultInterface == ifa->ifa_name) {
            auto subnet = Ipv4Network::fromAddressAndMask(address, fromSockaddr(ifa->ifa_netmask));
            if (subnet.has_value() && subnet->prefixLength() < kWidestScannedPrefix) {
                LOG_INFO(
                    Discovery,
                    "Default subnet {} is too wide to scan, using the /24 around {}",
                    subnet->toString(),
                    address.toString());
                subnet = Ipv4Network(address, 24);
            }
            info.defaultSubnet = subnet;
        }
    }
    freeifaddrs(addrs);

    LOG_DEBUG(
        Discovery,
        "Local network: {} gateway(s), {} local address(es), default subnet {}",
        info.gateways.size(),
        info.localAddresses.size(),
        info.defaultSubnet ? info.defaultSubnet->toString() : "none");
    return info;
}

} // namespace Discovery
} // namespace BjornManager
