#include "discovery/InfrastructureFilter.h"

namespace BjornManager {
namespace Discovery {

namespace {
constexpr const char* kCommonRouterAddresses[] = {
    "192.168.1.1",
    "192.168.0.1",
    "192.168.1.254",
    "10.0.0.1",
};
}

InfrastructureFilter InfrastructureFilter::fromLocalNetwork(
    const LocalNetworkInfo& local, const std::vector<std::string>& extraAddresses)
{
    InfrastructureFilter filter;
    for (const auto& gateway : local.gateways) {
        filter.add(gateway);
    }
    for (const char* router : kCommonRouterAddresses) {
        filter.add(router);
    }
    for (const auto& own : local.localAddresses) {
        filter.add(own);
    }
    for (const auto& extra : extraAddresses) {
        filter.add(extra);
    }
    return filter;
}

void InfrastructureFilter::add(const std::string& address)
{
    if (!address.empty()) {
        ignored_.insert(address);
    }
}

bool InfrastructureFilter::isIgnored(const std::string& address) const
{
    return ignored_.count(address) > 0;
}

} // namespace Discovery
} // namespace BjornManager
