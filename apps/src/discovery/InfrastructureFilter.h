#pragma once

#include "discovery/NetworkInterfaces.h"
#include <set>
#include <string>
#include <vector>

namespace BjornManager {
namespace Discovery {

// Addresses that are never a device: gateways, common router addresses, this machine.
class InfrastructureFilter {
public:
    InfrastructureFilter() = default;

    static InfrastructureFilter fromLocalNetwork(
        const LocalNetworkInfo& local, const std::vector<std::string>& extraAddresses);

    void add(const std::string& address);
    bool isIgnored(const std::string& address) const;

    const std::set<std::string>& addresses() const { return ignored_; }

private:
    std::set<std::string> ignored_;
};

} // namespace Discovery
} // namespace BjornManager
