#pragma once

#include "core/Pimpl.h"
#include "discovery/DiscoverySource.h"
#include <string>
#include <vector>

namespace BjornManager {
namespace Discovery {

// Browses the local network via Avahi for the given service types ("_ssh._tcp", ...).
// Every resolved IPv4 advertisement becomes a sighting carrying the advertised host name.
class MdnsBrowser : public DiscoverySourceInterface {
public:
    explicit MdnsBrowser(std::vector<std::string> serviceTypes);
    ~MdnsBrowser() override;

    MdnsBrowser(const MdnsBrowser&) = delete;
    MdnsBrowser& operator=(const MdnsBrowser&) = delete;

    SourceKind kind() const override { return SourceKind::Mdns; }
    VoidOutcome start(SightingSink& sink) override;
    void stop() override;
    bool isRunning() const override;

private:
    struct Impl;
    Pimpl<Impl> pImpl_;
};

} // namespace Discovery
} // namespace BjornManager
