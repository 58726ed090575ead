#pragma once

#include "core/Pimpl.h"
#include "discovery/DiscoverySource.h"
#include "discovery/Ipv4.h"
#include <chrono>
#include <functional>

namespace BjornManager {
namespace Discovery {

/**
 * @brief Periodic TCP connect sweep over a set of subnets.
 *
 * Targets are the union of the host addresses of every configured network. Each pass
 * probes the login port on a pool of worker threads; every address that accepts is
 * reported as an address-only sighting.
 */
class RangeProber : public DiscoverySourceInterface {
public:
    using ProbeFn = std::function<bool(const std::string& address, int port, int timeoutMs)>;

    struct Settings {
        std::vector<Ipv4Network> networks;
        int port = 22;
        int timeoutMs = 400;
        int workers = 24;
        std::chrono::milliseconds interval{ std::chrono::seconds(60) };
    };

    explicit RangeProber(Settings settings, ProbeFn probe = nullptr);
    ~RangeProber() override;

    RangeProber(const RangeProber&) = delete;
    RangeProber& operator=(const RangeProber&) = delete;

    SourceKind kind() const override { return SourceKind::RangeProbe; }
    VoidOutcome start(SightingSink& sink) override;
    void stop() override;
    bool isRunning() const override;

    // One synchronous pass. Returns the number of responding addresses.
    size_t scanOnce(SightingSink& sink);

    std::vector<std::string> targets() const;

private:
    struct Impl;
    Pimpl<Impl> pImpl_;
};

} // namespace Discovery
} // namespace BjornManager
