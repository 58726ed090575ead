#pragma once

#include "core/Pimpl.h"
#include "discovery/DiscoverySource.h"
#include <chrono>
#include <functional>
#include <optional>

namespace BjornManager {
namespace Discovery {

// Polls the web UI port of already-known addresses. Never creates identities; it only
// reports reachability through SightingSink::onWebUiStatus().
class LivenessPoller : public DiscoverySourceInterface {
public:
    using HttpGetFn = std::function<std::optional<int>(
        const std::string& address, int port, const std::string& path, int timeoutMs)>;

    struct Settings {
        int port = 8000;
        int timeoutMs = 1500;
        int workers = 8;
        std::chrono::milliseconds interval{ std::chrono::seconds(30) };
    };

    explicit LivenessPoller(Settings settings, HttpGetFn httpGet = nullptr);
    ~LivenessPoller() override;

    LivenessPoller(const LivenessPoller&) = delete;
    LivenessPoller& operator=(const LivenessPoller&) = delete;

    SourceKind kind() const override { return SourceKind::LivenessPoll; }
    VoidOutcome start(SightingSink& sink) override;
    void stop() override;
    bool isRunning() const override;

    void pollOnce(SightingSink& sink);

private:
    struct Impl;
    Pimpl<Impl> pImpl_;
};

} // namespace Discovery
} // namespace BjornManager
