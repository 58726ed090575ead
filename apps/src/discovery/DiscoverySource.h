#pragma once

#include "core/ManagerError.h"
#include <string>
#include <vector>

namespace BjornManager {
namespace Discovery {

enum class SourceKind { Mdns, RangeProbe, LivenessPoll };

const char* toString(SourceKind kind);

// Raw candidate from one source. hostname is empty when the source only knows an address.
struct Sighting {
    std::string hostname;
    std::string address;
    SourceKind source = SourceKind::Mdns;
};

// Receiving side of every source. Called from source threads, concurrently.
class SightingSink {
public:
    virtual ~SightingSink() = default;

    virtual void onSighting(const Sighting& sighting) = 0;
    virtual void onWebUiStatus(const std::string& address, bool reachable) = 0;
    virtual std::vector<std::string> knownAddresses() const = 0;
};

class DiscoverySourceInterface {
public:
    virtual ~DiscoverySourceInterface() = default;

    virtual SourceKind kind() const = 0;

    // A Discovery error means this source is unavailable; the others carry on.
    virtual VoidOutcome start(SightingSink& sink) = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;
};

} // namespace Discovery
} // namespace BjornManager
