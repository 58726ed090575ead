#pragma once

#include "core/StrongType.h"
#include <chrono>
#include <map>
#include <string>

namespace BjornManager {

// Stable key for a physical device, derived from its resolved (normalized) name.
using DeviceIdentity = std::string;

// Small sequential human-facing number, assigned once per identity. Starts at 1.
using Alias = StrongType<struct AliasTag>;

using SteadyClock = std::chrono::steady_clock;

enum class InterfaceClass { Lan, Usb, Bluetooth };

const char* toString(InterfaceClass interfaceClass);

struct Endpoint {
    std::string address;
    InterfaceClass interfaceClass = InterfaceClass::Lan;
    SteadyClock::time_point lastSeen{};
    bool stale = false;
    bool webUiReachable = false;
};

enum class Freshness { Fresh, Stale };

const char* toString(Freshness freshness);

struct DeviceRecord {
    DeviceIdentity identity;
    Alias alias;
    // Keyed by address.
    std::map<std::string, Endpoint> endpoints;
    Freshness freshness = Freshness::Fresh;
    // True while any endpoint answers on the web UI port.
    bool webUiReachable = false;
};

// "Bjorn 3" for the device card, "Bjorn 3 (USB)" for one of its endpoints.
std::string displayLabel(Alias alias);
std::string displayLabel(Alias alias, InterfaceClass interfaceClass);

enum class SessionState { Disconnected, Connecting, Connected, Failed };

const char* toString(SessionState state);

enum class JobState { Pending, Running, Succeeded, Failed, Aborted };

const char* toString(JobState state);

} // namespace BjornManager
