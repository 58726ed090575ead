#include "core/DeviceTypes.h"

namespace BjornManager {

const char* toString(InterfaceClass interfaceClass)
{
    switch (interfaceClass) {
        case InterfaceClass::Lan:
            return "LAN";
        case InterfaceClass::Usb:
            return "USB";
        case InterfaceClass::Bluetooth:
            return "Bluetooth";
    }
    return "LAN";
}

const char* toString(Freshness freshness)
{
    return freshness == Freshness::Fresh ? "fresh" : "stale";
}

std::string displayLabel(Alias alias)
{
    return "Bjorn " + std::to_string(alias.get());
}

std::string displayLabel(Alias alias, InterfaceClass interfaceClass)
{
    return displayLabel(alias) + " (" + toString(interfaceClass) + ")";
}

const char* toString(SessionState state)
{
    switch (state) {
        case SessionState::Disconnected:
            return "Disconnected";
        case SessionState::Connecting:
            return "Connecting";
        case SessionState::Connected:
            return "Connected";
        case SessionState::Failed:
            return "Failed";
    }
    return "Unknown";
}

const char* toString(JobState state)
{
    switch (state) {
        case JobState::Pending:
            return "Pending";
        case JobState::Running:
            return "Running";
        case JobState::Succeeded:
            return "Succeeded";
        case JobState::Failed:
            return "Failed";
        case JobState::Aborted:
            return "Aborted";
    }
    return "Unknown";
}

} // namespace BjornManager
