#pragma once

#include "core/DeviceTypes.h"
#include "core/ManagerError.h"
#include <concepts>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace BjornManager {
namespace Events {

template <typename T>
concept HasEventName = requires {
    { T::name() } -> std::convertible_to<const char*>;
};

struct EndpointInfo {
    std::string address;
    InterfaceClass interfaceClass = InterfaceClass::Lan;
};

struct DeviceFound {
    DeviceIdentity identity;
    Alias alias;
    std::string label;
    EndpointInfo endpoint;

    static constexpr const char* name() { return "deviceFound"; }
};

// A known device was seen on an additional address, or came back after going stale.
struct DeviceUpdated {
    DeviceIdentity identity;
    Alias alias;
    std::string label;
    EndpointInfo endpoint;

    static constexpr const char* name() { return "deviceUpdated"; }
};

// Every endpoint of the device went stale. Consumers decide whether to hide it.
struct DeviceGone {
    DeviceIdentity identity;
    Alias alias;
    bool removed = false;

    static constexpr const char* name() { return "deviceGone"; }
};

struct WebUiStatusChanged {
    DeviceIdentity identity;
    std::string address;
    bool reachable = false;

    static constexpr const char* name() { return "webUiStatusChanged"; }
};

struct SessionStateChanged {
    DeviceIdentity identity;
    SessionState state = SessionState::Disconnected;
    std::string message;

    static constexpr const char* name() { return "sessionStateChanged"; }
};

struct InstallProgress {
    DeviceIdentity identity;
    int stepIndex = 0;
    int stepTotal = 0;
    std::string label;

    static constexpr const char* name() { return "installProgress"; }
};

struct InstallLog {
    DeviceIdentity identity;
    std::string line;

    static constexpr const char* name() { return "installLog"; }
};

struct InstallFinished {
    DeviceIdentity identity;
    JobState outcome = JobState::Succeeded;
    std::optional<ErrorKind> errorKind;
    std::string message;
    // Trailing output lines, filled for failed jobs.
    std::vector<std::string> failureContext;

    static constexpr const char* name() { return "installFinished"; }
};

class UiEvent {
public:
    using Variant = std::variant<
        DeviceFound,
        DeviceUpdated,
        DeviceGone,
        WebUiStatusChanged,
        SessionStateChanged,
        InstallProgress,
        InstallLog,
        InstallFinished>;

    template <typename T>
        requires(!std::same_as<std::remove_cvref_t<T>, UiEvent>)
    UiEvent(T&& event) : variant_(std::forward<T>(event))
    {}

    UiEvent() = default;

    Variant& getVariant() { return variant_; }
    const Variant& getVariant() const { return variant_; }

private:
    Variant variant_;
};

inline std::string getEventName(const UiEvent& event)
{
    return std::visit([](auto&& e) { return std::string(e.name()); }, event.getVariant());
}

void to_json(nlohmann::json& j, const EndpointInfo& endpoint);

// {"event": "<name>", ...fields}. One JSON object per event.
void to_json(nlohmann::json& j, const UiEvent& event);

} // namespace Events
} // namespace BjornManager
