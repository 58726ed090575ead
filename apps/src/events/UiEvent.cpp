#include "events/UiEvent.h"

namespace BjornManager {
namespace Events {

namespace {

nlohmann::json fields(const DeviceFound& e)
{
    return { { "identity", e.identity },
             { "alias", e.alias },
             { "label", e.label },
             { "endpoint", e.endpoint } };
}

nlohmann::json fields(const DeviceUpdated& e)
{
    return { { "identity", e.identity },
             { "alias", e.alias },
             { "label", e.label },
             { "endpoint", e.endpoint } };
}

nlohmann::json fields(const DeviceGone& e)
{
    return { { "identity", e.identity }, { "alias", e.alias }, { "removed", e.removed } };
}

nlohmann::json fields(const WebUiStatusChanged& e)
{
    return { { "identity", e.identity },
             { "address", e.address },
             { "reachable", e.reachable } };
}

nlohmann::json fields(const SessionStateChanged& e)
{
    nlohmann::json j = { { "identity", e.identity }, { "state", toString(e.state) } };
    if (!e.message.empty()) {
        j["message"] = e.message;
    }
    return j;
}

nlohmann::json fields(const InstallProgress& e)
{
    return { { "identity", e.identity },
             { "stepIndex", e.stepIndex },
             { "stepTotal", e.stepTotal },
             { "label", e.label } };
}

nlohmann::json fields(const InstallLog& e)
{
    return { { "identity", e.identity }, { "line", e.line } };
}

nlohmann::json fields(const InstallFinished& e)
{
    nlohmann::json j = { { "identity", e.identity }, { "outcome", toString(e.outcome) } };
    if (e.errorKind.has_value()) {
        j["errorKind"] = toString(e.errorKind.value());
    }
    if (!e.message.empty()) {
        j["message"] = e.message;
    }
    if (!e.failureContext.empty()) {
        j["failureContext"] = e.failureContext;
    }
    return j;
}

} // namespace

void to_json(nlohmann::json& j, const EndpointInfo& endpoint)
{
    j = { { "address", endpoint.address },
          { "interfaceClass", toString(endpoint.interfaceClass) } };
}

void to_json(nlohmann::json& j, const UiEvent& event)
{
    std::visit(
        [&j]<HasEventName E>(const E& e) {
            j = fields(e);
            j["event"] = e.name();
        },
        event.getVariant());
}

} // namespace Events
} // namespace BjornManager
