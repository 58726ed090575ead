#pragma once

#include "events/UiEvent.h"

namespace BjornManager {
namespace Events {

// Producer side of the UI event stream. publish() must be safe to call from any thread
// and must not wait on delivery.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void publish(UiEvent event) = 0;
};

} // namespace Events
} // namespace BjornManager
