#pragma once

#include "core/Pimpl.h"
#include "events/EventSink.h"
#include <chrono>
#include <functional>

namespace BjornManager {
namespace Events {

/**
 * @brief Ordered many-producer, single-consumer hand-off to a non-reentrant UI channel.
 *
 * publish() enqueues from any thread. One consumer thread, started by markReady(),
 * drains the queue and invokes the delivery callback in enqueue order. Events published
 * before markReady() are buffered, not dropped. The callback is never invoked from
 * two threads at once.
 */
class EventRelay : public EventSink {
public:
    using DeliveryFn = std::function<void(const UiEvent&)>;

    EventRelay();
    ~EventRelay() override;

    EventRelay(const EventRelay&) = delete;
    EventRelay& operator=(const EventRelay&) = delete;

    void publish(UiEvent event) override;

    // Starts the consumer thread. A second call is ignored.
    void markReady(DeliveryFn deliver);

    // Delivers whatever is still queued, then joins the consumer. Idempotent.
    void stop();

    // Blocks until every event published so far has been delivered, or timeout.
    bool flush(std::chrono::milliseconds timeout);

    bool isReady() const;
    size_t pendingCount() const;

private:
    struct Impl;
    Pimpl<Impl> pImpl_;
};

} // namespace Events
} // namespace BjornManager
