#include "events/EventRelay.h"
#include "core/LoggingChannels.h"
#include "core/SynchronizedQueue.h"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace BjornManager {
namespace Events {

namespace {
constexpr auto kConsumerWakeInterval = std::chrono::milliseconds(200);
}

struct EventRelay::Impl {
    SynchronizedQueue<UiEvent> queue;
    DeliveryFn deliver;
    std::thread consumer;
    std::atomic<bool> ready{ false };
    std::atomic<bool> stopRequested{ false };

    std::mutex progressMutex;
    std::condition_variable progressCv;
    uint64_t published = 0;
    uint64_t delivered = 0;

    void deliverOne(const UiEvent& event)
    {
        try {
            deliver(event);
        }
        catch (const std::exception& e) {
            LOG_ERROR(Events, "Delivery of {} failed: {}", getEventName(event), e.what());
        }
        catch (...) {
            LOG_ERROR(
                Events, "Delivery of {} failed with a non-standard exception", getEventName(event));
        }

        {
            std::lock_guard<std::mutex> lock(progressMutex);
            ++delivered;
        }
        progressCv.notify_all();
    }

    void run()
    {
        LOG_DEBUG(Events, "Event consumer started");
        while (true) {
            auto event = queue.waitAndPop(kConsumerWakeInterval);
            if (event.has_value()) {
                LOG_TRACE(Events, "Delivering {}", getEventName(event.value()));
                deliverOne(event.value());
                continue;
            }
            if (stopRequested && queue.empty()) {
                break;
            }
        }
        LOG_DEBUG(Events, "Event consumer stopped");
    }
};

EventRelay::EventRelay() = default;

EventRelay::~EventRelay()
{
    stop();
}

void EventRelay::publish(UiEvent event)
{
    LOG_TRACE(Events, "Enqueuing {}", getEventName(event));
    {
        std::lock_guard<std::mutex> lock(pImpl_->progressMutex);
        ++pImpl_->published;
    }
    pImpl_->queue.push(std::move(event));
}

void EventRelay::markReady(DeliveryFn deliver)
{
    if (pImpl_->ready.exchange(true)) {
        LOG_WARN(Events, "markReady called twice, ignoring");
        return;
    }

    LOG_INFO(Events, "UI ready, delivering {} buffered event(s)", pImpl_->queue.size());
    pImpl_->deliver = std::move(deliver);
    pImpl_->stopRequested = false;
    pImpl_->consumer = std::thread([this] { pImpl_->run(); });
}

void EventRelay::stop()
{
    pImpl_->stopRequested = true;
    pImpl_->queue.wakeAll();
    if (pImpl_->consumer.joinable()) {
        pImpl_->consumer.join();
    }
}

bool EventRelay::flush(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(pImpl_->progressMutex);
    const uint64_t target = pImpl_->published;
    return pImpl_->progressCv.wait_for(
        lock, timeout, [this, target] { return pImpl_->delivered >= target; });
}

bool EventRelay::isReady() const
{
    return pImpl_->ready;
}

size_t EventRelay::pendingCount() const
{
    return pImpl_->queue.size();
}

} // namespace Events
} // namespace BjornManager
