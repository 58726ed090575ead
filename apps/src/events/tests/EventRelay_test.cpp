#include "events/EventRelay.h"
#include <atomic>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <vector>

using namespace BjornManager;
using namespace BjornManager::Events;

namespace {

struct RecordingDelivery {
    std::mutex mutex;
    std::vector<UiEvent> events;
    std::atomic<int> concurrent{ 0 };
    std::atomic<int> maxConcurrent{ 0 };

    EventRelay::DeliveryFn fn()
    {
        return [this](const UiEvent& event) {
            const int now = ++concurrent;
            int expected = maxConcurrent.load();
            while (now > expected && !maxConcurrent.compare_exchange_weak(expected, now)) {}
            {
                std::lock_guard<std::mutex> lock(mutex);
                events.push_back(event);
            }
            --concurrent;
        };
    }

    std::vector<UiEvent> snapshot()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }
};

InstallLog logLine(const std::string& identity, int n)
{
    return InstallLog{ .identity = identity, .line = "line " + std::to_string(n) };
}

} // namespace

TEST(EventRelayTest, EventsPublishedBeforeReadyAreBufferedThenDelivered)
{
    EventRelay relay;
    RecordingDelivery recorder;

    relay.publish(DeviceGone{ .identity = "bjorn", .alias = Alias{ 1 } });
    relay.publish(logLine("bjorn", 1));
    EXPECT_EQ(relay.pendingCount(), 2u);
    EXPECT_TRUE(recorder.snapshot().empty());

    relay.markReady(recorder.fn());
    ASSERT_TRUE(relay.flush(std::chrono::seconds(2)));

    const auto delivered = recorder.snapshot();
    ASSERT_EQ(delivered.size(), 2u);
    EXPECT_EQ(getEventName(delivered[0]), "deviceGone");
    EXPECT_EQ(getEventName(delivered[1]), "installLog");
}

TEST(EventRelayTest, PerProducerOrderIsPreservedAndDeliveryIsSerialized)
{
    EventRelay relay;
    RecordingDelivery recorder;
    relay.markReady(recorder.fn());

    constexpr int kProducers = 4;
    constexpr int kPerProducer = 250;
    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&relay, p] {
            for (int i = 0; i < kPerProducer; ++i) {
                relay.publish(logLine("producer-" + std::to_string(p), i));
            }
        });
    }
    for (auto& t : producers) {
        t.join();
    }

    ASSERT_TRUE(relay.flush(std::chrono::seconds(5)));
    const auto delivered = recorder.snapshot();
    ASSERT_EQ(delivered.size(), static_cast<size_t>(kProducers * kPerProducer));
    EXPECT_EQ(recorder.maxConcurrent.load(), 1);

    std::vector<int> nextExpected(kProducers, 0);
    for (const auto& event : delivered) {
        const auto& log = std::get<InstallLog>(event.getVariant());
        const int producer = std::stoi(log.identity.substr(log.identity.find('-') + 1));
        EXPECT_EQ(log.line, "line " + std::to_string(nextExpected[producer]));
        ++nextExpected[producer];
    }
}

TEST(EventRelayTest, ThrowingDeliveryDoesNotStopTheConsumer)
{
    EventRelay relay;
    std::atomic<int> calls{ 0 };
    relay.markReady([&calls](const UiEvent&) {
        if (++calls == 1) {
            throw std::runtime_error("ui went away");
        }
    });

    relay.publish(logLine("bjorn", 1));
    relay.publish(logLine("bjorn", 2));
    ASSERT_TRUE(relay.flush(std::chrono::seconds(2)));
    EXPECT_EQ(calls.load(), 2);
}

TEST(EventRelayTest, NonStandardThrowDoesNotStopTheConsumer)
{
    EventRelay relay;
    std::atomic<int> calls{ 0 };
    relay.markReady([&calls](const UiEvent&) {
        if (++calls == 1) {
            throw 42;
        }
    });

    relay.publish(logLine("bjorn", 1));
    relay.publish(logLine("bjorn", 2));
    relay.publish(logLine("bjorn", 3));
    ASSERT_TRUE(relay.flush(std::chrono::seconds(2)));
    EXPECT_EQ(calls.load(), 3);
}

TEST(EventRelayTest, StopDeliversRemainingEvents)
{
    EventRelay relay;
    RecordingDelivery recorder;
    relay.markReady(recorder.fn());

    for (int i = 0; i < 50; ++i) {
        relay.publish(logLine("bjorn", i));
    }
    relay.stop();
    relay.stop();

    EXPECT_EQ(recorder.snapshot().size(), 50u);
}

TEST(EventRelayTest, SecondMarkReadyIsIgnored)
{
    EventRelay relay;
    RecordingDelivery first;
    RecordingDelivery second;
    relay.markReady(first.fn());
    relay.markReady(second.fn());

    relay.publish(logLine("bjorn", 1));
    ASSERT_TRUE(relay.flush(std::chrono::seconds(2)));
    EXPECT_EQ(first.snapshot().size(), 1u);
    EXPECT_TRUE(second.snapshot().empty());
}
