#include "discovery/LivenessPoller.h"
#include "core/LoggingChannels.h"
#include "discovery/TcpProbe.h"
#include "discovery/WorkerPool.h"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace BjornManager {
namespace Discovery {

struct LivenessPoller::Impl {
    Settings settings;
    HttpGetFn httpGet;

    std::thread thread;
    std::atomic<bool> running{ false };
    std::atomic<bool> stopRequested{ false };
    std::mutex waitMutex;
    std::condition_variable waitCv;

    Impl(Settings s, HttpGetFn fn) : settings(s), httpGet(std::move(fn))
    {
        if (!httpGet) {
            httpGet = httpGetStatus;
        }
    }

    void poll(SightingSink& sink)
    {
        const auto addresses = sink.knownAddresses();
        forEachParallel<std::string>(
            addresses, settings.workers, stopRequested, [&](const std::string& address) {
                const auto status = httpGet(address, settings.port, "/", settings.timeoutMs);
                LOG_TRACE(
                    Discovery,
                    "Web UI {}:{} -> {}",
                    address,
                    settings.port,
                    status ? std::to_string(status.value()) : "no answer");
                sink.onWebUiStatus(address, status.has_value());
            });
    }

    void run(SightingSink& sink)
    {
        while (!stopRequested) {
            poll(sink);
            std::unique_lock<std::mutex> lock(waitMutex);
            waitCv.wait_for(lock, settings.interval, [this] { return stopRequested.load(); });
        }
    }
};

LivenessPoller::LivenessPoller(Settings settings, HttpGetFn httpGet)
    : pImpl_(settings, std::move(httpGet))
{}

LivenessPoller::~LivenessPoller()
{
    stop();
}

VoidOutcome LivenessPoller::start(SightingSink& sink)
{
    if (pImpl_->running) {
        return okayVoid();
    }
    LOG_INFO(
        Discovery,
        "Web UI liveness poll on port {} every {} s",
        pImpl_->settings.port,
        std::chrono::duration_cast<std::chrono::seconds>(pImpl_->settings.interval).count());

    pImpl_->stopRequested = false;
    pImpl_->running = true;
    pImpl_->thread = std::thread([this, &sink] { pImpl_->run(sink); });
    return okayVoid();
}

void LivenessPoller::stop()
{
    {
        std::lock_guard<std::mutex> lock(pImpl_->waitMutex);
        pImpl_->stopRequested = true;
    }
    pImpl_->waitCv.notify_all();
    if (pImpl_->thread.joinable()) {
        pImpl_->thread.join();
    }
    pImpl_->running = false;
}

bool LivenessPoller::isRunning() const
{
    return pImpl_->running;
}

void LivenessPoller::pollOnce(SightingSink& sink)
{
    pImpl_->poll(sink);
}

} // namespace Discovery
} // namespace BjornManager
