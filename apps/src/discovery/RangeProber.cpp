#include "discovery/RangeProber.h"
#include "core/LoggingChannels.h"
#include "discovery/TcpProbe.h"
#include "discovery/WorkerPool.h"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <set>
#include <thread>

namespace BjornManager {
namespace Discovery {

struct RangeProber::Impl {
    Settings settings;
    ProbeFn probe;
    std::vector<std::string> targets;

    std::thread thread;
    std::atomic<bool> running{ false };
    std::atomic<bool> stopRequested{ false };
    std::mutex waitMutex;
    std::condition_variable waitCv;

    Impl(Settings s, ProbeFn p) : settings(std::move(s)), probe(std::move(p))
    {
        if (!probe) {
            probe = probeTcp;
        }

        std::set<Ipv4Address> unique;
        for (const auto& network : settings.networks) {
            for (const auto& host : network.hosts()) {
                unique.insert(host);
            }
        }
        targets.reserve(unique.size());
        for (const auto& address : unique) {
            targets.push_back(address.toString());
        }
    }

    size_t scan(SightingSink& sink)
    {
        std::atomic<size_t> found{ 0 };
        forEachParallel<std::string>(
            targets, settings.workers, stopRequested, [&](const std::string& address) {
                if (probe(address, settings.port, settings.timeoutMs)) {
                    ++found;
                    LOG_TRACE(Discovery, "Port {} open on {}", settings.port, address);
                    sink.onSighting(Sighting{ "", address, SourceKind::RangeProbe });
                }
            });
        return found;
    }

    void run(SightingSink& sink)
    {
        while (!stopRequested) {
            const auto started = std::chrono::steady_clock::now();
            const size_t found = scan(sink);
            LOG_DEBUG(
                Discovery,
                "Range probe pass finished: {} of {} address(es) answered in {} ms",
                found,
                targets.size(),
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - started)
                    .count());

            std::unique_lock<std::mutex> lock(waitMutex);
            waitCv.wait_for(lock, settings.interval, [this] { return stopRequested.load(); });
        }
    }
};

RangeProber::RangeProber(Settings settings, ProbeFn probe)
    : pImpl_(std::move(settings), std::move(probe))
{}

RangeProber::~RangeProber()
{
    stop();
}

VoidOutcome RangeProber::start(SightingSink& sink)
{
    if (pImpl_->running) {
        return okayVoid();
    }
    if (pImpl_->targets.empty()) {
        return failVoid(ErrorKind::Discovery, "No address ranges to probe");
    }

    LOG_INFO(
        Discovery,
        "Range probe over {} network(s), {} address(es), port {}",
        pImpl_->settings.networks.size(),
        pImpl_->targets.size(),
        pImpl_->settings.port);

    pImpl_->stopRequested = false;
    pImpl_->running = true;
    pImpl_->thread = std::thread([this, &sink] { pImpl_->run(sink); });
    return okayVoid();
}

void RangeProber::stop()
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

bool RangeProber::isRunning() const
{
    return pImpl_->running;
}

size_t RangeProber::scanOnce(SightingSink& sink)
{
    return pImpl_->scan(sink);
}

std::vector<std::string> RangeProber::targets() const
{
    return pImpl_->targets;
}

} // namespace Discovery
} // namespace BjornManager
