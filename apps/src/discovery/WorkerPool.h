#pragma once

#include <algorithm>
#include <atomic>
#include <functional>
#include <thread>
#include <vector>

namespace BjornManager {
namespace Discovery {

// Runs fn over items on up to `workers` threads and joins them. Workers stop taking new
// items once stopRequested is set.
template <typename T>
void forEachParallel(
    const std::vector<T>& items,
    int workers,
    const std::atomic<bool>& stopRequested,
    const std::function<void(const T&)>& fn)
{
    std::atomic<size_t> next{ 0 };
    const size_t threadCount =
        std::min(items.size(), static_cast<size_t>(std::max(workers, 1)));

    std::vector<std::thread> threads;
    threads.reserve(threadCount);
    for (size_t i = 0; i < threadCount; ++i) {
        threads.emplace_back([&] {
            while (!stopRequested) {
                const size_t index = next.fetch_add(1);
                if (index >= items.size()) {
                    break;
                }
                fn(items[index]);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
}

} // namespace Discovery
} // namespace BjornManager
