#pragma once

#include <cstdlib>
#include <spdlog/spdlog.h>
#include <string_view>

namespace BjornManager {
namespace Detail {

[[noreturn]] inline void assertionFailed(
    std::string_view condition, std::string_view message, const char* file, int line)
{
    spdlog::critical("Assertion failed at {}:{}: {} ({})", file, line, message, condition);
    spdlog::shutdown();
    std::abort();
}

} // namespace Detail
} // namespace BjornManager

// Never compiled out. Only for broken internal invariants; anything a device or the
// network can cause is reported through ManagerError instead.
#define BJORN_ASSERT(condition, message)                                                   \
    do {                                                                                   \
        if (!(condition)) {                                                                \
            ::BjornManager::Detail::assertionFailed(#condition, message, __FILE__, __LINE__); \
        }                                                                                  \
    } while (0)
