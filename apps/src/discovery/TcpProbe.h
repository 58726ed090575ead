#pragma once

#include <optional>
#include <string>

namespace BjornManager {
namespace Discovery {

// True if a TCP connection to address:port completes within timeoutMs.
bool probeTcp(const std::string& address, int port, int timeoutMs);

// Reverse DNS (PTR) lookup. nullopt when the address has no name.
std::optional<std::string> reverseLookup(const std::string& address);

// HTTP GET; returns the status code of any HTTP response, nullopt otherwise.
std::optional<int> httpGetStatus(
    const std::string& address, int port, const std::string& path, int timeoutMs);

} // namespace Discovery
} // namespace BjornManager
