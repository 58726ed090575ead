#pragma once

#include <string>

namespace BjornManager {
namespace Discovery {

// Lower-case, trim whitespace and a trailing dot, strip one ".local" or ".home" suffix.
std::string normalizeHost(const std::string& host);

/**
 * @brief Device naming convention check.
 *
 * With prefix "bjorn", accepts: "bjorn", "bjorn-*", "bjorn_*", and any "bjorn*" name
 * ending in ".local" or ".home". Case-insensitive; a trailing dot is ignored.
 */
class HostnamePolicy {
public:
    explicit HostnamePolicy(std::string prefix = "bjorn");

    bool matches(const std::string& host) const;

    const std::string& prefix() const { return prefix_; }

private:
    std::string prefix_;
};

} // namespace Discovery
} // namespace BjornManager
