#include "discovery/HostnamePolicy.h"
#include <algorithm>
#include <cctype>

namespace BjornManager {
namespace Discovery {

namespace {

std::string lowerTrimmed(const std::string& host)
{
    const auto first = host.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = host.find_last_not_of(" \t\r\n");
    std::string s = host.substr(first, last - first + 1);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    while (!s.empty() && s.back() == '.') {
        s.pop_back();
    }
    return s;
}

bool endsWith(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size()
        && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool startsWith(const std::string& s, const std::string& prefix)
{
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::string normalizeHost(const std::string& host)
{
    std::string h = lowerTrimmed(host);
    if (endsWith(h, ".local")) {
        h.resize(h.size() - 6);
    }
    else if (endsWith(h, ".home")) {
        h.resize(h.size() - 5);
    }
    return h;
}

HostnamePolicy::HostnamePolicy(std::string prefix) : prefix_(lowerTrimmed(prefix))
{}

bool HostnamePolicy::matches(const std::string& host) const
{
    const std::string s = lowerTrimmed(host);
    if (s.empty() || prefix_.empty()) {
        return false;
    }

    if (startsWith(s, prefix_) && (endsWith(s, ".local") || endsWith(s, ".home"))) {
        return true;
    }
    return s == prefix_ || startsWith(s, prefix_ + "-") || startsWith(s, prefix_ + "_");
}

} // namespace Discovery
} // namespace BjornManager
