#include "discovery/Ipv4.h"
#include <charconv>

namespace BjornManager {
namespace Discovery {

std::optional<Ipv4Address> Ipv4Address::parse(const std::string& text)
{
    uint32_t value = 0;
    const char* pos = text.data();
    const char* end = text.data() + text.size();

    for (int octet = 0; octet < 4; ++octet) {
        if (octet > 0) {
            if (pos == end || *pos != '.') {
                return std::nullopt;
            }
            ++pos;
        }
        unsigned int part = 0;
        auto [next, ec] = std::from_chars(pos, end, part);
        if (ec != std::errc() || next == pos || next - pos > 3 || part > 255) {
            return std::nullopt;
        }
        value = (value << 8) | part;
        pos = next;
    }

    if (pos != end) {
        return std::nullopt;
    }
    return Ipv4Address(value);
}

std::string Ipv4Address::toString() const
{
    return std::to_string((value_ >> 24) & 0xff) + "." + std::to_string((value_ >> 16) & 0xff)
        + "." + std::to_string((value_ >> 8) & 0xff) + "." + std::to_string(value_ & 0xff);
}

Ipv4Network::Ipv4Network(Ipv4Address address, int prefixLength)
    : prefixLength_(prefixLength < 0 ? 0 : (prefixLength > 32 ? 32 : prefixLength))
{
    network_ = Ipv4Address(address.value() & mask());
}

uint32_t Ipv4Network::mask() const
{
    if (prefixLength_ == 0) {
        return 0;
    }
    return 0xffffffffu << (32 - prefixLength_);
}

std::optional<Ipv4Network> Ipv4Network::parse(const std::string& cidr)
{
    const auto slash = cidr.find('/');
    const auto address = Ipv4Address::parse(cidr.substr(0, slash));
    if (!address.has_value()) {
        return std::nullopt;
    }
    if (slash == std::string::npos) {
        return Ipv4Network(address.value(), 32);
    }

    const std::string prefixText = cidr.substr(slash + 1);
    int prefix = -1;
    auto [next, ec] =
        std::from_chars(prefixText.data(), prefixText.data() + prefixText.size(), prefix);
    if (ec != std::errc() || next != prefixText.data() + prefixText.size() || prefix < 0
        || prefix > 32) {
        return std::nullopt;
    }
    return Ipv4Network(address.value(), prefix);
}

std::optional<Ipv4Network> Ipv4Network::fromAddressAndMask(Ipv4Address address, Ipv4Address mask)
{
    // Masks must be contiguous ones followed by zeros.
    const uint32_t bits = mask.value();
    const uint32_t inverted = ~bits;
    if ((inverted & (inverted + 1)) != 0) {
        return std::nullopt;
    }

    int prefix = 0;
    for (uint32_t probe = bits; probe & 0x80000000u; probe <<= 1) {
        ++prefix;
    }
    return Ipv4Network(address, prefix);
}

bool Ipv4Network::contains(Ipv4Address address) const
{
    return (address.value() & mask()) == network_.value();
}

bool Ipv4Network::contains(const std::string& address) const
{
    const auto parsed = Ipv4Address::parse(address);
    return parsed.has_value() && contains(parsed.value());
}

std::vector<Ipv4Address> Ipv4Network::hosts() const
{
    std::vector<Ipv4Address> result;
    const uint64_t size = uint64_t{ 1 } << (32 - prefixLength_);
    if (prefixLength_ >= 31) {
        for (uint64_t i = 0; i < size; ++i) {
            result.emplace_back(static_cast<uint32_t>(network_.value() + i));
        }
        return result;
    }

    result.reserve(static_cast<size_t>(size - 2));
    for (uint64_t i = 1; i + 1 < size; ++i) {
        result.emplace_back(static_cast<uint32_t>(network_.value() + i));
    }
    return result;
}

std::string Ipv4Network::toString() const
{
    return network_.toString() + "/" + std::to_string(prefixLength_);
}

} // namespace Discovery
} // namespace BjornManager
