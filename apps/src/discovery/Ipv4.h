#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace BjornManager {
namespace Discovery {

class Ipv4Address {
public:
    Ipv4Address() = default;
    explicit Ipv4Address(uint32_t hostOrder) : value_(hostOrder) {}

    // Dotted quad only ("172.20.2.5"); no hostnames, no shorthand forms.
    static std::optional<Ipv4Address> parse(const std::string& text);

    uint32_t value() const { return value_; }
    std::string toString() const;

    bool operator==(const Ipv4Address& other) const { return value_ == other.value_; }
    bool operator<(const Ipv4Address& other) const { return value_ < other.value_; }

private:
    uint32_t value_ = 0;
};

class Ipv4Network {
public:
    Ipv4Network() = default;
    Ipv4Network(Ipv4Address address, int prefixLength);

    // "a.b.c.d/n". Host bits are cleared, as with a non-strict parse.
    static std::optional<Ipv4Network> parse(const std::string& cidr);
    static std::optional<Ipv4Network> fromAddressAndMask(Ipv4Address address, Ipv4Address mask);

    Ipv4Address network() const { return network_; }
    int prefixLength() const { return prefixLength_; }
    uint32_t mask() const;

    bool contains(Ipv4Address address) const;
    bool contains(const std::string& address) const;

    // Usable host addresses: network and broadcast excluded below /31.
    std::vector<Ipv4Address> hosts() const;

    std::string toString() const;

    bool operator==(const Ipv4Network& other) const
    {
        return network_ == other.network_ && prefixLength_ == other.prefixLength_;
    }

private:
    Ipv4Address network_;
    int prefixLength_ = 32;
};

} // namespace Discovery
} // namespace BjornManager
