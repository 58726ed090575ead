#pragma once

#include <compare>
#include <functional>
#include <nlohmann/json.hpp>
#include <ostream>
#include <spdlog/fmt/fmt.h>

namespace BjornManager {

// Integer value tagged with a distinct type, so an alias cannot be passed where a step
// index or a port is expected. Zero is the "unassigned" value.
//
//   using Alias = StrongType<struct AliasTag>;
//   Alias alias{ 3 };
//   int raw = alias.get();
template <typename Tag>
class StrongType {
public:
    constexpr StrongType() = default;
    constexpr explicit StrongType(int value) : value_{ value } {}

    [[nodiscard]] constexpr int get() const { return value_; }
    [[nodiscard]] constexpr bool isAssigned() const { return value_ != 0; }

    constexpr auto operator<=>(const StrongType&) const = default;

private:
    int value_ = 0;
};

template <typename Tag>
void to_json(nlohmann::json& j, const StrongType<Tag>& value)
{
    j = value.get();
}

template <typename Tag>
void from_json(const nlohmann::json& j, StrongType<Tag>& value)
{
    value = StrongType<Tag>{ j.get<int>() };
}

// Lets GoogleTest print values in failure messages.
template <typename Tag>
std::ostream& operator<<(std::ostream& os, const StrongType<Tag>& value)
{
    return os << value.get();
}

} // namespace BjornManager

template <typename Tag>
struct std::hash<BjornManager::StrongType<Tag>> {
    std::size_t operator()(const BjornManager::StrongType<Tag>& value) const noexcept
    {
        return std::hash<int>{}(value.get());
    }
};

template <typename Tag>
struct fmt::formatter<BjornManager::StrongType<Tag>> : fmt::formatter<int> {
    auto format(const BjornManager::StrongType<Tag>& value, fmt::format_context& ctx) const
    {
        return fmt::formatter<int>::format(value.get(), ctx);
    }
};
