#pragma once

/// @file types.hpp
/// @brief Strong identifier types for services, regions and failover events.

#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace afc::foundation {

/// Tag-based strong typedef for numeric identifiers.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

/// Tag-based strong typedef for identifiers that are names in the fleet
/// definition (service "checkout", region "us-east").
///
/// Prevents passing a region name where a service name is expected.
template <typename Tag>
class NamedId {
public:
    NamedId() = default;
    explicit NamedId(std::string value) : value_(std::move(value)) {}

    [[nodiscard]] const std::string& value() const noexcept { return value_; }
    [[nodiscard]] bool isValid() const noexcept { return !value_.empty(); }

    auto operator<=>(const NamedId&) const = default;

private:
    std::string value_;
};

template <typename Tag>
std::ostream& operator<<(std::ostream& os, const NamedId<Tag>& id) {
    return os << id.value();
}

// Tag types
struct ServiceIdTag {};
struct RegionIdTag {};
struct FailoverEventIdTag {};

/// Service name from the fleet definition.
using ServiceId = NamedId<ServiceIdTag>;

/// Region name from the fleet definition.
using RegionId = NamedId<RegionIdTag>;

/// Process-unique identifier of a FailoverEvent.
using FailoverEventId = StrongId<FailoverEventIdTag>;

} // namespace afc::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<afc::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const afc::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};

template <typename Tag>
struct std::hash<afc::foundation::NamedId<Tag>> {
    std::size_t operator()(const afc::foundation::NamedId<Tag>& id) const noexcept {
        return std::hash<std::string>{}(id.value());
    }
};
