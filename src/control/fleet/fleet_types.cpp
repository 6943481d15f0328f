/// @file fleet_types.cpp
/// @brief Name tables and lookups for fleet types.

#include "afc/control/fleet_types.hpp"

#include <algorithm>
#include <cmath>

namespace afc::control {

std::string_view regionRoleName(RegionRole role) {
    switch (role) {
        case RegionRole::Primary: return "primary";
        case RegionRole::Standby: return "standby";
        case RegionRole::Cold:    return "cold";
    }
    return "unknown";
}

std::string_view regionStateName(RegionState state) {
    switch (state) {
        case RegionState::Healthy:     return "healthy";
        case RegionState::Degraded:    return "degraded";
        case RegionState::Unreachable: return "unreachable";
        case RegionState::Promoting:   return "promoting";
        case RegionState::Promoted:    return "promoted";
        case RegionState::Failed:      return "failed";
    }
    return "unknown";
}

std::optional<RegionRole> parseRegionRole(std::string_view name) {
    if (name == "primary") { return RegionRole::Primary; }
    if (name == "standby") { return RegionRole::Standby; }
    if (name == "cold") { return RegionRole::Cold; }
    return std::nullopt;
}

std::string_view probeOutcomeName(ProbeOutcome outcome) {
    switch (outcome) {
        case ProbeOutcome::Success: return "success";
        case ProbeOutcome::Failure: return "failure";
        case ProbeOutcome::Timeout: return "timeout";
    }
    return "unknown";
}

Millis RetryPolicy::backoffBefore(uint32_t attempt) const {
    if (attempt <= 1) {
        return Millis{0};
    }
    double delay = static_cast<double>(initialBackoff.count()) *
                   std::pow(multiplier, static_cast<double>(attempt - 2));
    auto capped = std::min(delay, static_cast<double>(maxBackoff.count()));
    return Millis{static_cast<Millis::rep>(capped)};
}

std::optional<RegionId> ServiceSpec::configuredPrimary() const {
    for (const auto& r : regions) {
        if (r.role == RegionRole::Primary) {
            return r.id;
        }
    }
    return std::nullopt;
}

const RegionSpec* ServiceSpec::findRegion(const RegionId& region) const {
    auto it = std::find_if(regions.begin(), regions.end(),
                           [&](const RegionSpec& r) { return r.id == region; });
    return it == regions.end() ? nullptr : &*it;
}

const ServiceSpec* FleetConfig::findService(const ServiceId& id) const {
    auto it = std::find_if(services.begin(), services.end(),
                           [&](const ServiceSpec& s) { return s.id == id; });
    return it == services.end() ? nullptr : &*it;
}

} // namespace afc::control
