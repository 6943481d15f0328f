#pragma once

/// @file external_apis.hpp
/// @brief Capability interfaces of the infrastructure a failover drives.
///
/// Every call is idempotent and bounded by the timeout it receives.

#include "afc/control/fleet_types.hpp"
#include "afc/foundation/control_result.hpp"

#include <memory>

namespace afc::control {

enum class PromotionResult : uint8_t { Promoted, AlreadyPrimary };

/// Database promotion of a region.
class PromotionApi {
public:
    virtual ~PromotionApi() = default;

    /// Promote @p region's database to primary. "Already primary" is success.
    virtual foundation::ControlResult<PromotionResult> promote(
        const ServiceId& service, const RegionId& region, Millis timeout) = 0;

    /// Return @p region's database to replica (compensation of promote).
    virtual foundation::ControlResult<void> demote(
        const ServiceId& service, const RegionId& region, Millis timeout) = 0;
};

/// DNS / traffic-manager routing.
class RoutingApi {
public:
    virtual ~RoutingApi() = default;

    /// Route all traffic of @p service to @p region.
    virtual foundation::ControlResult<void> routeTo(
        const ServiceId& service, const RegionId& region, Millis timeout) = 0;
};

/// Write admission on a region.
class WriteControlApi {
public:
    virtual ~WriteControlApi() = default;

    virtual foundation::ControlResult<void> quiesce(
        const ServiceId& service, const RegionId& region, Millis timeout) = 0;

    virtual foundation::ControlResult<void> resume(
        const ServiceId& service, const RegionId& region, Millis timeout) = 0;
};

/// Replication lag of a standby behind the current primary.
class ReplicationMonitor {
public:
    virtual ~ReplicationMonitor() = default;

    virtual foundation::ControlResult<std::chrono::seconds> replicationLag(
        const ServiceId& service, const RegionId& region, Millis timeout) = 0;
};

/// The capability set a FailoverExecutor and coordinator work against.
struct FleetApis {
    std::shared_ptr<PromotionApi> promotion;
    std::shared_ptr<RoutingApi> routing;
    std::shared_ptr<WriteControlApi> writes;
    std::shared_ptr<ReplicationMonitor> replication;

    [[nodiscard]] bool complete() const {
        return promotion && routing && writes && replication;
    }
};

} // namespace afc::control
