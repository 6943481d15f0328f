#pragma once

/// @file http_fleet_api.hpp
/// @brief Capability interfaces implemented against each region's HTTP
///        control-plane API.

#include "afc/control/external_apis.hpp"
#include "afc/control/fleet_types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace afc::control {

/// Control-plane calls, relative to the region's `api_base_url`:
///
/// | Call            | Request                                          |
/// |-----------------|--------------------------------------------------|
/// | promote         | POST /services/{service}/promote                 |
/// | demote          | POST /services/{service}/demote                  |
/// | routeTo         | POST /services/{service}/route {"region": "..."} |
/// | quiesce         | POST /services/{service}/writes/quiesce          |
/// | resume          | POST /services/{service}/writes/resume           |
/// | replicationLag  | GET  /services/{service}/replication             |
///
/// Any 2xx status is success. promote answers 409 with a body containing
/// "already_primary" when the region is already primary. The replication
/// response carries `"lag_seconds": <number>`. Routing requests go to the
/// region that traffic is being routed to.
class HttpFleetApi final : public PromotionApi,
                           public RoutingApi,
                           public WriteControlApi,
                           public ReplicationMonitor {
public:
    explicit HttpFleetApi(const FleetConfig& fleet);

    foundation::ControlResult<PromotionResult> promote(const ServiceId& service,
                                                       const RegionId& region,
                                                       Millis timeout) override;
    foundation::ControlResult<void> demote(const ServiceId& service, const RegionId& region,
                                           Millis timeout) override;

    foundation::ControlResult<void> routeTo(const ServiceId& service, const RegionId& region,
                                            Millis timeout) override;

    foundation::ControlResult<void> quiesce(const ServiceId& service, const RegionId& region,
                                            Millis timeout) override;
    foundation::ControlResult<void> resume(const ServiceId& service, const RegionId& region,
                                           Millis timeout) override;

    foundation::ControlResult<std::chrono::seconds> replicationLag(
        const ServiceId& service, const RegionId& region, Millis timeout) override;

    /// All four capabilities backed by one shared adapter.
    [[nodiscard]] static FleetApis makeFleetApis(const FleetConfig& fleet);

private:
    struct Call {
        int status = 0;
        std::string body;
    };

    foundation::ControlResult<Call> call(const ServiceId& service, const RegionId& region,
                                         const std::string& method, const std::string& suffix,
                                         std::string body, Millis timeout) const;

    foundation::ControlResult<void> post(const ServiceId& service, const RegionId& region,
                                         const std::string& suffix, std::string body,
                                         Millis timeout) const;

    // "service/region" -> api base URL
    std::unordered_map<std::string, std::string> baseUrls_;
};

/// Numeric top-level field of a JSON object. Returns nullopt when the body is
/// not a JSON object or the field is missing or not a number; fields of
/// nested objects are never matched.
[[nodiscard]] std::optional<double> findJsonNumber(const std::string& body,
                                                   std::string_view key);

} // namespace afc::control
