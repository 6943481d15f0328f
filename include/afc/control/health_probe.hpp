#pragma once

/// @file health_probe.hpp
/// @brief Health endpoints and the HealthProbe that turns one check into one
///        ProbeSample.

#include "afc/control/fleet_types.hpp"

#include <memory>
#include <string>

namespace afc::control {

/// Raw answer of a health endpoint.
struct HealthCheckOutcome {
    bool healthy = false;
    bool timedOut = false;
    std::string detail;
};

/// Capability: something that can be asked "are you healthy?".
///
/// Implementations must return within @p timeout.
class HealthEndpoint {
public:
    virtual ~HealthEndpoint() = default;

    virtual HealthCheckOutcome check(Millis timeout) = 0;
};

/// GET <path>; healthy iff the status equals the expected status and the body
/// contains the expected substring (when one is configured).
class HttpHealthEndpoint : public HealthEndpoint {
public:
    explicit HttpHealthEndpoint(HealthEndpointSpec spec);

    HealthCheckOutcome check(Millis timeout) override;

private:
    HealthEndpointSpec spec_;
};

/// Healthy iff a TCP connection to host:port completes.
class TcpHealthEndpoint : public HealthEndpoint {
public:
    explicit TcpHealthEndpoint(HealthEndpointSpec spec);

    HealthCheckOutcome check(Millis timeout) override;

private:
    HealthEndpointSpec spec_;
};

[[nodiscard]] std::shared_ptr<HealthEndpoint> makeHealthEndpoint(const HealthEndpointSpec& spec);

/// Probe for one (service, region).
///
/// Every call yields exactly one sample. A check that reports a timeout, or
/// whose measured latency exceeds the configured timeout, is recorded with
/// outcome Timeout.
class HealthProbe {
public:
    HealthProbe(ServiceId service, RegionId region,
                std::shared_ptr<HealthEndpoint> endpoint, Millis timeout);

    [[nodiscard]] ProbeSample probe() const;

    [[nodiscard]] const ServiceId& service() const { return service_; }
    [[nodiscard]] const RegionId& region() const { return region_; }

private:
    ServiceId service_;
    RegionId region_;
    std::shared_ptr<HealthEndpoint> endpoint_;
    Millis timeout_;
};

} // namespace afc::control
