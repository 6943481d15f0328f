#pragma once

/// @file fleet_types.hpp
/// @brief Core types shared by the availability controller components.
///
/// Fleet definition (services, regions, thresholds), probe samples and the
/// region record held by the Region State Store.

#include "afc/foundation/types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace afc::control {

using foundation::FailoverEventId;
using foundation::RegionId;
using foundation::ServiceId;

/// Monotonic clock for every controller decision.
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::milliseconds;

// ── Region role and state ───────────────────────────────────────────────────

enum class RegionRole : uint8_t { Primary, Standby, Cold };

/// Believed state of a (service, region) as recorded in the store.
///
/// Healthy/Degraded/Unreachable are written by the Failure Detector;
/// Promoting/Promoted/Failed are written by the Failover Executor.
enum class RegionState : uint8_t {
    Healthy,
    Degraded,
    Unreachable,
    Promoting,
    Promoted,
    Failed
};

[[nodiscard]] std::string_view regionRoleName(RegionRole role);
[[nodiscard]] std::string_view regionStateName(RegionState state);
[[nodiscard]] std::optional<RegionRole> parseRegionRole(std::string_view name);

/// True for states only the executor may write.
[[nodiscard]] constexpr bool isExecutorOwned(RegionState state) {
    return state == RegionState::Promoting || state == RegionState::Promoted ||
           state == RegionState::Failed;
}

// ── Probe samples ───────────────────────────────────────────────────────────

enum class ProbeOutcome : uint8_t { Success, Failure, Timeout };

[[nodiscard]] std::string_view probeOutcomeName(ProbeOutcome outcome);

/// Result of one health check against one (service, region).
struct ProbeSample {
    ServiceId service;
    RegionId region;
    TimePoint timestamp{};
    ProbeOutcome outcome = ProbeOutcome::Failure;
    Millis latency{0};
    std::string detail;

    [[nodiscard]] bool succeeded() const noexcept { return outcome == ProbeOutcome::Success; }
};

// ── Service definition ──────────────────────────────────────────────────────

/// Availability objective of a service.
struct SloTarget {
    double successRatio = 0.999;   ///< e.g. 0.999 = 99.9 %
    Millis latencyCeiling{1000};   ///< Slower successes count as bad.
};

/// Named rolling windows evaluated by the SLO tracker.
struct SloWindows {
    std::chrono::seconds shortWindow{std::chrono::minutes(5)};
    std::chrono::seconds longWindow{std::chrono::hours(24 * 30)};
};

enum class SloWindow : uint8_t { Short, Long };

/// Hysteresis thresholds of the failure detector.
struct DetectorThresholds {
    uint32_t degradeFailures = 3;             ///< N
    std::chrono::seconds degradeInterval{60}; ///< T
    uint32_t recoverySuccesses = 5;           ///< M, must exceed N
    double suspectBurnRate = 1.0;
    double hardBurnRate = 10.0;
};

struct ProbeSettings {
    Millis interval{10000};
    Millis timeout{2000};
    uint32_t verificationProbes = 5;
};

/// Bounded exponential backoff.
struct RetryPolicy {
    uint32_t maxAttempts = 3;
    Millis initialBackoff{500};
    double multiplier = 2.0;
    Millis maxBackoff{10000};

    /// Delay before attempt @p attempt (1-based; attempt 1 has no delay).
    [[nodiscard]] Millis backoffBefore(uint32_t attempt) const;
};

struct StepSettings {
    Millis timeout{30000};
    RetryPolicy retry;
};

/// How a region's health is checked.
struct HealthEndpointSpec {
    enum class Kind : uint8_t { Http, Tcp };

    Kind kind = Kind::Http;
    std::string host;
    uint16_t port = 80;
    std::string path = "/health";
    int expectedStatus = 200;
    std::string expectedBody;  ///< Substring; empty accepts any body.
};

struct RegionSpec {
    RegionId id;
    RegionRole role = RegionRole::Standby;
    HealthEndpointSpec health;
    std::string apiBaseUrl;  ///< Control-plane API for promotion/routing.
};

/// Immutable description of one service after configuration load.
struct ServiceSpec {
    ServiceId id;
    std::vector<RegionSpec> regions;  ///< Failover priority order.
    SloTarget slo;
    SloWindows windows;
    std::chrono::seconds rto{300};
    std::chrono::seconds rpo{300};
    ProbeSettings probe;
    DetectorThresholds detector;
    StepSettings step;
    std::chrono::seconds escalationInterval{60};

    /// The region configured with role primary, if any.
    [[nodiscard]] std::optional<RegionId> configuredPrimary() const;

    [[nodiscard]] const RegionSpec* findRegion(const RegionId& region) const;
};

/// Process-wide controller settings.
struct ControllerSettings {
    Millis decisionTick{1000};
    std::size_t queueCapacity = 1024;
    Millis enqueueTimeout{100};
    std::string journalDir = "/var/lib/afc/journal";
    uint16_t healthPort = 9180;
    std::string healthBindAddress = "127.0.0.1";
    std::string logLevel = "info";
    std::string logFormat = "text";  ///< "text" or "json"
    std::size_t probeThreads = 4;
    std::vector<std::string> authorizedOperators;

    /// Operator id -> bearer token accepted on the HTTP operator routes.
    /// Tokens are read from the environment variables named in the config,
    /// never from the file itself.
    std::map<std::string, std::string> operatorTokens;
};

struct FleetConfig {
    std::vector<ServiceSpec> services;
    ControllerSettings controller;

    [[nodiscard]] const ServiceSpec* findService(const ServiceId& id) const;
};

// ── Region record ───────────────────────────────────────────────────────────

/// Store entry for one (service, region).
struct RegionRecord {
    ServiceId service;
    RegionId region;
    RegionRole role = RegionRole::Standby;
    RegionState state = RegionState::Healthy;
    std::optional<TimePoint> lastProbe;
    uint32_t consecutiveFailures = 0;
    uint64_t version = 0;  ///< Increments on every accepted mutation.
};

} // namespace afc::control
