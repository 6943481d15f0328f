/// @file fleet_config.cpp
/// @brief FleetConfig construction from flattened YAML keys.

#include "afc/control/fleet_config.hpp"

#include "afc/foundation/control_logger.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <set>
#include <string>

namespace afc::control {

using foundation::ConfigManager;
using foundation::ControlError;
using foundation::ControlResult;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

ControlError configError(std::string message) {
    return ControlError(ErrorCode::ConfigurationError, std::move(message));
}

/// Reads optional keys into existing defaults and remembers the first error.
class KeyReader {
public:
    explicit KeyReader(const ConfigManager& config) : config_(config) {}

    template <typename T>
    void read(const std::string& key, T& out) {
        if (!config_.hasKey(key)) {
            return;
        }
        auto value = config_.get<T>(key);
        if (!value) {
            fail("invalid value for '" + key + "': " + std::string(value.error().message()));
            return;
        }
        out = value.value();
    }

    template <typename Duration>
    void readDuration(const std::string& key, Duration& out) {
        int64_t raw = static_cast<int64_t>(out.count());
        read(key, raw);
        out = Duration{raw};
    }

    void fail(std::string message) {
        if (!error_) {
            error_ = configError(std::move(message));
        }
    }

    [[nodiscard]] bool failed() const { return error_.has_value(); }
    [[nodiscard]] const ControlError& error() const { return *error_; }

    [[nodiscard]] std::size_t count(const std::string& key) const {
        return config_.sequenceSize(key);
    }

private:
    const ConfigManager& config_;
    std::optional<ControlError> error_;
};

HealthEndpointSpec readHealth(KeyReader& in, const std::string& prefix) {
    HealthEndpointSpec health;
    std::string type = "http";
    in.read(prefix + ".type", type);
    if (type == "tcp") {
        health.kind = HealthEndpointSpec::Kind::Tcp;
    } else if (type != "http") {
        in.fail("unknown health check type '" + type + "' at " + prefix);
    }
    in.read(prefix + ".host", health.host);
    int port = health.port;
    in.read(prefix + ".port", port);
    if (port <= 0 || port > 65535) {
        in.fail("health port out of range at " + prefix);
    }
    health.port = static_cast<uint16_t>(port);
    in.read(prefix + ".path", health.path);
    in.read(prefix + ".expected_status", health.expectedStatus);
    in.read(prefix + ".expected_body", health.expectedBody);
    return health;
}

RegionSpec readRegion(KeyReader& in, const std::string& prefix) {
    RegionSpec region;
    std::string id;
    in.read(prefix + ".id", id);
    region.id = RegionId(id);

    std::string role = "standby";
    in.read(prefix + ".role", role);
    if (auto parsed = parseRegionRole(role)) {
        region.role = *parsed;
    } else {
        in.fail("unknown region role '" + role + "' for region '" + id + "'");
    }

    in.read(prefix + ".api_base_url", region.apiBaseUrl);
    region.health = readHealth(in, prefix + ".health");
    return region;
}

/// controller.operator_tokens: [{operator, token_env}]; the token itself
/// comes from the named environment variable.
void readOperatorTokens(KeyReader& in, ControllerSettings& ctl) {
    auto count = in.count("controller.operator_tokens");
    for (std::size_t i = 0; i < count; ++i) {
        auto prefix = "controller.operator_tokens." + std::to_string(i);
        std::string op;
        std::string env;
        in.read(prefix + ".operator", op);
        in.read(prefix + ".token_env", env);
        if (op.empty() || env.empty()) {
            in.fail(prefix + " needs operator and token_env");
            return;
        }
        const char* token = std::getenv(env.c_str());
        if (token == nullptr || *token == '\0') {
            in.fail("environment variable " + env + " holding the token of operator '" + op +
                    "' is unset or empty");
            return;
        }
        if (!ctl.operatorTokens.emplace(op, token).second) {
            in.fail("operator '" + op + "' has more than one token");
            return;
        }
    }
}

ServiceSpec readService(KeyReader& in, const std::string& prefix) {
    ServiceSpec svc;
    std::string id;
    in.read(prefix + ".id", id);
    svc.id = ServiceId(id);

    auto regionCount = in.count(prefix + ".regions");
    for (std::size_t i = 0; i < regionCount; ++i) {
        svc.regions.push_back(readRegion(in, prefix + ".regions." + std::to_string(i)));
    }

    in.read(prefix + ".slo.success_ratio", svc.slo.successRatio);
    in.readDuration(prefix + ".slo.latency_ceiling_ms", svc.slo.latencyCeiling);
    in.readDuration(prefix + ".slo.short_window_seconds", svc.windows.shortWindow);
    in.readDuration(prefix + ".slo.long_window_seconds", svc.windows.longWindow);

    in.readDuration(prefix + ".rto_seconds", svc.rto);
    in.readDuration(prefix + ".rpo_seconds", svc.rpo);
    in.readDuration(prefix + ".escalation_interval_seconds", svc.escalationInterval);

    in.readDuration(prefix + ".probe.interval_ms", svc.probe.interval);
    in.readDuration(prefix + ".probe.timeout_ms", svc.probe.timeout);
    in.read(prefix + ".probe.verification_probes", svc.probe.verificationProbes);

    in.read(prefix + ".detector.degrade_failures", svc.detector.degradeFailures);
    in.readDuration(prefix + ".detector.degrade_interval_seconds", svc.detector.degradeInterval);
    in.read(prefix + ".detector.recovery_successes", svc.detector.recoverySuccesses);
    in.read(prefix + ".detector.suspect_burn_rate", svc.detector.suspectBurnRate);
    in.read(prefix + ".detector.hard_burn_rate", svc.detector.hardBurnRate);

    in.readDuration(prefix + ".step.timeout_ms", svc.step.timeout);
    in.read(prefix + ".step.max_attempts", svc.step.retry.maxAttempts);
    in.readDuration(prefix + ".step.initial_backoff_ms", svc.step.retry.initialBackoff);
    in.read(prefix + ".step.backoff_multiplier", svc.step.retry.multiplier);
    in.readDuration(prefix + ".step.max_backoff_ms", svc.step.retry.maxBackoff);

    // An explicit primary must name one of the listed regions and wins over
    // per-region roles.
    std::string primary;
    in.read(prefix + ".primary", primary);
    if (!primary.empty()) {
        auto* spec = svc.findRegion(RegionId(primary));
        if (spec == nullptr) {
            in.fail("service '" + id + "' names unknown primary region '" + primary + "'");
        } else {
            for (auto& r : svc.regions) {
                if (r.id.value() == primary) {
                    r.role = RegionRole::Primary;
                } else if (r.role == RegionRole::Primary) {
                    r.role = RegionRole::Standby;
                }
            }
        }
    }
    return svc;
}

} // namespace

ControlResult<void> validateFleetConfig(const FleetConfig& fleet) {
    if (fleet.services.empty()) {
        return ControlResult<void>::err(configError("no services configured"));
    }

    std::set<std::string> serviceIds;
    for (const auto& svc : fleet.services) {
        const auto& name = svc.id.value();
        if (!svc.id.isValid()) {
            return ControlResult<void>::err(configError("service without id"));
        }
        if (!serviceIds.insert(name).second) {
            return ControlResult<void>::err(configError("duplicate service '" + name + "'"));
        }
        if (svc.regions.empty()) {
            return ControlResult<void>::err(configError("service '" + name + "' has no regions"));
        }

        std::set<std::string> regionIds;
        int primaries = 0;
        for (const auto& region : svc.regions) {
            if (!region.id.isValid()) {
                return ControlResult<void>::err(
                    configError("service '" + name + "' has a region without id"));
            }
            if (!regionIds.insert(region.id.value()).second) {
                return ControlResult<void>::err(configError(
                    "service '" + name + "' lists region '" + region.id.value() + "' twice"));
            }
            if (region.role == RegionRole::Primary) {
                ++primaries;
            }
        }
        if (primaries != 1) {
            return ControlResult<void>::err(configError(
                "service '" + name + "' must have exactly one primary region, found " +
                std::to_string(primaries)));
        }

        const auto& d = svc.detector;
        if (d.degradeFailures == 0) {
            return ControlResult<void>::err(
                configError("service '" + name + "': degrade_failures must be positive"));
        }
        if (d.recoverySuccesses <= d.degradeFailures) {
            return ControlResult<void>::err(configError(
                "service '" + name + "': recovery_successes (" +
                std::to_string(d.recoverySuccesses) + ") must exceed degrade_failures (" +
                std::to_string(d.degradeFailures) + ")"));
        }
        if (d.hardBurnRate < d.suspectBurnRate) {
            return ControlResult<void>::err(configError(
                "service '" + name + "': hard_burn_rate below suspect_burn_rate"));
        }
        if (!(svc.slo.successRatio > 0.0 && svc.slo.successRatio < 1.0)) {
            return ControlResult<void>::err(configError(
                "service '" + name + "': success_ratio must lie in (0, 1)"));
        }
        if (svc.windows.shortWindow.count() <= 0 ||
            svc.windows.longWindow < svc.windows.shortWindow) {
            return ControlResult<void>::err(
                configError("service '" + name + "': invalid SLO windows"));
        }
        if (svc.probe.interval.count() <= 0 || svc.probe.timeout.count() <= 0) {
            return ControlResult<void>::err(configError(
                "service '" + name + "': probe interval and timeout must be positive"));
        }
        if (svc.step.retry.maxAttempts == 0 || svc.step.timeout.count() <= 0) {
            return ControlResult<void>::err(configError(
                "service '" + name + "': step needs a positive timeout and at least one attempt"));
        }
    }

    for (const auto& op : fleet.controller.authorizedOperators) {
        if (op.empty()) {
            return ControlResult<void>::err(configError("empty authorized operator name"));
        }
    }
    std::set<std::string> tokens;
    for (const auto& [op, token] : fleet.controller.operatorTokens) {
        const auto& ops = fleet.controller.authorizedOperators;
        if (std::find(ops.begin(), ops.end(), op) == ops.end()) {
            return ControlResult<void>::err(
                configError("operator '" + op + "' has a token but is not authorized"));
        }
        if (token.empty() || !tokens.insert(token).second) {
            return ControlResult<void>::err(
                configError("operator '" + op + "' needs a non-empty token of its own"));
        }
    }
    if (fleet.controller.healthBindAddress.empty()) {
        return ControlResult<void>::err(configError("health_bind_address must not be empty"));
    }
    if (!foundation::parseLogLevel(fleet.controller.logLevel)) {
        return ControlResult<void>::err(
            configError("unknown log_level '" + fleet.controller.logLevel + "'"));
    }
    if (fleet.controller.logFormat != "text" && fleet.controller.logFormat != "json") {
        return ControlResult<void>::err(
            configError("log_format must be text or json, got '" + fleet.controller.logFormat + "'"));
    }
    if (fleet.controller.queueCapacity == 0) {
        return ControlResult<void>::err(configError("queue_capacity must be positive"));
    }
    return ControlResult<void>::ok();
}

ControlResult<FleetConfig> loadFleetConfig(const ConfigManager& config) {
    KeyReader in(config);
    FleetConfig fleet;

    auto& ctl = fleet.controller;
    in.readDuration("controller.decision_tick_ms", ctl.decisionTick);
    in.read("controller.queue_capacity", ctl.queueCapacity);
    in.readDuration("controller.enqueue_timeout_ms", ctl.enqueueTimeout);
    in.read("controller.journal_dir", ctl.journalDir);
    int port = ctl.healthPort;
    in.read("controller.health_port", port);
    ctl.healthPort = static_cast<uint16_t>(port);
    in.read("controller.log_level", ctl.logLevel);
    in.read("controller.log_format", ctl.logFormat);
    in.read("controller.probe_threads", ctl.probeThreads);
    in.read("controller.authorized_operators", ctl.authorizedOperators);
    in.read("controller.health_bind_address", ctl.healthBindAddress);
    readOperatorTokens(in, ctl);

    auto serviceCount = in.count("services");
    for (std::size_t i = 0; i < serviceCount; ++i) {
        fleet.services.push_back(readService(in, "services." + std::to_string(i)));
    }

    if (in.failed()) {
        AFC_LOG_ERROR(LogCategory::Config, std::string(in.error().message()));
        return ControlResult<FleetConfig>::err(in.error());
    }

    auto valid = validateFleetConfig(fleet);
    if (!valid) {
        AFC_LOG_ERROR(LogCategory::Config, std::string(valid.error().message()));
        return ControlResult<FleetConfig>::err(valid.error());
    }

    AFC_LOG_INFO(LogCategory::Config,
                 "fleet loaded: " + std::to_string(fleet.services.size()) + " service(s)");
    return ControlResult<FleetConfig>::ok(std::move(fleet));
}

} // namespace afc::control
