#pragma once

/// @file fleet_config.hpp
/// @brief Build and validate a FleetConfig from a loaded ConfigManager.
///
/// Expected YAML layout:
/// @code
///   controller:
///     authorized_operators: [oncall-sre]
///     operator_tokens:                # bearer tokens for the HTTP routes
///       - { operator: oncall-sre, token_env: AFC_TOKEN_ONCALL_SRE }
///     health_bind_address: 127.0.0.1
///     decision_tick_ms: 1000
///   services:
///     - id: checkout
///       primary: us-east            # optional, must name a listed region
///       rpo_seconds: 300
///       slo: { success_ratio: 0.999, latency_ceiling_ms: 800 }
///       detector: { degrade_failures: 3, recovery_successes: 5 }
///       regions:
///         - id: us-east
///           role: primary
///           api_base_url: http://ctl.us-east.internal:8080
///           health: { type: http, host: us-east.internal, port: 8080, path: /health }
/// @endcode

#include "afc/control/fleet_types.hpp"
#include "afc/foundation/config_manager.hpp"
#include "afc/foundation/control_result.hpp"

namespace afc::control {

/// Read every service and controller setting; missing keys take defaults.
/// @return The fleet, or ConfigurationError on a wrong-typed value, an unset
///         token environment variable or any validation failure.
[[nodiscard]] foundation::ControlResult<FleetConfig> loadFleetConfig(
    const foundation::ConfigManager& config);

/// Check structural invariants of an already built fleet:
///   - at least one service, unique non-empty service ids
///   - unique non-empty region ids, exactly one primary per service
///   - recovery successes (M) strictly greater than degrade failures (N)
///   - SLO success ratio in (0, 1), positive probe interval and timeout
///   - at least one retry attempt, non-empty operator names
///   - operator tokens only for authorized operators, distinct and non-empty
[[nodiscard]] foundation::ControlResult<void> validateFleetConfig(const FleetConfig& fleet);

} // namespace afc::control
