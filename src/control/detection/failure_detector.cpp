/// @file failure_detector.cpp
/// @brief FailureDetector hysteresis rules and store synchronization.

#include "afc/control/failure_detector.hpp"

#include "afc/control/region_state_store.hpp"
#include "afc/control/slo_tracker.hpp"
#include "afc/foundation/control_logger.hpp"

#include <sstream>

namespace afc::control {

using foundation::ControlError;
using foundation::ControlResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

std::string_view detectorStateName(DetectorState state) {
    switch (state) {
        case DetectorState::Healthy:           return "Healthy";
        case DetectorState::SuspectedDegraded: return "SuspectedDegraded";
        case DetectorState::Degraded:          return "Degraded";
        case DetectorState::Unreachable:       return "Unreachable";
        case DetectorState::Recovering:        return "Recovering";
    }
    return "Unknown";
}

RegionState storeStateFor(DetectorState state) {
    switch (state) {
        case DetectorState::Healthy:
            return RegionState::Healthy;
        case DetectorState::SuspectedDegraded:
        case DetectorState::Degraded:
        case DetectorState::Recovering:
            return RegionState::Degraded;
        case DetectorState::Unreachable:
            return RegionState::Unreachable;
    }
    return RegionState::Degraded;
}

namespace {

std::string formatRate(double rate) {
    std::ostringstream oss;
    oss.precision(3);
    oss << rate;
    return oss.str();
}

bool isRecoveryStep(DetectorState from, DetectorState to) {
    return to == DetectorState::Healthy ||
           (to == DetectorState::Recovering &&
            (from == DetectorState::Degraded || from == DetectorState::Unreachable));
}

} // namespace

FailureDetector::FailureDetector(RegionStateStore& store, const SloTracker& slo)
    : store_(store), slo_(slo) {}

void FailureDetector::registerService(const ServiceSpec& spec) {
    std::lock_guard lock(mutex_);
    specs_[spec.id] = spec;
    auto& regions = pairs_[spec.id];
    regions.clear();
    for (const auto& r : spec.regions) {
        regions.emplace(r.id, PairState{});
    }
}

ControlResult<DetectorState> FailureDetector::state(const ServiceId& service,
                                                    const RegionId& region) const {
    std::lock_guard lock(mutex_);
    auto svc = pairs_.find(service);
    if (svc == pairs_.end()) {
        return ControlResult<DetectorState>::err(
            ControlError(ErrorCode::ServiceNotFound, "unknown service " + service.value()));
    }
    auto it = svc->second.find(region);
    if (it == svc->second.end()) {
        return ControlResult<DetectorState>::err(
            ControlError(ErrorCode::RegionNotFound, "unknown region " + region.value()));
    }
    return ControlResult<DetectorState>::ok(it->second.state);
}

std::vector<DetectorTransition> FailureDetector::onSample(const ProbeSample& sample) {
    std::vector<DetectorTransition> out;

    std::lock_guard lock(mutex_);
    auto specIt = specs_.find(sample.service);
    if (specIt == specs_.end()) {
        AFC_LOG_WARN(LogCategory::Detector,
                     "sample for unknown service " + sample.service.value());
        return out;
    }
    auto& regions = pairs_[sample.service];
    auto pairIt = regions.find(sample.region);
    if (pairIt == regions.end()) {
        AFC_LOG_WARN(LogCategory::Detector, "sample for unknown region " +
                                                sample.service.value() + "/" +
                                                sample.region.value());
        return out;
    }

    auto bookkeeping = store_.recordProbe(sample.service, sample.region, sample.timestamp,
                                          sample.succeeded());
    if (!bookkeeping) {
        AFC_LOG_WARN(LogCategory::Detector,
                     "probe bookkeeping failed: " + std::string(bookkeeping.error().message()));
    }

    if (auto t = step(specIt->second, sample.region, pairIt->second, sample.succeeded(),
                      sample.timestamp)) {
        out.push_back(std::move(*t));
    }
    return out;
}

std::vector<DetectorTransition> FailureDetector::evaluate(const ServiceId& service,
                                                          TimePoint now) {
    std::vector<DetectorTransition> out;

    std::lock_guard lock(mutex_);
    auto specIt = specs_.find(service);
    if (specIt == specs_.end()) {
        return out;
    }
    auto& regions = pairs_[service];
    for (const auto& r : specIt->second.regions) {
        auto pairIt = regions.find(r.id);
        if (pairIt == regions.end()) {
            continue;
        }
        if (auto t = step(specIt->second, r.id, pairIt->second, std::nullopt, now)) {
            out.push_back(std::move(*t));
        }
    }
    return out;
}

std::optional<DetectorTransition> FailureDetector::step(const ServiceSpec& spec,
                                                        const RegionId& region,
                                                        PairState& pair,
                                                        std::optional<bool> sampleSucceeded,
                                                        TimePoint now) {
    const auto& d = spec.detector;

    if (sampleSucceeded) {
        if (*sampleSucceeded) {
            ++pair.consecutiveSuccesses;
            pair.consecutiveFailures = 0;
            pair.recentFailures.clear();
            pair.streakStart.reset();
        } else {
            ++pair.consecutiveFailures;
            pair.consecutiveSuccesses = 0;
            pair.recentFailures.push_back(now);
            while (pair.recentFailures.size() > d.degradeFailures) {
                pair.recentFailures.pop_front();
            }
            if (!pair.streakStart) {
                pair.streakStart = now;
            }
        }
    }

    double burn = slo_.burnRate(spec.id, region, SloWindow::Short, now).valueOr(0.0);
    if (burn > d.hardBurnRate) {
        if (!pair.hardBurnSince) {
            pair.hardBurnSince = now;
        }
    } else {
        pair.hardBurnSince.reset();
    }

    auto proposal = decide(spec, pair, sampleSucceeded, burn, now);
    if (!proposal) {
        return std::nullopt;
    }

    auto from = pair.state;
    if (!applyToStore(spec.id, region, from, proposal->to)) {
        deferred_.fetch_add(1, std::memory_order_relaxed);
        AFC_LOG_DEBUG(LogCategory::Detector,
                      "deferred " + spec.id.value() + "/" + region.value() + " " +
                          std::string(detectorStateName(from)) + " -> " +
                          std::string(detectorStateName(proposal->to)));
        return std::nullopt;
    }

    pair.state = proposal->to;
    if (isRecoveryStep(from, proposal->to)) {
        pair.consecutiveSuccesses = 0;
    }

    LogContext ctx;
    ctx.serviceId = spec.id;
    ctx.regionId = region;
    ctx.extra["from"] = std::string(detectorStateName(from));
    ctx.extra["to"] = std::string(detectorStateName(proposal->to));
    ctx.extra["burn_rate"] = formatRate(burn);
    foundation::ControlLogger::instance().logWithContext(
        proposal->to == DetectorState::Healthy ? LogLevel::Info : LogLevel::Warning,
        LogCategory::Detector, proposal->reason, ctx);

    return DetectorTransition{spec.id, region, from, proposal->to, now,
                              std::move(proposal->reason)};
}

std::optional<FailureDetector::Proposal> FailureDetector::decide(
    const ServiceSpec& spec, const PairState& pair, std::optional<bool> sampleSucceeded,
    double burn, TimePoint now) const {
    const auto& d = spec.detector;
    bool failure = sampleSucceeded && !*sampleSucceeded;
    bool success = sampleSucceeded && *sampleSucceeded;
    bool recovered = success && pair.consecutiveSuccesses >= d.recoverySuccesses;
    bool burnCleared = burn <= d.suspectBurnRate;

    switch (pair.state) {
        case DetectorState::Healthy:
            if (failure) {
                return Proposal{DetectorState::SuspectedDegraded, "probe failure"};
            }
            if (burn > d.suspectBurnRate) {
                return Proposal{DetectorState::SuspectedDegraded,
                                "short-window burn rate " + formatRate(burn)};
            }
            break;

        case DetectorState::SuspectedDegraded:
            if (failure && pair.consecutiveFailures >= d.degradeFailures &&
                pair.recentFailures.size() >= d.degradeFailures &&
                pair.recentFailures.back() - pair.recentFailures.front() <= d.degradeInterval) {
                return Proposal{DetectorState::Degraded,
                                std::to_string(pair.consecutiveFailures) +
                                    " consecutive failures"};
            }
            if (recovered && burnCleared) {
                return Proposal{DetectorState::Healthy, "recovered"};
            }
            break;

        case DetectorState::Degraded: {
            if (!success) {
                bool hardSustained = pair.hardBurnSince &&
                                     now - *pair.hardBurnSince >= spec.windows.shortWindow;
                if (hardSustained) {
                    return Proposal{DetectorState::Unreachable,
                                    "burn rate " + formatRate(burn) +
                                        " above hard threshold for the short window"};
                }
                bool longStreak = pair.consecutiveFailures > 0 && pair.streakStart &&
                                  now - *pair.streakStart >= spec.rto / 2;
                if (longStreak) {
                    return Proposal{DetectorState::Unreachable,
                                    "failure streak of " +
                                        std::to_string(pair.consecutiveFailures) +
                                        " probes lasting half the RTO"};
                }
            }
            if (recovered) {
                return Proposal{DetectorState::Recovering, "successes while degraded"};
            }
            break;
        }

        case DetectorState::Unreachable:
            if (recovered) {
                return Proposal{DetectorState::Recovering, "successes while unreachable"};
            }
            break;

        case DetectorState::Recovering:
            if (failure) {
                return Proposal{DetectorState::Degraded, "failure while recovering"};
            }
            if (recovered && burnCleared) {
                return Proposal{DetectorState::Healthy, "recovered"};
            }
            break;
    }
    return std::nullopt;
}

bool FailureDetector::applyToStore(const ServiceId& service, const RegionId& region,
                                   DetectorState from, DetectorState to) {
    auto target = storeStateFor(to);
    auto expected = storeStateFor(from);

    for (int attempt = 0; attempt < 2; ++attempt) {
        if (isExecutorOwned(expected)) {
            return false;
        }
        if (expected == target) {
            // Same store state (e.g. SuspectedDegraded -> Degraded); confirm it.
            auto rec = store_.get(service, region);
            if (!rec) {
                return false;
            }
            if (rec.value().state == target) {
                return true;
            }
            expected = rec.value().state;
            continue;
        }

        auto r = store_.transition(service, region, expected, target);
        if (r) {
            return true;
        }
        if (r.error().code() != ErrorCode::ConflictError) {
            AFC_LOG_ERROR(LogCategory::Detector,
                          "store write failed: " + std::string(r.error().message()));
            return false;
        }
        const auto* seen = r.error().context<RegionRecord>();
        if (seen == nullptr) {
            return false;
        }
        if (seen->state == target) {
            return true;
        }
        expected = seen->state;
    }
    return false;
}

} // namespace afc::control
