/// @file availability_controller.cpp
/// @brief AvailabilityController wiring, journal replay and operator routes.

#include "afc/control/availability_controller.hpp"

#include "afc/foundation/control_logger.hpp"
#include "afc/foundation/control_metrics.hpp"
#include "afc/foundation/json_log_formatter.hpp"

#include <nlohmann/json.hpp>

#include <type_traits>
#include <variant>

namespace afc::control {

using foundation::ControlError;
using foundation::ControlResult;
using foundation::ErrorCode;
using foundation::HealthStatus;
using foundation::LogCategory;

namespace {

nlohmann::ordered_json eventJson(const FailoverEvent& event) {
    nlohmann::ordered_json doc;
    doc["id"] = event.id().value();
    doc["from"] = event.fromRegion().value();
    doc["to"] = event.toRegion().value();
    doc["reason"] = event.reason();
    doc["manual"] = event.manual();
    doc["phase"] = std::string(failoverPhaseName(event.phase()));
    auto steps = nlohmann::ordered_json::array();
    for (const auto& step : event.steps()) {
        steps.push_back({{"step", std::string(stepKindName(step.step))},
                         {"status", std::string(stepStatusName(step.status))},
                         {"attempts", step.attempts},
                         {"message", step.message}});
    }
    doc["steps"] = std::move(steps);
    return doc;
}

HttpReply jsonReply(int status, const std::string& message) {
    nlohmann::ordered_json body;
    body["message"] = message;
    return HttpReply{status, "application/json", foundation::toJsonText(body)};
}

int httpStatusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unauthenticated:     return 401;
        case ErrorCode::PermissionDenied:    return 403;
        case ErrorCode::ServiceNotFound:
        case ErrorCode::RegionNotFound:      return 404;
        case ErrorCode::InvalidTransition:
        case ErrorCode::FailoverAlreadyLive: return 409;
        case ErrorCode::QueueFull:
        case ErrorCode::QueueClosed:         return 503;
        default:                             return 400;
    }
}

} // namespace

AvailabilityController::AvailabilityController(FleetConfig fleet, FleetApis apis,
                                               foundation::ControlMetrics& metrics,
                                               ControllerOptions options)
    : fleet_(std::move(fleet)),
      apis_(std::move(apis)),
      metrics_(metrics),
      options_(std::move(options)),
      operators_(fleet_.controller.operatorTokens),
      detector_(store_, slo_) {
    if (!options_.endpoints) {
        options_.endpoints = [](const ServiceSpec&, const RegionSpec& region) {
            return makeHealthEndpoint(region.health);
        };
    }
    if (options_.journalEnabled) {
        journal_ = std::make_unique<FailoverJournal>(
            JournalConfig{.directory = fleet_.controller.journalDir, .syncOnWrite = true});
    }

    for (const auto& spec : fleet_.services) {
        slo_.registerService(spec);
        store_.registerService(spec);
        detector_.registerService(spec);

        auto& runtime = services_[spec.id];
        runtime.spec = &spec;
        for (const auto& region : spec.regions) {
            runtime.probes[region.id] = std::make_shared<HealthProbe>(
                spec.id, region.id, options_.endpoints(spec, region), spec.probe.timeout);
        }

        ServiceRuntime* rt = &runtime;
        CoordinatorContext ctx{
            .store = store_,
            .slo = slo_,
            .notifier = notifier_,
            .metrics = metrics_,
            .ids = ids_,
            .apis = apis_,
            .prober = [rt](const ServiceId& service, const RegionId& region) {
                auto it = rt->probes.find(region);
                if (it == rt->probes.end()) {
                    ProbeSample missing;
                    missing.service = service;
                    missing.region = region;
                    missing.timestamp = Clock::now();
                    missing.detail = "no probe for region";
                    return missing;
                }
                return it->second->probe();
            },
            .journal = journal_.get(),
            .authorizedOperators = fleet_.controller.authorizedOperators,
        };
        runtime.coordinator = std::make_unique<FailoverCoordinator>(spec, std::move(ctx));
        runtime.loop = std::make_unique<ServiceDecisionLoop>(
            spec.id,
            DecisionLoopOptions{.capacity = fleet_.controller.queueCapacity,
                                .enqueueTimeout = fleet_.controller.enqueueTimeout,
                                .tickInterval = fleet_.controller.decisionTick},
            [this, rt](DecisionItem item) { handle(*rt, std::move(item)); }, metrics_);
    }
}

AvailabilityController::~AvailabilityController() {
    stop();
}

ControlResult<void> AvailabilityController::start() {
    if (running_) {
        return ControlResult<void>::ok();
    }

    if (journal_) {
        auto replayed = replayJournal();
        if (!replayed) {
            metrics_.setComponentHealth("journal", HealthStatus::Unhealthy);
            return replayed;
        }
        metrics_.setComponentHealth("journal", HealthStatus::Healthy);
    }

    for (auto& [id, runtime] : services_) {
        auto started = runtime.loop->start();
        if (!started) {
            stop();
            return started;
        }
    }
    metrics_.setComponentHealth("decision_loops", HealthStatus::Healthy);

    if (journal_) {
        auto live = journal_->liveEvents();
        if (!live) {
            return ControlResult<void>::err(live.error());
        }
        for (auto& event : live.value()) {
            auto* runtime = find(event.service());
            if (runtime == nullptr) {
                AFC_LOG_WARN(LogCategory::Core, "journaled event " +
                                                    std::to_string(event.id().value()) +
                                                    " names unknown service " +
                                                    event.service().value());
                continue;
            }
            AFC_LOG_INFO(LogCategory::Core, "resuming failover " +
                                                std::to_string(event.id().value()) + " of " +
                                                event.service().value());
            auto queued = runtime->loop->submit(std::move(event));
            if (!queued) {
                AFC_LOG_ERROR(LogCategory::Core, std::string(queued.error().message()));
            }
        }
    }

    if (options_.probingEnabled) {
        scheduler_ = std::make_unique<ProbeScheduler>(fleet_.controller.probeThreads, metrics_);
        for (auto& [id, runtime] : services_) {
            for (auto& [region, probe] : runtime.probes) {
                auto added = scheduler_->add(probe, runtime.spec->probe.interval,
                                             [this](ProbeSample sample) {
                                                 auto queued = submitSample(std::move(sample));
                                                 if (!queued) {
                                                     AFC_LOG_DEBUG(
                                                         LogCategory::Probe,
                                                         std::string(queued.error().message()));
                                                 }
                                             });
                if (!added) {
                    stop();
                    return added;
                }
            }
        }
        auto started = scheduler_->start();
        if (!started) {
            stop();
            return started;
        }
        metrics_.setComponentHealth("probes", HealthStatus::Healthy);
    }

    running_ = true;
    AFC_LOG_INFO(LogCategory::Core, "controller started for " +
                                        std::to_string(services_.size()) + " service(s)");
    return ControlResult<void>::ok();
}

void AvailabilityController::stop() {
    // A running failover finishes its current sequence before its loop joins.
    if (scheduler_) {
        scheduler_->stop();
    }
    for (auto& [id, runtime] : services_) {
        runtime.loop->stop();
    }
    if (journal_) {
        journal_->close();
    }
    if (running_) {
        AFC_LOG_INFO(LogCategory::Core, "controller stopped");
    }
    running_ = false;
}

ControlResult<void> AvailabilityController::replayJournal() {
    auto opened = journal_->open();
    if (!opened) {
        return opened;
    }
    ids_.seed(journal_->maxEventId());

    auto events = journal_->replay();
    if (!events) {
        return ControlResult<void>::err(events.error());
    }
    // Completed failovers moved the primary away from the configured one.
    for (const auto& event : events.value()) {
        if (event.phase() != FailoverPhase::Completed || find(event.service()) == nullptr) {
            continue;
        }
        auto moved = store_.compareAndSetPrimary(event.service(), event.fromRegion(),
                                                  event.toRegion());
        if (moved) {
            AFC_LOG_INFO(LogCategory::Core, "restored primary " + event.toRegion().value() +
                                                " of " + event.service().value());
        }
    }
    return ControlResult<void>::ok();
}

// ---------------------------------------------------------------------------
// Inputs
// ---------------------------------------------------------------------------

ControlResult<void> AvailabilityController::submitSample(ProbeSample sample) {
    auto* runtime = find(sample.service);
    if (runtime == nullptr) {
        return ControlResult<void>::err(ControlError(
            ErrorCode::ServiceNotFound, "unknown service " + sample.service.value()));
    }
    return runtime->loop->submit(std::move(sample));
}

ControlResult<void> AvailabilityController::submitSignal(ManualSignal signal) {
    auto* runtime = find(signal.service);
    if (runtime == nullptr) {
        return ControlResult<void>::err(ControlError(
            ErrorCode::ServiceNotFound, "unknown service " + signal.service.value()));
    }
    if (!runtime->coordinator->isAuthorized(signal.operatorId)) {
        return runtime->coordinator->signal(signal);
    }
    if (signal.kind == ManualSignalKind::Abort) {
        runtime->coordinator->cancelRunning();
    }
    return runtime->loop->submit(std::move(signal));
}

ControlResult<void> AvailabilityController::process(const ServiceId& service, DecisionItem item) {
    auto* runtime = find(service);
    if (runtime == nullptr) {
        return ControlResult<void>::err(
            ControlError(ErrorCode::ServiceNotFound, "unknown service " + service.value()));
    }
    handle(*runtime, std::move(item));
    return ControlResult<void>::ok();
}

void AvailabilityController::handle(ServiceRuntime& runtime, DecisionItem item) {
    auto& coordinator = *runtime.coordinator;
    std::visit(
        [&](auto&& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, ProbeSample>) {
                auto recorded = slo_.record(value);
                if (!recorded) {
                    AFC_LOG_WARN(LogCategory::Slo, std::string(recorded.error().message()));
                    return;
                }
                auto transitions = detector_.onSample(value);
                publishTransitions(runtime, transitions);
                for (const auto& t : transitions) {
                    coordinator.onTransition(t, value.timestamp);
                }
            } else if constexpr (std::is_same_v<T, ManualSignal>) {
                auto applied = coordinator.signal(value);
                if (!applied) {
                    AFC_LOG_DEBUG(LogCategory::Coordinator,
                                  std::string(applied.error().message()));
                }
            } else if constexpr (std::is_same_v<T, DecisionTick>) {
                auto transitions = detector_.evaluate(runtime.spec->id, value.at);
                publishTransitions(runtime, transitions);
                for (const auto& t : transitions) {
                    coordinator.onTransition(t, value.at);
                }
                coordinator.tick(value.at);
            } else {
                auto resumed = coordinator.resume(std::move(value));
                if (!resumed) {
                    AFC_LOG_ERROR(LogCategory::Coordinator,
                                  "cannot resume failover: " +
                                      std::string(resumed.error().message()));
                }
            }
        },
        std::move(item));
}

void AvailabilityController::publishTransitions(
    ServiceRuntime& runtime, const std::vector<DetectorTransition>& transitions) {
    for (const auto& t : transitions) {
        ControlEvent event;
        event.kind = ControlEventKind::RegionTransition;
        event.service = runtime.spec->id;
        event.region = t.region;
        event.message = t.reason;
        event.at = WallClock::now();
        event.fields.emplace_back("from", std::string(detectorStateName(t.from)));
        event.fields.emplace_back("to", std::string(detectorStateName(t.to)));
        notifier_.notify(event);
    }
}

// ---------------------------------------------------------------------------
// Views
// ---------------------------------------------------------------------------

ControlResult<CoordinatorSnapshot> AvailabilityController::snapshot(
    const ServiceId& service) const {
    const auto* runtime = find(service);
    if (runtime == nullptr) {
        return ControlResult<CoordinatorSnapshot>::err(
            ControlError(ErrorCode::ServiceNotFound, "unknown service " + service.value()));
    }
    return ControlResult<CoordinatorSnapshot>::ok(runtime->coordinator->snapshot());
}

std::string AvailabilityController::statusJson() const {
    auto services = nlohmann::ordered_json::array();
    for (const auto& [id, runtime] : services_) {
        auto snap = runtime.coordinator->snapshot();
        nlohmann::ordered_json entry;
        entry["service"] = id.value();
        entry["state"] = std::string(coordinatorStateName(snap.state));
        entry["primary"] = snap.primary.value();
        entry["escalations"] = snap.escalations;
        if (snap.liveEvent) {
            entry["live_event"] = eventJson(*snap.liveEvent);
        }
        if (snap.lastEvent) {
            entry["last_event"] = eventJson(*snap.lastEvent);
        }

        auto regions = nlohmann::ordered_json::array();
        auto records = store_.snapshot(id);
        if (records) {
            for (const auto& rec : records.value()) {
                nlohmann::ordered_json region;
                region["region"] = rec.region.value();
                region["role"] = std::string(regionRoleName(rec.role));
                region["state"] = std::string(regionStateName(rec.state));
                auto detected = detector_.state(id, rec.region);
                if (detected) {
                    region["detector"] = std::string(detectorStateName(detected.value()));
                }
                region["consecutive_failures"] = rec.consecutiveFailures;
                regions.push_back(std::move(region));
            }
        }
        entry["regions"] = std::move(regions);
        services.push_back(std::move(entry));
    }
    nlohmann::ordered_json doc;
    doc["services"] = std::move(services);
    return foundation::toJsonText(doc);
}

RequestHandler AvailabilityController::requestHandler() {
    return [this](const IncomingRequest& request) -> std::optional<HttpReply> {
        const auto path = request.path;
        if (path == "/status") {
            if (request.method != "GET") {
                return jsonReply(405, "use GET");
            }
            return HttpReply{200, "application/json", statusJson()};
        }

        constexpr std::string_view prefix = "/services/";
        if (path.substr(0, prefix.size()) != prefix) {
            return std::nullopt;
        }
        auto rest = path.substr(prefix.size());
        auto slash = rest.find('/');
        if (slash == std::string_view::npos) {
            return std::nullopt;
        }
        ManualSignal signal;
        signal.service = ServiceId(std::string(rest.substr(0, slash)));
        auto action = rest.substr(slash + 1);
        if (action == "abort") {
            signal.kind = ManualSignalKind::Abort;
        } else if (action == "force-failover") {
            signal.kind = ManualSignalKind::ForceFailover;
        } else if (action == "clear-abort") {
            signal.kind = ManualSignalKind::ClearAbort;
        } else {
            return std::nullopt;
        }
        if (request.method != "POST") {
            return jsonReply(405, "use POST");
        }

        auto operatorId = operators_.authenticate(request.authorization);
        if (!operatorId) {
            AFC_LOG_WARN(LogCategory::Core, "rejected " + std::string(action) + " for " +
                                                signal.service.value() + ": " +
                                                std::string(operatorId.error().message()));
            return jsonReply(httpStatusFor(operatorId.error().code()),
                             std::string(operatorId.error().message()));
        }
        signal.operatorId = operatorId.value();
        if (auto target = queryParam(request.query, "target")) {
            signal.target = RegionId(*target);
        }
        signal.note = queryParam(request.query, "note").value_or("");

        auto queued = submitSignal(std::move(signal));
        if (!queued) {
            return jsonReply(httpStatusFor(queued.error().code()),
                             std::string(queued.error().message()));
        }
        return jsonReply(202, std::string(action) + " queued");
    };
}

AvailabilityController::ServiceRuntime* AvailabilityController::find(const ServiceId& service) {
    auto it = services_.find(service);
    return it == services_.end() ? nullptr : &it->second;
}

const AvailabilityController::ServiceRuntime* AvailabilityController::find(
    const ServiceId& service) const {
    auto it = services_.find(service);
    return it == services_.end() ? nullptr : &it->second;
}

} // namespace afc::control
