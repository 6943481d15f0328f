#pragma once

/// @file availability_controller.hpp
/// @brief Wires probing, SLO tracking, detection, coordination, execution,
///        journaling and notification for a whole fleet.

#include "afc/control/decision_loop.hpp"
#include "afc/control/external_apis.hpp"
#include "afc/control/failover_coordinator.hpp"
#include "afc/control/failover_journal.hpp"
#include "afc/control/failure_detector.hpp"
#include "afc/control/health_probe.hpp"
#include "afc/control/health_server.hpp"
#include "afc/control/notifier.hpp"
#include "afc/control/operator_auth.hpp"
#include "afc/control/probe_scheduler.hpp"
#include "afc/control/region_state_store.hpp"
#include "afc/control/slo_tracker.hpp"
#include "afc/foundation/control_result.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace afc::foundation {
class ControlMetrics;
}

namespace afc::control {

/// Builds the health endpoint of a region.
using EndpointFactory =
    std::function<std::shared_ptr<HealthEndpoint>(const ServiceSpec&, const RegionSpec&)>;

struct ControllerOptions {
    /// Defaults to makeHealthEndpoint(region.health).
    EndpointFactory endpoints;

    /// Open the journal under controller.journalDir and replay it on start().
    bool journalEnabled = true;

    /// Launch the probe scheduler on start(). Tests feed samples directly.
    bool probingEnabled = true;
};

/// The controller for one fleet.
///
/// Every service gets a decision loop that applies, in order, the service's
/// probe samples, operator signals and periodic ticks:
///   sample -> SloTracker -> FailureDetector (store CAS) -> FailoverCoordinator
/// Region and coordinator transitions, failover progress and escalations are
/// published to the Notifier; every FailoverEvent mutation is journaled.
///
/// @code
///   AvailabilityController controller(fleet, HttpFleetApi::makeFleetApis(fleet),
///                                     ControlMetrics::instance());
///   controller.notifier().addSink(std::make_shared<LogEventSink>());
///   controller.start();
///   ...
///   controller.stop();
/// @endcode
class AvailabilityController {
public:
    AvailabilityController(FleetConfig fleet, FleetApis apis,
                           foundation::ControlMetrics& metrics,
                           ControllerOptions options = {});
    ~AvailabilityController();

    AvailabilityController(const AvailabilityController&) = delete;
    AvailabilityController& operator=(const AvailabilityController&) = delete;

    /// Replay the journal, start the decision loops and probing.
    [[nodiscard]] foundation::ControlResult<void> start();

    /// Stop probing and every decision loop. A failover in progress runs to
    /// its end first.
    void stop();

    [[nodiscard]] bool isRunning() const { return running_; }

    /// Queue a probe sample for its service.
    foundation::ControlResult<void> submitSample(ProbeSample sample);

    /// Queue an operator signal. An authorized Abort also cancels the
    /// running failover immediately; an unauthorized signal is rejected
    /// without being queued.
    foundation::ControlResult<void> submitSignal(ManualSignal signal);

    /// Apply one decision item on the calling thread. For use while the
    /// decision loops are not running.
    foundation::ControlResult<void> process(const ServiceId& service, DecisionItem item);

    [[nodiscard]] foundation::ControlResult<CoordinatorSnapshot> snapshot(
        const ServiceId& service) const;

    /// JSON view of every service: coordinator state, live event, regions.
    [[nodiscard]] std::string statusJson() const;

    /// Routes served next to /healthz:
    ///   GET  /status
    ///   POST /services/{service}/abort
    ///   POST /services/{service}/force-failover?target=...&note=...
    ///   POST /services/{service}/clear-abort
    /// POST routes identify the operator by "Authorization: Bearer <token>"
    /// (controller.operator_tokens) and answer 401 without a valid one.
    [[nodiscard]] RequestHandler requestHandler();

    [[nodiscard]] Notifier& notifier() { return notifier_; }
    [[nodiscard]] RegionStateStore& store() { return store_; }
    [[nodiscard]] const SloTracker& slo() const { return slo_; }
    [[nodiscard]] const FailureDetector& detector() const { return detector_; }
    [[nodiscard]] const FleetConfig& fleet() const { return fleet_; }

private:
    struct ServiceRuntime {
        const ServiceSpec* spec = nullptr;
        std::unique_ptr<FailoverCoordinator> coordinator;
        std::unique_ptr<ServiceDecisionLoop> loop;
        std::map<RegionId, std::shared_ptr<HealthProbe>> probes;
    };

    void handle(ServiceRuntime& runtime, DecisionItem item);
    void publishTransitions(ServiceRuntime& runtime,
                            const std::vector<DetectorTransition>& transitions);
    foundation::ControlResult<void> replayJournal();

    ServiceRuntime* find(const ServiceId& service);
    const ServiceRuntime* find(const ServiceId& service) const;

    FleetConfig fleet_;
    FleetApis apis_;
    foundation::ControlMetrics& metrics_;
    ControllerOptions options_;
    OperatorAuthenticator operators_;

    SloTracker slo_;
    RegionStateStore store_;
    FailureDetector detector_;
    Notifier notifier_;
    EventIdSequence ids_;
    std::unique_ptr<FailoverJournal> journal_;
    std::unique_ptr<ProbeScheduler> scheduler_;
    std::map<ServiceId, ServiceRuntime> services_;
    bool running_ = false;
};

} // namespace afc::control
