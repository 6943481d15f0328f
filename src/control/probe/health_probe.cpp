/// @file health_probe.cpp
/// @brief HTTP/TCP health endpoints and HealthProbe.

#include "afc/control/health_probe.hpp"

#include "afc/control/http_client.hpp"
#include "afc/foundation/control_logger.hpp"

namespace afc::control {

using foundation::ErrorCode;

HttpHealthEndpoint::HttpHealthEndpoint(HealthEndpointSpec spec) : spec_(std::move(spec)) {}

HealthCheckOutcome HttpHealthEndpoint::check(Millis timeout) {
    HttpRequest req;
    req.method = "GET";
    req.host = spec_.host;
    req.port = spec_.port;
    req.path = spec_.path;

    auto response = httpExchange(req, timeout);
    if (!response) {
        return HealthCheckOutcome{
            false, response.error().code() == ErrorCode::Timeout,
            std::string(response.error().message())};
    }

    const auto& r = response.value();
    if (r.status != spec_.expectedStatus) {
        return HealthCheckOutcome{false, false, "status " + std::to_string(r.status)};
    }
    if (!spec_.expectedBody.empty() && r.body.find(spec_.expectedBody) == std::string::npos) {
        return HealthCheckOutcome{false, false, "unexpected body"};
    }
    return HealthCheckOutcome{true, false, {}};
}

TcpHealthEndpoint::TcpHealthEndpoint(HealthEndpointSpec spec) : spec_(std::move(spec)) {}

HealthCheckOutcome TcpHealthEndpoint::check(Millis timeout) {
    auto connected = tcpConnect(spec_.host, spec_.port, timeout);
    if (!connected) {
        return HealthCheckOutcome{
            false, connected.error().code() == ErrorCode::Timeout,
            std::string(connected.error().message())};
    }
    return HealthCheckOutcome{true, false, {}};
}

std::shared_ptr<HealthEndpoint> makeHealthEndpoint(const HealthEndpointSpec& spec) {
    if (spec.kind == HealthEndpointSpec::Kind::Tcp) {
        return std::make_shared<TcpHealthEndpoint>(spec);
    }
    return std::make_shared<HttpHealthEndpoint>(spec);
}

// ---------------------------------------------------------------------------
// HealthProbe
// ---------------------------------------------------------------------------

HealthProbe::HealthProbe(ServiceId service, RegionId region,
                         std::shared_ptr<HealthEndpoint> endpoint, Millis timeout)
    : service_(std::move(service)),
      region_(std::move(region)),
      endpoint_(std::move(endpoint)),
      timeout_(timeout) {}

ProbeSample HealthProbe::probe() const {
    ProbeSample sample;
    sample.service = service_;
    sample.region = region_;

    auto start = Clock::now();
    HealthCheckOutcome outcome;
    try {
        outcome = endpoint_->check(timeout_);
    } catch (const std::exception& e) {
        outcome = HealthCheckOutcome{false, false, std::string("endpoint error: ") + e.what()};
    }
    auto end = Clock::now();

    sample.timestamp = end;
    sample.latency = std::chrono::duration_cast<Millis>(end - start);
    sample.detail = std::move(outcome.detail);

    if (outcome.timedOut || sample.latency > timeout_) {
        sample.outcome = ProbeOutcome::Timeout;
        if (sample.detail.empty()) {
            sample.detail = "exceeded " + std::to_string(timeout_.count()) + "ms";
        }
    } else if (outcome.healthy) {
        sample.outcome = ProbeOutcome::Success;
    } else {
        sample.outcome = ProbeOutcome::Failure;
    }

    if (sample.outcome != ProbeOutcome::Success) {
        AFC_LOG_DEBUG(foundation::LogCategory::Probe,
                      service_.value() + "/" + region_.value() + " " +
                          std::string(probeOutcomeName(sample.outcome)) + ": " + sample.detail);
    }
    return sample;
}

} // namespace afc::control
