#pragma once

/// @file health_server.hpp
/// @brief Self-health, metrics and operator endpoints of the controller
///        process.
///
/// Provides /healthz (liveness), /readyz (readiness) and /metrics (Prometheus
/// text format) over a minimal HTTP responder. Further routes (controller
/// status, operator signals) are served by an optional request handler.

#include "afc/foundation/control_result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace afc::foundation {
class ControlMetrics;
}

namespace afc::control {

struct HealthServerConfig {
    /// TCP port to listen on; 0 picks an ephemeral port (see port()).
    uint16_t port = 9180;

    std::string serviceName = "afc_controller";

    /// IPv4 address to bind. Loopback unless the deployment exposes the
    /// endpoints on purpose (e.g. "0.0.0.0" for an external scraper).
    std::string bindAddress = "127.0.0.1";
};

/// Reply produced by an extra route.
struct HttpReply {
    int status = 200;
    std::string contentType = "application/json";
    std::string body;
};

/// Request as handed to an extra route. Views are valid for the duration of
/// the handler call.
struct IncomingRequest {
    std::string_view method;
    std::string_view path;
    std::string_view query;
    /// Authorization header value, empty when absent.
    std::string_view authorization;
};

/// Handles routes other than the built-in ones. Returns nullopt for an
/// unknown route (the server answers 404).
using RequestHandler = std::function<std::optional<HttpReply>(const IncomingRequest& request)>;

/// Minimal HTTP server of the controller process.
///
/// Endpoints:
///   - GET /healthz -> 200 with component health JSON
///   - GET /readyz  -> 200 if ready, 503 if not
///   - GET /metrics -> Prometheus text exposition format
///
/// @code
///   HealthServer health({.port = 9180}, ControlMetrics::instance());
///   health.setRequestHandler(routes);
///   health.start();
///   health.setReady(true);
/// @endcode
///
/// Runs one background thread that accepts and answers connections serially.
/// Request heads are parsed with Boost.Beast; a head over 8 KiB or one that
/// does not arrive within 2 s is dropped.
class HealthServer {
public:
    HealthServer(HealthServerConfig config, foundation::ControlMetrics& metrics);
    ~HealthServer();

    HealthServer(const HealthServer&) = delete;
    HealthServer& operator=(const HealthServer&) = delete;

    /// Must be called before start().
    void setRequestHandler(RequestHandler handler);

    [[nodiscard]] foundation::ControlResult<void> start();

    void stop();

    /// When false, /readyz returns 503.
    void setReady(bool ready);

    [[nodiscard]] bool isRunning() const;

    /// Bound port (the ephemeral one when configured with 0).
    [[nodiscard]] uint16_t port() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Value of @p key in an "a=1&b=2" query string (no percent-decoding of
/// anything but "%20" and '+').
[[nodiscard]] std::optional<std::string> queryParam(std::string_view query,
                                                    std::string_view key);

} // namespace afc::control
