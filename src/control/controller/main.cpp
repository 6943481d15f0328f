/// @file main.cpp
/// @brief afc_controller entry point.
///
/// Loads and validates the fleet definition, starts the controller with the
/// HTTP capability adapters, and serves /healthz, /readyz, /metrics, /status
/// and the operator signal routes until SIGINT or SIGTERM.

#include <cstdlib>
#include <iostream>
#include <memory>

#include "afc/control/availability_controller.hpp"
#include "afc/control/fleet_config.hpp"
#include "afc/control/health_server.hpp"
#include "afc/control/http_fleet_api.hpp"
#include "afc/control/notifier.hpp"
#include "afc/control/service_runner.hpp"
#include "afc/foundation/config_manager.hpp"
#include "afc/foundation/control_logger.hpp"
#include "afc/foundation/control_metrics.hpp"
#include "afc/version.hpp"

int main(int argc, char* argv[]) {
    using namespace afc;

    control::SignalHandler signals;

    foundation::ConfigManager config;
    auto loadResult = control::loadConfig(config, control::parseConfigArg(argc, argv));
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto fleetResult = control::loadFleetConfig(config);
    if (!fleetResult) {
        std::cerr << "Invalid fleet definition: " << fleetResult.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto fleet = std::move(fleetResult).value();

    auto& logger = foundation::ControlLogger::instance();
    logger.setJsonMode(fleet.controller.logFormat == "json");
    if (auto level = foundation::parseLogLevel(fleet.controller.logLevel)) {
        for (std::size_t i = 0; i < foundation::kLogCategoryCount; ++i) {
            logger.setCategoryLevel(static_cast<foundation::LogCategory>(i), *level);
        }
    }

    auto& metrics = foundation::ControlMetrics::instance();
    control::HealthServer health({.port = fleet.controller.healthPort,
                                  .bindAddress = fleet.controller.healthBindAddress},
                                 metrics);

    auto apis = control::HttpFleetApi::makeFleetApis(fleet);
    control::AvailabilityController controller(fleet, apis, metrics);
    controller.notifier().addSink(std::make_shared<control::LogEventSink>());
    health.setRequestHandler(controller.requestHandler());

    auto healthResult = health.start();
    if (!healthResult) {
        std::cerr << "Failed to start health server: " << healthResult.error().message()
                  << "\n";
        return EXIT_FAILURE;
    }

    auto startResult = controller.start();
    if (!startResult) {
        std::cerr << "Failed to start controller: " << startResult.error().message() << "\n";
        health.stop();
        return EXIT_FAILURE;
    }
    health.setReady(true);

    AFC_LOG_INFO(foundation::LogCategory::Core,
                 std::string("afc_controller ") + afc::Version::string +
                     " started: " + std::to_string(fleet.services.size()) +
                     " service(s), health port " + std::to_string(health.port()));

    signals.waitForShutdown();

    control::GracefulShutdown shutdown;
    shutdown.addHook("readiness", [&] { health.setReady(false); });
    shutdown.addHook("controller", [&] { controller.stop(); });
    shutdown.addHook("health", [&] { health.stop(); });
    shutdown.addHook("logger", [] {
        auto flushed = foundation::ControlLogger::instance().flush();
        if (!flushed) {
            std::cerr << "Log flush failed: " << flushed.error().message() << "\n";
        }
    });
    shutdown.execute();
    return EXIT_SUCCESS;
}
