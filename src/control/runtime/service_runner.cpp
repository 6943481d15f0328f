/// @file service_runner.cpp
/// @brief SignalHandler, GracefulShutdown and config path resolution.

#include "afc/control/service_runner.hpp"

#include "afc/foundation/control_logger.hpp"

#include <csignal>
#include <cstdlib>
#include <exception>
#include <string_view>
#include <thread>

namespace afc::control {

using foundation::LogCategory;

// -- SignalHandler ----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown() const {
    using namespace std::chrono_literals;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(100ms);
    }
}

// -- GracefulShutdown -------------------------------------------------------

void GracefulShutdown::addHook(std::string name, ShutdownHook hook) {
    hooks_.push_back(Hook{std::move(name), std::move(hook)});
}

std::size_t GracefulShutdown::execute() {
    auto started = std::chrono::steady_clock::now();
    std::size_t completed = 0;
    for (const auto& hook : hooks_) {
        try {
            hook.callback();
            ++completed;
            AFC_LOG_DEBUG(LogCategory::Core, "shutdown hook '" + hook.name + "' done");
        } catch (const std::exception& e) {
            AFC_LOG_ERROR(LogCategory::Core,
                          "shutdown hook '" + hook.name + "' failed: " + e.what());
        }
    }
    auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed > drainTimeout_) {
        AFC_LOG_WARN(LogCategory::Core,
                     "shutdown took " +
                         std::to_string(
                             std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()) +
                         "s, over the " + std::to_string(drainTimeout_.count()) + "s budget");
    }
    return completed;
}

// -- Config -----------------------------------------------------------------

std::filesystem::path resolveConfigPath(const std::filesystem::path& cliPath) {
    const char* envPath = std::getenv("AFC_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        return envPath;
    }
    return cliPath.empty() ? kDefaultConfigPath : cliPath;
}

foundation::ControlResult<void> loadConfig(foundation::ConfigManager& config,
                                           const std::filesystem::path& cliPath) {
    auto path = resolveConfigPath(cliPath);
    AFC_LOG_INFO(LogCategory::Config, "loading fleet definition from " + path.string());
    return config.load(path);
}

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {
            return argv[i + 1];
        }
    }
    return {};
}

} // namespace afc::control
