#pragma once

/// @file service_runner.hpp
/// @brief Process plumbing of the controller executable: signals, config path
///        resolution and ordered shutdown.

#include "afc/foundation/config_manager.hpp"
#include "afc/foundation/control_result.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace afc::control {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one instance should exist per process. Default handlers are restored
/// on destruction so a second signal terminates immediately.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block until SIGINT or SIGTERM arrives.
    void waitForShutdown() const;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

using ShutdownHook = std::function<void()>;

/// Runs named shutdown hooks in registration order.
///
/// @code
///   GracefulShutdown shutdown;
///   shutdown.addHook("readiness",  [&] { health.setReady(false); });
///   shutdown.addHook("controller", [&] { controller.stop(); });
///   shutdown.addHook("health",     [&] { health.stop(); });
///   shutdown.execute();
/// @endcode
class GracefulShutdown {
public:
    void addHook(std::string name, ShutdownHook hook);

    /// Run every hook. A throwing hook is logged and the rest still run.
    /// @return Number of hooks that completed.
    std::size_t execute();

    [[nodiscard]] std::size_t hookCount() const { return hooks_.size(); }

    /// Hooks running past this budget are reported.
    void setDrainTimeout(std::chrono::seconds timeout) { drainTimeout_ = timeout; }

private:
    struct Hook {
        std::string name;
        ShutdownHook callback;
    };
    std::vector<Hook> hooks_;
    std::chrono::seconds drainTimeout_{30};
};

/// Default fleet definition path.
inline const std::filesystem::path kDefaultConfigPath = "/etc/afc/fleet.yaml";

/// Resolve the config path: AFC_CONFIG_PATH if set, else @p cliPath if not
/// empty, else kDefaultConfigPath.
[[nodiscard]] std::filesystem::path resolveConfigPath(const std::filesystem::path& cliPath);

/// Load the file named by resolveConfigPath(@p cliPath) into @p config.
[[nodiscard]] foundation::ControlResult<void> loadConfig(foundation::ConfigManager& config,
                                                         const std::filesystem::path& cliPath);

/// Parse `--config <path>`. @return Empty path if absent.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

} // namespace afc::control
