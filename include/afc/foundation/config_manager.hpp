#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed dotted-key access.

#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "afc/foundation/control_result.hpp"

namespace afc::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML-backed configuration store.
///
/// The YAML tree is flattened into dotted keys. Sequence elements are
/// addressed by index, so a fleet file such as
/// @code
///   services:
///     - id: checkout
///       regions:
///         - id: us-east
/// @endcode
/// yields the keys "services.0.id" and "services.0.regions.0.id", and
/// sequenceSize("services") returns 1. Flattening avoids yaml-cpp's
/// reference-semantic pitfalls when nodes are shared across threads.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing any previous content.
    /// @return Success or ConfigLoadFailed.
    ControlResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    ControlResult<void> loadFromString(std::string_view yaml);

    /// Retrieve a typed value by dotted key (e.g., "controller.health_port").
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch.
    template <typename T>
    ControlResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, falling back to @p fallback when the key is
    /// absent. A present key of the wrong type is still an error.
    template <typename T>
    ControlResult<T> getOr(std::string_view key, T fallback) const;

    /// Set a value by dotted key and notify watchers of that key.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Register a callback that fires when the given key changes via set().
    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Number of elements of the sequence stored at @p key (0 if absent or
    /// not a sequence).
    [[nodiscard]] std::size_t sequenceSize(std::string_view key) const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);
    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::size_t> sequenceSizes_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
ControlResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return ControlResult<T>::err(
            ControlError(ErrorCode::ConfigKeyNotFound,
                         std::string("config key not found: ") + std::string(key)));
    }
    try {
        return ControlResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return ControlResult<T>::err(
            ControlError(ErrorCode::ConfigTypeMismatch,
                         std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
ControlResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return ControlResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace afc::foundation
