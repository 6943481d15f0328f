#include "afc/foundation/config_manager.hpp"

namespace afc::foundation {

ControlResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::LoadFile(path.string());
        entries_.clear();
        sequenceSizes_.clear();
        flatten("", root);
        return ControlResult<void>::ok();
    } catch (const YAML::BadFile&) {
        return ControlResult<void>::err(
            ControlError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return ControlResult<void>::err(
            ControlError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

ControlResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::Load(std::string(yaml));
        entries_.clear();
        sequenceSizes_.clear();
        flatten("", root);
        return ControlResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return ControlResult<void>::err(
            ControlError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::size_t ConfigManager::sequenceSize(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = sequenceSizes_.find(std::string(key));
    return it == sequenceSizes_.end() ? 0 : it->second;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (node.IsSequence()) {
        // Keep the whole sequence under its own key (scalar lists such as
        // authorized_operators read back as std::vector) and index each element.
        entries_[prefix] = YAML::Clone(node);
        sequenceSizes_[prefix] = node.size();
        for (std::size_t i = 0; i < node.size(); ++i) {
            flatten(prefix + "." + std::to_string(i), node[i]);
        }
    } else {
        entries_[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it != watchers_.end()) {
            callbacks = it->second;
        }
    }
    for (auto& cb : callbacks) {
        cb(key);
    }
}

}  // namespace afc::foundation
