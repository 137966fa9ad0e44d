#pragma once

/// @file config_manager.hpp
/// @brief YAML configuration with dotted-key typed access and change watchers.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "nsim/foundation/game_result.hpp"

namespace nsim::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML-backed configuration for a simulation run.
///
/// The document is flattened into dotted keys ("game.total_days",
/// "saves.directory") so lookups never walk yaml-cpp nodes by reference.
///
/// Example:
/// @code
///   ConfigManager config;
///   if (!config.load("config/nsim.yaml")) { ... }
///   auto days = config.getOr<int>("game.total_days", 9);
/// @endcode
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing any previous entries.
    GameResult<void> load(const std::filesystem::path& path);

    /// Load configuration from YAML text, replacing any previous entries.
    GameResult<void> loadFromString(std::string_view yaml);

    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    GameResult<T> get(std::string_view key) const;

    /// The value at @p key, or @p fallback when missing or mistyped.
    template <typename T>
    T getOr(std::string_view key, T fallback) const {
        auto result = get<T>(key);
        return result.hasValue() ? result.value() : fallback;
    }

    /// Set a value and notify watchers registered for @p key.
    template <typename T>
    void set(std::string_view key, const T& value);

    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    GameResult<void> loadRoot(const YAML::Node& root);

    void flatten(const std::string& prefix, const YAML::Node& node);

    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
GameResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigKeyNotFound,
                      std::string("config key not found: ") + std::string(key)));
    }
    try {
        return GameResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigTypeMismatch,
                      std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace nsim::foundation
