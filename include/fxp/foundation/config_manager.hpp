#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration management with typed, dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "fxp/foundation/game_result.hpp"

namespace fxp::foundation {

/// YAML-based configuration manager providing typed access to config values.
///
/// Loads a file or an in-memory document, flattens mappings into dotted
/// keys (e.g. "ingest.poll_interval_ms") and keeps sequences and scalars as
/// leaf nodes. The document order of keys is preserved for childKeys().
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file.
    /// @return Success or ConfigLoadFailed error.
    GameResult<void> load(const std::filesystem::path& path);

    /// Load configuration from YAML text.
    GameResult<void> loadString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    GameResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, or @p fallback when the key is absent.
    /// A present key of the wrong type is still an error.
    template <typename T>
    GameResult<T> getOr(std::string_view key, T fallback) const;

    /// Set a value by dotted key.
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Direct children of a mapping key, in document order.
    /// childKeys("progression.xp_awards") -> {"KILL", "HEADSHOT", ...}
    [[nodiscard]] std::vector<std::string> childKeys(std::string_view prefix) const;

private:
    GameResult<void> replace(const YAML::Node& root);
    void flatten(const std::string& prefix, const YAML::Node& node);
    void store(const std::string& key, YAML::Node node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::vector<std::string> order_;
};

// --- Template implementations ---

template <typename T>
GameResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigKeyNotFound, "config key not found", std::string(key)));
    }
    try {
        return GameResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigTypeMismatch, "value has the wrong type", std::string(key)));
    }
}

template <typename T>
GameResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return GameResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    store(std::string(key), YAML::Node(value));
}

} // namespace fxp::foundation
