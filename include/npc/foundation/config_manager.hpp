#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration management with typed access and watch support.

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "npc/foundation/npc_result.hpp"

namespace npc::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML configuration with dotted-key typed access
/// (e.g. "memory.decay.normal.grace_turns").
///
/// The YAML tree is flattened into a key-value map on load, so lookups
/// never walk yaml-cpp's reference-semantic node graph.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed error.
    NpcResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    NpcResult<void> loadFromString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    NpcResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, or @p fallback when the key is missing or
    /// holds a value of another type.
    template <typename T>
    T getOr(std::string_view key, T fallback) const {
        return get<T>(key).valueOr(std::move(fallback));
    }

    /// Set a value by dotted key and notify watchers of that key.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Register a callback that fires when the given key changes via set().
    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    void notifyWatchers(std::string_view key);

    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
NpcResult<T> ConfigManager::get(std::string_view key) const {
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return NpcResult<T>::err(
            NpcError(ErrorCode::ConfigKeyNotFound,
                     std::string("config key not found: ") + std::string(key)));
    }
    try {
        return NpcResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return NpcResult<T>::err(
            NpcError(ErrorCode::ConfigTypeMismatch,
                     std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    entries_[std::string(key)] = YAML::Node(value);
    notifyWatchers(key);
}

} // namespace npc::foundation
