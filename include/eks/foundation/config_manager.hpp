#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed, dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "eks/foundation/service_result.hpp"

namespace eks::foundation {

/// YAML configuration manager.
///
/// Loads a YAML document and flattens it into dotted keys
/// (e.g. "server.port"), which keeps yaml-cpp's reference-semantic nodes
/// out of the lookup path.
///
/// Example:
/// @code
///   ConfigManager config;
///   config.load("keyserver.yaml");
///   auto port = config.getOr<int>("server.port", 3030);
/// @endcode
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing any loaded entries.
    /// @return Success or ConfigLoadFailed.
    ServiceResult<void> load(const std::filesystem::path& path);

    /// Load configuration from YAML text, replacing any loaded entries.
    ServiceResult<void> loadFromString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value, ConfigKeyNotFound or ConfigTypeMismatch.
    template <typename T>
    ServiceResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, or @p fallback when the key is absent.
    /// A present value of the wrong type is still reported as an error.
    template <typename T>
    ServiceResult<T> getOr(std::string_view key, T fallback) const;

    /// Set a value by dotted key.
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    using EntryMap = std::unordered_map<std::string, YAML::Node>;

    /// Throws YAML::Exception for a map key that is not a scalar.
    static void flatten(const std::string& prefix, const YAML::Node& node, EntryMap& out);

    mutable std::mutex mutex_;
    EntryMap entries_;
};

// --- Template implementations ---

template <typename T>
ServiceResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return ServiceResult<T>::err(
            ServiceError(ErrorCode::ConfigKeyNotFound,
                         std::string("config key not found: ") + std::string(key)));
    }
    try {
        return ServiceResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return ServiceResult<T>::err(
            ServiceError(ErrorCode::ConfigTypeMismatch,
                         std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
ServiceResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    auto result = get<T>(key);
    if (result.hasError() && result.error().code() == ErrorCode::ConfigKeyNotFound) {
        return ServiceResult<T>::ok(std::move(fallback));
    }
    return result;
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

}  // namespace eks::foundation
