#pragma once

/// @file config.h
/// @brief DriftGuard configuration management

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>
#include <yaml-cpp/yaml.h>

namespace driftguard {

/// @brief Configuration manager for loading and accessing configuration
///
/// Example layout:
/// @code
///   logging:
///     level: info
///     file: /var/log/driftguard.log
///   metrics:
///     psi:
///       default_threshold: 0.1
///       feature_thresholds:
///         income: 0.2
/// @endcode
class Config {
public:
    /// @brief Default constructor creates empty configuration
    Config() = default;

    /// @brief Load configuration from a YAML file
    /// @param path Path to the YAML configuration file
    /// @return Loaded configuration or NotFound / InvalidArgument
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Load configuration from a YAML string
    /// @param yaml_content YAML content as a string
    static absl::StatusOr<Config> LoadFromString(absl::string_view yaml_content);

    /// @brief Load configuration from environment variables with a prefix
    /// @param prefix Environment variable prefix (e.g., "DRIFTGUARD_")
    static Config LoadFromEnvironment(absl::string_view prefix = "DRIFTGUARD_");

    /// @brief Load an optional file and overlay environment variables
    /// @param path Configuration file, or nullopt for environment only
    /// @param env_prefix Environment variable prefix
    static absl::StatusOr<Config> LoadWithEnvironment(
        const std::optional<std::filesystem::path>& path,
        absl::string_view env_prefix = "DRIFTGUARD_");

    /// @brief Merge another configuration into this one (other takes precedence)
    void Merge(const Config& other);

    /// @brief Get a string value
    /// @param key Configuration key (supports dot notation, e.g., "logging.level")
    /// @param default_value Default value if key not found
    std::string GetString(absl::string_view key, absl::string_view default_value = "") const;

    /// @brief Get an integer value; non-integer scalars yield the default
    int64_t GetInt(absl::string_view key, int64_t default_value = 0) const;

    /// @brief Check if a key exists
    bool HasKey(absl::string_view key) const;

    /// @brief Set a scalar value, creating intermediate maps
    void Set(absl::string_view key, absl::string_view value);

    /// @brief Get the underlying YAML node for advanced access
    const YAML::Node& GetNode() const { return root_; }

private:
    YAML::Node root_;

    /// @brief Navigate to a nested node using dot notation
    std::optional<YAML::Node> GetNestedNode(absl::string_view key) const;
};

}  // namespace driftguard
