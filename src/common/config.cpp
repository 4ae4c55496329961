#include "common/config.h"

#include <cstdlib>
#include <functional>
#include <vector>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "common/error.h"
#include "common/logging.h"

namespace driftguard {

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return NotFoundError(
            absl::StrCat("Configuration file not found: ", path.string()));
    }

    try {
        Config config;
        config.root_ = YAML::LoadFile(path.string());
        return config;
    } catch (const YAML::Exception& e) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("Failed to parse YAML configuration: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(absl::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
}

Config Config::LoadFromEnvironment(absl::string_view prefix) {
    Config config;

    auto get_env = [&prefix](const char* suffix) -> std::optional<std::string> {
        std::string key = std::string(prefix) + suffix;
        const char* value = std::getenv(key.c_str());
        if (value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    };

    if (auto val = get_env("LOG_LEVEL")) {
        config.Set("logging.level", *val);
    }
    if (auto val = get_env("LOG_FILE")) {
        config.Set("logging.file", *val);
    }
    if (auto val = get_env("METRIC")) {
        config.Set("pipeline.metric", *val);
    }
    if (auto val = get_env("FEATURE_TYPE")) {
        config.Set("pipeline.feature_type", *val);
    }

    return config;
}

absl::StatusOr<Config> Config::LoadWithEnvironment(
    const std::optional<std::filesystem::path>& path,
    absl::string_view env_prefix) {

    Config config;

    if (path.has_value()) {
        auto file_config = LoadFromFile(*path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        config.Merge(*file_config);
        DRIFTGUARD_LOG_DEBUG("Loaded configuration from {}", path->string());
    }

    // Environment variables have the highest priority
    config.Merge(LoadFromEnvironment(env_prefix));
    return config;
}

void Config::Merge(const Config& other) {
    // Deep merge YAML nodes
    std::function<void(YAML::Node&, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node& base, const YAML::Node& overlay) {
        if (overlay.IsMap()) {
            for (const auto& kv : overlay) {
                const std::string key = kv.first.as<std::string>();
                if (base[key] && base[key].IsMap() && kv.second.IsMap()) {
                    YAML::Node base_child = base[key];
                    merge_nodes(base_child, kv.second);
                } else {
                    base[key] = kv.second;
                }
            }
        }
    };

    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(absl::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(key, '.');
    YAML::Node current = root_;

    for (const auto& part : parts) {
        if (!current || !current.IsMap()) {
            return std::nullopt;
        }
        // Const lookup so missing keys are not inserted into the tree
        const YAML::Node& view = current;
        current.reset(view[part]);
    }

    if (!current || current.IsNull()) {
        return std::nullopt;
    }

    return current;
}

std::string Config::GetString(absl::string_view key, absl::string_view default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        return node->as<std::string>();
    }
    return std::string(default_value);
}

int64_t Config::GetInt(absl::string_view key, int64_t default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<int64_t>();
        } catch (const YAML::BadConversion&) {
            return default_value;
        }
    }
    return default_value;
}

bool Config::HasKey(absl::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(absl::string_view key, absl::string_view value) {
    std::vector<std::string> parts = absl::StrSplit(key, '.');

    // Node assignment writes through the handle, so rebind with reset()
    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }
    YAML::Node current = root_;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!current[parts[i]] || !current[parts[i]].IsMap()) {
            current[parts[i]] = YAML::Node(YAML::NodeType::Map);
        }
        current.reset(current[parts[i]]);
    }

    current[parts.back()] = std::string(value);
}

}  // namespace driftguard
