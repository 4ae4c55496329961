#include "drift/threshold_resolver.h"

#include <string>

#include <absl/strings/str_cat.h>
#include <yaml-cpp/yaml.h>

#include "common/error.h"
#include "common/logging.h"

namespace driftguard::drift {

namespace {

absl::StatusOr<double> ReadThreshold(const YAML::Node& node, absl::string_view where) {
    if (!node.IsScalar()) {
        return TypeError(absl::StrCat(where, " must be a number"));
    }
    try {
        return node.as<double>();
    } catch (const YAML::BadConversion&) {
        return TypeError(absl::StrCat(where, " must be a number, got '",
                                      node.Scalar(), "'"));
    }
}

}  // namespace

absl::StatusOr<double> ResolveThreshold(const Config& config,
                                        absl::string_view metric,
                                        absl::string_view feature) {
    // Node-by-node lookup: feature names may contain dots
    const YAML::Node& root = config.GetNode();
    const YAML::Node metrics = root.IsMap() ? root["metrics"] : YAML::Node();
    if (!metrics || !metrics.IsMap()) {
        return ValidationError("metrics configuration is required");
    }

    const std::string metric_key(metric);
    const YAML::Node metric_config = metrics[metric_key];
    if (!metric_config || !metric_config.IsMap()) {
        return ValidationError(absl::StrCat("metric '", metric, "' is not configured"));
    }

    const YAML::Node overrides = metric_config["feature_thresholds"];
    if (overrides && overrides.IsMap()) {
        const YAML::Node feature_threshold = overrides[std::string(feature)];
        if (feature_threshold) {
            DRIFTGUARD_LOG_DEBUG("Using feature threshold for {}.{}", metric_key,
                                 std::string(feature));
            return ReadThreshold(feature_threshold,
                                 absl::StrCat("feature threshold for '", feature, "'"));
        }
    }

    const YAML::Node default_threshold = metric_config["default_threshold"];
    if (!default_threshold || default_threshold.IsNull()) {
        return ValidationError(
            absl::StrCat("default_threshold is required for metric '", metric, "'"));
    }
    return ReadThreshold(default_threshold, "default_threshold");
}

}  // namespace driftguard::drift
