#pragma once

/// @file detection.h
/// @brief Normalized output of a drift detector

#include <optional>
#include <variant>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "drift/metric.h"

namespace driftguard::drift {

/// @brief Score carried by a PSI detection
struct ValueScore {
    double value = 0.0;
};

/// @brief Score carried by a hypothesis-test detection (KS, Chi-square)
///
/// Both fields are optional because records decoded from external mappings
/// may carry only one of them.
struct TestScore {
    std::optional<double> statistic;
    std::optional<double> p_value;
};

using DetectionScore = std::variant<ValueScore, TestScore>;

/// @brief Result of comparing a metric against its threshold
struct DetectionRecord {
    bool drift_detected = false;
    Metric metric = Metric::kPsi;

    /// Exactly the threshold the detector was called with
    double threshold = 0.0;

    DetectionScore score = ValueScore{};

    /// Additional diagnostic fields, passed through to alert details verbatim
    nlohmann::json extras = nlohmann::json::object();
};

/// @brief Serialize to {drift_detected, metric, threshold, value | statistic, p_value, ...extras}
nlohmann::json DetectionRecordToJson(const DetectionRecord& record);

/// @brief Decode a detector-output mapping
///
/// - not an object (including null): type error
/// - missing `drift_detected` / `metric`: validation error naming the key
/// - unrecognized metric tag: validation error
/// - `value` present: ValueScore; otherwise `statistic` / `p_value`: TestScore
/// - `threshold` defaults to 0 when absent
/// - every other key is kept in `extras`
absl::StatusOr<DetectionRecord> DetectionRecordFromJson(const nlohmann::json& json);

}  // namespace driftguard::drift
