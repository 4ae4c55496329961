#pragma once

/// @file alert_generator.h
/// @brief Turns drift detections into severity-tagged alerts

#include <optional>
#include <string>

#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>
#include <nlohmann/json.hpp>

#include "drift/detection.h"

namespace driftguard::alerting {

/// @brief Alert severity levels
enum class AlertSeverity {
    kWarning,   ///< Score within twice the threshold
    kCritical   ///< Score beyond twice the threshold
};

/// @brief Convert severity to string ("warning", "critical")
absl::string_view AlertSeverityToString(AlertSeverity severity);

/// @brief Alert produced for a positive drift detection
///
/// Alerts are produced per pipeline run and never merged across runs.
struct Alert {
    AlertSeverity severity = AlertSeverity::kWarning;
    drift::Metric metric = drift::Metric::kPsi;
    std::string message;

    /// The detection record without its drift_detected flag
    nlohmann::json details = nlohmann::json::object();
};

/// @brief Serialize to {alert: true, severity, metric, message, details}
nlohmann::json AlertToJson(const Alert& alert);

/// @brief Value compared against the threshold to grade severity
///
/// PSI detections use their value and test detections their statistic. A
/// test detection that carries only a p-value grades as 0.
double SeverityValue(const drift::DetectionScore& score);

/// @brief Grade a severity value: warning iff value <= 2 * threshold
AlertSeverity ClassifySeverity(double value, double threshold);

/// @brief Build an alert for a detection record
/// @return Alert when drift was detected, std::nullopt otherwise
std::optional<Alert> GenerateAlert(const drift::DetectionRecord& record);

/// @brief Build an alert from a detector-output mapping
///
/// The mapping is validated and decoded with drift::DetectionRecordFromJson.
/// The alert details are the mapping itself without "drift_detected"; keys
/// the mapping omits (such as "threshold") are not filled in.
/// @return Alert or std::nullopt, or the decoding error
absl::StatusOr<std::optional<Alert>> GenerateAlert(const nlohmann::json& detector_output);

}  // namespace driftguard::alerting
