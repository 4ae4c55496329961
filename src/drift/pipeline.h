#pragma once

/// @file pipeline.h
/// @brief End-to-end drift check: metric, detection, alerting, report

#include <map>
#include <string>
#include <vector>

#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>
#include <nlohmann/json.hpp>

#include "alerting/alert_generator.h"
#include "data/table.h"
#include "drift/detection.h"
#include "drift/metric.h"

namespace driftguard::drift {

/// @brief Row counts of the compared tables
struct WindowSizes {
    size_t reference_size = 0;
    size_t current_size = 0;
};

/// @brief Outcome of one pipeline run
struct PipelineReport {
    bool drift_detected = false;

    /// Zero or one alert
    std::vector<alerting::Alert> alerts;

    /// Metric tag -> result
    std::map<std::string, MetricResult> metrics;

    WindowSizes window;
};

/// @brief Serialize to {drift_detected, alerts, metrics, window}
nlohmann::json PipelineReportToJson(const PipelineReport& report);

/// @brief Compare the first column of two tables with one drift metric
///
/// Runs the metric calculator, the matching detector and the alert generator
/// in that order. Any failure aborts the run; there is no partial report.
///
/// @param reference_table Baseline data (first column is compared)
/// @param current_table Data to check (first column is compared)
/// @param feature_type Declared kind of the feature; a mismatch with the
///        metric is logged, the metric's own type check decides
/// @param metric "psi", "ks" or "chi_square"
/// @param threshold Detection threshold (> 0)
absl::StatusOr<PipelineReport> RunDriftPipeline(const data::Table& reference_table,
                                                const data::Table& current_table,
                                                FeatureType feature_type,
                                                absl::string_view metric,
                                                double threshold);

}  // namespace driftguard::drift
