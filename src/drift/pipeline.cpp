/// @file pipeline.cpp
/// @brief Drift pipeline orchestration

#include "drift/pipeline.h"

#include "common/error.h"
#include "common/logging.h"
#include "drift/detectors.h"
#include "drift/metrics.h"

namespace driftguard::drift {

using json = nlohmann::json;

json PipelineReportToJson(const PipelineReport& report) {
    json alerts = json::array();
    for (const auto& alert : report.alerts) {
        alerts.push_back(alerting::AlertToJson(alert));
    }

    json metrics = json::object();
    for (const auto& [name, result] : report.metrics) {
        metrics[name] = MetricResultToJson(result);
    }

    return {
        {"drift_detected", report.drift_detected},
        {"alerts", std::move(alerts)},
        {"metrics", std::move(metrics)},
        {"window", {
            {"reference_size", report.window.reference_size},
            {"current_size", report.window.current_size},
        }},
    };
}

absl::StatusOr<PipelineReport> RunDriftPipeline(const data::Table& reference_table,
                                                const data::Table& current_table,
                                                FeatureType feature_type,
                                                absl::string_view metric,
                                                double threshold) {
    if (reference_table.Empty()) {
        return ValidationError("reference data cannot be empty");
    }
    if (current_table.Empty()) {
        return ValidationError("current data cannot be empty");
    }
    DRIFTGUARD_ASSIGN_OR_RETURN(Metric parsed_metric, ParseMetric(metric));

    if (ExpectedFeatureType(parsed_metric) != feature_type) {
        DRIFTGUARD_LOG_WARN("{} metric expects a {} feature, but the feature is declared {}",
                            std::string(MetricToString(parsed_metric)),
                            std::string(FeatureTypeToString(ExpectedFeatureType(parsed_metric))),
                            std::string(FeatureTypeToString(feature_type)));
    }

    // One designated feature per run: the first column of each table
    const data::Column& reference_column = reference_table.ColumnAt(0);
    const data::Column& current_column = current_table.ColumnAt(0);

    DRIFTGUARD_LOG_DEBUG("Running {} drift check on '{}' ({} rows) vs '{}' ({} rows)",
                         std::string(MetricToString(parsed_metric)), reference_column.name,
                         reference_table.NumRows(), current_column.name,
                         current_table.NumRows());

    DRIFTGUARD_ASSIGN_OR_RETURN(MetricResult result,
                                CalculateMetric(parsed_metric, reference_column.values,
                                                current_column.values));
    DRIFTGUARD_ASSIGN_OR_RETURN(DetectionRecord record, DetectDrift(result, threshold));

    PipelineReport report;
    report.drift_detected = record.drift_detected;
    if (auto alert = alerting::GenerateAlert(record)) {
        report.alerts.push_back(std::move(*alert));
    }
    report.metrics.emplace(std::string(MetricToString(parsed_metric)), result);
    report.window.reference_size = reference_table.NumRows();
    report.window.current_size = current_table.NumRows();

    DRIFTGUARD_LOG_INFO("Drift check complete: metric={}, drift_detected={}, alerts={}",
                        std::string(MetricToString(parsed_metric)), report.drift_detected,
                        report.alerts.size());
    return report;
}

}  // namespace driftguard::drift
