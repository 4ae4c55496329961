/// @file alert_generator.cpp
/// @brief Alert generator implementation

#include "alerting/alert_generator.h"

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace driftguard::alerting {

namespace {

struct SeverityValueVisitor {
    double operator()(const drift::ValueScore& score) const { return score.value; }

    double operator()(const drift::TestScore& score) const {
        if (score.statistic.has_value()) {
            return *score.statistic;
        }
        // No statistic to grade with; a bare p-value grades as zero
        return 0.0;
    }
};

}  // namespace

absl::string_view AlertSeverityToString(AlertSeverity severity) {
    switch (severity) {
        case AlertSeverity::kWarning: return "warning";
        case AlertSeverity::kCritical: return "critical";
        default: return "unknown";
    }
}

nlohmann::json AlertToJson(const Alert& alert) {
    return {
        {"alert", true},
        {"severity", std::string(AlertSeverityToString(alert.severity))},
        {"metric", std::string(drift::MetricToString(alert.metric))},
        {"message", alert.message},
        {"details", alert.details},
    };
}

double SeverityValue(const drift::DetectionScore& score) {
    return std::visit(SeverityValueVisitor{}, score);
}

AlertSeverity ClassifySeverity(double value, double threshold) {
    return value <= 2.0 * threshold ? AlertSeverity::kWarning : AlertSeverity::kCritical;
}

std::optional<Alert> GenerateAlert(const drift::DetectionRecord& record) {
    if (!record.drift_detected) {
        return std::nullopt;
    }

    Alert alert;
    alert.metric = record.metric;
    alert.severity = ClassifySeverity(SeverityValue(record.score), record.threshold);
    alert.message = absl::StrCat("Drift detected using ",
                                 drift::MetricToString(record.metric), " metric");

    alert.details = drift::DetectionRecordToJson(record);
    alert.details.erase("drift_detected");

    DRIFTGUARD_LOG_INFO("{} alert: {}", std::string(AlertSeverityToString(alert.severity)),
                        alert.message);
    return alert;
}

absl::StatusOr<std::optional<Alert>> GenerateAlert(const nlohmann::json& detector_output) {
    DRIFTGUARD_ASSIGN_OR_RETURN(drift::DetectionRecord record,
                                drift::DetectionRecordFromJson(detector_output));
    std::optional<Alert> alert = GenerateAlert(record);
    if (alert.has_value()) {
        // Details echo the caller's mapping, not the decoded record with defaults
        alert->details = detector_output;
        alert->details.erase("drift_detected");
    }
    return alert;
}

}  // namespace driftguard::alerting
