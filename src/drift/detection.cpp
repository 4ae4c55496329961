/// @file detection.cpp
/// @brief DetectionRecord serialization

#include "drift/detection.h"

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace driftguard::drift {

using json = nlohmann::json;

namespace {

absl::StatusOr<double> ReadNumber(const json& object, const char* key) {
    const json& value = object.at(key);
    if (!value.is_number()) {
        return TypeError(absl::StrCat(key, " must be a number"));
    }
    return value.get<double>();
}

}  // namespace

json DetectionRecordToJson(const DetectionRecord& record) {
    json out = record.extras.is_object() ? record.extras : json::object();
    out["drift_detected"] = record.drift_detected;
    out["metric"] = std::string(MetricToString(record.metric));
    out["threshold"] = record.threshold;

    if (const auto* value_score = std::get_if<ValueScore>(&record.score)) {
        out["value"] = value_score->value;
    } else {
        const auto& test_score = std::get<TestScore>(record.score);
        if (test_score.statistic.has_value()) {
            out["statistic"] = *test_score.statistic;
        }
        if (test_score.p_value.has_value()) {
            out["p_value"] = *test_score.p_value;
        }
    }
    return out;
}

absl::StatusOr<DetectionRecord> DetectionRecordFromJson(const json& input) {
    if (!input.is_object()) {
        return TypeError("detector_output must be a mapping");
    }
    if (!input.contains("drift_detected")) {
        return ValidationError("drift_detected key is required");
    }
    if (!input.contains("metric")) {
        return ValidationError("metric key is required");
    }

    const json& drift_detected = input.at("drift_detected");
    if (!drift_detected.is_boolean()) {
        return TypeError("drift_detected must be a boolean");
    }
    const json& metric_tag = input.at("metric");
    if (!metric_tag.is_string()) {
        return TypeError("metric must be a string");
    }

    DetectionRecord record;
    record.drift_detected = drift_detected.get<bool>();
    DRIFTGUARD_ASSIGN_OR_RETURN(record.metric,
                                ParseMetric(metric_tag.get<std::string>()));

    if (input.contains("threshold")) {
        DRIFTGUARD_ASSIGN_OR_RETURN(record.threshold, ReadNumber(input, "threshold"));
    }

    json extras = input;
    extras.erase("drift_detected");
    extras.erase("metric");
    extras.erase("threshold");

    if (input.contains("value")) {
        DRIFTGUARD_ASSIGN_OR_RETURN(double value, ReadNumber(input, "value"));
        record.score = ValueScore{value};
        extras.erase("value");
    } else {
        TestScore score;
        if (input.contains("statistic")) {
            DRIFTGUARD_ASSIGN_OR_RETURN(score.statistic, ReadNumber(input, "statistic"));
            extras.erase("statistic");
        }
        if (input.contains("p_value")) {
            DRIFTGUARD_ASSIGN_OR_RETURN(score.p_value, ReadNumber(input, "p_value"));
            extras.erase("p_value");
        }
        record.score = score;
    }

    record.extras = std::move(extras);
    return record;
}

}  // namespace driftguard::drift
