/// @file detectors.cpp
/// @brief Drift detector implementations

#include "drift/detectors.h"

#include "common/error.h"
#include "common/logging.h"

namespace driftguard::drift {

namespace {

absl::Status ValidateThreshold(double threshold) {
    // Negated comparison also rejects NaN
    if (!(threshold > 0.0)) {
        return ValidationError("threshold must be greater than 0");
    }
    return absl::OkStatus();
}

DetectionRecord MakeTestRecord(Metric metric, bool drift_detected, double statistic,
                               double p_value, double threshold) {
    DetectionRecord record;
    record.drift_detected = drift_detected;
    record.metric = metric;
    record.threshold = threshold;
    record.score = TestScore{statistic, p_value};
    return record;
}

}  // namespace

absl::StatusOr<DetectionRecord> DetectPsiDrift(double psi_value, double threshold) {
    DRIFTGUARD_RETURN_IF_ERROR(ValidateThreshold(threshold));

    DetectionRecord record;
    record.drift_detected = psi_value > threshold;
    record.metric = Metric::kPsi;
    record.threshold = threshold;
    record.score = ValueScore{psi_value};

    DRIFTGUARD_LOG_DEBUG("PSI detection: value={:.6f}, threshold={:.6f}, drifted={}",
                         psi_value, threshold, record.drift_detected);
    return record;
}

absl::StatusOr<DetectionRecord> DetectKsDrift(double statistic, double p_value,
                                              double threshold) {
    DRIFTGUARD_RETURN_IF_ERROR(ValidateThreshold(threshold));

    const bool drifted = statistic > threshold;
    DRIFTGUARD_LOG_DEBUG("KS detection: statistic={:.6f}, threshold={:.6f}, drifted={}",
                         statistic, threshold, drifted);
    return MakeTestRecord(Metric::kKs, drifted, statistic, p_value, threshold);
}

absl::StatusOr<DetectionRecord> DetectChiSquareDrift(double statistic, double p_value,
                                                     double threshold) {
    DRIFTGUARD_RETURN_IF_ERROR(ValidateThreshold(threshold));

    // A low p-value signals divergence, so the comparison runs the other way
    const bool drifted = p_value < threshold;
    DRIFTGUARD_LOG_DEBUG("Chi-square detection: p_value={:.6f}, threshold={:.6f}, "
                         "drifted={}", p_value, threshold, drifted);
    return MakeTestRecord(Metric::kChiSquare, drifted, statistic, p_value, threshold);
}

absl::StatusOr<DetectionRecord> DetectDrift(const MetricResult& result, double threshold) {
    if (const auto* psi = std::get_if<PsiResult>(&result)) {
        return DetectPsiDrift(psi->value, threshold);
    }
    if (const auto* ks = std::get_if<KsResult>(&result)) {
        return DetectKsDrift(ks->statistic, ks->p_value, threshold);
    }
    const auto& chi = std::get<ChiSquareResult>(result);
    return DetectChiSquareDrift(chi.statistic, chi.p_value, threshold);
}

}  // namespace driftguard::drift
