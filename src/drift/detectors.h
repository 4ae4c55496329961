#pragma once

/// @file detectors.h
/// @brief Threshold-based drift decisions, one per metric

#include <absl/status/statusor.h>

#include "drift/detection.h"
#include "drift/metric.h"

namespace driftguard::drift {

/// @brief Flag drift when the PSI value is strictly above the threshold
/// @param psi_value PSI metric value
/// @param threshold Detection threshold (> 0)
absl::StatusOr<DetectionRecord> DetectPsiDrift(double psi_value, double threshold);

/// @brief Flag drift when the KS statistic is strictly above the threshold
///
/// The p-value is carried through for auditing but does not affect the decision.
absl::StatusOr<DetectionRecord> DetectKsDrift(double statistic, double p_value,
                                              double threshold);

/// @brief Flag drift when the chi-square p-value is strictly below the threshold
absl::StatusOr<DetectionRecord> DetectChiSquareDrift(double statistic, double p_value,
                                                     double threshold);

/// @brief Run the detector matching the result's metric
absl::StatusOr<DetectionRecord> DetectDrift(const MetricResult& result, double threshold);

}  // namespace driftguard::drift
