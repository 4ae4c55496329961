#pragma once

/// @file metrics.h
/// @brief Stateless drift metric calculators for DriftGuard

#include <vector>

#include <absl/status/statusor.h>

#include "data/sample.h"
#include "drift/metric.h"

namespace driftguard::drift {

/// @brief Configuration for PSI binning
struct PsiConfig {
    /// Number of equal-width bins over the reference range
    size_t num_bins = 10;

    /// Replacement for empty-bin proportions to avoid log(0)
    double epsilon = 1e-10;
};

/// @brief Population Stability Index between two numerical samples
///
/// Formula: PSI = sum((actual_% - expected_%) * ln(actual_% / expected_%))
///
/// Bins are equal-width over [min(reference), max(reference)] with the outer
/// edges opened to -inf / +inf, so current values outside the reference range
/// land in the first or last bin.
///
/// Interpretation:
/// - PSI < 0.1: No significant shift
/// - 0.1 <= PSI < 0.25: Moderate shift, investigate
/// - PSI >= 0.25: Significant shift, action required
///
/// @return PSI value, validation error for an empty side, type error for text
absl::StatusOr<double> CalculatePsi(const data::Sample& reference,
                                    const data::Sample& current,
                                    const PsiConfig& config = {});

/// @brief Two-sample Kolmogorov-Smirnov test
///
/// The statistic is the largest gap between the two empirical CDFs; the
/// p-value is the asymptotic Kolmogorov tail probability.
absl::StatusOr<KsResult> CalculateKs(const data::Sample& reference,
                                     const data::Sample& current);

/// @brief Chi-square test of independence on a 2 x k contingency table
///
/// Rows are {reference, current}, columns are the union of category labels.
/// Yates' continuity correction is applied when there is one degree of
/// freedom. Float samples are rejected; integer and text labels are accepted.
absl::StatusOr<ChiSquareResult> CalculateChiSquare(const data::Sample& reference,
                                                   const data::Sample& current);

/// @brief Compute the requested metric
absl::StatusOr<MetricResult> CalculateMetric(Metric metric,
                                             const data::Sample& reference,
                                             const data::Sample& current);

/// @brief Bin edges used by PSI for a reference range
///
/// Returns num_bins + 1 edges, the first -inf and the last +inf.
std::vector<double> BuildPsiBinEdges(double min_value, double max_value,
                                     size_t num_bins);

}  // namespace driftguard::drift
