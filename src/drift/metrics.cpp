/// @file metrics.cpp
/// @brief PSI, Kolmogorov-Smirnov and Chi-square metric implementations

#include "drift/metrics.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <map>
#include <string>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "drift/distributions.h"

namespace driftguard::drift {

namespace {

absl::Status ValidateNonEmpty(const data::Sample& reference,
                              const data::Sample& current) {
    if (reference.Empty()) {
        return ValidationError("reference data cannot be empty");
    }
    if (current.Empty()) {
        return ValidationError("current data cannot be empty");
    }
    return absl::OkStatus();
}

absl::Status ValidateNumerical(const data::Sample& reference,
                               const data::Sample& current,
                               absl::string_view metric_label) {
    if (!reference.IsNumerical() || !current.IsNumerical()) {
        return TypeError(absl::StrCat(metric_label,
                                      " requires numerical data, not categorical"));
    }
    return absl::OkStatus();
}

/// @brief Reject NaN and infinite values, which have no place in a bin or an ECDF
absl::Status ValidateFinite(const std::vector<double>& values, absl::string_view side) {
    for (double value : values) {
        if (!std::isfinite(value)) {
            return ValidationError(absl::StrCat(side, " data contains non-finite values"));
        }
    }
    return absl::OkStatus();
}

/// @brief Bin proportions of `values` over `bin_edges`
///
/// A value equal to an interior edge falls in the bin to its right.
std::vector<double> BinProportions(const std::vector<double>& values,
                                   const std::vector<double>& bin_edges) {
    std::vector<size_t> bin_counts(bin_edges.size() - 1, 0);

    for (double val : values) {
        auto it = std::upper_bound(bin_edges.begin(), bin_edges.end(), val);
        size_t bin_idx = static_cast<size_t>(std::distance(bin_edges.begin(), it));
        bin_idx = bin_idx == 0 ? 0 : bin_idx - 1;
        bin_idx = std::min(bin_idx, bin_counts.size() - 1);
        bin_counts[bin_idx]++;
    }

    std::vector<double> proportions(bin_counts.size());
    const double n = static_cast<double>(values.size());
    for (size_t i = 0; i < bin_counts.size(); ++i) {
        proportions[i] = static_cast<double>(bin_counts[i]) / n;
    }
    return proportions;
}

/// @brief Fraction of sorted values <= x
double EmpiricalCdf(const std::vector<double>& sorted, double x) {
    auto it = std::upper_bound(sorted.begin(), sorted.end(), x);
    return static_cast<double>(std::distance(sorted.begin(), it)) /
           static_cast<double>(sorted.size());
}

}  // namespace

// =============================================================================
// PSI
// =============================================================================

std::vector<double> BuildPsiBinEdges(double min_value, double max_value,
                                     size_t num_bins) {
    num_bins = std::max<size_t>(num_bins, 1);
    const double step = (max_value - min_value) / static_cast<double>(num_bins);

    std::vector<double> edges(num_bins + 1);
    for (size_t i = 0; i < num_bins; ++i) {
        edges[i] = min_value + static_cast<double>(i) * step;
    }
    edges[num_bins] = max_value;

    // Open the outer edges so out-of-range current values are still counted
    edges.front() = -std::numeric_limits<double>::infinity();
    edges.back() = std::numeric_limits<double>::infinity();
    return edges;
}

absl::StatusOr<double> CalculatePsi(const data::Sample& reference,
                                    const data::Sample& current,
                                    const PsiConfig& config) {
    DRIFTGUARD_RETURN_IF_ERROR(ValidateNonEmpty(reference, current));
    DRIFTGUARD_RETURN_IF_ERROR(ValidateNumerical(reference, current, "PSI"));

    DRIFTGUARD_ASSIGN_OR_RETURN(std::vector<double> ref_values, reference.AsDoubles());
    DRIFTGUARD_ASSIGN_OR_RETURN(std::vector<double> cur_values, current.AsDoubles());
    DRIFTGUARD_RETURN_IF_ERROR(ValidateFinite(ref_values, "reference"));
    DRIFTGUARD_RETURN_IF_ERROR(ValidateFinite(cur_values, "current"));

    const auto [min_it, max_it] = std::minmax_element(ref_values.begin(), ref_values.end());
    const std::vector<double> bin_edges =
        BuildPsiBinEdges(*min_it, *max_it, config.num_bins);

    const std::vector<double> ref_props = BinProportions(ref_values, bin_edges);
    const std::vector<double> cur_props = BinProportions(cur_values, bin_edges);

    double psi = 0.0;
    for (size_t i = 0; i < ref_props.size(); ++i) {
        const double expected = ref_props[i] == 0.0 ? config.epsilon : ref_props[i];
        const double actual = cur_props[i] == 0.0 ? config.epsilon : cur_props[i];
        psi += (actual - expected) * std::log(actual / expected);
    }

    DRIFTGUARD_LOG_DEBUG("PSI computed: value={:.6f}, reference_size={}, current_size={}",
                         psi, ref_values.size(), cur_values.size());
    return psi;
}

// =============================================================================
// Kolmogorov-Smirnov
// =============================================================================

absl::StatusOr<KsResult> CalculateKs(const data::Sample& reference,
                                     const data::Sample& current) {
    DRIFTGUARD_RETURN_IF_ERROR(ValidateNonEmpty(reference, current));
    DRIFTGUARD_RETURN_IF_ERROR(ValidateNumerical(reference, current, "KS test"));

    DRIFTGUARD_ASSIGN_OR_RETURN(std::vector<double> sample1, reference.AsDoubles());
    DRIFTGUARD_ASSIGN_OR_RETURN(std::vector<double> sample2, current.AsDoubles());
    DRIFTGUARD_RETURN_IF_ERROR(ValidateFinite(sample1, "reference"));
    DRIFTGUARD_RETURN_IF_ERROR(ValidateFinite(sample2, "current"));

    std::sort(sample1.begin(), sample1.end());
    std::sort(sample2.begin(), sample2.end());

    // Both CDFs only change at observed values, so the supremum is attained there
    double d = 0.0;
    for (const auto* sorted : {&sample1, &sample2}) {
        for (double x : *sorted) {
            d = std::max(d, std::abs(EmpiricalCdf(sample1, x) - EmpiricalCdf(sample2, x)));
        }
    }

    const double n1 = static_cast<double>(sample1.size());
    const double n2 = static_cast<double>(sample2.size());
    const double effective_n = n1 * n2 / (n1 + n2);

    KsResult result;
    result.statistic = d;
    result.p_value = KolmogorovSurvival(std::sqrt(effective_n) * d);

    DRIFTGUARD_LOG_DEBUG("KS computed: statistic={:.6f}, p_value={:.6f}",
                         result.statistic, result.p_value);
    return result;
}

// =============================================================================
// Chi-square
// =============================================================================

absl::StatusOr<ChiSquareResult> CalculateChiSquare(const data::Sample& reference,
                                                   const data::Sample& current) {
    DRIFTGUARD_RETURN_IF_ERROR(ValidateNonEmpty(reference, current));
    if (reference.Kind() == data::ValueKind::kFloat ||
        current.Kind() == data::ValueKind::kFloat) {
        return TypeError(
            "Chi-Square test requires categorical data, not continuous numerical");
    }

    // Ordered map gives a consistent category order within one call
    std::map<std::string, std::array<double, 2>> counts;
    for (const auto& label : reference.AsLabels()) {
        counts[label][0] += 1.0;
    }
    for (const auto& label : current.AsLabels()) {
        counts[label][1] += 1.0;
    }

    ChiSquareResult result;
    const size_t num_categories = counts.size();
    if (num_categories < 2) {
        // Zero degrees of freedom: the two rows cannot differ
        return result;
    }

    const double row_totals[2] = {static_cast<double>(reference.Size()),
                                  static_cast<double>(current.Size())};
    const double total = row_totals[0] + row_totals[1];
    const double dof = static_cast<double>(num_categories - 1);
    const bool yates = num_categories == 2;

    double chi_sq = 0.0;
    for (const auto& [label, observed] : counts) {
        const double column_total = observed[0] + observed[1];
        for (int row = 0; row < 2; ++row) {
            const double expected = row_totals[row] * column_total / total;
            double diff = observed[row] - expected;
            if (yates) {
                diff = std::copysign(std::max(std::abs(diff) - 0.5, 0.0), diff);
            }
            chi_sq += (diff * diff) / expected;
        }
    }

    result.statistic = chi_sq;
    result.p_value = ChiSquaredSurvival(chi_sq, dof);

    DRIFTGUARD_LOG_DEBUG("Chi-square computed: statistic={:.6f}, p_value={:.6f}, "
                         "categories={}", result.statistic, result.p_value,
                         num_categories);
    return result;
}

absl::StatusOr<MetricResult> CalculateMetric(Metric metric,
                                             const data::Sample& reference,
                                             const data::Sample& current) {
    switch (metric) {
        case Metric::kPsi: {
            DRIFTGUARD_ASSIGN_OR_RETURN(double value, CalculatePsi(reference, current));
            return MetricResult(PsiResult{value});
        }
        case Metric::kKs: {
            DRIFTGUARD_ASSIGN_OR_RETURN(KsResult ks, CalculateKs(reference, current));
            return MetricResult(ks);
        }
        case Metric::kChiSquare: {
            DRIFTGUARD_ASSIGN_OR_RETURN(ChiSquareResult chi,
                                        CalculateChiSquare(reference, current));
            return MetricResult(chi);
        }
    }
    return InternalError("unhandled metric");
}

}  // namespace driftguard::drift
