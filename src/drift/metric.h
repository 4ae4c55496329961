#pragma once

/// @file metric.h
/// @brief Drift metric tags and metric result types

#include <string>
#include <variant>

#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>
#include <nlohmann/json.hpp>

namespace driftguard::drift {

/// @brief Recognized drift metrics
enum class Metric {
    kPsi,        ///< Population Stability Index (numerical)
    kKs,         ///< Two-sample Kolmogorov-Smirnov test (numerical)
    kChiSquare   ///< Chi-square test of independence (categorical)
};

/// @brief Convert metric to its wire tag ("psi", "ks", "chi_square")
absl::string_view MetricToString(Metric metric);

/// @brief Parse a metric tag
/// @return Metric, or validation error "unsupported metric: <name>"
absl::StatusOr<Metric> ParseMetric(absl::string_view name);

/// @brief Declared kind of the compared feature
enum class FeatureType {
    kNumerical,
    kCategorical
};

absl::string_view FeatureTypeToString(FeatureType type);

/// @brief Parse "numerical" or "categorical"
absl::StatusOr<FeatureType> ParseFeatureType(absl::string_view name);

/// @brief Feature type a metric operates on
FeatureType ExpectedFeatureType(Metric metric);

/// @brief PSI metric output
struct PsiResult {
    double value = 0.0;

    bool operator==(const PsiResult& other) const { return value == other.value; }
};

/// @brief Kolmogorov-Smirnov test output
struct KsResult {
    double statistic = 0.0;
    double p_value = 1.0;

    bool operator==(const KsResult& other) const {
        return statistic == other.statistic && p_value == other.p_value;
    }
};

/// @brief Chi-square test output
struct ChiSquareResult {
    double statistic = 0.0;
    double p_value = 1.0;

    bool operator==(const ChiSquareResult& other) const {
        return statistic == other.statistic && p_value == other.p_value;
    }
};

/// @brief Result of one metric computation, tagged by metric
using MetricResult = std::variant<PsiResult, KsResult, ChiSquareResult>;

/// @brief Metric that produced a result
Metric MetricOf(const MetricResult& result);

/// @brief Serialize: a bare number for PSI, {statistic, p_value} otherwise
nlohmann::json MetricResultToJson(const MetricResult& result);

}  // namespace driftguard::drift
