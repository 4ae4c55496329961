/// @file metric.cpp
/// @brief Metric tag conversions and result serialization

#include "drift/metric.h"

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace driftguard::drift {

absl::string_view MetricToString(Metric metric) {
    switch (metric) {
        case Metric::kPsi: return "psi";
        case Metric::kKs: return "ks";
        case Metric::kChiSquare: return "chi_square";
        default: return "unknown";
    }
}

absl::StatusOr<Metric> ParseMetric(absl::string_view name) {
    if (name == "psi") {
        return Metric::kPsi;
    }
    if (name == "ks") {
        return Metric::kKs;
    }
    if (name == "chi_square") {
        return Metric::kChiSquare;
    }
    return ValidationError(absl::StrCat("unsupported metric: ", name));
}

absl::string_view FeatureTypeToString(FeatureType type) {
    switch (type) {
        case FeatureType::kNumerical: return "numerical";
        case FeatureType::kCategorical: return "categorical";
        default: return "unknown";
    }
}

absl::StatusOr<FeatureType> ParseFeatureType(absl::string_view name) {
    if (name == "numerical") {
        return FeatureType::kNumerical;
    }
    if (name == "categorical") {
        return FeatureType::kCategorical;
    }
    return ValidationError(absl::StrCat("unsupported feature type: ", name));
}

FeatureType ExpectedFeatureType(Metric metric) {
    return metric == Metric::kChiSquare ? FeatureType::kCategorical
                                        : FeatureType::kNumerical;
}

namespace {

struct MetricOfVisitor {
    Metric operator()(const PsiResult&) const { return Metric::kPsi; }
    Metric operator()(const KsResult&) const { return Metric::kKs; }
    Metric operator()(const ChiSquareResult&) const { return Metric::kChiSquare; }
};

struct ToJsonVisitor {
    nlohmann::json operator()(const PsiResult& r) const { return r.value; }
    nlohmann::json operator()(const KsResult& r) const {
        return {{"statistic", r.statistic}, {"p_value", r.p_value}};
    }
    nlohmann::json operator()(const ChiSquareResult& r) const {
        return {{"statistic", r.statistic}, {"p_value", r.p_value}};
    }
};

}  // namespace

Metric MetricOf(const MetricResult& result) {
    return std::visit(MetricOfVisitor{}, result);
}

nlohmann::json MetricResultToJson(const MetricResult& result) {
    return std::visit(ToJsonVisitor{}, result);
}

}  // namespace driftguard::drift
