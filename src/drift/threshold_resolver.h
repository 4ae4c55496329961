#pragma once

/// @file threshold_resolver.h
/// @brief Per-metric and per-feature threshold lookup from configuration

#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>

#include "common/config.h"

namespace driftguard::drift {

/// @brief Resolve the drift threshold for a metric and feature
///
/// Resolution order:
/// 1. metrics.<metric>.feature_thresholds.<feature>
/// 2. metrics.<metric>.default_threshold
///
/// @return Threshold, validation error when the metric or its default is not
///         configured, type error for a non-numeric value
absl::StatusOr<double> ResolveThreshold(const Config& config,
                                        absl::string_view metric,
                                        absl::string_view feature);

}  // namespace driftguard::drift
