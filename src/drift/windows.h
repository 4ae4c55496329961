#pragma once

/// @file windows.h
/// @brief Fixed-offset windowing of a table into reference and current slices

#include <cstdint>

#include <absl/status/statusor.h>

#include "data/table.h"

namespace driftguard::drift {

/// @brief Reference and current slices of one table
struct Windows {
    data::Table reference;
    data::Table current;
};

/// @brief Slice a table into reference (head) and current (tail) windows
///
/// The reference window is the first `reference_size` rows and the current
/// window the last `current_size` rows, both in original order. The windows
/// may overlap; each size only has to fit the table on its own.
///
/// @return Windows, or a validation error for non-positive or oversized sizes
absl::StatusOr<Windows> GetWindows(const data::Table& table,
                                   int64_t reference_size,
                                   int64_t current_size);

}  // namespace driftguard::drift
