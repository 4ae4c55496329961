#include "drift/windows.h"

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace driftguard::drift {

absl::StatusOr<Windows> GetWindows(const data::Table& table,
                                   int64_t reference_size,
                                   int64_t current_size) {
    DRIFTGUARD_CHECK_OR_RETURN(reference_size > 0,
                               ValidationError("reference_size must be greater than 0"));
    DRIFTGUARD_CHECK_OR_RETURN(current_size > 0,
                               ValidationError("current_size must be greater than 0"));

    const auto data_size = static_cast<int64_t>(table.NumRows());
    if (reference_size > data_size) {
        return ValidationError(absl::StrCat("reference_size (", reference_size,
                                            ") exceeds data size (", data_size, ")"));
    }
    if (current_size > data_size) {
        return ValidationError(absl::StrCat("current_size (", current_size,
                                            ") exceeds data size (", data_size, ")"));
    }

    Windows windows;
    windows.reference = table.Slice(0, static_cast<size_t>(reference_size));
    windows.current = table.Slice(static_cast<size_t>(data_size - current_size),
                                  static_cast<size_t>(current_size));

    DRIFTGUARD_LOG_DEBUG("Windows: reference rows [0, {}), current rows [{}, {})",
                         reference_size, data_size - current_size, data_size);
    return windows;
}

}  // namespace driftguard::drift
