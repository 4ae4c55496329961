#pragma once

/// @file error.h
/// @brief DriftGuard error handling utilities using absl::Status

#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/string_view.h>

namespace driftguard {

/// @brief Error codes specific to DriftGuard
///
/// Every status produced by DriftGuard carries one of these codes as a
/// payload, so callers can tell a bad argument value from a bad data kind
/// even though both surface as absl::StatusCode::kInvalidArgument.
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kFailedPrecondition,
    kInternal,
    kUnavailable,

    // DriftGuard-specific error codes
    kValidationError,   ///< Bad argument value (empty sample, bad threshold, ...)
    kTypeError,         ///< Wrong data kind for the requested operation
    kParseError,        ///< Malformed input file
    kConfigurationError,
};

/// @brief Payload type URL under which the ErrorCode is stored
inline constexpr absl::string_view kErrorCodePayloadUrl =
    "type.driftguard.dev/driftguard.ErrorCode";

/// @brief Convert DriftGuard error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Name of an error code, as stored in the status payload
absl::string_view ErrorCodeToString(ErrorCode code);

/// @brief Create an OK status
inline absl::Status OkStatus() {
    return absl::OkStatus();
}

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, absl::string_view message);

/// @brief Recover the DriftGuard error code from a status
///
/// Statuses without a DriftGuard payload are classified from their absl code.
ErrorCode GetErrorCode(const absl::Status& status);

/// @brief Create a validation error (bad argument value)
inline absl::Status ValidationError(absl::string_view message) {
    return MakeError(ErrorCode::kValidationError, message);
}

/// @brief Create a type error (wrong data kind)
inline absl::Status TypeError(absl::string_view message) {
    return MakeError(ErrorCode::kTypeError, message);
}

inline bool IsValidationError(const absl::Status& status) {
    return GetErrorCode(status) == ErrorCode::kValidationError;
}

inline bool IsTypeError(const absl::Status& status) {
    return GetErrorCode(status) == ErrorCode::kTypeError;
}

/// @brief Create an internal error
inline absl::Status InternalError(absl::string_view message) {
    return MakeError(ErrorCode::kInternal, message);
}

/// @brief Create a not found error
inline absl::Status NotFoundError(absl::string_view message) {
    return MakeError(ErrorCode::kNotFound, message);
}

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define DRIFTGUARD_RETURN_IF_ERROR(expr)                                        \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define DRIFTGUARD_ASSIGN_OR_RETURN(lhs, rhs)                                   \
    DRIFTGUARD_ASSIGN_OR_RETURN_IMPL(                                           \
        DRIFTGUARD_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define DRIFTGUARD_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                    \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define DRIFTGUARD_CONCAT(a, b) DRIFTGUARD_CONCAT_IMPL(a, b)
#define DRIFTGUARD_CONCAT_IMPL(a, b) a##b

/// @brief Check condition and return error if false
#define DRIFTGUARD_CHECK_OR_RETURN(condition, error_status)                     \
    do {                                                                        \
        if (!(condition)) {                                                     \
            return (error_status);                                              \
        }                                                                       \
    } while (0)

}  // namespace driftguard
