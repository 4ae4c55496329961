#include "common/error.h"

#include <absl/strings/cord.h>

namespace driftguard {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kValidationError:
        case ErrorCode::kTypeError:
        case ErrorCode::kParseError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kFailedPrecondition:
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kInternal:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnavailable:
            return absl::StatusCode::kUnavailable;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

absl::string_view ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk: return "ok";
        case ErrorCode::kInvalidArgument: return "invalid_argument";
        case ErrorCode::kNotFound: return "not_found";
        case ErrorCode::kFailedPrecondition: return "failed_precondition";
        case ErrorCode::kInternal: return "internal";
        case ErrorCode::kUnavailable: return "unavailable";
        case ErrorCode::kValidationError: return "validation_error";
        case ErrorCode::kTypeError: return "type_error";
        case ErrorCode::kParseError: return "parse_error";
        case ErrorCode::kConfigurationError: return "configuration_error";
        case ErrorCode::kUnknown:
        default:
            return "unknown";
    }
}

absl::Status MakeError(ErrorCode code, absl::string_view message) {
    absl::Status status(ToAbslCode(code), message);
    if (!status.ok()) {
        status.SetPayload(kErrorCodePayloadUrl,
                          absl::Cord(ErrorCodeToString(code)));
    }
    return status;
}

ErrorCode GetErrorCode(const absl::Status& status) {
    if (status.ok()) {
        return ErrorCode::kOk;
    }

    auto payload = status.GetPayload(kErrorCodePayloadUrl);
    if (payload.has_value()) {
        const std::string name(*payload);
        for (ErrorCode code : {ErrorCode::kInvalidArgument, ErrorCode::kNotFound,
                               ErrorCode::kFailedPrecondition, ErrorCode::kInternal,
                               ErrorCode::kUnavailable, ErrorCode::kValidationError,
                               ErrorCode::kTypeError, ErrorCode::kParseError,
                               ErrorCode::kConfigurationError}) {
            if (ErrorCodeToString(code) == name) {
                return code;
            }
        }
    }

    switch (status.code()) {
        case absl::StatusCode::kInvalidArgument:
            return ErrorCode::kInvalidArgument;
        case absl::StatusCode::kNotFound:
            return ErrorCode::kNotFound;
        case absl::StatusCode::kFailedPrecondition:
            return ErrorCode::kFailedPrecondition;
        case absl::StatusCode::kInternal:
            return ErrorCode::kInternal;
        case absl::StatusCode::kUnavailable:
            return ErrorCode::kUnavailable;
        default:
            return ErrorCode::kUnknown;
    }
}

}  // namespace driftguard
