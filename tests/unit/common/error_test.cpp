/// @file error_test.cpp
/// @brief Tests for DriftGuard error codes and status helpers

#include <gtest/gtest.h>

#include "common/error.h"

namespace driftguard {
namespace {

absl::StatusOr<int> ParsePositive(int value) {
    DRIFTGUARD_CHECK_OR_RETURN(value > 0, ValidationError("value must be positive"));
    return value;
}

absl::StatusOr<int> Doubled(int value) {
    DRIFTGUARD_ASSIGN_OR_RETURN(int parsed, ParsePositive(value));
    return parsed * 2;
}

absl::Status CheckBoth(int a, int b) {
    DRIFTGUARD_RETURN_IF_ERROR(ParsePositive(a).status());
    DRIFTGUARD_RETURN_IF_ERROR(ParsePositive(b).status());
    return OkStatus();
}

TEST(ErrorTest, ValidationAndTypeErrorsShareAbslCode) {
    const absl::Status validation = ValidationError("bad value");
    const absl::Status type = TypeError("bad type");

    EXPECT_EQ(validation.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(type.code(), absl::StatusCode::kInvalidArgument);

    EXPECT_TRUE(IsValidationError(validation));
    EXPECT_FALSE(IsTypeError(validation));
    EXPECT_TRUE(IsTypeError(type));
    EXPECT_FALSE(IsValidationError(type));
}

TEST(ErrorTest, ErrorCodeSurvivesCopy) {
    const absl::Status original = MakeError(ErrorCode::kParseError, "line 2: oops");
    const absl::Status copy = original;

    EXPECT_EQ(GetErrorCode(copy), ErrorCode::kParseError);
    EXPECT_EQ(copy.message(), "line 2: oops");
}

TEST(ErrorTest, PlainAbslStatusesMapByCode) {
    EXPECT_EQ(GetErrorCode(absl::OkStatus()), ErrorCode::kOk);
    EXPECT_EQ(GetErrorCode(absl::InvalidArgumentError("x")), ErrorCode::kInvalidArgument);
    EXPECT_EQ(GetErrorCode(absl::NotFoundError("x")), ErrorCode::kNotFound);
    EXPECT_EQ(GetErrorCode(absl::DeadlineExceededError("x")), ErrorCode::kUnknown);
    EXPECT_FALSE(IsValidationError(absl::InvalidArgumentError("x")));
}

TEST(ErrorTest, ToAbslCode) {
    EXPECT_EQ(ToAbslCode(ErrorCode::kNotFound), absl::StatusCode::kNotFound);
    EXPECT_EQ(ToAbslCode(ErrorCode::kParseError), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(ToAbslCode(ErrorCode::kConfigurationError),
              absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(ToAbslCode(ErrorCode::kUnavailable), absl::StatusCode::kUnavailable);
}

TEST(ErrorTest, ErrorCodeNames) {
    EXPECT_EQ(ErrorCodeToString(ErrorCode::kValidationError), "validation_error");
    EXPECT_EQ(ErrorCodeToString(ErrorCode::kTypeError), "type_error");
    EXPECT_EQ(ErrorCodeToString(ErrorCode::kParseError), "parse_error");
}

TEST(ErrorTest, Macros) {
    auto ok = Doubled(4);
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(*ok, 8);

    auto failed = Doubled(-1);
    ASSERT_FALSE(failed.ok());
    EXPECT_TRUE(IsValidationError(failed.status()));
    EXPECT_EQ(failed.status().message(), "value must be positive");

    EXPECT_TRUE(CheckBoth(1, 2).ok());
    EXPECT_TRUE(IsValidationError(CheckBoth(1, 0)));
}

}  // namespace
}  // namespace driftguard
