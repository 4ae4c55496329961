#pragma once

/// @file sample.h
/// @brief One-dimensional homogeneous value sequence

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>

namespace driftguard::data {

/// @brief Element kind of a sample
enum class ValueKind {
    kInteger,   ///< 64-bit signed integers (numerical, also usable as labels)
    kFloat,     ///< Continuous floating-point values
    kText       ///< Categorical string labels
};

/// @brief Convert value kind to string
absl::string_view ValueKindToString(ValueKind kind);

/// @brief A 1-D ordered sequence of values sharing one ValueKind
///
/// Samples are immutable once built. Slicing produces a new sample.
class Sample {
public:
    using Values = std::variant<
        std::vector<int64_t>,
        std::vector<double>,
        std::vector<std::string>
    >;

    Sample() : values_(std::vector<double>{}) {}
    explicit Sample(std::vector<int64_t> values) : values_(std::move(values)) {}
    explicit Sample(std::vector<double> values) : values_(std::move(values)) {}
    explicit Sample(std::vector<std::string> values) : values_(std::move(values)) {}

    ValueKind Kind() const;

    size_t Size() const;
    bool Empty() const { return Size() == 0; }

    /// @brief True for integer and float samples
    bool IsNumerical() const { return Kind() != ValueKind::kText; }

    /// @brief Numerical values widened to double
    /// @return Values, or a type error for text samples
    absl::StatusOr<std::vector<double>> AsDoubles() const;

    /// @brief Values rendered as category labels
    ///
    /// Integers and floats are formatted in their shortest form, text is
    /// returned unchanged.
    std::vector<std::string> AsLabels() const;

    /// @brief Copy of `count` values starting at `offset` (clamped to size)
    Sample Slice(size_t offset, size_t count) const;

    const Values& values() const { return values_; }

    bool operator==(const Sample& other) const { return values_ == other.values_; }

private:
    Values values_;
};

}  // namespace driftguard::data
