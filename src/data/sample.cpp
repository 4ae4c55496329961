/// @file sample.cpp
/// @brief Sample implementation

#include "data/sample.h"

#include <algorithm>

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace driftguard::data {

absl::string_view ValueKindToString(ValueKind kind) {
    switch (kind) {
        case ValueKind::kInteger: return "integer";
        case ValueKind::kFloat: return "float";
        case ValueKind::kText: return "text";
        default: return "unknown";
    }
}

ValueKind Sample::Kind() const {
    switch (values_.index()) {
        case 0: return ValueKind::kInteger;
        case 1: return ValueKind::kFloat;
        default: return ValueKind::kText;
    }
}

size_t Sample::Size() const {
    return std::visit([](const auto& v) { return v.size(); }, values_);
}

absl::StatusOr<std::vector<double>> Sample::AsDoubles() const {
    if (const auto* ints = std::get_if<std::vector<int64_t>>(&values_)) {
        std::vector<double> out;
        out.reserve(ints->size());
        for (int64_t v : *ints) {
            out.push_back(static_cast<double>(v));
        }
        return out;
    }
    if (const auto* doubles = std::get_if<std::vector<double>>(&values_)) {
        return *doubles;
    }
    return TypeError("Sample holds text values, not numerical values");
}

std::vector<std::string> Sample::AsLabels() const {
    return std::visit([](const auto& v) {
        using T = typename std::decay_t<decltype(v)>::value_type;
        std::vector<std::string> labels;
        labels.reserve(v.size());
        for (const auto& item : v) {
            if constexpr (std::is_same_v<T, std::string>) {
                labels.push_back(item);
            } else {
                labels.push_back(absl::StrCat(item));
            }
        }
        return labels;
    }, values_);
}

Sample Sample::Slice(size_t offset, size_t count) const {
    return std::visit([offset, count](const auto& v) {
        using Vec = std::decay_t<decltype(v)>;
        const size_t begin = std::min(offset, v.size());
        const size_t end = begin + std::min(count, v.size() - begin);
        return Sample(Vec(v.begin() + begin, v.begin() + end));
    }, values_);
}

}  // namespace driftguard::data
