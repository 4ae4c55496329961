/// @file table.cpp
/// @brief Table implementation

#include "data/table.h"

#include <unordered_set>

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace driftguard::data {

absl::StatusOr<Table> Table::Create(std::vector<Column> columns) {
    std::unordered_set<std::string> names;
    for (const auto& column : columns) {
        if (!names.insert(column.name).second) {
            return ValidationError(
                absl::StrCat("duplicate column name: ", column.name));
        }
        if (column.values.Size() != columns.front().values.Size()) {
            return ValidationError(absl::StrCat(
                "column '", column.name, "' has ", column.values.Size(),
                " rows, expected ", columns.front().values.Size()));
        }
    }
    return Table(std::move(columns));
}

size_t Table::NumRows() const {
    return columns_.empty() ? 0 : columns_.front().values.Size();
}

absl::StatusOr<const Column*> Table::ColumnByName(absl::string_view name) const {
    for (const auto& column : columns_) {
        if (column.name == name) {
            return &column;
        }
    }
    return NotFoundError(absl::StrCat("column not found: ", name));
}

std::vector<std::string> Table::ColumnNames() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& column : columns_) {
        names.push_back(column.name);
    }
    return names;
}

Table Table::Slice(size_t offset, size_t count) const {
    std::vector<Column> sliced;
    sliced.reserve(columns_.size());
    for (const auto& column : columns_) {
        sliced.push_back(Column{column.name, column.values.Slice(offset, count)});
    }
    return Table(std::move(sliced));
}

absl::StatusOr<Table> Table::Select(absl::string_view name) const {
    DRIFTGUARD_ASSIGN_OR_RETURN(const Column* column, ColumnByName(name));
    return Table(std::vector<Column>{*column});
}

}  // namespace driftguard::data
