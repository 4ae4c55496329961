#pragma once

/// @file table.h
/// @brief Column-oriented read-only table of named samples

#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>

#include "data/sample.h"

namespace driftguard::data {

/// @brief A named column
struct Column {
    std::string name;
    Sample values;
};

/// @brief Ordered rows sharing named columns
///
/// Stored column by column; every column has the same length.
class Table {
public:
    Table() = default;

    /// @brief Build a table, validating equal column lengths and unique names
    static absl::StatusOr<Table> Create(std::vector<Column> columns);

    /// @brief Number of rows (0 for a table without columns)
    size_t NumRows() const;
    size_t NumColumns() const { return columns_.size(); }

    /// @brief True when the table has no rows or no columns
    bool Empty() const { return NumRows() == 0; }

    const std::vector<Column>& Columns() const { return columns_; }
    const Column& ColumnAt(size_t index) const { return columns_.at(index); }

    /// @brief Look up a column by name
    /// @return Pointer into this table, or NotFound
    absl::StatusOr<const Column*> ColumnByName(absl::string_view name) const;

    std::vector<std::string> ColumnNames() const;

    /// @brief Rows [offset, offset + count) in original order (clamped)
    Table Slice(size_t offset, size_t count) const;

    /// @brief Table holding only the named column
    absl::StatusOr<Table> Select(absl::string_view name) const;

private:
    explicit Table(std::vector<Column> columns) : columns_(std::move(columns)) {}

    std::vector<Column> columns_;
};

}  // namespace driftguard::data
