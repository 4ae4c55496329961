#pragma once

/// @file csv_reader.h
/// @brief Delimited text ingestion into a Table

#include <filesystem>
#include <string>
#include <vector>

#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>

#include "data/table.h"

namespace driftguard::data {

/// @brief Options for CSV parsing
struct CsvOptions {
    /// Field separator
    char delimiter = ',';

    /// Keep integer-valued columns as their text labels ("007" stays "007").
    /// Float columns are still read as floats.
    bool integers_as_text = false;
};

/// @brief Split one line into fields, honouring double-quoted fields
///
/// Inside quotes the delimiter is literal and `""` is an escaped quote.
/// Unquoted fields are trimmed of surrounding ASCII whitespace.
absl::StatusOr<std::vector<std::string>> SplitCsvLine(absl::string_view line,
                                                      char delimiter);

/// @brief Parse CSV text whose first non-blank line is the header
///
/// Column kinds are inferred per column: integer if every field parses as
/// int64, else float if every field parses as double, else text.
absl::StatusOr<Table> ParseCsv(absl::string_view text, const CsvOptions& options = {});

/// @brief Read and parse a CSV file
absl::StatusOr<Table> ReadCsvFile(const std::filesystem::path& path,
                                  const CsvOptions& options = {});

}  // namespace driftguard::data
