/// @file csv_reader.cpp
/// @brief CSV reader implementation

#include "data/csv_reader.h"

#include <fstream>
#include <sstream>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "common/error.h"
#include "common/logging.h"

namespace driftguard::data {

namespace {

/// @brief Infer the narrowest kind that represents every field
Sample BuildSample(std::vector<std::string> fields, bool integers_as_text) {
    std::vector<int64_t> ints;
    ints.reserve(fields.size());
    for (const auto& field : fields) {
        int64_t value = 0;
        if (!absl::SimpleAtoi(field, &value)) {
            break;
        }
        ints.push_back(value);
    }
    if (ints.size() == fields.size()) {
        if (integers_as_text) {
            return Sample(std::move(fields));
        }
        return Sample(std::move(ints));
    }

    std::vector<double> doubles;
    doubles.reserve(fields.size());
    for (const auto& field : fields) {
        double value = 0.0;
        if (!absl::SimpleAtod(field, &value)) {
            break;
        }
        doubles.push_back(value);
    }
    if (doubles.size() == fields.size()) {
        return Sample(std::move(doubles));
    }
    return Sample(std::move(fields));
}

}  // namespace

absl::StatusOr<std::vector<std::string>> SplitCsvLine(absl::string_view line,
                                                      char delimiter) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;
    bool was_quoted = false;

    auto finish_field = [&]() {
        if (was_quoted) {
            fields.push_back(std::move(current));
        } else {
            fields.emplace_back(absl::StripAsciiWhitespace(current));
        }
        current.clear();
        was_quoted = false;
    };

    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                current.push_back(c);
            }
        } else if (c == '"' && absl::StripAsciiWhitespace(current).empty()) {
            current.clear();
            in_quotes = true;
            was_quoted = true;
        } else if (c == delimiter) {
            finish_field();
        } else if (!was_quoted || !absl::ascii_isspace(static_cast<unsigned char>(c))) {
            current.push_back(c);
        }
    }

    if (in_quotes) {
        return MakeError(ErrorCode::kParseError, "unterminated quoted field");
    }
    finish_field();
    return fields;
}

absl::StatusOr<Table> ParseCsv(absl::string_view text, const CsvOptions& options) {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> columns;
    size_t line_number = 0;
    bool have_header = false;

    for (absl::string_view raw_line : absl::StrSplit(text, '\n')) {
        ++line_number;
        if (!raw_line.empty() && raw_line.back() == '\r') {
            raw_line.remove_suffix(1);
        }
        if (absl::StripAsciiWhitespace(raw_line).empty()) {
            continue;
        }

        auto fields = SplitCsvLine(raw_line, options.delimiter);
        if (!fields.ok()) {
            return MakeError(ErrorCode::kParseError,
                             absl::StrCat("line ", line_number, ": ",
                                          fields.status().message()));
        }

        if (!have_header) {
            header = std::move(*fields);
            columns.resize(header.size());
            have_header = true;
            continue;
        }

        if (fields->size() != header.size()) {
            return MakeError(ErrorCode::kParseError,
                             absl::StrCat("line ", line_number, ": expected ",
                                          header.size(), " fields, found ",
                                          fields->size()));
        }

        for (size_t c = 0; c < fields->size(); ++c) {
            if ((*fields)[c].empty()) {
                return MakeError(ErrorCode::kParseError,
                                 absl::StrCat("line ", line_number,
                                              ": missing value in column '",
                                              header[c], "'"));
            }
            columns[c].push_back(std::move((*fields)[c]));
        }
    }

    if (!have_header) {
        return MakeError(ErrorCode::kParseError, "CSV input has no header line");
    }

    std::vector<Column> built;
    built.reserve(header.size());
    for (size_t c = 0; c < header.size(); ++c) {
        built.push_back(Column{header[c], BuildSample(std::move(columns[c]),
                                                      options.integers_as_text)});
    }

    auto table = Table::Create(std::move(built));
    if (table.ok()) {
        DRIFTGUARD_LOG_DEBUG("Parsed CSV: {} rows, {} columns",
                             table->NumRows(), table->NumColumns());
    }
    return table;
}

absl::StatusOr<Table> ReadCsvFile(const std::filesystem::path& path,
                                  const CsvOptions& options) {
    if (!std::filesystem::exists(path)) {
        return NotFoundError(absl::StrCat("CSV file not found: ", path.string()));
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return MakeError(ErrorCode::kUnavailable,
                         absl::StrCat("Failed to open CSV file: ", path.string()));
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    auto table = ParseCsv(buffer.str(), options);
    if (!table.ok()) {
        return MakeError(GetErrorCode(table.status()),
                         absl::StrCat(path.string(), ": ", table.status().message()));
    }
    return table;
}

}  // namespace driftguard::data
