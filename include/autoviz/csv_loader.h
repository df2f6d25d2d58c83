#pragma once

#include "types.h"
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace autoviz {

struct CsvOptions {
    char delimiter = ',';
    bool infer_temporal = true;   // ISO-8601 dates become TEMPORAL columns
};

// Read a header + rows CSV into a typed DataTable.
// nullopt when the source is unreadable or has no header row.
std::optional<DataTable> load_csv(const std::string& path, const CsvOptions& options = {});
std::optional<DataTable> parse_csv(const std::string& text, const CsvOptions& options = {});
std::optional<DataTable> read_csv(std::istream& is, const CsvOptions& options = {});

namespace csv {

// One RFC-4180 record; quoted fields may span lines. Empty when the stream
// is exhausted. Unquoted fields are trimmed.
std::vector<std::string> parse_record(std::istream& is, char delimiter, bool* malformed = nullptr);

// Empty names become column_N, repeats get a _2, _3... suffix
std::vector<std::string> normalize_header(const std::vector<std::string>& header);

// "", NA, NaN, null (any case)
bool is_missing_token(const std::string& field);

std::optional<double> parse_number(const std::string& field);

// YYYY-MM-DD with optional [T ]HH:MM[:SS]; seconds since the Unix epoch (UTC)
std::optional<double> parse_iso_datetime(const std::string& field);

ColumnDataType infer_column_type(const std::vector<std::string>& cells, bool infer_temporal = true);

}  // namespace csv

}  // namespace autoviz
