#include "autoviz/csv_loader.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>

namespace autoviz {

namespace csv {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

bool read_digits(const std::string& s, size_t pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    out = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        out = out * 10 + (s[i] - '0');
    }
    return true;
}

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int days_in_month(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return m == 2 && is_leap(y) ? 29 : days[m - 1];
}

}  // anonymous namespace

std::vector<std::string> parse_record(std::istream& is, char delimiter, bool* malformed) {
    if (malformed) *malformed = false;

    std::vector<std::string> row;
    std::string field;
    bool in_quotes = false;
    bool field_quoted = false;
    bool has_data = false;
    char c;

    auto push_field = [&]() {
        row.push_back(field_quoted ? field : trim(field));
        field.clear();
        field_quoted = false;
    };

    while (is.get(c)) {
        if (in_quotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                    field += '"';
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        if (c == '"' && trim(field).empty()) {
            field.clear();
            in_quotes = true;
            field_quoted = true;
            has_data = true;
        } else if (c == delimiter) {
            push_field();
            has_data = true;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            if (has_data || !field.empty()) break;
            // blank line
        } else if (field_quoted && (c == ' ' || c == '\t')) {
            // padding after a closing quote
        } else {
            field += c;
            has_data = true;
        }
    }

    if (in_quotes && malformed) {
        *malformed = true;
    }

    if (has_data || !field.empty()) {
        push_field();
    }
    return row;
}

std::vector<std::string> normalize_header(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::set<std::string> seen;

    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].empty()) {
            out[i] = "column_" + std::to_string(i + 1);
        }
        if (seen.count(out[i]) > 0) {
            const std::string base = out[i];
            int suffix = 2;
            while (seen.count(base + "_" + std::to_string(suffix)) > 0) ++suffix;
            out[i] = base + "_" + std::to_string(suffix);
        }
        seen.insert(out[i]);
    }
    return out;
}

bool is_missing_token(const std::string& field) {
    if (field.empty()) return true;
    std::string lower = field;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "na" || lower == "nan" || lower == "null";
}

std::optional<double> parse_number(const std::string& field) {
    if (field.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(field.c_str(), &end);
    if (errno != 0 || end != field.c_str() + field.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parse_iso_datetime(const std::string& field) {
    int year, month, day;
    if (field.size() < 10 ||
        !read_digits(field, 0, 4, year) || field[4] != '-' ||
        !read_digits(field, 5, 2, month) || field[7] != '-' ||
        !read_digits(field, 8, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        return std::nullopt;
    }

    int hour = 0, minute = 0, second = 0;
    if (field.size() > 10) {
        if (field[10] != 'T' && field[10] != ' ') return std::nullopt;
        if (!read_digits(field, 11, 2, hour) || field.size() < 16 || field[13] != ':' ||
            !read_digits(field, 14, 2, minute)) {
            return std::nullopt;
        }
        if (field.size() > 16) {
            if (field.size() != 19 || field[16] != ':' || !read_digits(field, 17, 2, second)) {
                return std::nullopt;
            }
        }
        if (hour > 23 || minute > 59 || second > 59) return std::nullopt;
    }

    const int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return static_cast<double>(days * 86400 + hour * 3600 + minute * 60 + second);
}

ColumnDataType infer_column_type(const std::vector<std::string>& cells, bool infer_temporal) {
    bool any = false;
    bool all_numeric = true;
    bool all_temporal = infer_temporal;

    for (const auto& cell : cells) {
        if (is_missing_token(cell)) continue;
        any = true;
        if (all_numeric && !parse_number(cell)) all_numeric = false;
        if (all_temporal && !parse_iso_datetime(cell)) all_temporal = false;
        if (!all_numeric && !all_temporal) break;
    }

    if (!any) return ColumnDataType::TEXT;
    if (all_numeric) return ColumnDataType::NUMERIC;
    if (all_temporal) return ColumnDataType::TEMPORAL;
    return ColumnDataType::TEXT;
}

}  // namespace csv

// ============================================================================
// Table assembly
// ============================================================================

std::optional<DataTable> read_csv(std::istream& is, const CsvOptions& options) {
    bool malformed = false;
    std::vector<std::string> header = csv::parse_record(is, options.delimiter, &malformed);
    if (header.empty()) {
        spdlog::warn("CSV input has no header row");
        return std::nullopt;
    }
    header = csv::normalize_header(header);

    std::vector<std::vector<std::string>> cells(header.size());
    size_t record = 1;
    size_t skipped = 0;

    while (is.peek() != EOF) {
        std::vector<std::string> row = csv::parse_record(is, options.delimiter, &malformed);
        ++record;
        if (row.empty()) continue;

        if (malformed || row.size() != header.size()) {
            spdlog::warn("CSV record {} has {} fields, expected {}; skipped",
                         record, row.size(), header.size());
            ++skipped;
            continue;
        }
        for (size_t c = 0; c < row.size(); ++c) {
            cells[c].push_back(std::move(row[c]));
        }
    }

    DataTable table;
    for (size_t c = 0; c < header.size(); ++c) {
        const auto& column_cells = cells[c];
        const ColumnDataType type = csv::infer_column_type(column_cells, options.infer_temporal);

        if (type == ColumnDataType::NUMERIC) {
            std::vector<double> values;
            values.reserve(column_cells.size());
            for (const auto& cell : column_cells) {
                values.push_back(csv::is_missing_token(cell)
                    ? std::numeric_limits<double>::quiet_NaN()
                    : csv::parse_number(cell).value_or(std::numeric_limits<double>::quiet_NaN()));
            }
            table.add_column(Column::numeric(header[c], std::move(values)));
        } else if (type == ColumnDataType::TEMPORAL) {
            std::vector<double> seconds;
            MissingMask missing(column_cells.size(), 0);
            seconds.reserve(column_cells.size());
            for (size_t r = 0; r < column_cells.size(); ++r) {
                auto ts = csv::is_missing_token(column_cells[r])
                    ? std::nullopt : csv::parse_iso_datetime(column_cells[r]);
                seconds.push_back(ts.value_or(0.0));
                missing[r] = ts ? 0 : 1;
            }
            table.add_column(Column::temporal(header[c], std::move(seconds), std::move(missing)));
        } else {
            std::vector<std::string> labels;
            MissingMask missing(column_cells.size(), 0);
            labels.reserve(column_cells.size());
            for (size_t r = 0; r < column_cells.size(); ++r) {
                if (csv::is_missing_token(column_cells[r])) {
                    labels.emplace_back();
                    missing[r] = 1;
                } else {
                    labels.push_back(column_cells[r]);
                }
            }
            table.add_column(Column::text(header[c], std::move(labels), std::move(missing)));
        }
    }

    spdlog::debug("CSV: {} rows x {} columns ({} skipped)", table.row_count(), table.column_count(), skipped);
    return table;
}

std::optional<DataTable> parse_csv(const std::string& text, const CsvOptions& options) {
    std::istringstream iss(text);
    return read_csv(iss, options);
}

std::optional<DataTable> load_csv(const std::string& path, const CsvOptions& options) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::warn("Cannot open CSV file {}", path);
        return std::nullopt;
    }
    return read_csv(file, options);
}

}  // namespace autoviz
