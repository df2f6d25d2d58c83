#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

namespace autoviz {

// Declared (intrinsic) storage type of a column, as reported by the loader
enum class ColumnDataType {
    NUMERIC,    // integer / floating point
    TEMPORAL,   // date or datetime, stored as epoch seconds
    TEXT,       // strings / enumerations
    OTHER       // anything the loader could not type
};

using MissingMask = std::vector<uint8_t>;

// ============================================================================
// Column
// ============================================================================

struct Column {
    std::string name;
    ColumnDataType type = ColumnDataType::TEXT;

    std::vector<double> numbers;      // NUMERIC and TEMPORAL cells
    std::vector<std::string> labels;  // TEXT and OTHER cells
    MissingMask missing;              // 1 = missing

    size_t size() const;
    bool is_missing(size_t row) const { return missing[row] != 0; }
    size_t missing_count() const;

    // NaN cells are folded into the missing mask
    static Column numeric(const std::string& name, std::vector<double> values);
    static Column temporal(const std::string& name,
                           std::vector<double> epoch_seconds,
                           MissingMask missing = {});
    static Column text(const std::string& name,
                       std::vector<std::string> values,
                       MissingMask missing = {});
    static Column other(const std::string& name,
                        std::vector<std::string> values,
                        MissingMask missing = {});
};

// ============================================================================
// DataTable - the already-materialized table the core consumes
// ============================================================================

class DataTable {
public:
    DataTable() = default;

    // Throws InputError on duplicate name, row-count mismatch, or storage that
    // disagrees with the missing mask
    void add_column(Column column);

    size_t row_count() const { return row_count_; }
    size_t column_count() const { return columns_.size(); }

    const std::vector<Column>& columns() const { return columns_; }
    std::vector<std::string> column_names() const;

    // Throws InputError when absent
    const Column& column(const std::string& name) const;
    std::optional<size_t> find_column(const std::string& name) const;

    // Inherent ordering key; positional when never set
    void set_row_index(std::vector<double> keys);
    bool is_row_order_monotonic() const;

    size_t missing_count() const;
    size_t memory_usage_bytes() const;

private:
    std::vector<Column> columns_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<double> row_index_;
    size_t row_count_ = 0;
};

}  // namespace autoviz
