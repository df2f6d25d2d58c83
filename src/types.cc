#include "autoviz/types.h"
#include "autoviz/errors.h"
#include <algorithm>
#include <cmath>

namespace autoviz {

namespace {

MissingMask normalize_mask(MissingMask missing, size_t rows) {
    if (missing.empty()) {
        missing.assign(rows, 0);
    } else if (missing.size() != rows) {
        throw InputError("missing mask has " + std::to_string(missing.size()) +
                         " entries for " + std::to_string(rows) + " values");
    }
    return missing;
}

}  // anonymous namespace

// ============================================================================
// Column
// ============================================================================

size_t Column::size() const {
    return missing.size();
}

size_t Column::missing_count() const {
    return static_cast<size_t>(std::count(missing.begin(), missing.end(), uint8_t{1}));
}

Column Column::numeric(const std::string& name, std::vector<double> values) {
    Column col;
    col.name = name;
    col.type = ColumnDataType::NUMERIC;
    col.missing.assign(values.size(), 0);
    for (size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) {
            col.missing[i] = 1;
        }
    }
    col.numbers = std::move(values);
    return col;
}

Column Column::temporal(const std::string& name,
                        std::vector<double> epoch_seconds,
                        MissingMask missing) {
    Column col;
    col.name = name;
    col.type = ColumnDataType::TEMPORAL;
    col.missing = normalize_mask(std::move(missing), epoch_seconds.size());
    for (size_t i = 0; i < epoch_seconds.size(); ++i) {
        if (!std::isfinite(epoch_seconds[i])) {
            col.missing[i] = 1;
        }
    }
    col.numbers = std::move(epoch_seconds);
    return col;
}

Column Column::text(const std::string& name,
                    std::vector<std::string> values,
                    MissingMask missing) {
    Column col;
    col.name = name;
    col.type = ColumnDataType::TEXT;
    col.missing = normalize_mask(std::move(missing), values.size());
    col.labels = std::move(values);
    return col;
}

Column Column::other(const std::string& name,
                     std::vector<std::string> values,
                     MissingMask missing) {
    Column col = text(name, std::move(values), std::move(missing));
    col.type = ColumnDataType::OTHER;
    return col;
}

// ============================================================================
// DataTable
// ============================================================================

void DataTable::add_column(Column column) {
    const bool numeric_storage =
        column.type == ColumnDataType::NUMERIC || column.type == ColumnDataType::TEMPORAL;
    const size_t stored = numeric_storage ? column.numbers.size() : column.labels.size();
    if (stored != column.missing.size()) {
        throw InputError("column '" + column.name + "' stores " + std::to_string(stored) +
                         " values but its missing mask has " +
                         std::to_string(column.missing.size()) + " entries");
    }
    if (index_.count(column.name) > 0) {
        throw InputError("duplicate column '" + column.name + "'");
    }
    if (!columns_.empty() && column.size() != row_count_) {
        throw InputError("column '" + column.name + "' has " + std::to_string(column.size()) +
                         " rows, table has " + std::to_string(row_count_));
    }
    if (columns_.empty()) {
        row_count_ = column.size();
        if (!row_index_.empty() && row_index_.size() != row_count_) {
            throw InputError("row index does not match column '" + column.name + "'");
        }
    }
    index_[column.name] = columns_.size();
    columns_.push_back(std::move(column));
}

std::vector<std::string> DataTable::column_names() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& col : columns_) {
        names.push_back(col.name);
    }
    return names;
}

const Column& DataTable::column(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw InputError("no column named '" + name + "'");
    }
    return columns_[it->second];
}

std::optional<size_t> DataTable::find_column(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void DataTable::set_row_index(std::vector<double> keys) {
    if (!columns_.empty() && keys.size() != row_count_) {
        throw InputError("row index has " + std::to_string(keys.size()) +
                         " keys, table has " + std::to_string(row_count_) + " rows");
    }
    row_index_ = std::move(keys);
}

bool DataTable::is_row_order_monotonic() const {
    if (row_index_.empty()) {
        return true;
    }
    return std::is_sorted(row_index_.begin(), row_index_.end());
}

size_t DataTable::missing_count() const {
    size_t total = 0;
    for (const auto& col : columns_) {
        total += col.missing_count();
    }
    return total;
}

size_t DataTable::memory_usage_bytes() const {
    size_t bytes = 0;
    for (const auto& col : columns_) {
        bytes += col.numbers.size() * sizeof(double);
        bytes += col.missing.size();
        for (const auto& label : col.labels) {
            bytes += sizeof(std::string) + label.capacity();
        }
    }
    bytes += row_index_.size() * sizeof(double);
    return bytes;
}

}  // namespace autoviz
