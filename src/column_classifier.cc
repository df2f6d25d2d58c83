#include "autoviz/column_classifier.h"
#include "autoviz/errors.h"
#include <algorithm>

namespace autoviz {

SemanticType ColumnClassifier::classify_column(const Column& column) {
    switch (column.type) {
        case ColumnDataType::NUMERIC: return SemanticType::NUMERIC;
        case ColumnDataType::TEMPORAL: return SemanticType::TEMPORAL;
        case ColumnDataType::TEXT: return SemanticType::CATEGORICAL;
        case ColumnDataType::OTHER: return SemanticType::UNKNOWN;
        default: return SemanticType::UNKNOWN;
    }
}

ColumnTypeMap ColumnClassifier::classify(const DataTable& table) const {
    ColumnTypeMap types;
    types.reserve(table.column_count());
    for (const auto& col : table.columns()) {
        types.emplace_back(col.name, classify_column(col));
    }
    return types;
}

std::string ColumnClassifier::type_to_string(SemanticType type) {
    switch (type) {
        case SemanticType::NUMERIC: return "numeric";
        case SemanticType::TEMPORAL: return "temporal";
        case SemanticType::CATEGORICAL: return "categorical";
        case SemanticType::UNKNOWN: return "unknown";
        default: return "unknown";
    }
}

std::vector<std::string> columns_of_type(const ColumnTypeMap& types, SemanticType type) {
    std::vector<std::string> names;
    for (const auto& [name, t] : types) {
        if (t == type) names.push_back(name);
    }
    return names;
}

size_t count_of_type(const ColumnTypeMap& types, SemanticType type) {
    return static_cast<size_t>(std::count_if(types.begin(), types.end(),
        [type](const auto& entry) { return entry.second == type; }));
}

bool has_type(const ColumnTypeMap& types, SemanticType type) {
    return count_of_type(types, type) > 0;
}

SemanticType type_of(const ColumnTypeMap& types, const std::string& column) {
    for (const auto& [name, t] : types) {
        if (name == column) return t;
    }
    throw InputError("no column named '" + column + "'");
}

}  // namespace autoviz
