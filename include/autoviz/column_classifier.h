#pragma once

#include "types.h"
#include <string>
#include <utility>
#include <vector>

namespace autoviz {

// Semantic role of a column, independent of storage
enum class SemanticType {
    NUMERIC,
    TEMPORAL,
    CATEGORICAL,
    UNKNOWN
};

// Column name -> semantic type, in table column order
using ColumnTypeMap = std::vector<std::pair<std::string, SemanticType>>;

class ColumnClassifier {
public:
    // Pure mapping over the declared types; empty columns are classified
    // from their declared type without inspecting values.
    ColumnTypeMap classify(const DataTable& table) const;

    static SemanticType classify_column(const Column& column);

    static std::string type_to_string(SemanticType type);
};

// Helpers over a ColumnTypeMap
std::vector<std::string> columns_of_type(const ColumnTypeMap& types, SemanticType type);
size_t count_of_type(const ColumnTypeMap& types, SemanticType type);
bool has_type(const ColumnTypeMap& types, SemanticType type);
SemanticType type_of(const ColumnTypeMap& types, const std::string& column);

}  // namespace autoviz
