#pragma once

#include "types.h"
#include "column_classifier.h"
#include <optional>
#include <string>
#include <vector>

namespace autoviz {

enum class RelationshipKind {
    STRONG_CORRELATION,
    STRONG_NEGATIVE_CORRELATION,
    MODERATE_CORRELATION,
    MODERATE_NEGATIVE_CORRELATION
};

struct Relationship {
    std::string column_a;
    std::string column_b;
    RelationshipKind kind;
    double correlation;
};

struct RelationshipThresholds {
    double strong = 0.7;     // |r| > strong
    double moderate = 0.4;   // moderate < |r| <= strong
};

class RelationshipAnalyzer {
public:
    RelationshipAnalyzer() = default;
    explicit RelationshipAnalyzer(const RelationshipThresholds& thresholds);

    // Pairwise Pearson over numeric columns, pairwise-complete rows.
    // Pairs come out in (outer asc, inner asc, inner > outer) order.
    std::vector<Relationship> analyze(const DataTable& table, const ColumnTypeMap& types) const;

    // nullopt when |r| is at or below the moderate threshold or r is NaN
    std::optional<RelationshipKind> classify(double r) const;

    static std::string kind_to_string(RelationshipKind kind);

private:
    RelationshipThresholds thresholds_;
};

}  // namespace autoviz
