#include "autoviz/relationship_analyzer.h"
#include "autoviz/statistics.h"
#include <spdlog/spdlog.h>
#include <cmath>

namespace autoviz {

RelationshipAnalyzer::RelationshipAnalyzer(const RelationshipThresholds& thresholds)
    : thresholds_(thresholds) {}

std::string RelationshipAnalyzer::kind_to_string(RelationshipKind kind) {
    switch (kind) {
        case RelationshipKind::STRONG_CORRELATION: return "strong_correlation";
        case RelationshipKind::STRONG_NEGATIVE_CORRELATION: return "strong_negative_correlation";
        case RelationshipKind::MODERATE_CORRELATION: return "moderate_correlation";
        case RelationshipKind::MODERATE_NEGATIVE_CORRELATION: return "moderate_negative_correlation";
        default: return "unknown";
    }
}

std::optional<RelationshipKind> RelationshipAnalyzer::classify(double r) const {
    if (!std::isfinite(r)) return std::nullopt;

    const double magnitude = std::abs(r);
    if (magnitude > thresholds_.strong) {
        return r > 0 ? RelationshipKind::STRONG_CORRELATION
                     : RelationshipKind::STRONG_NEGATIVE_CORRELATION;
    }
    if (magnitude > thresholds_.moderate) {
        return r > 0 ? RelationshipKind::MODERATE_CORRELATION
                     : RelationshipKind::MODERATE_NEGATIVE_CORRELATION;
    }
    return std::nullopt;
}

std::vector<Relationship> RelationshipAnalyzer::analyze(
    const DataTable& table,
    const ColumnTypeMap& types
) const {
    std::vector<Relationship> relationships;

    const auto numeric_cols = columns_of_type(types, SemanticType::NUMERIC);
    if (numeric_cols.size() < 2) {
        spdlog::debug("Fewer than two numeric columns, skipping correlation analysis");
        return relationships;
    }

    for (size_t i = 0; i < numeric_cols.size(); ++i) {
        const Column& a = table.column(numeric_cols[i]);
        for (size_t j = i + 1; j < numeric_cols.size(); ++j) {
            const Column& b = table.column(numeric_cols[j]);
            auto [xs, ys] = paired_non_missing(a, b);
            const double r = pearson(xs, ys);

            auto kind = classify(r);
            if (kind) {
                relationships.push_back({a.name, b.name, *kind, r});
            }
        }
    }

    return relationships;
}

}  // namespace autoviz
