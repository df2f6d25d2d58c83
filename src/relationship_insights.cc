#include "autoviz/insights.h"
#include "autoviz/statistics.h"
#include <algorithm>
#include <map>

namespace autoviz {

std::optional<double> RelationshipInsightDetector::variance_ratio(
    const Column& categorical,
    const Column& numeric,
    const InsightThresholds& thresholds
) {
    std::map<std::string, std::vector<double>> groups;
    const size_t rows = std::min(categorical.size(), numeric.size());
    for (size_t i = 0; i < rows; ++i) {
        if (categorical.is_missing(i) || numeric.is_missing(i)) continue;
        groups[categorical.labels[i]].push_back(numeric.numbers[i]);
    }

    std::vector<double> group_means;
    for (const auto& [label, values] : groups) {
        if (values.size() >= thresholds.min_group_size) {
            group_means.push_back(mean(values));
        }
    }
    if (group_means.size() < thresholds.min_groups) return std::nullopt;

    const double overall = sample_variance(non_missing(numeric));
    if (!(overall > 0.0)) return std::nullopt;

    return sample_variance(group_means) / overall;
}

std::vector<GraphInsight> RelationshipInsightDetector::analyze(const AnalysisContext& ctx) const {
    std::vector<GraphInsight> insights;
    const InsightThresholds& t = ctx.thresholds;

    const auto categorical_cols = columns_of_type(ctx.types, SemanticType::CATEGORICAL);
    const auto numeric_cols = columns_of_type(ctx.types, SemanticType::NUMERIC);
    const size_t cat_limit = std::min(categorical_cols.size(), t.max_relationship_columns);
    const size_t num_limit = std::min(numeric_cols.size(), t.max_relationship_columns);

    for (size_t c = 0; c < cat_limit; ++c) {
        const Column& cat = ctx.table.column(categorical_cols[c]);
        for (size_t n = 0; n < num_limit; ++n) {
            const Column& num = ctx.table.column(numeric_cols[n]);
            auto ratio = variance_ratio(cat, num, t);
            if (ratio && *ratio > t.variance_ratio_threshold) {
                insights.push_back(insight_templates::categorical_influence(cat.name, num.name, *ratio));
            }
        }
    }

    return insights;
}

}  // namespace autoviz
