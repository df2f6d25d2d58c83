#include "autoviz/insights.h"
#include "autoviz/statistics.h"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace autoviz {

std::vector<GraphInsight> TrendDetector::analyze(const AnalysisContext& ctx) const {
    std::vector<GraphInsight> insights = correlation_trends(ctx);
    std::vector<GraphInsight> monotonic = monotonic_trends(ctx);
    insights.insert(insights.end(), monotonic.begin(), monotonic.end());
    return insights;
}

std::vector<GraphInsight> TrendDetector::correlation_trends(const AnalysisContext& ctx) const {
    std::vector<GraphInsight> insights;
    const InsightThresholds& t = ctx.thresholds;

    const auto numeric_cols = columns_of_type(ctx.types, SemanticType::NUMERIC);
    if (numeric_cols.size() < 2) return insights;

    const size_t outer = std::min(numeric_cols.size(), t.max_trend_columns);
    const size_t inner_end = std::min(numeric_cols.size(), t.max_trend_partner_index);

    for (size_t i = 0; i < outer; ++i) {
        const Column& a = ctx.table.column(numeric_cols[i]);
        for (size_t j = i + 1; j < inner_end; ++j) {
            const Column& b = ctx.table.column(numeric_cols[j]);
            auto [xs, ys] = paired_non_missing(a, b);
            if (xs.size() < t.min_samples) continue;

            const double r = pearson(xs, ys);
            if (std::abs(r) > t.trend_correlation) {
                insights.push_back(insight_templates::correlation_trend(a.name, b.name, r, t));
            }
        }
    }

    return insights;
}

std::vector<GraphInsight> TrendDetector::monotonic_trends(const AnalysisContext& ctx) const {
    std::vector<GraphInsight> insights;
    const InsightThresholds& t = ctx.thresholds;

    if (!ctx.table.is_row_order_monotonic()) return insights;

    const auto numeric_cols = columns_of_type(ctx.types, SemanticType::NUMERIC);
    const size_t limit = std::min(numeric_cols.size(), t.max_trend_columns);

    for (size_t i = 0; i < limit; ++i) {
        const std::vector<double> y = non_missing(ctx.table.column(numeric_cols[i]));
        if (y.size() < t.min_samples) continue;

        auto [min_it, max_it] = std::minmax_element(y.begin(), y.end());
        const double range = *max_it - *min_it;
        if (!(range > 0.0)) continue;

        std::vector<double> x(y.size());
        std::iota(x.begin(), x.end(), 0.0);
        const LinearFit fit = linear_fit(x, y);

        const double normalized = fit.slope * static_cast<double>(y.size()) / range;
        if (std::abs(normalized) > t.normalized_slope_threshold) {
            insights.push_back(insight_templates::monotonic_trend(numeric_cols[i], fit.slope, normalized));
        }
    }

    return insights;
}

}  // namespace autoviz
