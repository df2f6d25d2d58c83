#include "autoviz/insights.h"
#include "autoviz/statistics.h"
#include <cmath>

namespace autoviz {

std::vector<GraphInsight> StatisticalInsightExtractor::analyze(const AnalysisContext& ctx) const {
    std::vector<GraphInsight> insights;
    const InsightThresholds& t = ctx.thresholds;

    for (const auto& name : columns_of_type(ctx.types, SemanticType::NUMERIC)) {
        const std::vector<double> data = non_missing(ctx.table.column(name));
        if (data.empty()) continue;

        const double m = mean(data);
        const double s = sample_stddev(data);
        const double skew = skewness(data);

        if (std::abs(skew) > t.skew_threshold) {
            insights.push_back(insight_templates::skewed_distribution(name, skew, m, t));
        }

        if (m != 0.0) {
            const double cv = (s / std::abs(m)) * 100.0;
            if (cv > t.cv_threshold_pct) {
                insights.push_back(insight_templates::high_variability(name, cv, s, t));
            }
        }
    }

    return insights;
}

}  // namespace autoviz
