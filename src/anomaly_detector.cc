#include "autoviz/insights.h"
#include "autoviz/statistics.h"

namespace autoviz {

std::vector<GraphInsight> AnomalyDetector::analyze(const AnalysisContext& ctx) const {
    std::vector<GraphInsight> insights;
    const InsightThresholds& t = ctx.thresholds;

    for (const auto& name : columns_of_type(ctx.types, SemanticType::NUMERIC)) {
        const std::vector<double> data = non_missing(ctx.table.column(name));
        if (data.size() < t.min_samples) continue;

        const double q1 = quantile(data, 0.25);
        const double q3 = quantile(data, 0.75);
        const double iqr = q3 - q1;
        const double lower = q1 - t.iqr_factor * iqr;
        const double upper = q3 + t.iqr_factor * iqr;

        size_t outliers = 0;
        for (double v : data) {
            if (v < lower || v > upper) ++outliers;
        }

        const double outlier_pct = static_cast<double>(outliers) / static_cast<double>(data.size()) * 100.0;
        if (outlier_pct > t.outlier_pct_threshold) {
            insights.push_back(insight_templates::outliers_detected(
                name, outliers, outlier_pct, lower, upper, t));
        }
    }

    return insights;
}

}  // namespace autoviz
