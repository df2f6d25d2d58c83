#include "autoviz/insights.h"
#include "autoviz/statistics.h"
#include <algorithm>

namespace autoviz {

size_t PatternInsightDetector::count_histogram_peaks(const std::vector<double>& values, size_t bins) {
    if (values.empty() || bins < 3) return 0;

    auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
    const double lo = *min_it;
    const double span = *max_it - lo;
    if (!(span > 0.0)) return 0;

    std::vector<size_t> hist(bins, 0);
    for (double v : values) {
        size_t bin = static_cast<size_t>((v - lo) / span * static_cast<double>(bins));
        // Upper edge belongs to the last bin
        hist[std::min(bin, bins - 1)]++;
    }

    size_t peaks = 0;
    for (size_t i = 1; i + 1 < bins; ++i) {
        if (hist[i] > hist[i - 1] && hist[i] > hist[i + 1]) ++peaks;
    }
    return peaks;
}

std::vector<GraphInsight> PatternInsightDetector::analyze(const AnalysisContext& ctx) const {
    std::vector<GraphInsight> insights;
    const InsightThresholds& t = ctx.thresholds;

    const auto numeric_cols = columns_of_type(ctx.types, SemanticType::NUMERIC);
    if (numeric_cols.size() >= 2) {
        const size_t limit = std::min(numeric_cols.size(), t.max_pattern_columns);
        for (size_t i = 0; i < limit; ++i) {
            const std::vector<double> data = non_missing(ctx.table.column(numeric_cols[i]));
            if (data.size() < t.min_samples) continue;

            const size_t peaks = count_histogram_peaks(data, t.histogram_bins);
            if (peaks >= t.min_peaks) {
                insights.push_back(insight_templates::multimodal_distribution(numeric_cols[i], peaks, t));
            }
        }
    }

    for (const auto& col : ctx.table.columns()) {
        if (StructuralPatternDetector::contains_any(StructuralPatternDetector::to_lower(col.name),
                                                    {"date", "time"})) {
            insights.push_back(insight_templates::temporal_data_detected());
            break;
        }
    }

    return insights;
}

}  // namespace autoviz
