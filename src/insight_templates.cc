// ============================================================================
// AutoViz Insight Templates
// ============================================================================
// Wording, severity and confidence of every insight the detectors can emit.
// Detectors decide *whether* an insight fires; templates decide what it says.
// ============================================================================

#include "autoviz/insights.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace autoviz {

std::string category_to_string(InsightCategory cat) {
    switch (cat) {
        case InsightCategory::STATISTICAL: return "statistical";
        case InsightCategory::PATTERN: return "pattern";
        case InsightCategory::ANOMALY: return "anomaly";
        case InsightCategory::TREND: return "trend";
        case InsightCategory::RELATIONSHIP: return "relationship";
        default: return "unknown";
    }
}

std::string severity_to_string(InsightSeverity sev) {
    switch (sev) {
        case InsightSeverity::LOW: return "low";
        case InsightSeverity::MEDIUM: return "medium";
        case InsightSeverity::HIGH: return "high";
        default: return "unknown";
    }
}

int severity_weight(InsightSeverity sev) {
    switch (sev) {
        case InsightSeverity::LOW: return 1;
        case InsightSeverity::MEDIUM: return 2;
        case InsightSeverity::HIGH: return 3;
        default: return 1;
    }
}

namespace insight_templates {

namespace {

std::string fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string capitalize(std::string word) {
    if (!word.empty()) {
        word[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
    }
    return word;
}

}  // anonymous namespace

GraphInsight skewed_distribution(const std::string& column, double skew, double mean,
                                 const InsightThresholds& thresholds) {
    GraphInsight insight;
    const std::string direction = skew > 0 ? "right" : "left";
    insight.category = InsightCategory::STATISTICAL;
    insight.severity = std::abs(skew) > thresholds.high_skew_threshold
        ? InsightSeverity::HIGH : InsightSeverity::MEDIUM;
    insight.confidence = std::min(std::abs(skew) / 3.0, 1.0);
    insight.title = "Skewed Distribution in " + column;
    insight.description = column + " shows " + direction + "-skewed distribution (skewness: " +
                          fixed(skew, 2) + ")";
    insight.data_points = {
        {"column", column},
        {"skewness", skew},
        {"mean", mean}
    };
    insight.recommendation = "Consider log transformation or outlier investigation for " + column;
    return insight;
}

GraphInsight high_variability(const std::string& column, double cv, double std,
                              const InsightThresholds& thresholds) {
    GraphInsight insight;
    insight.category = InsightCategory::STATISTICAL;
    insight.severity = InsightSeverity::MEDIUM;
    insight.confidence = thresholds.cv_confidence;
    insight.title = "High Variability in " + column;
    insight.description = column + " has high variability (CV: " + fixed(cv, 1) + "%)";
    insight.data_points = {
        {"column", column},
        {"cv", cv},
        {"std", std}
    };
    insight.recommendation = "High variability in " + column + " may indicate multiple subgroups";
    return insight;
}

GraphInsight multimodal_distribution(const std::string& column, size_t peaks,
                                     const InsightThresholds& thresholds) {
    GraphInsight insight;
    insight.category = InsightCategory::PATTERN;
    insight.severity = InsightSeverity::MEDIUM;
    insight.confidence = thresholds.multimodal_confidence;
    insight.title = "Multimodal Distribution in " + column;
    insight.description = column + " shows " + std::to_string(peaks) + " distinct clusters or groups";
    insight.data_points = {
        {"column", column},
        {"peaks", static_cast<int64_t>(peaks)}
    };
    insight.recommendation = "Consider grouping or segmentation analysis for " + column;
    return insight;
}

GraphInsight temporal_data_detected() {
    GraphInsight insight;
    insight.category = InsightCategory::PATTERN;
    insight.severity = InsightSeverity::LOW;
    insight.confidence = 1.0;
    insight.title = "Temporal Data Detected";
    insight.description = "Data contains time-based information suitable for trend analysis";
    insight.data_points = {{"type", std::string("temporal")}};
    insight.recommendation = "Consider time-series analysis or animated visualizations";
    return insight;
}

GraphInsight outliers_detected(const std::string& column, size_t outlier_count, double outlier_pct,
                               double lower_bound, double upper_bound,
                               const InsightThresholds& thresholds) {
    GraphInsight insight;
    insight.category = InsightCategory::ANOMALY;
    insight.severity = outlier_pct > thresholds.high_outlier_pct
        ? InsightSeverity::HIGH : InsightSeverity::MEDIUM;
    insight.confidence = thresholds.outlier_confidence;
    insight.title = "Outliers Detected in " + column;
    insight.description = fixed(outlier_pct, 1) + "% of " + column + " values are statistical outliers";
    insight.data_points = {
        {"column", column},
        {"outlier_count", static_cast<int64_t>(outlier_count)},
        {"outlier_pct", outlier_pct},
        {"bounds", std::vector<double>{lower_bound, upper_bound}}
    };
    insight.recommendation = "Investigate outliers in " + column +
                             " - may indicate errors or special cases";
    return insight;
}

GraphInsight correlation_trend(const std::string& col1, const std::string& col2, double r,
                               const InsightThresholds& thresholds) {
    GraphInsight insight;
    const bool strong = std::abs(r) > thresholds.strong_trend_correlation;
    const std::string direction = r > 0 ? "positive" : "negative";
    const std::string strength = strong ? "strong" : "moderate";

    insight.category = InsightCategory::TREND;
    insight.severity = strong ? InsightSeverity::HIGH : InsightSeverity::MEDIUM;
    insight.confidence = std::abs(r);
    insight.title = capitalize(strength) + " " + capitalize(direction) + " Correlation";
    insight.description = col1 + " and " + col2 + " show " + strength + " " + direction +
                          " correlation (r=" + fixed(r, 3) + ")";
    insight.data_points = {
        {"col1", col1},
        {"col2", col2},
        {"correlation", r}
    };
    insight.recommendation = "Strong relationship between " + col1 + " and " + col2 +
                             " suggests predictive potential";
    return insight;
}

GraphInsight monotonic_trend(const std::string& column, double slope, double normalized_slope) {
    GraphInsight insight;
    const std::string direction = normalized_slope > 0 ? "increasing" : "decreasing";
    insight.category = InsightCategory::TREND;
    insight.severity = InsightSeverity::MEDIUM;
    insight.confidence = std::min(std::abs(normalized_slope), 1.0);
    insight.title = capitalize(direction) + " Trend in " + column;
    insight.description = column + " shows a clear " + direction + " trend over the dataset";
    insight.data_points = {
        {"column", column},
        {"slope", slope},
        {"normalized_slope", normalized_slope}
    };
    insight.recommendation = "Monitor " + column + " - trend suggests continued " + direction + " pattern";
    return insight;
}

GraphInsight categorical_influence(const std::string& categorical, const std::string& numeric,
                                   double variance_ratio) {
    GraphInsight insight;
    insight.category = InsightCategory::RELATIONSHIP;
    insight.severity = InsightSeverity::MEDIUM;
    insight.confidence = std::min(variance_ratio, 1.0);
    insight.title = categorical + " Influences " + numeric;
    insight.description = categorical + " groups show distinct " + numeric + " values";
    insight.data_points = {
        {"categorical", categorical},
        {"numeric", numeric},
        {"variance_ratio", variance_ratio}
    };
    insight.recommendation = "Use " + categorical + " for color/grouping in visualizations";
    return insight;
}

GraphInsight network_density(size_t nodes, size_t edges, double density,
                             const InsightThresholds& thresholds) {
    std::string level = "dense";
    if (density < thresholds.sparse_density) {
        level = "sparse";
    } else if (density < thresholds.moderate_density) {
        level = "moderate";
    }

    GraphInsight insight;
    insight.category = InsightCategory::PATTERN;
    insight.severity = InsightSeverity::LOW;
    insight.confidence = 1.0;
    insight.title = capitalize(level) + " Network";
    insight.description = "Network has " + std::to_string(nodes) + " nodes and " +
                          std::to_string(edges) + " edges (density: " + fixed(density, 3) + ")";
    insight.data_points = {
        {"nodes", static_cast<int64_t>(nodes)},
        {"edges", static_cast<int64_t>(edges)},
        {"density", density}
    };
    insight.recommendation = "Network is " + level + ", consider hub analysis";
    return insight;
}

GraphInsight network_hubs(size_t hub_count, const std::string& top_hub, size_t top_connections,
                          const InsightThresholds& thresholds) {
    GraphInsight insight;
    insight.category = InsightCategory::PATTERN;
    insight.severity = InsightSeverity::HIGH;
    insight.confidence = thresholds.hub_confidence;
    insight.title = "Network Hubs Detected";
    insight.description = std::to_string(hub_count) + " hub nodes identified, top hub: " + top_hub +
                          " (" + std::to_string(top_connections) + " connections)";
    insight.data_points = {
        {"hub_count", static_cast<int64_t>(hub_count)},
        {"top_hub", top_hub},
        {"top_connections", static_cast<int64_t>(top_connections)}
    };
    insight.recommendation = "Focus on hub nodes for network influence analysis";
    return insight;
}

}  // namespace insight_templates

}  // namespace autoviz
