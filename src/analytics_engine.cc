// ============================================================================
// AutoViz Analytics Engine
// ============================================================================
// Runs the insight detectors in a fixed order and folds their output into an
// AnalyticsReport: category lists, recommendations, key findings and a
// templated natural-language summary.
// ============================================================================

#include "autoviz/analytics_engine.h"
#include "autoviz/errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace autoviz {

std::string current_timestamp() {
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

std::vector<std::unique_ptr<IInsightDetector>> create_default_detectors(
    const AnalysisToggles& toggles,
    const KeywordRules& keywords
) {
    std::vector<std::unique_ptr<IInsightDetector>> detectors;
    if (toggles.statistical) detectors.push_back(std::make_unique<StatisticalInsightExtractor>());
    if (toggles.patterns) detectors.push_back(std::make_unique<PatternInsightDetector>());
    if (toggles.anomalies) detectors.push_back(std::make_unique<AnomalyDetector>());
    if (toggles.trends) detectors.push_back(std::make_unique<TrendDetector>());
    if (toggles.relationships) detectors.push_back(std::make_unique<RelationshipInsightDetector>());
    if (toggles.network) detectors.push_back(std::make_unique<NetworkInsightDetector>(keywords));
    return detectors;
}

// ============================================================================
// InsightAggregator
// ============================================================================

InsightAggregator::InsightAggregator(const InsightThresholds& thresholds) : thresholds_(thresholds) {}

std::vector<std::string> InsightAggregator::descriptions_of(
    const std::vector<GraphInsight>& insights,
    InsightCategory category
) {
    std::vector<std::string> descriptions;
    for (const auto& insight : insights) {
        if (insight.category == category) descriptions.push_back(insight.description);
    }
    return descriptions;
}

DataSummary InsightAggregator::create_data_summary(const DataTable& table, const ColumnTypeMap& types) {
    DataSummary summary;
    summary.total_records = table.row_count();
    summary.total_columns = table.column_count();
    summary.numeric_columns = count_of_type(types, SemanticType::NUMERIC);
    summary.categorical_columns = count_of_type(types, SemanticType::CATEGORICAL);
    summary.missing_values = table.missing_count();

    const size_t cells = table.row_count() * table.column_count();
    summary.missing_percentage = cells > 0
        ? static_cast<double>(summary.missing_values) / static_cast<double>(cells) * 100.0
        : 0.0;
    summary.memory_usage_mb = static_cast<double>(table.memory_usage_bytes()) / 1024.0 / 1024.0;
    return summary;
}

std::vector<std::string> InsightAggregator::generate_recommendations(
    const std::vector<GraphInsight>& insights,
    const DataSummary& summary,
    const ColumnTypeMap& types,
    VisualizationType visualization
) const {
    std::vector<std::string> recommendations;

    for (const auto& insight : insights) {
        if (insight.recommendation && insight.confidence > thresholds_.recommendation_confidence) {
            recommendations.push_back(*insight.recommendation);
        }
    }

    if (summary.total_records > thresholds_.large_dataset_rows) {
        recommendations.push_back(
            "Consider aggregation or sampling for better performance with large datasets");
    }

    if (summary.missing_percentage > thresholds_.missing_notice_pct) {
        std::ostringstream oss;
        oss << "Dataset has " << std::fixed << std::setprecision(1) << summary.missing_percentage
            << "% missing values - consider imputation or filtering";
        recommendations.push_back(oss.str());
    }

    if (visualization == VisualizationType::SCATTER_3D ||
        visualization == VisualizationType::GENERIC_SCATTER) {
        const auto categorical = columns_of_type(types, SemanticType::CATEGORICAL);
        if (!categorical.empty()) {
            recommendations.push_back("Use " + categorical.front() +
                                      " for color encoding to reveal patterns");
        }
    }

    if (recommendations.size() > thresholds_.max_recommendations) {
        recommendations.resize(thresholds_.max_recommendations);
    }
    return recommendations;
}

std::string InsightAggregator::generate_summary(
    const std::vector<GraphInsight>& insights,
    const DataSummary& summary,
    VisualizationType visualization
) const {
    std::vector<std::string> parts;

    parts.push_back("This " + describe(visualization) + " visualization represents a dataset with " +
                    std::to_string(summary.total_records) + " records and " +
                    std::to_string(summary.total_columns) + " variables.");

    const auto high_confidence = std::count_if(insights.begin(), insights.end(),
        [this](const GraphInsight& i) { return i.confidence > thresholds_.high_confidence; });
    if (high_confidence > 0) {
        parts.push_back("Analysis identified " + std::to_string(high_confidence) +
                        " high-confidence insights.");
    }

    const size_t patterns = descriptions_of(insights, InsightCategory::PATTERN).size();
    if (patterns > 0) {
        parts.push_back("Detected " + std::to_string(patterns) +
                        " distinct patterns in the data structure.");
    }

    const size_t anomalies = descriptions_of(insights, InsightCategory::ANOMALY).size();
    if (anomalies > 0) {
        parts.push_back("Found " + std::to_string(anomalies) +
                        " anomalies that may require attention.");
    }

    const size_t trends = descriptions_of(insights, InsightCategory::TREND).size();
    if (trends > 0) {
        parts.push_back("Identified " + std::to_string(trends) +
                        " significant trends or correlations.");
    }

    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) oss << ' ';
        oss << parts[i];
    }
    return oss.str();
}

std::vector<std::string> InsightAggregator::extract_key_findings(
    const std::vector<GraphInsight>& insights
) const {
    std::vector<const GraphInsight*> ranked;
    ranked.reserve(insights.size());
    for (const auto& insight : insights) ranked.push_back(&insight);

    std::stable_sort(ranked.begin(), ranked.end(), [](const GraphInsight* a, const GraphInsight* b) {
        return a->confidence * severity_weight(a->severity) >
               b->confidence * severity_weight(b->severity);
    });

    std::vector<std::string> findings;
    for (const auto* insight : ranked) {
        if (findings.size() >= thresholds_.max_key_findings) break;
        findings.push_back(insight->title + ": " + insight->description);
    }
    return findings;
}

AnalyticsReport InsightAggregator::aggregate(
    const DataTable& table,
    const ColumnTypeMap& types,
    VisualizationType visualization,
    std::vector<GraphInsight> insights
) const {
    AnalyticsReport report;
    report.timestamp = current_timestamp();
    report.visualization = visualization;
    report.data_summary = create_data_summary(table, types);

    report.patterns = descriptions_of(insights, InsightCategory::PATTERN);
    report.anomalies = descriptions_of(insights, InsightCategory::ANOMALY);
    report.trends = descriptions_of(insights, InsightCategory::TREND);

    report.recommendations = generate_recommendations(insights, report.data_summary, types, visualization);
    report.natural_language_summary = generate_summary(insights, report.data_summary, visualization);
    report.key_findings = extract_key_findings(insights);
    report.insights = std::move(insights);

    return report;
}

// ============================================================================
// AnalyticsEngine
// ============================================================================

AnalyticsEngine::AnalyticsEngine() : detectors_(create_default_detectors()) {}

AnalyticsEngine::AnalyticsEngine(
    const InsightThresholds& thresholds,
    const AnalysisToggles& toggles,
    const KeywordRules& keywords
) : thresholds_(thresholds),
    detectors_(create_default_detectors(toggles, keywords)) {}

AnalyticsReport AnalyticsEngine::analyze(const DataTable& table, VisualizationType visualization) const {
    if (table.column_count() == 0) {
        throw InputError("table has no columns");
    }

    spdlog::debug("Analyzing {} rows x {} columns for {} visualization",
                  table.row_count(), table.column_count(), to_string(visualization));

    const ColumnTypeMap types = classifier_.classify(table);
    const AnalysisContext ctx{table, types, visualization, thresholds_};

    std::vector<GraphInsight> insights;
    for (const auto& detector : detectors_) {
        std::vector<GraphInsight> found = detector->analyze(ctx);
        spdlog::debug("  {} module: {} insights", detector->name(), found.size());
        insights.insert(insights.end(),
                        std::make_move_iterator(found.begin()),
                        std::make_move_iterator(found.end()));
    }

    return InsightAggregator(thresholds_).aggregate(table, types, visualization, std::move(insights));
}

AnalyticsReport AnalyticsEngine::analyze(const DataTable& table, const std::string& visualization) const {
    auto type = parse_visualization_type(visualization);
    if (!type) {
        throw InputError("unknown visualization type '" + visualization + "'");
    }
    return analyze(table, *type);
}

}  // namespace autoviz
