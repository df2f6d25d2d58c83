#pragma once

#include "types.h"
#include "column_classifier.h"
#include "insights.h"
#include "visualization_recommender.h"
#include <memory>
#include <string>
#include <vector>

namespace autoviz {

// ============================================================================
// Analytics Report
// ============================================================================

struct DataSummary {
    size_t total_records = 0;
    size_t total_columns = 0;
    size_t numeric_columns = 0;
    size_t categorical_columns = 0;
    size_t missing_values = 0;
    double missing_percentage = 0.0;
    double memory_usage_mb = 0.0;
};

struct AnalyticsReport {
    std::string timestamp;                  // ISO-8601, local time
    VisualizationType visualization;
    DataSummary data_summary;

    std::vector<GraphInsight> insights;     // module execution order

    // Descriptions filtered out of insights by category
    std::vector<std::string> patterns;
    std::vector<std::string> anomalies;
    std::vector<std::string> trends;

    std::vector<std::string> recommendations;   // at most max_recommendations
    std::string natural_language_summary;
    std::vector<std::string> key_findings;      // at most max_key_findings
};

// ============================================================================
// Insight Aggregator
// ============================================================================

class InsightAggregator {
public:
    explicit InsightAggregator(const InsightThresholds& thresholds);

    AnalyticsReport aggregate(
        const DataTable& table,
        const ColumnTypeMap& types,
        VisualizationType visualization,
        std::vector<GraphInsight> insights
    ) const;

    static std::vector<std::string> descriptions_of(const std::vector<GraphInsight>& insights,
                                                    InsightCategory category);

    std::vector<std::string> generate_recommendations(
        const std::vector<GraphInsight>& insights,
        const DataSummary& summary,
        const ColumnTypeMap& types,
        VisualizationType visualization
    ) const;

    std::string generate_summary(
        const std::vector<GraphInsight>& insights,
        const DataSummary& summary,
        VisualizationType visualization
    ) const;

    // Ranked by confidence x severity weight, ties keep insight order
    std::vector<std::string> extract_key_findings(const std::vector<GraphInsight>& insights) const;

    static DataSummary create_data_summary(const DataTable& table, const ColumnTypeMap& types);

private:
    InsightThresholds thresholds_;
};

// ============================================================================
// Analytics Engine - analyze(table, vizType) composition root
// ============================================================================

class AnalyticsEngine {
public:
    AnalyticsEngine();
    explicit AnalyticsEngine(const InsightThresholds& thresholds,
                             const AnalysisToggles& toggles = {},
                             const KeywordRules& keywords = {});

    // Throws InputError for a table without columns
    AnalyticsReport analyze(const DataTable& table, VisualizationType visualization) const;

    // Throws InputError for an unknown visualization name
    AnalyticsReport analyze(const DataTable& table, const std::string& visualization) const;

    const InsightThresholds& thresholds() const { return thresholds_; }
    const std::vector<std::unique_ptr<IInsightDetector>>& detectors() const { return detectors_; }

private:
    InsightThresholds thresholds_;
    ColumnClassifier classifier_;
    std::vector<std::unique_ptr<IInsightDetector>> detectors_;
};

std::string current_timestamp();

}  // namespace autoviz
