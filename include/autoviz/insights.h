#pragma once

#include "types.h"
#include "column_classifier.h"
#include "pattern_detector.h"
#include "visualization_recommender.h"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace autoviz {

// ============================================================================
// Insight Categories and Severity Levels
// ============================================================================

enum class InsightCategory {
    STATISTICAL,    // Distribution shape, dispersion
    PATTERN,        // Clusters, temporal content, network structure
    ANOMALY,        // Outliers
    TREND,          // Correlations, monotonic drift
    RELATIONSHIP    // Categorical -> numeric influence
};

enum class InsightSeverity {
    LOW,
    MEDIUM,
    HIGH
};

// ============================================================================
// Insight Data Structures
// ============================================================================

using DataPointValue = std::variant<int64_t, double, std::string, std::vector<double>>;
using DataPoints = std::map<std::string, DataPointValue>;

struct GraphInsight {
    InsightCategory category;
    std::string title;
    std::string description;
    double confidence;              // 0..1, heuristic strength
    InsightSeverity severity;
    DataPoints data_points;         // Evidence behind the insight
    std::optional<std::string> recommendation;
};

// ============================================================================
// Threshold Configuration
// ============================================================================

struct InsightThresholds {
    // Statistical
    double skew_threshold = 1.0;            // |skew| > 1 = skewed
    double high_skew_threshold = 2.0;       // |skew| > 2 = high severity
    double cv_threshold_pct = 50.0;         // CV > 50% = high variability
    double cv_confidence = 0.9;

    // Shared minimum sample count for outlier/trend/pattern checks
    size_t min_samples = 10;

    // Pattern
    size_t histogram_bins = 10;
    size_t min_peaks = 2;
    size_t max_pattern_columns = 3;
    double multimodal_confidence = 0.75;

    // Anomaly
    double iqr_factor = 1.5;
    double outlier_pct_threshold = 5.0;     // > 5% of values outside fences
    double high_outlier_pct = 10.0;
    double outlier_confidence = 0.9;

    // Trend
    size_t max_trend_columns = 3;           // outer columns
    size_t max_trend_partner_index = 4;     // inner columns < this index
    double trend_correlation = 0.7;
    double strong_trend_correlation = 0.9;
    double normalized_slope_threshold = 0.3;

    // Relationship
    size_t max_relationship_columns = 2;
    size_t min_group_size = 3;
    size_t min_groups = 2;
    double variance_ratio_threshold = 0.3;

    // Network
    double sparse_density = 0.1;
    double moderate_density = 0.5;
    double hub_degree_factor = 2.0;
    double hub_confidence = 0.95;

    // Aggregation
    double recommendation_confidence = 0.7;  // insight recommendations kept above this
    double high_confidence = 0.8;            // counted as high-confidence in the summary
    size_t max_recommendations = 5;
    size_t max_key_findings = 5;
    size_t large_dataset_rows = 1000;
    double missing_notice_pct = 5.0;
};

// Which modules run; disabled modules contribute nothing
struct AnalysisToggles {
    bool statistical = true;
    bool patterns = true;
    bool anomalies = true;
    bool trends = true;
    bool relationships = true;
    bool network = true;
};

// ============================================================================
// Insight Detectors
// ============================================================================

struct AnalysisContext {
    const DataTable& table;
    const ColumnTypeMap& types;
    VisualizationType visualization;
    const InsightThresholds& thresholds;
};

// Each detector returns its own accumulator; nothing is shared between calls
class IInsightDetector {
public:
    virtual ~IInsightDetector() = default;

    virtual std::string name() const = 0;
    virtual std::vector<GraphInsight> analyze(const AnalysisContext& ctx) const = 0;
};

// Skewness and coefficient of variation per numeric column
class StatisticalInsightExtractor : public IInsightDetector {
public:
    std::string name() const override { return "statistical"; }
    std::vector<GraphInsight> analyze(const AnalysisContext& ctx) const override;
};

// Multimodal histograms and time-named columns
class PatternInsightDetector : public IInsightDetector {
public:
    std::string name() const override { return "pattern"; }
    std::vector<GraphInsight> analyze(const AnalysisContext& ctx) const override;

    // Interior local maxima of an equal-width histogram
    static size_t count_histogram_peaks(const std::vector<double>& values, size_t bins);
};

// IQR fences
class AnomalyDetector : public IInsightDetector {
public:
    std::string name() const override { return "anomaly"; }
    std::vector<GraphInsight> analyze(const AnalysisContext& ctx) const override;
};

// Pairwise correlation trends and monotonic drift against row position
class TrendDetector : public IInsightDetector {
public:
    std::string name() const override { return "trend"; }
    std::vector<GraphInsight> analyze(const AnalysisContext& ctx) const override;

    std::vector<GraphInsight> correlation_trends(const AnalysisContext& ctx) const;
    std::vector<GraphInsight> monotonic_trends(const AnalysisContext& ctx) const;
};

// Between-group variance of numeric columns grouped by categorical columns
class RelationshipInsightDetector : public IInsightDetector {
public:
    std::string name() const override { return "relationship"; }
    std::vector<GraphInsight> analyze(const AnalysisContext& ctx) const override;

    // nullopt when fewer than min_groups groups qualify or variance is 0
    static std::optional<double> variance_ratio(const Column& categorical,
                                                const Column& numeric,
                                                const InsightThresholds& thresholds);
};

// Density and hubs of a source/target edge list; only for network visualizations
class NetworkInsightDetector : public IInsightDetector {
public:
    NetworkInsightDetector() = default;
    explicit NetworkInsightDetector(const KeywordRules& keywords);

    std::string name() const override { return "network"; }
    std::vector<GraphInsight> analyze(const AnalysisContext& ctx) const override;

private:
    StructuralPatternDetector detector_;
};

// Default pipeline, in execution order
std::vector<std::unique_ptr<IInsightDetector>> create_default_detectors(
    const AnalysisToggles& toggles = {},
    const KeywordRules& keywords = {}
);

std::string category_to_string(InsightCategory cat);
std::string severity_to_string(InsightSeverity sev);
int severity_weight(InsightSeverity sev);

// ============================================================================
// Predefined Insight Templates
// ============================================================================

namespace insight_templates {

GraphInsight skewed_distribution(const std::string& column, double skew, double mean,
                                 const InsightThresholds& thresholds);
GraphInsight high_variability(const std::string& column, double cv, double std,
                              const InsightThresholds& thresholds);

GraphInsight multimodal_distribution(const std::string& column, size_t peaks,
                                     const InsightThresholds& thresholds);
GraphInsight temporal_data_detected();

GraphInsight outliers_detected(const std::string& column, size_t outlier_count, double outlier_pct,
                               double lower_bound, double upper_bound,
                               const InsightThresholds& thresholds);

GraphInsight correlation_trend(const std::string& col1, const std::string& col2, double r,
                               const InsightThresholds& thresholds);
GraphInsight monotonic_trend(const std::string& column, double slope, double normalized_slope);

GraphInsight categorical_influence(const std::string& categorical, const std::string& numeric,
                                   double variance_ratio);

GraphInsight network_density(size_t nodes, size_t edges, double density,
                             const InsightThresholds& thresholds);
GraphInsight network_hubs(size_t hub_count, const std::string& top_hub, size_t top_connections,
                          const InsightThresholds& thresholds);

}  // namespace insight_templates

}  // namespace autoviz
