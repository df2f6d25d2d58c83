#pragma once

#include "types.h"
#include "column_classifier.h"
#include "pattern_detector.h"
#include "relationship_analyzer.h"
#include "visualization_recommender.h"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace autoviz {

// ============================================================================
// Data profile
// ============================================================================

struct NumericColumnStats {
    double mean;
    double std;
    double min;
    double max;
    double median;
};

struct CategoricalColumnStats {
    size_t unique_count;
    std::optional<std::string> most_common;   // smallest label among ties
};

struct StatisticalSummary {
    std::map<std::string, NumericColumnStats> numeric;
    std::map<std::string, CategoricalColumnStats> categorical;
    std::vector<std::pair<std::string, size_t>> missing_values;  // column order
};

struct DataProfile {
    size_t row_count = 0;
    size_t column_count = 0;
    std::vector<std::string> column_names;
    ColumnTypeMap column_types;

    bool has_temporal = false;
    bool has_categorical = false;
    bool has_numeric = false;
    bool has_network_structure = false;
    bool has_spatial = false;

    std::vector<Relationship> relationships;
    StatisticalSummary statistical_summary;

    // Confidence descending, never empty
    std::vector<VisualizationType> suggested_visualizations;
    std::map<VisualizationType, double> confidence_scores;

    ProfileFeatures features() const;
};

// Autonomous choice plus what the renderer needs to draw it
struct VisualizationDecision {
    VisualizationType type;
    double confidence;
    bool autonomous;                  // false when a caller override was honoured
    VisualizationParameters parameters;
    DataProfile profile;
};

// ============================================================================
// Profiler - profile(table) composition root
// ============================================================================

class Profiler {
public:
    Profiler() = default;
    Profiler(const KeywordRules& keywords, const RelationshipThresholds& thresholds);

    // Throws InputError for a table without columns
    DataProfile profile(const DataTable& table) const;

    std::vector<Recommendation> suggest(const DataTable& table) const;

    VisualizationDecision decide_visualization(
        const DataTable& table,
        std::optional<VisualizationType> preference = std::nullopt
    ) const;

    static StatisticalSummary compute_statistics(const DataTable& table,
                                                 const ColumnTypeMap& types);

private:
    ColumnClassifier classifier_;
    StructuralPatternDetector pattern_detector_;
    RelationshipAnalyzer relationship_analyzer_;
    VisualizationRecommender recommender_;
};

}  // namespace autoviz
