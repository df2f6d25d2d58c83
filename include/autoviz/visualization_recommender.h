#pragma once

#include "types.h"
#include "column_classifier.h"
#include "pattern_detector.h"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace autoviz {

// ============================================================================
// Visualization types
// ============================================================================

enum class VisualizationType {
    NETWORK,
    SCATTER_3D,
    SURFACE_3D,
    LINE_3D,
    BAR_3D,
    MESH_3D,
    GENERIC_SCATTER   // fallback when no rule fires
};

std::string to_string(VisualizationType type);
std::optional<VisualizationType> parse_visualization_type(const std::string& name);

// Human label: "3d_scatter" -> "scatter", "generic_scatter" -> "generic scatter"
std::string describe(VisualizationType type);

std::vector<VisualizationType> all_visualization_types();

// Axis/column bindings handed to the rendering collaborator
using VisualizationParameters = std::map<std::string, std::string>;

struct Recommendation {
    VisualizationType type;
    double confidence;
};

// Everything the rule table looks at
struct ProfileFeatures {
    size_t row_count = 0;
    size_t numeric_count = 0;
    size_t categorical_count = 0;
    bool has_temporal = false;
    bool has_categorical = false;
    bool has_network_structure = false;
    bool has_spatial = false;
};

// ============================================================================
// Rule table
// ============================================================================

struct RecommendationRule {
    VisualizationType type;
    std::function<bool(const ProfileFeatures&)> applies;
    std::function<double(const ProfileFeatures&)> confidence;
};

class VisualizationRecommender {
public:
    VisualizationRecommender();

    // All firing rules, confidence descending; ties keep rule declaration
    // order. Never empty: falls back to (generic_scatter, 0.5).
    std::vector<Recommendation> recommend(const ProfileFeatures& features) const;

    // Override is honoured only when it is among the candidates
    Recommendation choose(const std::vector<Recommendation>& candidates,
                          std::optional<VisualizationType> preference = std::nullopt) const;

    const std::vector<RecommendationRule>& rules() const { return rules_; }

    static std::vector<RecommendationRule> get_default_rules();
    static Recommendation fallback() { return {VisualizationType::GENERIC_SCATTER, 0.5}; }

    static VisualizationParameters bind_columns(VisualizationType type,
                                                const DataTable& table,
                                                const ColumnTypeMap& types);

private:
    std::vector<RecommendationRule> rules_;
};

}  // namespace autoviz
