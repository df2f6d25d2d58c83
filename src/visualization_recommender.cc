#include "autoviz/visualization_recommender.h"
#include <algorithm>

namespace autoviz {

// ============================================================================
// VisualizationType helpers
// ============================================================================

std::string to_string(VisualizationType type) {
    switch (type) {
        case VisualizationType::NETWORK: return "network";
        case VisualizationType::SCATTER_3D: return "3d_scatter";
        case VisualizationType::SURFACE_3D: return "3d_surface";
        case VisualizationType::LINE_3D: return "3d_line";
        case VisualizationType::BAR_3D: return "3d_bar";
        case VisualizationType::MESH_3D: return "3d_mesh";
        case VisualizationType::GENERIC_SCATTER: return "generic_scatter";
        default: return "generic_scatter";
    }
}

std::vector<VisualizationType> all_visualization_types() {
    return {
        VisualizationType::NETWORK,
        VisualizationType::SCATTER_3D,
        VisualizationType::SURFACE_3D,
        VisualizationType::LINE_3D,
        VisualizationType::BAR_3D,
        VisualizationType::MESH_3D,
        VisualizationType::GENERIC_SCATTER
    };
}

std::optional<VisualizationType> parse_visualization_type(const std::string& name) {
    const std::string lower = StructuralPatternDetector::to_lower(name);
    for (auto type : all_visualization_types()) {
        if (to_string(type) == lower) return type;
    }
    return std::nullopt;
}

std::string describe(VisualizationType type) {
    std::string label = to_string(type);
    if (label.rfind("3d_", 0) == 0) {
        label = label.substr(3);
    }
    std::replace(label.begin(), label.end(), '_', ' ');
    return label;
}

// ============================================================================
// Rule table
// ============================================================================

std::vector<RecommendationRule> VisualizationRecommender::get_default_rules() {
    std::vector<RecommendationRule> rules;

    rules.push_back({
        VisualizationType::NETWORK,
        [](const ProfileFeatures& f) { return f.has_network_structure; },
        [](const ProfileFeatures&) { return 0.95; }
    });

    rules.push_back({
        VisualizationType::SCATTER_3D,
        [](const ProfileFeatures& f) { return f.numeric_count >= 3; },
        [](const ProfileFeatures& f) {
            return std::min(0.9, 0.6 + 0.1 * static_cast<double>(f.numeric_count));
        }
    });

    rules.push_back({
        VisualizationType::SURFACE_3D,
        [](const ProfileFeatures& f) { return f.numeric_count == 3 && f.row_count >= 10; },
        [](const ProfileFeatures&) { return 0.75; }
    });

    rules.push_back({
        VisualizationType::LINE_3D,
        [](const ProfileFeatures& f) { return f.has_temporal && f.numeric_count >= 2; },
        [](const ProfileFeatures&) { return 0.80; }
    });

    rules.push_back({
        VisualizationType::BAR_3D,
        [](const ProfileFeatures& f) {
            return f.has_categorical && f.numeric_count >= 1 &&
                   f.categorical_count <= 2 && f.row_count <= 100;
        },
        [](const ProfileFeatures&) { return 0.70; }
    });

    rules.push_back({
        VisualizationType::MESH_3D,
        [](const ProfileFeatures& f) { return f.has_spatial && f.numeric_count >= 3; },
        [](const ProfileFeatures&) { return 0.85; }
    });

    return rules;
}

VisualizationRecommender::VisualizationRecommender() : rules_(get_default_rules()) {}

std::vector<Recommendation> VisualizationRecommender::recommend(const ProfileFeatures& features) const {
    std::vector<Recommendation> candidates;

    for (const auto& rule : rules_) {
        if (!rule.applies(features)) continue;
        const double confidence = std::clamp(rule.confidence(features), 0.0, 1.0);
        candidates.push_back({rule.type, confidence});
    }

    if (candidates.empty()) {
        candidates.push_back(fallback());
        return candidates;
    }

    std::stable_sort(candidates.begin(), candidates.end(),
        [](const Recommendation& a, const Recommendation& b) {
            return a.confidence > b.confidence;
        });
    return candidates;
}

Recommendation VisualizationRecommender::choose(
    const std::vector<Recommendation>& candidates,
    std::optional<VisualizationType> preference
) const {
    if (candidates.empty()) {
        return fallback();
    }
    if (preference) {
        for (const auto& candidate : candidates) {
            if (candidate.type == *preference) return candidate;
        }
    }
    return candidates.front();
}

// ============================================================================
// Column bindings
// ============================================================================

namespace {

std::optional<std::string> nth(const std::vector<std::string>& names, size_t n) {
    if (n < names.size()) return names[n];
    return std::nullopt;
}

void bind(VisualizationParameters& params, const std::string& key,
          std::optional<std::string> preferred, std::optional<std::string> fallback) {
    if (preferred) {
        params[key] = *preferred;
    } else if (fallback) {
        params[key] = *fallback;
    }
}

std::optional<std::string> first_matching(const std::vector<std::string>& names,
                                          const std::vector<std::string>& keywords) {
    for (const auto& name : names) {
        if (StructuralPatternDetector::contains_any(StructuralPatternDetector::to_lower(name), keywords)) {
            return name;
        }
    }
    return std::nullopt;
}

}  // anonymous namespace

VisualizationParameters VisualizationRecommender::bind_columns(
    VisualizationType type,
    const DataTable& table,
    const ColumnTypeMap& types
) {
    VisualizationParameters params;
    const auto names = table.column_names();
    const auto numeric = columns_of_type(types, SemanticType::NUMERIC);
    const auto categorical = columns_of_type(types, SemanticType::CATEGORICAL);

    switch (type) {
        case VisualizationType::NETWORK: {
            auto source = first_matching(names, {"source", "from", "node1", "src"});
            auto target = first_matching(names, {"target", "to", "node2", "dst", "dest"});
            bind(params, "source_col", source, nth(names, 0));
            bind(params, "target_col", target, names.size() > 1 ? nth(names, 1) : nth(names, 0));
            break;
        }
        case VisualizationType::BAR_3D: {
            bind(params, "x_col", nth(categorical, 0), nth(names, 0));
            bind(params, "y_col", nth(categorical, 1),
                 nth(numeric, 0) ? nth(numeric, 0) : nth(names, 1));
            bind(params, "z_col", nth(numeric, 0), nth(names, 2));
            break;
        }
        default: {
            bind(params, "x_col", nth(numeric, 0), nth(names, 0));
            bind(params, "y_col", nth(numeric, 1), nth(names, 1));
            bind(params, "z_col", nth(numeric, 2), nth(names, 2));
            break;
        }
    }

    return params;
}

}  // namespace autoviz
