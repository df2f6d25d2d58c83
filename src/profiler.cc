#include "autoviz/profiler.h"
#include "autoviz/errors.h"
#include "autoviz/statistics.h"
#include <spdlog/spdlog.h>
#include <map>

namespace autoviz {

ProfileFeatures DataProfile::features() const {
    ProfileFeatures f;
    f.row_count = row_count;
    f.numeric_count = count_of_type(column_types, SemanticType::NUMERIC);
    f.categorical_count = count_of_type(column_types, SemanticType::CATEGORICAL);
    f.has_temporal = has_temporal;
    f.has_categorical = has_categorical;
    f.has_network_structure = has_network_structure;
    f.has_spatial = has_spatial;
    return f;
}

Profiler::Profiler(const KeywordRules& keywords, const RelationshipThresholds& thresholds)
    : pattern_detector_(keywords),
      relationship_analyzer_(thresholds) {}

StatisticalSummary Profiler::compute_statistics(const DataTable& table, const ColumnTypeMap& types) {
    StatisticalSummary stats;

    for (const auto& col : table.columns()) {
        stats.missing_values.emplace_back(col.name, col.missing_count());
    }

    for (const auto& name : columns_of_type(types, SemanticType::NUMERIC)) {
        const NumericSummary summary = summarize(non_missing(table.column(name)));
        stats.numeric[name] = {summary.mean, summary.std, summary.min, summary.max, summary.median};
    }

    for (const auto& name : columns_of_type(types, SemanticType::CATEGORICAL)) {
        const Column& col = table.column(name);
        std::map<std::string, size_t> counts;
        for (size_t i = 0; i < col.labels.size(); ++i) {
            if (!col.is_missing(i)) ++counts[col.labels[i]];
        }

        CategoricalColumnStats cat{counts.size(), std::nullopt};
        size_t best = 0;
        for (const auto& [label, count] : counts) {
            if (count > best) {
                best = count;
                cat.most_common = label;
            }
        }
        stats.categorical[name] = cat;
    }

    return stats;
}

DataProfile Profiler::profile(const DataTable& table) const {
    if (table.column_count() == 0) {
        throw InputError("table has no columns");
    }

    spdlog::debug("Profiling dataset: {} rows x {} columns", table.row_count(), table.column_count());

    DataProfile profile;
    profile.row_count = table.row_count();
    profile.column_count = table.column_count();
    profile.column_names = table.column_names();
    profile.column_types = classifier_.classify(table);

    const StructuralPatterns patterns = pattern_detector_.detect(profile.column_names, profile.column_types);
    profile.has_temporal = patterns.has_temporal;
    profile.has_network_structure = patterns.has_network_structure;
    profile.has_spatial = patterns.has_spatial;
    profile.has_categorical = has_type(profile.column_types, SemanticType::CATEGORICAL);
    profile.has_numeric = has_type(profile.column_types, SemanticType::NUMERIC);

    profile.relationships = relationship_analyzer_.analyze(table, profile.column_types);
    profile.statistical_summary = compute_statistics(table, profile.column_types);

    for (const auto& rec : recommender_.recommend(profile.features())) {
        profile.suggested_visualizations.push_back(rec.type);
        profile.confidence_scores[rec.type] = rec.confidence;
    }

    spdlog::debug("Profile: {} relationships, {} candidate visualizations",
                  profile.relationships.size(), profile.suggested_visualizations.size());

    return profile;
}

std::vector<Recommendation> Profiler::suggest(const DataTable& table) const {
    const DataProfile p = profile(table);
    std::vector<Recommendation> suggestions;
    for (auto type : p.suggested_visualizations) {
        suggestions.push_back({type, p.confidence_scores.at(type)});
    }
    return suggestions;
}

VisualizationDecision Profiler::decide_visualization(
    const DataTable& table,
    std::optional<VisualizationType> preference
) const {
    DataProfile p = profile(table);

    std::vector<Recommendation> candidates;
    for (auto type : p.suggested_visualizations) {
        candidates.push_back({type, p.confidence_scores.at(type)});
    }
    const Recommendation chosen = recommender_.choose(candidates, preference);

    VisualizationDecision decision;
    decision.type = chosen.type;
    decision.confidence = chosen.confidence;
    decision.autonomous = !(preference && *preference == chosen.type);
    decision.parameters = VisualizationRecommender::bind_columns(chosen.type, table, p.column_types);
    decision.profile = std::move(p);

    if (decision.autonomous) {
        spdlog::info("Autonomous decision: {} (confidence {:.1f}%)",
                     to_string(decision.type), decision.confidence * 100.0);
    } else {
        spdlog::info("Using caller preference: {}", to_string(decision.type));
    }

    return decision;
}

}  // namespace autoviz
