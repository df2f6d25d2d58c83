#include "autoviz/pattern_detector.h"
#include <algorithm>
#include <cctype>

namespace autoviz {

StructuralPatternDetector::StructuralPatternDetector(const KeywordRules& rules) : rules_(rules) {}

std::string StructuralPatternDetector::to_lower(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool StructuralPatternDetector::contains_any(const std::string& lowered,
                                             const std::vector<std::string>& keywords) {
    for (const auto& kw : keywords) {
        if (lowered.find(kw) != std::string::npos) return true;
    }
    return false;
}

StructuralPatterns StructuralPatternDetector::detect(
    const std::vector<std::string>& column_names,
    const ColumnTypeMap& types
) const {
    StructuralPatterns patterns;
    patterns.has_temporal = detect_temporal(column_names, types);
    patterns.has_network_structure = detect_network(column_names);
    patterns.has_spatial = detect_spatial(column_names);
    return patterns;
}

bool StructuralPatternDetector::detect_temporal(
    const std::vector<std::string>& column_names,
    const ColumnTypeMap& types
) const {
    if (has_type(types, SemanticType::TEMPORAL)) {
        return true;
    }
    for (const auto& name : column_names) {
        if (contains_any(to_lower(name), rules_.temporal)) return true;
    }
    return false;
}

bool StructuralPatternDetector::detect_network(const std::vector<std::string>& column_names) const {
    bool has_source = false;
    bool has_target = false;
    bool has_node = false;
    bool has_edge = false;

    for (const auto& name : column_names) {
        const std::string lower = to_lower(name);
        has_source = has_source || contains_any(lower, rules_.source);
        has_target = has_target || contains_any(lower, rules_.target);
        has_node = has_node || lower.find(rules_.node) != std::string::npos;
        has_edge = has_edge || lower.find(rules_.edge) != std::string::npos;
    }

    if (has_source && has_target) {
        return true;
    }
    return has_node && has_edge;
}

bool StructuralPatternDetector::detect_spatial(const std::vector<std::string>& column_names) const {
    return std::any_of(column_names.begin(), column_names.end(), [this](const std::string& name) {
        return contains_any(to_lower(name), rules_.spatial);
    });
}

std::optional<NetworkColumns> StructuralPatternDetector::find_network_columns(
    const std::vector<std::string>& column_names
) const {
    std::optional<std::string> source;
    std::optional<std::string> target;

    for (const auto& name : column_names) {
        const std::string lower = to_lower(name);
        if (contains_any(lower, rules_.source)) {
            source = name;
        } else if (contains_any(lower, rules_.target)) {
            target = name;
        }
    }

    if (!source || !target) {
        return std::nullopt;
    }
    return NetworkColumns{*source, *target};
}

}  // namespace autoviz
