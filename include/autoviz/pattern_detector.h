#pragma once

#include "column_classifier.h"
#include <optional>
#include <string>
#include <vector>

namespace autoviz {

// Column-name keyword sets. Matching is case-insensitive substring matching,
// so "from_address" counts as a source-like column.
struct KeywordRules {
    std::vector<std::string> temporal = {"date", "time", "timestamp", "year", "month", "day"};
    std::vector<std::string> source = {"source", "from", "node1"};
    std::vector<std::string> target = {"target", "to", "node2"};
    std::vector<std::string> spatial = {"x", "y", "z", "lat", "lon", "latitude", "longitude"};
    std::string node = "node";
    std::string edge = "edge";
};

struct StructuralPatterns {
    bool has_temporal = false;
    bool has_network_structure = false;
    bool has_spatial = false;
};

struct NetworkColumns {
    std::string source;
    std::string target;
};

class StructuralPatternDetector {
public:
    StructuralPatternDetector() = default;
    explicit StructuralPatternDetector(const KeywordRules& rules);

    StructuralPatterns detect(const std::vector<std::string>& column_names,
                              const ColumnTypeMap& types) const;

    bool detect_temporal(const std::vector<std::string>& column_names,
                         const ColumnTypeMap& types) const;
    bool detect_network(const std::vector<std::string>& column_names) const;
    bool detect_spatial(const std::vector<std::string>& column_names) const;

    // Source/target edge columns. For each column the source set is tried
    // before the target set; a later match replaces an earlier one.
    std::optional<NetworkColumns> find_network_columns(
        const std::vector<std::string>& column_names) const;

    const KeywordRules& rules() const { return rules_; }

    static std::string to_lower(const std::string& s);
    static bool contains_any(const std::string& lowered,
                             const std::vector<std::string>& keywords);

private:
    KeywordRules rules_;
};

}  // namespace autoviz
