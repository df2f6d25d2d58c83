#include "autoviz/insights.h"
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>

namespace autoviz {

namespace {

// Node identity of a cell: the label for text columns, the number otherwise
std::optional<std::string> node_key(const Column& col, size_t row) {
    if (col.is_missing(row)) return std::nullopt;
    if (!col.labels.empty()) return col.labels[row];

    const double v = col.numbers[row];
    std::ostringstream oss;
    if (v == std::floor(v) && std::abs(v) < 1e15) {
        oss << static_cast<long long>(v);
    } else {
        oss << std::setprecision(15) << v;
    }
    return oss.str();
}

}  // anonymous namespace

NetworkInsightDetector::NetworkInsightDetector(const KeywordRules& keywords) : detector_(keywords) {}

std::vector<GraphInsight> NetworkInsightDetector::analyze(const AnalysisContext& ctx) const {
    std::vector<GraphInsight> insights;
    if (ctx.visualization != VisualizationType::NETWORK) return insights;

    const auto columns = detector_.find_network_columns(ctx.table.column_names());
    if (!columns) return insights;

    const InsightThresholds& t = ctx.thresholds;
    const Column& source = ctx.table.column(columns->source);
    const Column& target = ctx.table.column(columns->target);

    std::map<std::string, size_t> degrees;
    for (size_t row = 0; row < ctx.table.row_count(); ++row) {
        if (auto key = node_key(source, row)) degrees[*key]++;
        if (auto key = node_key(target, row)) degrees[*key]++;
    }

    const size_t nodes = degrees.size();
    const size_t edges = ctx.table.row_count();
    if (nodes > 1) {
        const double density = static_cast<double>(edges) /
                               (static_cast<double>(nodes) * static_cast<double>(nodes - 1));
        insights.push_back(insight_templates::network_density(nodes, edges, density, t));
    }

    if (!degrees.empty()) {
        double total = 0.0;
        for (const auto& [node, degree] : degrees) total += static_cast<double>(degree);
        const double avg_degree = total / static_cast<double>(nodes);

        size_t hub_count = 0;
        std::string top_hub;
        size_t top_degree = 0;
        for (const auto& [node, degree] : degrees) {
            if (static_cast<double>(degree) <= avg_degree * t.hub_degree_factor) continue;
            ++hub_count;
            if (degree > top_degree) {
                top_degree = degree;
                top_hub = node;
            }
        }

        if (hub_count > 0) {
            insights.push_back(insight_templates::network_hubs(hub_count, top_hub, top_degree, t));
        }
    }

    return insights;
}

}  // namespace autoviz
