// ============================================================================
// AutoViz Insights Demo
// ============================================================================
// Builds two synthetic datasets (a correlated sales table and a small edge
// list), lets the profiler pick a visualization for each, and prints the
// analytics report.
// ============================================================================

#include "autoviz/autoviz.h"
#include <spdlog/spdlog.h>
#include <cmath>
#include <iostream>

using namespace autoviz;

DataTable make_sales_table() {
    const size_t rows = 200;
    std::vector<double> ad_spend(rows), revenue(rows), discount(rows);
    std::vector<std::string> region(rows);
    const char* regions[] = {"north", "south", "east"};

    for (size_t i = 0; i < rows; ++i) {
        const double t = static_cast<double>(i);
        ad_spend[i] = 100.0 + t * 3.0;
        revenue[i] = 2.5 * ad_spend[i] + std::sin(t) * 20.0 + (i % 3) * 150.0;
        discount[i] = (i % 25 == 0) ? 90.0 : std::exp(static_cast<double>(i % 7) / 3.0);
        region[i] = regions[i % 3];
    }

    DataTable table;
    table.add_column(Column::numeric("ad_spend", std::move(ad_spend)));
    table.add_column(Column::numeric("revenue", std::move(revenue)));
    table.add_column(Column::numeric("discount", std::move(discount)));
    table.add_column(Column::text("region", std::move(region)));
    return table;
}

DataTable make_edge_list() {
    DataTable table;
    table.add_column(Column::text("source", {"a", "a", "a", "a", "a", "b", "c", "d", "e", "f"}));
    table.add_column(Column::text("target", {"b", "c", "d", "e", "f", "c", "d", "e", "f", "g"}));
    table.add_column(Column::numeric("weight", {1, 2, 1, 3, 1, 2, 2, 1, 1, 4}));
    return table;
}

void run(const std::string& name, const DataTable& table) {
    std::cout << "========================================================================\n";
    std::cout << "  " << name << "\n";
    std::cout << "========================================================================\n\n";

    Profiler profiler;
    const VisualizationDecision decision = profiler.decide_visualization(table);

    AnalyticsEngine engine;
    const AnalyticsReport report = engine.analyze(table, decision.type);

    TextReportGenerator generator;
    generator.set_config(ReportConfig{name});
    generator.add_profile(decision.profile);
    generator.add_decision(decision);
    generator.add_report(report);
    std::cout << generator.generate() << "\n";
}

int main() {
    spdlog::set_level(spdlog::level::info);
    std::cout << "AutoViz " << get_version_string() << "\n\n";

    try {
        run("Sales dataset", make_sales_table());
        run("Edge list", make_edge_list());
    } catch (const AutovizError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
