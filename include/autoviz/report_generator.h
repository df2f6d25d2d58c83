#pragma once

#include "analytics_engine.h"
#include "insights.h"
#include "profiler.h"
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace autoviz {

enum class ReportFormat {
    JSON,
    MARKDOWN,
    TEXT
};

// "json", "md"/"markdown", "text"/"txt"; nullopt otherwise
std::optional<ReportFormat> parse_report_format(const std::string& name);
std::string report_format_to_string(ReportFormat format);
std::string report_file_extension(ReportFormat format);

// Report configuration
struct ReportConfig {
    std::string title = "AutoViz Analytics Report";
    bool include_profile = true;
    bool include_data_points = true;

    // Markdown/text
    size_t max_table_rows = 50;

    // JSON-specific
    bool pretty_print = true;
    int indent = 2;
};

// Abstract report generator interface
class IReportGenerator {
public:
    virtual ~IReportGenerator() = default;

    virtual void set_config(const ReportConfig& config) = 0;

    virtual void add_report(const AnalyticsReport& report) = 0;
    virtual void add_profile(const DataProfile& profile) = 0;
    virtual void add_decision(const VisualizationDecision& decision) = 0;

    virtual std::string generate() = 0;

    // False when the file cannot be opened or written
    virtual bool generate_to_file(const std::string& path);

    virtual ReportFormat get_format() const = 0;
};

// Factory for report generators
class ReportGeneratorFactory {
public:
    static std::unique_ptr<IReportGenerator> create(ReportFormat format);
    // Unknown names yield nullptr
    static std::unique_ptr<IReportGenerator> create(const std::string& format_name);
};

// JSON report generator
class JSONReportGenerator : public IReportGenerator {
public:
    JSONReportGenerator();

    void set_config(const ReportConfig& config) override;

    void add_report(const AnalyticsReport& report) override;
    void add_profile(const DataProfile& profile) override;
    void add_decision(const VisualizationDecision& decision) override;

    std::string generate() override;

    ReportFormat get_format() const override { return ReportFormat::JSON; }

    // Get raw JSON object
    const nlohmann::json& get_json() const { return json_; }

private:
    ReportConfig config_;
    nlohmann::json json_;
};

// Markdown report generator
class MarkdownReportGenerator : public IReportGenerator {
public:
    MarkdownReportGenerator();

    void set_config(const ReportConfig& config) override;

    void add_report(const AnalyticsReport& report) override;
    void add_profile(const DataProfile& profile) override;
    void add_decision(const VisualizationDecision& decision) override;

    std::string generate() override;

    ReportFormat get_format() const override { return ReportFormat::MARKDOWN; }

private:
    ReportConfig config_;
    std::string decision_section_;
    std::string profile_section_;
    std::string report_section_;

    std::string format_table(
        const std::vector<std::string>& headers,
        const std::vector<std::vector<std::string>>& rows
    ) const;
};

// Plain-text report generator (console output)
class TextReportGenerator : public IReportGenerator {
public:
    TextReportGenerator();

    void set_config(const ReportConfig& config) override;

    void add_report(const AnalyticsReport& report) override;
    void add_profile(const DataProfile& profile) override;
    void add_decision(const VisualizationDecision& decision) override;

    std::string generate() override;

    ReportFormat get_format() const override { return ReportFormat::TEXT; }

private:
    ReportConfig config_;
    std::ostringstream content_;
};

// ============================================================================
// JSON conversion
// ============================================================================

nlohmann::json data_points_to_json(const DataPoints& points);
nlohmann::json insight_to_json(const GraphInsight& insight, bool include_data_points = true);
nlohmann::json report_to_json(const AnalyticsReport& report, bool include_data_points = true);
nlohmann::json profile_to_json(const DataProfile& profile);
nlohmann::json decision_to_json(const VisualizationDecision& decision);

// Utility functions for formatting
namespace format {

std::string format_percentage(double ratio, int precision = 1);
std::string format_confidence(double confidence, int precision = 2);
std::string format_megabytes(double mb, int precision = 2);
std::string format_count(uint64_t count);

// Generate ASCII bar chart
std::string ascii_bar(double value, double max_value, int width = 40);

// Confidence in [0, 1] as a fixed-width bar
std::string confidence_bar(double confidence, int width = 20);

// Generate ASCII table
std::string ascii_table(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows
);

}  // namespace format

}  // namespace autoviz
