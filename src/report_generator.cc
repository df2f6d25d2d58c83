#include "autoviz/report_generator.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <variant>

namespace autoviz {

std::optional<ReportFormat> parse_report_format(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "json") return ReportFormat::JSON;
    if (lower == "markdown" || lower == "md") return ReportFormat::MARKDOWN;
    if (lower == "text" || lower == "txt") return ReportFormat::TEXT;
    return std::nullopt;
}

std::string report_format_to_string(ReportFormat format) {
    switch (format) {
        case ReportFormat::JSON: return "json";
        case ReportFormat::MARKDOWN: return "md";
        case ReportFormat::TEXT: return "text";
        default: return "json";
    }
}

std::string report_file_extension(ReportFormat format) {
    switch (format) {
        case ReportFormat::JSON: return ".json";
        case ReportFormat::MARKDOWN: return ".md";
        case ReportFormat::TEXT: return ".txt";
        default: return ".json";
    }
}

bool IReportGenerator::generate_to_file(const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        return false;
    }
    file << generate();
    return static_cast<bool>(file);
}

// Factory implementation
std::unique_ptr<IReportGenerator> ReportGeneratorFactory::create(ReportFormat format) {
    switch (format) {
        case ReportFormat::JSON:
            return std::make_unique<JSONReportGenerator>();
        case ReportFormat::MARKDOWN:
            return std::make_unique<MarkdownReportGenerator>();
        case ReportFormat::TEXT:
            return std::make_unique<TextReportGenerator>();
        default:
            return std::make_unique<JSONReportGenerator>();
    }
}

std::unique_ptr<IReportGenerator> ReportGeneratorFactory::create(const std::string& format_name) {
    auto format = parse_report_format(format_name);
    if (!format) {
        return nullptr;
    }
    return create(*format);
}

// ============================================================================
// JSON conversion
// ============================================================================

nlohmann::json data_points_to_json(const DataPoints& points) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& entry : points) {
        const std::string& key = entry.first;
        std::visit([&out, &key](const auto& v) { out[key] = v; }, entry.second);
    }
    return out;
}

nlohmann::json insight_to_json(const GraphInsight& insight, bool include_data_points) {
    nlohmann::json out;
    out["category"] = category_to_string(insight.category);
    out["title"] = insight.title;
    out["description"] = insight.description;
    out["confidence"] = insight.confidence;
    out["severity"] = severity_to_string(insight.severity);
    out["data_points"] = include_data_points ? data_points_to_json(insight.data_points)
                                             : nlohmann::json::object();
    if (insight.recommendation) {
        out["recommendation"] = *insight.recommendation;
    } else {
        out["recommendation"] = nullptr;
    }
    return out;
}

nlohmann::json report_to_json(const AnalyticsReport& report, bool include_data_points) {
    nlohmann::json out;
    out["timestamp"] = report.timestamp;
    out["visualization"] = to_string(report.visualization);

    const auto& ds = report.data_summary;
    out["data_summary"] = {
        {"total_records", ds.total_records},
        {"total_columns", ds.total_columns},
        {"numeric_columns", ds.numeric_columns},
        {"categorical_columns", ds.categorical_columns},
        {"missing_values", ds.missing_values},
        {"missing_percentage", ds.missing_percentage},
        {"memory_usage_mb", ds.memory_usage_mb}
    };

    nlohmann::json insights = nlohmann::json::array();
    for (const auto& insight : report.insights) {
        insights.push_back(insight_to_json(insight, include_data_points));
    }
    out["insights"] = insights;

    out["patterns"] = report.patterns;
    out["anomalies"] = report.anomalies;
    out["trends"] = report.trends;
    out["recommendations"] = report.recommendations;
    out["summary"] = report.natural_language_summary;
    out["key_findings"] = report.key_findings;
    return out;
}

nlohmann::json profile_to_json(const DataProfile& profile) {
    nlohmann::json out;
    out["row_count"] = profile.row_count;
    out["column_count"] = profile.column_count;
    out["column_names"] = profile.column_names;

    nlohmann::json types = nlohmann::json::object();
    for (const auto& [name, type] : profile.column_types) {
        types[name] = ColumnClassifier::type_to_string(type);
    }
    out["column_types"] = types;

    out["has_temporal"] = profile.has_temporal;
    out["has_categorical"] = profile.has_categorical;
    out["has_numeric"] = profile.has_numeric;
    out["has_network_structure"] = profile.has_network_structure;
    out["has_spatial"] = profile.has_spatial;

    nlohmann::json relationships = nlohmann::json::array();
    for (const auto& rel : profile.relationships) {
        relationships.push_back({
            {"col1", rel.column_a},
            {"col2", rel.column_b},
            {"type", RelationshipAnalyzer::kind_to_string(rel.kind)},
            {"correlation", rel.correlation}
        });
    }
    out["relationships"] = relationships;

    const auto& stats = profile.statistical_summary;
    nlohmann::json numeric = nlohmann::json::object();
    for (const auto& [name, s] : stats.numeric) {
        numeric[name] = {
            {"mean", s.mean},
            {"std", s.std},
            {"min", s.min},
            {"max", s.max},
            {"median", s.median}
        };
    }
    nlohmann::json categorical = nlohmann::json::object();
    for (const auto& [name, s] : stats.categorical) {
        nlohmann::json entry;
        entry["unique_count"] = s.unique_count;
        if (s.most_common) {
            entry["most_common"] = *s.most_common;
        } else {
            entry["most_common"] = nullptr;
        }
        categorical[name] = entry;
    }
    nlohmann::json missing = nlohmann::json::object();
    for (const auto& [name, count] : stats.missing_values) {
        missing[name] = count;
    }
    out["statistical_summary"] = {
        {"numeric", numeric},
        {"categorical", categorical},
        {"missing_values", missing}
    };

    nlohmann::json suggestions = nlohmann::json::array();
    nlohmann::json scores = nlohmann::json::object();
    for (const auto& type : profile.suggested_visualizations) {
        suggestions.push_back(to_string(type));
        auto it = profile.confidence_scores.find(type);
        if (it != profile.confidence_scores.end()) {
            scores[to_string(type)] = it->second;
        }
    }
    out["suggested_visualizations"] = suggestions;
    out["confidence_scores"] = scores;
    return out;
}

nlohmann::json decision_to_json(const VisualizationDecision& decision) {
    return {
        {"type", to_string(decision.type)},
        {"confidence", decision.confidence},
        {"autonomous", decision.autonomous},
        {"parameters", decision.parameters}
    };
}

// ============================================================================
// JSON Report Generator
// ============================================================================

JSONReportGenerator::JSONReportGenerator() : json_(nlohmann::json::object()) {}

void JSONReportGenerator::set_config(const ReportConfig& config) {
    config_ = config;
}

void JSONReportGenerator::add_report(const AnalyticsReport& report) {
    json_.update(report_to_json(report, config_.include_data_points));
}

void JSONReportGenerator::add_profile(const DataProfile& profile) {
    if (config_.include_profile) {
        json_["profile"] = profile_to_json(profile);
    }
}

void JSONReportGenerator::add_decision(const VisualizationDecision& decision) {
    json_["decision"] = decision_to_json(decision);
}

std::string JSONReportGenerator::generate() {
    // Labels come straight from CSV cells and may not be valid UTF-8
    const int indent = config_.pretty_print ? config_.indent : -1;
    return json_.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

// ============================================================================
// Markdown Report Generator
// ============================================================================

MarkdownReportGenerator::MarkdownReportGenerator() {}

void MarkdownReportGenerator::set_config(const ReportConfig& config) {
    config_ = config;
}

void MarkdownReportGenerator::add_decision(const VisualizationDecision& decision) {
    std::ostringstream oss;
    oss << "## Visualization\n\n";
    oss << "**" << to_string(decision.type) << "** (confidence "
        << format::format_confidence(decision.confidence) << ", "
        << (decision.autonomous ? "autonomous" : "requested") << ")\n\n";

    if (!decision.parameters.empty()) {
        std::vector<std::vector<std::string>> rows;
        for (const auto& [key, column] : decision.parameters) {
            rows.push_back({key, column});
        }
        oss << format_table({"Parameter", "Column"}, rows) << "\n";
    }
    decision_section_ = oss.str();
}

void MarkdownReportGenerator::add_profile(const DataProfile& profile) {
    if (!config_.include_profile) {
        return;
    }

    std::ostringstream oss;
    oss << "## Data Profile\n\n";
    oss << profile.row_count << " rows x " << profile.column_count << " columns\n\n";

    std::vector<std::vector<std::string>> type_rows;
    for (const auto& [name, type] : profile.column_types) {
        type_rows.push_back({name, ColumnClassifier::type_to_string(type)});
    }
    oss << format_table({"Column", "Type"}, type_rows) << "\n";

    oss << "- Temporal: " << (profile.has_temporal ? "yes" : "no") << "\n";
    oss << "- Network structure: " << (profile.has_network_structure ? "yes" : "no") << "\n";
    oss << "- Spatial: " << (profile.has_spatial ? "yes" : "no") << "\n\n";

    if (!profile.relationships.empty()) {
        oss << "### Relationships\n\n";
        std::vector<std::vector<std::string>> rows;
        for (const auto& rel : profile.relationships) {
            if (rows.size() >= config_.max_table_rows) break;
            rows.push_back({rel.column_a, rel.column_b,
                            RelationshipAnalyzer::kind_to_string(rel.kind),
                            format::format_confidence(rel.correlation, 3)});
        }
        oss << format_table({"Column A", "Column B", "Kind", "r"}, rows) << "\n";
    }

    oss << "### Suggested Visualizations\n\n";
    std::vector<std::vector<std::string>> rows;
    for (const auto& type : profile.suggested_visualizations) {
        auto it = profile.confidence_scores.find(type);
        const double conf = it != profile.confidence_scores.end() ? it->second : 0.0;
        rows.push_back({to_string(type), format::format_confidence(conf)});
    }
    oss << format_table({"Visualization", "Confidence"}, rows) << "\n";

    profile_section_ = oss.str();
}

void MarkdownReportGenerator::add_report(const AnalyticsReport& report) {
    std::ostringstream oss;

    oss << "## Summary\n\n" << report.natural_language_summary << "\n\n";

    const auto& ds = report.data_summary;
    oss << "## Data Summary\n\n";
    oss << format_table({"Metric", "Value"}, {
        {"Records", format::format_count(ds.total_records)},
        {"Columns", std::to_string(ds.total_columns)},
        {"Numeric columns", std::to_string(ds.numeric_columns)},
        {"Categorical columns", std::to_string(ds.categorical_columns)},
        {"Missing values", format::format_count(ds.missing_values)},
        {"Missing", format::format_percentage(ds.missing_percentage / 100.0)},
        {"Memory", format::format_megabytes(ds.memory_usage_mb)}
    }) << "\n";

    if (!report.key_findings.empty()) {
        oss << "## Key Findings\n\n";
        for (size_t i = 0; i < report.key_findings.size(); ++i) {
            oss << (i + 1) << ". " << report.key_findings[i] << "\n";
        }
        oss << "\n";
    }

    if (!report.insights.empty()) {
        oss << "## Insights\n\n";
        std::vector<std::vector<std::string>> rows;
        for (const auto& insight : report.insights) {
            if (rows.size() >= config_.max_table_rows) break;
            rows.push_back({category_to_string(insight.category),
                            severity_to_string(insight.severity),
                            format::format_confidence(insight.confidence),
                            insight.title});
        }
        oss << format_table({"Category", "Severity", "Confidence", "Insight"}, rows) << "\n";
    }

    if (!report.recommendations.empty()) {
        oss << "## Recommendations\n\n";
        for (const auto& rec : report.recommendations) {
            oss << "- " << rec << "\n";
        }
        oss << "\n";
    }

    oss << "_Generated " << report.timestamp << " for " << to_string(report.visualization) << "_\n";
    report_section_ = oss.str();
}

std::string MarkdownReportGenerator::generate() {
    std::ostringstream oss;
    oss << "# " << config_.title << "\n\n";
    oss << decision_section_ << profile_section_ << report_section_;
    return oss.str();
}

std::string MarkdownReportGenerator::format_table(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows
) const {
    std::ostringstream oss;

    oss << "|";
    for (const auto& h : headers) {
        oss << " " << h << " |";
    }
    oss << "\n|";
    for (size_t i = 0; i < headers.size(); ++i) {
        oss << "---|";
    }
    oss << "\n";

    for (const auto& row : rows) {
        oss << "|";
        for (const auto& cell : row) {
            oss << " " << cell << " |";
        }
        oss << "\n";
    }

    return oss.str();
}

// ============================================================================
// Text Report Generator
// ============================================================================

TextReportGenerator::TextReportGenerator() {}

void TextReportGenerator::set_config(const ReportConfig& config) {
    config_ = config;
}

void TextReportGenerator::add_profile(const DataProfile& profile) {
    if (!config_.include_profile) {
        return;
    }

    content_ << "Data profile\n";
    content_ << "  Dimensions: " << profile.row_count << " rows x " << profile.column_count
             << " columns\n";
    content_ << "  Column types:\n";
    for (const auto& [name, type] : profile.column_types) {
        content_ << "    " << name << ": " << ColumnClassifier::type_to_string(type) << "\n";
    }
    content_ << "  Temporal: " << (profile.has_temporal ? "yes" : "no")
             << "  Network: " << (profile.has_network_structure ? "yes" : "no")
             << "  Spatial: " << (profile.has_spatial ? "yes" : "no") << "\n";

    if (!profile.relationships.empty()) {
        content_ << "  Relationships:\n";
        const size_t shown = std::min<size_t>(profile.relationships.size(), 5);
        for (size_t i = 0; i < shown; ++i) {
            const auto& rel = profile.relationships[i];
            content_ << "    " << rel.column_a << " <-> " << rel.column_b << ": "
                     << RelationshipAnalyzer::kind_to_string(rel.kind)
                     << " (r=" << format::format_confidence(rel.correlation, 3) << ")\n";
        }
    }

    content_ << "  Suggested visualizations:\n";
    const size_t shown = std::min<size_t>(profile.suggested_visualizations.size(), 3);
    for (size_t i = 0; i < shown; ++i) {
        const auto type = profile.suggested_visualizations[i];
        auto it = profile.confidence_scores.find(type);
        const double conf = it != profile.confidence_scores.end() ? it->second : 0.0;
        content_ << "    " << (i + 1) << ". " << std::setw(16) << std::left << to_string(type)
                 << " [" << format::confidence_bar(conf) << "] "
                 << format::format_confidence(conf) << "\n";
    }
    content_ << "\n";
}

void TextReportGenerator::add_decision(const VisualizationDecision& decision) {
    content_ << "Decision: " << to_string(decision.type)
             << " (confidence " << format::format_confidence(decision.confidence) << ", "
             << (decision.autonomous ? "autonomous" : "requested") << ")\n";
    for (const auto& [key, column] : decision.parameters) {
        content_ << "  " << key << " = " << column << "\n";
    }
    content_ << "\n";
}

void TextReportGenerator::add_report(const AnalyticsReport& report) {
    content_ << "Summary\n  " << report.natural_language_summary << "\n\n";

    const auto& ds = report.data_summary;
    content_ << format::ascii_table({"Records", "Columns", "Numeric", "Categorical", "Missing", "Memory"}, {{
        format::format_count(ds.total_records),
        std::to_string(ds.total_columns),
        std::to_string(ds.numeric_columns),
        std::to_string(ds.categorical_columns),
        format::format_percentage(ds.missing_percentage / 100.0),
        format::format_megabytes(ds.memory_usage_mb)
    }}) << "\n";

    if (!report.insights.empty()) {
        content_ << "Insights (" << report.insights.size() << ")\n";
        for (const auto& insight : report.insights) {
            content_ << "  [" << format::confidence_bar(insight.confidence) << "] "
                     << format::format_confidence(insight.confidence) << " "
                     << std::setw(12) << std::left << category_to_string(insight.category)
                     << insight.title << "\n";
        }
        content_ << "\n";
    }

    if (!report.key_findings.empty()) {
        content_ << "Key findings\n";
        for (const auto& finding : report.key_findings) {
            content_ << "  * " << finding << "\n";
        }
        content_ << "\n";
    }

    if (!report.recommendations.empty()) {
        content_ << "Recommendations\n";
        for (const auto& rec : report.recommendations) {
            content_ << "  - " << rec << "\n";
        }
        content_ << "\n";
    }
}

std::string TextReportGenerator::generate() {
    std::ostringstream oss;
    oss << config_.title << "\n" << std::string(config_.title.size(), '=') << "\n\n";
    oss << content_.str();
    return oss.str();
}

// Format utilities
namespace format {

std::string format_percentage(double ratio, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << (ratio * 100) << "%";
    return oss.str();
}

std::string format_confidence(double confidence, int precision) {
    if (std::isnan(confidence)) {
        return "n/a";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << confidence;
    return oss.str();
}

std::string format_megabytes(double mb, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << mb << " MB";
    return oss.str();
}

std::string format_count(uint64_t count) {
    std::string str = std::to_string(count);
    std::string result;

    int n = 0;
    for (auto it = str.rbegin(); it != str.rend(); ++it) {
        if (n > 0 && n % 3 == 0) {
            result = ',' + result;
        }
        result = *it + result;
        n++;
    }

    return result;
}

std::string ascii_bar(double value, double max_value, int width) {
    if (max_value <= 0 || std::isnan(value)) {
        return std::string(width, '-');
    }
    int filled = static_cast<int>((value / max_value) * width);
    filled = std::clamp(filled, 0, width);
    return std::string(filled, '#') + std::string(width - filled, '-');
}

std::string confidence_bar(double confidence, int width) {
    return ascii_bar(confidence, 1.0, width);
}

std::string ascii_table(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows
) {
    std::vector<size_t> widths(headers.size(), 0);
    for (size_t i = 0; i < headers.size(); ++i) {
        widths[i] = headers[i].size();
    }
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size() && i < widths.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    std::ostringstream oss;

    oss << "|";
    for (size_t i = 0; i < headers.size(); ++i) {
        oss << " " << std::setw(static_cast<int>(widths[i])) << std::left << headers[i] << " |";
    }
    oss << "\n|";
    for (size_t i = 0; i < headers.size(); ++i) {
        oss << std::string(widths[i] + 2, '-') << "|";
    }
    oss << "\n";

    for (const auto& row : rows) {
        oss << "|";
        for (size_t i = 0; i < row.size() && i < widths.size(); ++i) {
            oss << " " << std::setw(static_cast<int>(widths[i])) << std::left << row[i] << " |";
        }
        oss << "\n";
    }

    return oss.str();
}

}  // namespace format

}  // namespace autoviz
