#include "autoviz/config.h"
#include "autoviz/report_generator.h"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace autoviz {

// ============================================================================
// Key tables shared by the YAML, JSON and environment readers
// ============================================================================

namespace {

struct DoubleKey {
    const char* name;
    double InsightThresholds::*field;
};

struct CountKey {
    const char* name;
    size_t InsightThresholds::*field;
};

struct ToggleKey {
    const char* name;
    bool AnalysisToggles::*field;
};

const DoubleKey kDoubleKeys[] = {
    {"skew_threshold", &InsightThresholds::skew_threshold},
    {"high_skew_threshold", &InsightThresholds::high_skew_threshold},
    {"cv_threshold_pct", &InsightThresholds::cv_threshold_pct},
    {"cv_confidence", &InsightThresholds::cv_confidence},
    {"multimodal_confidence", &InsightThresholds::multimodal_confidence},
    {"iqr_factor", &InsightThresholds::iqr_factor},
    {"outlier_pct_threshold", &InsightThresholds::outlier_pct_threshold},
    {"high_outlier_pct", &InsightThresholds::high_outlier_pct},
    {"outlier_confidence", &InsightThresholds::outlier_confidence},
    {"trend_correlation", &InsightThresholds::trend_correlation},
    {"strong_trend_correlation", &InsightThresholds::strong_trend_correlation},
    {"normalized_slope_threshold", &InsightThresholds::normalized_slope_threshold},
    {"variance_ratio_threshold", &InsightThresholds::variance_ratio_threshold},
    {"sparse_density", &InsightThresholds::sparse_density},
    {"moderate_density", &InsightThresholds::moderate_density},
    {"hub_degree_factor", &InsightThresholds::hub_degree_factor},
    {"hub_confidence", &InsightThresholds::hub_confidence},
    {"recommendation_confidence", &InsightThresholds::recommendation_confidence},
    {"high_confidence", &InsightThresholds::high_confidence},
    {"missing_notice_pct", &InsightThresholds::missing_notice_pct},
};

const CountKey kCountKeys[] = {
    {"min_samples", &InsightThresholds::min_samples},
    {"histogram_bins", &InsightThresholds::histogram_bins},
    {"min_peaks", &InsightThresholds::min_peaks},
    {"max_pattern_columns", &InsightThresholds::max_pattern_columns},
    {"max_trend_columns", &InsightThresholds::max_trend_columns},
    {"max_trend_partner_index", &InsightThresholds::max_trend_partner_index},
    {"max_relationship_columns", &InsightThresholds::max_relationship_columns},
    {"min_group_size", &InsightThresholds::min_group_size},
    {"min_groups", &InsightThresholds::min_groups},
    {"max_recommendations", &InsightThresholds::max_recommendations},
    {"max_key_findings", &InsightThresholds::max_key_findings},
    {"large_dataset_rows", &InsightThresholds::large_dataset_rows},
};

const ToggleKey kToggleKeys[] = {
    {"statistical", &AnalysisToggles::statistical},
    {"patterns", &AnalysisToggles::patterns},
    {"anomalies", &AnalysisToggles::anomalies},
    {"trends", &AnalysisToggles::trends},
    {"relationships", &AnalysisToggles::relationships},
    {"network", &AnalysisToggles::network},
};

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(s);
    std::string token;
    while (std::getline(ss, token, delimiter)) {
        token = trim(token);
        if (!token.empty()) tokens.push_back(token);
    }
    return tokens;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::optional<double> parse_double(const std::string& text) {
    if (text.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end != text.c_str() + text.size()) return std::nullopt;
    return value;
}

std::optional<size_t> parse_count(const std::string& text) {
    if (text.empty() || text[0] == '-') return std::nullopt;
    errno = 0;
    char* end = nullptr;
    const unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size()) return std::nullopt;
    return static_cast<size_t>(value);
}

std::optional<bool> parse_bool(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "yes" || lower == "1" || lower == "on") return true;
    if (lower == "false" || lower == "no" || lower == "0" || lower == "off") return false;
    return std::nullopt;
}

// Formats may be written "[json, md]" or "json, md"
std::vector<std::string> parse_list(std::string value) {
    if (!value.empty() && value.front() == '[') value.erase(0, 1);
    if (!value.empty() && value.back() == ']') value.pop_back();
    std::vector<std::string> items;
    for (const auto& item : split(value, ',')) {
        items.push_back(unquote(item));
    }
    return items;
}

bool set_threshold(InsightThresholds& thresholds, const std::string& key, const std::string& value) {
    for (const auto& k : kDoubleKeys) {
        if (key == k.name) {
            if (auto v = parse_double(value)) {
                thresholds.*k.field = *v;
            } else {
                spdlog::warn("Config: ignoring non-numeric value '{}' for thresholds.{}", value, key);
            }
            return true;
        }
    }
    for (const auto& k : kCountKeys) {
        if (key == k.name) {
            if (auto v = parse_count(value)) {
                thresholds.*k.field = *v;
            } else {
                spdlog::warn("Config: ignoring non-count value '{}' for thresholds.{}", value, key);
            }
            return true;
        }
    }
    return false;
}

bool set_toggle(AnalysisToggles& toggles, const std::string& key, const std::string& value) {
    for (const auto& k : kToggleKeys) {
        if (key == k.name) {
            if (auto v = parse_bool(value)) {
                toggles.*k.field = *v;
            } else {
                spdlog::warn("Config: ignoring non-boolean value '{}' for analysis.{}", value, key);
            }
            return true;
        }
    }
    return false;
}

nlohmann::json config_to_json(const FileConfig& config) {
    nlohmann::json j;

    nlohmann::json thresholds = nlohmann::json::object();
    for (const auto& k : kDoubleKeys) thresholds[k.name] = config.thresholds.*k.field;
    for (const auto& k : kCountKeys) thresholds[k.name] = config.thresholds.*k.field;
    j["thresholds"] = thresholds;

    nlohmann::json analysis = nlohmann::json::object();
    for (const auto& k : kToggleKeys) analysis[k.name] = config.analysis.*k.field;
    j["analysis"] = analysis;

    j["output"] = {
        {"formats", config.output.formats},
        {"path", config.output.path},
        {"console", config.output.console},
        {"verbose", config.output.verbose}
    };

    j["profile"] = {
        {"preferred_visualization", config.profile.preferred_visualization},
        {"strong_correlation", config.profile.relationships.strong},
        {"moderate_correlation", config.profile.relationships.moderate}
    };
    return j;
}

}  // anonymous namespace

// ============================================================================
// ConfigParser implementation
// ============================================================================

std::optional<FileConfig> ConfigParser::parse_yaml(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    FileConfig config;
    std::string line;
    std::string current_section;

    while (std::getline(file, line)) {
        // Strip trailing comments
        const size_t hash = line.find('#');
        if (hash != std::string::npos) line = line.substr(0, hash);
        line = trim(line);

        if (line.empty()) continue;

        // Section headers
        if (line.back() == ':' && line.find(':') == line.size() - 1) {
            current_section = line.substr(0, line.size() - 1);
            continue;
        }

        size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, colon_pos));
        std::string value = unquote(trim(line.substr(colon_pos + 1)));

        bool known = false;
        if (current_section == "thresholds") {
            known = set_threshold(config.thresholds, key, value);
        } else if (current_section == "analysis") {
            known = set_toggle(config.analysis, key, value);
        } else if (current_section == "output") {
            known = true;
            if (key == "formats") config.output.formats = parse_list(value);
            else if (key == "path") config.output.path = value;
            else if (key == "console") config.output.console = parse_bool(value).value_or(true);
            else if (key == "verbose") config.output.verbose = parse_bool(value).value_or(false);
            else known = false;
        } else if (current_section == "profile") {
            known = true;
            if (key == "preferred_visualization") {
                config.profile.preferred_visualization = value;
            } else if (key == "strong_correlation") {
                config.profile.relationships.strong =
                    parse_double(value).value_or(config.profile.relationships.strong);
            } else if (key == "moderate_correlation") {
                config.profile.relationships.moderate =
                    parse_double(value).value_or(config.profile.relationships.moderate);
            } else {
                known = false;
            }
        }

        if (!known) {
            spdlog::warn("Config: unknown key '{}' in section '{}'", key, current_section);
        }
    }

    return config;
}

std::optional<FileConfig> ConfigParser::parse_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_json_string(buffer.str());
}

std::optional<FileConfig> ConfigParser::parse_json_string(const std::string& content) {
    const nlohmann::json j = nlohmann::json::parse(content, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    FileConfig config;

    if (j.contains("thresholds") && j["thresholds"].is_object()) {
        const auto& t = j["thresholds"];
        for (const auto& k : kDoubleKeys) {
            if (t.contains(k.name) && t[k.name].is_number()) {
                config.thresholds.*k.field = t[k.name].get<double>();
            }
        }
        for (const auto& k : kCountKeys) {
            if (t.contains(k.name) && t[k.name].is_number_unsigned()) {
                config.thresholds.*k.field = t[k.name].get<size_t>();
            }
        }
    }

    if (j.contains("analysis") && j["analysis"].is_object()) {
        const auto& a = j["analysis"];
        for (const auto& k : kToggleKeys) {
            if (a.contains(k.name) && a[k.name].is_boolean()) {
                config.analysis.*k.field = a[k.name].get<bool>();
            }
        }
    }

    if (j.contains("output") && j["output"].is_object()) {
        const auto& o = j["output"];
        if (o.contains("formats") && o["formats"].is_array()) {
            config.output.formats.clear();
            for (const auto& f : o["formats"]) {
                if (f.is_string()) config.output.formats.push_back(f.get<std::string>());
            }
        }
        if (o.contains("path") && o["path"].is_string()) {
            config.output.path = o["path"].get<std::string>();
        }
        if (o.contains("console") && o["console"].is_boolean()) {
            config.output.console = o["console"].get<bool>();
        }
        if (o.contains("verbose") && o["verbose"].is_boolean()) {
            config.output.verbose = o["verbose"].get<bool>();
        }
    }

    if (j.contains("profile") && j["profile"].is_object()) {
        const auto& p = j["profile"];
        if (p.contains("preferred_visualization") && p["preferred_visualization"].is_string()) {
            config.profile.preferred_visualization = p["preferred_visualization"].get<std::string>();
        }
        if (p.contains("strong_correlation") && p["strong_correlation"].is_number()) {
            config.profile.relationships.strong = p["strong_correlation"].get<double>();
        }
        if (p.contains("moderate_correlation") && p["moderate_correlation"].is_number()) {
            config.profile.relationships.moderate = p["moderate_correlation"].get<double>();
        }
    }

    return config;
}

FileConfig ConfigParser::parse_environment() {
    FileConfig config;

    auto get_env = [](const char* name) -> std::optional<std::string> {
        const char* value = std::getenv(name);
        if (value) return std::string(value);
        return std::nullopt;
    };

    if (auto v = get_env("AUTOVIZ_VERBOSE")) {
        config.output.verbose = parse_bool(*v).value_or(false);
    }

    if (auto v = get_env("AUTOVIZ_OUTPUT_PATH")) {
        config.output.path = *v;
    }

    if (auto v = get_env("AUTOVIZ_VIZ_TYPE")) {
        config.profile.preferred_visualization = *v;
    }

    if (auto v = get_env("AUTOVIZ_SKEW_THRESHOLD")) {
        if (auto d = parse_double(*v)) {
            config.thresholds.skew_threshold = *d;
        } else {
            spdlog::warn("Ignoring AUTOVIZ_SKEW_THRESHOLD='{}'", *v);
        }
    }

    if (auto v = get_env("AUTOVIZ_OUTLIER_PCT")) {
        if (auto d = parse_double(*v)) {
            config.thresholds.outlier_pct_threshold = *d;
        } else {
            spdlog::warn("Ignoring AUTOVIZ_OUTLIER_PCT='{}'", *v);
        }
    }

    return config;
}

FileConfig ConfigParser::merge(const FileConfig& base, const FileConfig& overlay) {
    const FileConfig defaults;
    FileConfig result = base;

    for (const auto& k : kDoubleKeys) {
        if (overlay.thresholds.*k.field != defaults.thresholds.*k.field) {
            result.thresholds.*k.field = overlay.thresholds.*k.field;
        }
    }
    for (const auto& k : kCountKeys) {
        if (overlay.thresholds.*k.field != defaults.thresholds.*k.field) {
            result.thresholds.*k.field = overlay.thresholds.*k.field;
        }
    }
    for (const auto& k : kToggleKeys) {
        if (overlay.analysis.*k.field != defaults.analysis.*k.field) {
            result.analysis.*k.field = overlay.analysis.*k.field;
        }
    }

    if (overlay.output.formats != defaults.output.formats) {
        result.output.formats = overlay.output.formats;
    }
    if (!overlay.output.path.empty()) {
        result.output.path = overlay.output.path;
    }
    if (!overlay.output.console) {
        result.output.console = false;
    }
    if (overlay.output.verbose) {
        result.output.verbose = true;
    }

    if (!overlay.profile.preferred_visualization.empty()) {
        result.profile.preferred_visualization = overlay.profile.preferred_visualization;
    }
    if (overlay.profile.relationships.strong != defaults.profile.relationships.strong) {
        result.profile.relationships.strong = overlay.profile.relationships.strong;
    }
    if (overlay.profile.relationships.moderate != defaults.profile.relationships.moderate) {
        result.profile.relationships.moderate = overlay.profile.relationships.moderate;
    }

    return result;
}

bool ConfigParser::validate(const FileConfig& config, std::string& error_message) {
    const auto& t = config.thresholds;

    for (const auto& k : kDoubleKeys) {
        if (!(t.*k.field > 0)) {
            error_message = std::string("Threshold ") + k.name + " must be positive";
            return false;
        }
    }

    if (t.high_skew_threshold < t.skew_threshold) {
        error_message = "high_skew_threshold must not be below skew_threshold";
        return false;
    }
    if (t.high_outlier_pct < t.outlier_pct_threshold) {
        error_message = "high_outlier_pct must not be below outlier_pct_threshold";
        return false;
    }
    if (t.trend_correlation > 1.0 || t.strong_trend_correlation > 1.0 ||
        t.strong_trend_correlation < t.trend_correlation) {
        error_message = "Trend correlations must satisfy 0 < trend_correlation <= strong_trend_correlation <= 1";
        return false;
    }
    if (t.sparse_density >= t.moderate_density) {
        error_message = "sparse_density must be below moderate_density";
        return false;
    }
    for (double confidence : {t.cv_confidence, t.multimodal_confidence, t.outlier_confidence,
                              t.hub_confidence, t.recommendation_confidence, t.high_confidence}) {
        if (confidence > 1.0) {
            error_message = "Confidence thresholds must be between 0 and 1";
            return false;
        }
    }
    if (t.histogram_bins < 3) {
        error_message = "histogram_bins must be at least 3";
        return false;
    }

    const auto& rel = config.profile.relationships;
    if (!(rel.moderate > 0) || rel.moderate >= rel.strong || rel.strong > 1.0) {
        error_message = "Relationship thresholds must satisfy 0 < moderate < strong <= 1";
        return false;
    }

    for (const auto& format : config.output.formats) {
        if (!parse_report_format(format)) {
            error_message = "Invalid output format: " + format;
            return false;
        }
    }

    if (!config.profile.preferred_visualization.empty() &&
        !parse_visualization_type(config.profile.preferred_visualization)) {
        error_message = "Unknown visualization type: " + config.profile.preferred_visualization;
        return false;
    }

    return true;
}

std::string ConfigParser::generate_default_yaml() {
    const FileConfig defaults;
    std::ostringstream yaml;

    yaml << "# AutoViz Configuration File\n\n";

    yaml << "thresholds:\n";
    for (const auto& k : kDoubleKeys) {
        yaml << "  " << k.name << ": " << defaults.thresholds.*k.field << "\n";
    }
    for (const auto& k : kCountKeys) {
        yaml << "  " << k.name << ": " << defaults.thresholds.*k.field << "\n";
    }
    yaml << "\n";

    yaml << "analysis:\n";
    for (const auto& k : kToggleKeys) {
        yaml << "  " << k.name << ": " << (defaults.analysis.*k.field ? "true" : "false") << "\n";
    }
    yaml << "\n";

    yaml << "output:\n";
    yaml << "  formats: [json]  # json, md, text\n";
    yaml << "  path: \"\"\n";
    yaml << "  console: true\n";
    yaml << "  verbose: false\n\n";

    yaml << "profile:\n";
    yaml << "  preferred_visualization: \"\"  # network, 3d_scatter, 3d_surface, ...\n";
    yaml << "  strong_correlation: " << defaults.profile.relationships.strong << "\n";
    yaml << "  moderate_correlation: " << defaults.profile.relationships.moderate << "\n";

    return yaml.str();
}

std::string ConfigParser::generate_default_json() {
    return config_to_json(FileConfig{}).dump(2) + "\n";
}

bool ConfigParser::write_json(const FileConfig& config, const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file.is_open()) return false;

    file << config_to_json(config).dump(2) << "\n";
    return static_cast<bool>(file);
}

// ============================================================================
// ConfigManager implementation
// ============================================================================

bool ConfigManager::load(const std::string& filepath) {
    std::optional<FileConfig> loaded;

    if (ends_with(filepath, ".yaml") || ends_with(filepath, ".yml")) {
        loaded = ConfigParser::parse_yaml(filepath);
    } else if (ends_with(filepath, ".json")) {
        loaded = ConfigParser::parse_json(filepath);
    } else {
        last_error_ = "Unsupported config file extension: " + filepath;
        return false;
    }

    if (!loaded) {
        last_error_ = "Cannot read config file: " + filepath;
        return false;
    }

    FileConfig merged = ConfigParser::merge(config_, *loaded);
    std::string error;
    if (!ConfigParser::validate(merged, error)) {
        last_error_ = filepath + ": " + error;
        return false;
    }

    config_ = merged;
    loaded_path_ = filepath;
    spdlog::debug("Loaded configuration from {}", filepath);
    return true;
}

bool ConfigManager::load_default() {
    const std::vector<std::string> paths = {
        "./autoviz.yaml",
        "./autoviz.yml",
        "./autoviz.json",
        "./config/autoviz.yaml"
    };

    bool ok = true;
    for (const auto& path : paths) {
        if (std::ifstream(path).good()) {
            ok = load(path);
            break;
        }
    }

    apply_environment();
    return ok;
}

void ConfigManager::apply_environment() {
    config_ = ConfigParser::merge(config_, ConfigParser::parse_environment());
}

std::optional<VisualizationType> ConfigManager::preferred_visualization() const {
    if (config_.profile.preferred_visualization.empty()) {
        return std::nullopt;
    }
    return parse_visualization_type(config_.profile.preferred_visualization);
}

}  // namespace autoviz
