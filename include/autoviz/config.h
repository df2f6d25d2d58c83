#pragma once

#include "insights.h"
#include "relationship_analyzer.h"
#include "visualization_recommender.h"
#include <optional>
#include <string>
#include <vector>

namespace autoviz {

// Analysis configuration from file
struct FileConfig {
    // Insight thresholds (every detector threshold, named as in InsightThresholds)
    InsightThresholds thresholds;

    // Insight modules to run
    AnalysisToggles analysis;

    // Output configuration
    struct OutputConfig {
        std::vector<std::string> formats = {"json"};
        std::string path;
        bool console = true;
        bool verbose = false;
    };

    OutputConfig output;

    // Profiling configuration
    struct ProfileConfig {
        std::string preferred_visualization;   // empty = fully autonomous
        RelationshipThresholds relationships;
    };

    ProfileConfig profile;
};

// Configuration file parser
class ConfigParser {
public:
    // Parse configuration from a flat "section:" / "key: value" YAML file.
    // nullopt when the file cannot be read.
    static std::optional<FileConfig> parse_yaml(const std::string& filepath);

    // Parse configuration from JSON file; nullopt when unreadable or malformed
    static std::optional<FileConfig> parse_json(const std::string& filepath);
    static std::optional<FileConfig> parse_json_string(const std::string& content);

    // Parse configuration from AUTOVIZ_* environment variables
    static FileConfig parse_environment();

    // Merge configurations: overlay values that differ from the defaults win
    static FileConfig merge(const FileConfig& base, const FileConfig& overlay);

    // Validate configuration
    static bool validate(const FileConfig& config, std::string& error_message);

    // Generate default configuration file
    static std::string generate_default_yaml();
    static std::string generate_default_json();

    // Write configuration to file
    static bool write_json(const FileConfig& config, const std::string& filepath);
};

// Configuration manager
class ConfigManager {
public:
    ConfigManager() = default;

    // Load configuration from a .yaml/.yml/.json file, merged over the
    // current values. False when unreadable, malformed or invalid.
    bool load(const std::string& filepath);

    // Load from default locations, then apply the environment
    bool load_default();

    void apply_environment();

    // Get current configuration
    const FileConfig& config() const { return config_; }
    FileConfig& config() { return config_; }

    const std::string& last_error() const { return last_error_; }
    const std::string& loaded_path() const { return loaded_path_; }

    std::optional<VisualizationType> preferred_visualization() const;

private:
    FileConfig config_;
    std::string loaded_path_;
    std::string last_error_;
};

}  // namespace autoviz
