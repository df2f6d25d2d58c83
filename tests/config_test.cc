#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "autoviz/config.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace autoviz {
namespace testing {

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const auto& path : {yaml_path_, json_path_, txt_path_}) {
            if (std::filesystem::exists(path)) {
                std::filesystem::remove(path);
            }
        }
        unsetenv("AUTOVIZ_SKEW_THRESHOLD");
        unsetenv("AUTOVIZ_VIZ_TYPE");
        unsetenv("AUTOVIZ_OUTLIER_PCT");
    }

    void write(const std::string& path, const std::string& content) {
        std::ofstream file(path);
        file << content;
    }

    std::string yaml_path_ = "/tmp/autoviz_config_test.yaml";
    std::string json_path_ = "/tmp/autoviz_config_test.json";
    std::string txt_path_ = "/tmp/autoviz_config_test.txt";
};

TEST_F(ConfigTest, DefaultsAreValid) {
    std::string error;
    EXPECT_TRUE(ConfigParser::validate(FileConfig{}, error)) << error;
}

TEST_F(ConfigTest, ParseYaml) {
    write(yaml_path_,
          "# comment\n"
          "thresholds:\n"
          "  skew_threshold: 1.5   # looser\n"
          "  min_samples: 20\n"
          "analysis:\n"
          "  network: false\n"
          "output:\n"
          "  formats: [json, md]\n"
          "  path: \"out/report.json\"\n"
          "  console: no\n"
          "profile:\n"
          "  preferred_visualization: 3d_scatter\n"
          "  strong_correlation: 0.8\n");

    auto config = ConfigParser::parse_yaml(yaml_path_);
    ASSERT_TRUE(config.has_value());
    EXPECT_DOUBLE_EQ(config->thresholds.skew_threshold, 1.5);
    EXPECT_EQ(config->thresholds.min_samples, 20u);
    EXPECT_FALSE(config->analysis.network);
    EXPECT_TRUE(config->analysis.statistical);
    EXPECT_THAT(config->output.formats, ::testing::ElementsAre("json", "md"));
    EXPECT_EQ(config->output.path, "out/report.json");
    EXPECT_FALSE(config->output.console);
    EXPECT_EQ(config->profile.preferred_visualization, "3d_scatter");
    EXPECT_DOUBLE_EQ(config->profile.relationships.strong, 0.8);
}

TEST_F(ConfigTest, YamlIgnoresBadValues) {
    write(yaml_path_,
          "thresholds:\n"
          "  skew_threshold: lots\n"
          "  unknown_key: 3\n");
    auto config = ConfigParser::parse_yaml(yaml_path_);
    ASSERT_TRUE(config.has_value());
    EXPECT_DOUBLE_EQ(config->thresholds.skew_threshold, 1.0);
}

TEST_F(ConfigTest, ParseYamlMissingFile) {
    EXPECT_FALSE(ConfigParser::parse_yaml("/nonexistent/autoviz.yaml").has_value());
}

TEST_F(ConfigTest, ParseJsonString) {
    auto config = ConfigParser::parse_json_string(R"({
        "thresholds": {"outlier_pct_threshold": 3.0, "histogram_bins": 20},
        "analysis": {"trends": false},
        "output": {"formats": ["text"], "verbose": true},
        "profile": {"preferred_visualization": "network"}
    })");
    ASSERT_TRUE(config.has_value());
    EXPECT_DOUBLE_EQ(config->thresholds.outlier_pct_threshold, 3.0);
    EXPECT_EQ(config->thresholds.histogram_bins, 20u);
    EXPECT_FALSE(config->analysis.trends);
    EXPECT_THAT(config->output.formats, ::testing::ElementsAre("text"));
    EXPECT_TRUE(config->output.verbose);
    EXPECT_EQ(config->profile.preferred_visualization, "network");
}

TEST_F(ConfigTest, ParseJsonRejectsMalformed) {
    EXPECT_FALSE(ConfigParser::parse_json_string("{not json").has_value());
    EXPECT_FALSE(ConfigParser::parse_json_string("[1, 2]").has_value());
    EXPECT_FALSE(ConfigParser::parse_json("/nonexistent/autoviz.json").has_value());
}

TEST_F(ConfigTest, ParseJsonIgnoresWrongTypes) {
    auto config = ConfigParser::parse_json_string(R"({
        "output": {"console": "yes", "path": 3, "verbose": 1},
        "profile": {"preferred_visualization": 7, "strong_correlation": "high",
                    "moderate_correlation": null}
    })");
    ASSERT_TRUE(config.has_value());

    const FileConfig defaults;
    EXPECT_EQ(config->output.console, defaults.output.console);
    EXPECT_EQ(config->output.path, defaults.output.path);
    EXPECT_EQ(config->output.verbose, defaults.output.verbose);
    EXPECT_EQ(config->profile.preferred_visualization, defaults.profile.preferred_visualization);
    EXPECT_DOUBLE_EQ(config->profile.relationships.strong, defaults.profile.relationships.strong);
    EXPECT_DOUBLE_EQ(config->profile.relationships.moderate, defaults.profile.relationships.moderate);
}

TEST_F(ConfigTest, DefaultJsonRoundTrips) {
    auto config = ConfigParser::parse_json_string(ConfigParser::generate_default_json());
    ASSERT_TRUE(config.has_value());
    std::string error;
    EXPECT_TRUE(ConfigParser::validate(*config, error)) << error;
    EXPECT_DOUBLE_EQ(config->thresholds.iqr_factor, 1.5);
    EXPECT_EQ(config->thresholds.max_key_findings, 5u);
}

TEST_F(ConfigTest, DefaultYamlParses) {
    write(yaml_path_, ConfigParser::generate_default_yaml());
    auto config = ConfigParser::parse_yaml(yaml_path_);
    ASSERT_TRUE(config.has_value());
    std::string error;
    EXPECT_TRUE(ConfigParser::validate(*config, error)) << error;
    EXPECT_THAT(config->output.formats, ::testing::ElementsAre("json"));
    EXPECT_TRUE(config->profile.preferred_visualization.empty());
    EXPECT_DOUBLE_EQ(config->thresholds.sparse_density, 0.1);
}

TEST_F(ConfigTest, MergeOverlayWins) {
    FileConfig base;
    base.thresholds.skew_threshold = 1.5;
    base.output.path = "base.json";

    FileConfig overlay;
    overlay.thresholds.iqr_factor = 3.0;
    overlay.analysis.network = false;
    overlay.profile.preferred_visualization = "3d_bar";

    FileConfig merged = ConfigParser::merge(base, overlay);
    EXPECT_DOUBLE_EQ(merged.thresholds.skew_threshold, 1.5);
    EXPECT_DOUBLE_EQ(merged.thresholds.iqr_factor, 3.0);
    EXPECT_FALSE(merged.analysis.network);
    EXPECT_EQ(merged.output.path, "base.json");
    EXPECT_EQ(merged.profile.preferred_visualization, "3d_bar");
}

TEST_F(ConfigTest, ValidateRejects) {
    std::string error;

    FileConfig negative;
    negative.thresholds.iqr_factor = -1.0;
    EXPECT_FALSE(ConfigParser::validate(negative, error));
    EXPECT_THAT(error, ::testing::HasSubstr("iqr_factor"));

    FileConfig density;
    density.thresholds.sparse_density = 0.6;
    EXPECT_FALSE(ConfigParser::validate(density, error));

    FileConfig skew;
    skew.thresholds.high_skew_threshold = 0.5;
    EXPECT_FALSE(ConfigParser::validate(skew, error));

    FileConfig bins;
    bins.thresholds.histogram_bins = 2;
    EXPECT_FALSE(ConfigParser::validate(bins, error));

    FileConfig relationships;
    relationships.profile.relationships.moderate = 0.9;
    EXPECT_FALSE(ConfigParser::validate(relationships, error));

    FileConfig format;
    format.output.formats = {"html"};
    EXPECT_FALSE(ConfigParser::validate(format, error));
    EXPECT_THAT(error, ::testing::HasSubstr("html"));

    FileConfig viz;
    viz.profile.preferred_visualization = "pie";
    EXPECT_FALSE(ConfigParser::validate(viz, error));
}

TEST_F(ConfigTest, Environment) {
    setenv("AUTOVIZ_SKEW_THRESHOLD", "1.25", 1);
    setenv("AUTOVIZ_VIZ_TYPE", "network", 1);
    setenv("AUTOVIZ_OUTLIER_PCT", "not-a-number", 1);

    FileConfig config = ConfigParser::parse_environment();
    EXPECT_DOUBLE_EQ(config.thresholds.skew_threshold, 1.25);
    EXPECT_EQ(config.profile.preferred_visualization, "network");
    EXPECT_DOUBLE_EQ(config.thresholds.outlier_pct_threshold, 5.0);
}

TEST_F(ConfigTest, ManagerLoad) {
    write(json_path_, R"({"profile": {"preferred_visualization": "3d_mesh"}})");
    ConfigManager manager;
    ASSERT_TRUE(manager.load(json_path_)) << manager.last_error();
    EXPECT_EQ(manager.loaded_path(), json_path_);
    EXPECT_EQ(manager.preferred_visualization(), VisualizationType::MESH_3D);
}

TEST_F(ConfigTest, ManagerRejectsInvalid) {
    ConfigManager manager;

    write(txt_path_, "whatever");
    EXPECT_FALSE(manager.load(txt_path_));
    EXPECT_THAT(manager.last_error(), ::testing::HasSubstr("Unsupported"));

    EXPECT_FALSE(manager.load("/nonexistent/autoviz.yaml"));

    write(yaml_path_, "output:\n  formats: [pdf]\n");
    EXPECT_FALSE(manager.load(yaml_path_));
    EXPECT_THAT(manager.last_error(), ::testing::HasSubstr("pdf"));

    // Failed loads leave the configuration untouched
    EXPECT_THAT(manager.config().output.formats, ::testing::ElementsAre("json"));
    EXPECT_FALSE(manager.preferred_visualization().has_value());
}

TEST_F(ConfigTest, WriteJson) {
    FileConfig config;
    config.thresholds.min_samples = 25;
    ASSERT_TRUE(ConfigParser::write_json(config, json_path_));
    auto loaded = ConfigParser::parse_json(json_path_);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->thresholds.min_samples, 25u);
}

}  // namespace testing
}  // namespace autoviz
