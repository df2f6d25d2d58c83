#pragma once

#include "config.h"
#include "report_generator.h"
#include "visualization_recommender.h"
#include <optional>
#include <string>
#include <vector>

namespace autoviz {

// Command-line interface
struct CLIOptions {
    std::vector<std::string> input_paths;
    std::optional<VisualizationType> viz_type;
    std::string viz_type_name;          // as given, for error messages
    bool analytics = false;
    bool analytics_only = false;
    bool suggest = false;
    bool profile_only = false;
    std::string output_path;
    ReportFormat output_format = ReportFormat::JSON;
    bool format_given = false;
    std::string config_path;
    std::string batch_output_dir;
    bool list_viz = false;
    bool verbose = false;
    bool quiet = false;
    bool help = false;

    std::vector<std::string> errors;    // unknown options, bad values
};

CLIOptions parse_cli_args(int argc, char* argv[]);
void print_help();
int run_cli(int argc, char* argv[]);

// Process one CSV end to end; returns 0 on success
int process_file(const std::string& path, const CLIOptions& options,
                 const FileConfig& config, const std::string& output_path);

}  // namespace autoviz
