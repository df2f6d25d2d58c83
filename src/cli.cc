#include "autoviz/cli.h"
#include "autoviz/analytics_engine.h"
#include "autoviz/csv_loader.h"
#include "autoviz/errors.h"
#include "autoviz/profiler.h"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <getopt.h>

namespace autoviz {

namespace {

std::optional<VisualizationType> effective_preference(const CLIOptions& options,
                                                      const FileConfig& config) {
    if (options.viz_type) {
        return options.viz_type;
    }
    if (!config.profile.preferred_visualization.empty()) {
        return parse_visualization_type(config.profile.preferred_visualization);
    }
    return std::nullopt;
}

ReportFormat effective_format(const CLIOptions& options, const FileConfig& config) {
    if (options.format_given || config.output.formats.empty()) {
        return options.output_format;
    }
    return parse_report_format(config.output.formats.front()).value_or(options.output_format);
}

std::string batch_output_path(const std::string& input, const std::string& dir, ReportFormat format) {
    if (dir.empty()) {
        return "";
    }
    const std::filesystem::path stem = std::filesystem::path(input).stem();
    return (std::filesystem::path(dir) / (stem.string() + "_report" + report_file_extension(format))).string();
}

}  // anonymous namespace

// CLI implementation
CLIOptions parse_cli_args(int argc, char* argv[]) {
    CLIOptions options;

    // Reset getopt state for proper parsing across multiple calls
    optind = 1;

    static struct option long_options[] = {
        {"viz-type", required_argument, nullptr, 't'},
        {"analytics", no_argument, nullptr, 'a'},
        {"analytics-only", no_argument, nullptr, 'A'},
        {"suggest", no_argument, nullptr, 's'},
        {"profile-only", no_argument, nullptr, 'p'},
        {"output", required_argument, nullptr, 'o'},
        {"format", required_argument, nullptr, 'f'},
        {"config", required_argument, nullptr, 'c'},
        {"batch-output-dir", required_argument, nullptr, 'b'},
        {"list-viz", no_argument, nullptr, 'l'},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "t:aAspo:f:c:b:lvqh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 't':
                options.viz_type_name = optarg;
                options.viz_type = parse_visualization_type(optarg);
                if (!options.viz_type) {
                    options.errors.push_back("Unknown visualization type: " + std::string(optarg));
                }
                break;
            case 'a':
                options.analytics = true;
                break;
            case 'A':
                options.analytics = true;
                options.analytics_only = true;
                break;
            case 's':
                options.suggest = true;
                break;
            case 'p':
                options.profile_only = true;
                break;
            case 'o':
                options.output_path = optarg;
                break;
            case 'f':
                if (auto format = parse_report_format(optarg)) {
                    options.output_format = *format;
                    options.format_given = true;
                } else {
                    options.errors.push_back("Unknown output format: " + std::string(optarg));
                }
                break;
            case 'c':
                options.config_path = optarg;
                break;
            case 'b':
                options.batch_output_dir = optarg;
                break;
            case 'l':
                options.list_viz = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'h':
                options.help = true;
                break;
            default:
                options.errors.push_back("Unrecognized option");
                break;
        }
    }

    for (int i = optind; i < argc; ++i) {
        options.input_paths.push_back(argv[i]);
    }

    return options;
}

void print_help() {
    std::cout << R"(
AutoViz: Autonomous Profiling & Insight Engine

Usage: autoviz [OPTIONS] FILE.csv [FILE.csv ...]

Options:
  -t, --viz-type TYPE         Preferred visualization (honoured when it is a candidate)
  -a, --analytics             Run insight analytics after the decision
  -A, --analytics-only        Analytics report without the profile section
  -s, --suggest               Print ranked visualization suggestions only
  -p, --profile-only          Profile and decide, skip analytics
  -o, --output PATH           Write the report to PATH
  -f, --format FMT            Report format: json, md, text (default: json)
  -c, --config PATH           Load configuration (.yaml, .yml, .json)
  -b, --batch-output-dir DIR  Per-file reports for batch runs
  -l, --list-viz              List visualization types
  -v, --verbose               Verbose output
  -q, --quiet                 Quiet mode
  -h, --help                  Show this help

Examples:
  autoviz sales.csv
  autoviz --analytics --format md --output report.md sales.csv
  autoviz --viz-type network edges.csv
  autoviz -A -b reports/ data/*.csv

)" << std::endl;
}

int process_file(const std::string& path, const CLIOptions& options,
                 const FileConfig& config, const std::string& output_path) {
    std::optional<DataTable> table = load_csv(path);
    if (!table) {
        std::cerr << "Error: cannot read CSV file " << path << "\n";
        return 1;
    }

    const bool console = !options.quiet && config.output.console;
    const ReportFormat format = effective_format(options, config);

    try {
        Profiler profiler(KeywordRules{}, config.profile.relationships);

        if (options.suggest) {
            const auto suggestions = profiler.suggest(*table);
            std::cout << "Suggestions for " << path << ":\n";
            for (size_t i = 0; i < suggestions.size(); ++i) {
                std::cout << "  " << (i + 1) << ". " << std::setw(16) << std::left
                          << to_string(suggestions[i].type) << " "
                          << format::format_confidence(suggestions[i].confidence) << "\n";
            }
            return 0;
        }

        const auto preference = effective_preference(options, config);
        const VisualizationDecision decision = profiler.decide_visualization(*table, preference);
        if (preference && *preference != decision.type) {
            spdlog::warn("Requested {} is not a candidate for {}; using {}",
                         to_string(*preference), path, to_string(decision.type));
        }

        if (console && !options.analytics_only) {
            TextReportGenerator text;
            text.set_config(ReportConfig{"AutoViz: " + path});
            text.add_profile(decision.profile);
            text.add_decision(decision);
            std::cout << text.generate();
        }

        auto generator = ReportGeneratorFactory::create(format);
        ReportConfig report_config;
        report_config.include_profile = !options.analytics_only;
        generator->set_config(report_config);
        generator->add_decision(decision);
        generator->add_profile(decision.profile);

        const bool run_analytics = options.analytics && !options.profile_only;
        if (run_analytics) {
            AnalyticsEngine engine(config.thresholds, config.analysis);
            const AnalyticsReport report = engine.analyze(*table, decision.type);
            generator->add_report(report);
        }

        if (!output_path.empty()) {
            if (!generator->generate_to_file(output_path)) {
                std::cerr << "Error: cannot write report to " << output_path << "\n";
                return 1;
            }
            if (console) {
                std::cout << "Report written to " << output_path << "\n";
            }
        } else if (run_analytics) {
            std::cout << generator->generate() << "\n";
        }
    } catch (const AutovizError& e) {
        std::cerr << "Error: " << path << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << path << ": unexpected failure: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

int run_cli(int argc, char* argv[]) {
    CLIOptions options = parse_cli_args(argc, argv);

    if (options.help) {
        print_help();
        return 0;
    }

    if (!options.errors.empty()) {
        for (const auto& error : options.errors) {
            std::cerr << "Error: " << error << "\n";
        }
        std::cerr << "Try --help for usage.\n";
        return 1;
    }

    if (options.list_viz) {
        std::cout << "Visualization types:\n";
        for (auto type : all_visualization_types()) {
            std::cout << "  " << std::setw(16) << std::left << to_string(type)
                      << describe(type) << "\n";
        }
        return 0;
    }

    if (options.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (options.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    ConfigManager manager;
    if (!options.config_path.empty()) {
        if (!manager.load(options.config_path)) {
            std::cerr << "Error: " << manager.last_error() << "\n";
            return 1;
        }
        manager.apply_environment();
    } else if (!manager.load_default()) {
        spdlog::warn("Ignoring default configuration: {}", manager.last_error());
    }
    const FileConfig& config = manager.config();

    if (config.output.verbose && !options.quiet) {
        spdlog::set_level(spdlog::level::debug);
    }

    if (options.input_paths.empty()) {
        std::cerr << "Error: no input CSV file given\nTry --help for usage.\n";
        return 1;
    }

    if (!options.batch_output_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(options.batch_output_dir, ec);
        if (ec) {
            std::cerr << "Error: cannot create " << options.batch_output_dir << ": " << ec.message() << "\n";
            return 1;
        }
    }

    if (options.input_paths.size() == 1) {
        std::string output_path = options.output_path.empty() ? config.output.path : options.output_path;
        if (!options.batch_output_dir.empty()) {
            output_path = batch_output_path(options.input_paths.front(), options.batch_output_dir,
                                            effective_format(options, config));
        }
        return process_file(options.input_paths.front(), options, config, output_path);
    }

    // Batch mode

    size_t failures = 0;
    for (const auto& path : options.input_paths) {
        if (!options.quiet) {
            std::cout << "Processing " << path << "...\n";
        }
        const std::string output_path = batch_output_path(path, options.batch_output_dir,
                                                          effective_format(options, config));
        if (process_file(path, options, config, output_path) != 0) {
            ++failures;
        }
    }

    if (!options.quiet) {
        std::cout << "\nBatch complete: " << (options.input_paths.size() - failures) << " of "
                  << options.input_paths.size() << " files processed";
        if (failures > 0) {
            std::cout << " (" << failures << " failed)";
        }
        std::cout << "\n";
    }

    return failures == options.input_paths.size() ? 1 : 0;
}

}  // namespace autoviz
