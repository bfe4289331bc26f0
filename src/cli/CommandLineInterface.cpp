/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "ConfigurationManager.hpp"
#include "SimpleCommandLineParser.hpp"
#include "ByteSizeParser.hpp"
#include "version.h"
#include <iostream>

namespace gex {

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("extent-tool",
        "Merge per-file spatial/temporal extents and select downloads under a byte budget");

    // Input options
    parser.add_option("records", "r", "JSON document {\"records\": [{name, bbox, crs, tbox, hull}]}");
    parser.set_positional("records");
    parser.add_option("candidates", "f", "JSON document {\"files\": [{name, url, size}]}");
    parser.add_option("config", "c", "Load configuration from key=value file");
    parser.add_option("create-config", "", "Create a default configuration file at the specified path");
    parser.add_option("source-name", "", "Label of the remote source in messages (default: remote)");

    // Extent options
    parser.add_flag("convex-hull", "", "Merge into a convex hull instead of a bounding box");
    parser.add_flag("no-spatial", "", "Skip spatial extent merging");
    parser.add_flag("no-temporal", "", "Skip temporal extent merging");
    parser.add_flag("assume-wgs84", "", "Treat records without crs as EPSG:4326");
    parser.add_flag("repair-axis-order", "", "Flip lat/lon boxes that fall outside WGS84 ranges");

    // Download selection options
    parser.add_option("max-download-size", "", "Byte budget, e.g. 500000, 100MB, 2GiB (default: unlimited)");
    parser.add_option("download-method", "", "ordered, random, smallest or largest (default: ordered)");
    parser.add_option("seed", "", "Seed of the random method (default: 42)");
    parser.add_flag("hard-limit", "", "Fail instead of truncating when the budget is exceeded");
    parser.add_option("composite-extensions", "", "Extensions forming one dataset (default: .shp,.shx,.dbf,.prj,.sbn,.sbx,.cpg,.shp.xml)");

    // Logging and utility options
    parser.add_option("log-level", "", "Verbosity: 1=ERROR, 2=WARNING, 3=INFO (default), 4=DETAILED, 5=DEBUG, 6=TRACE; per component: 3,SpatialMerger=6");
    parser.add_option("log-file", "", "Log to specified file (append if exists)");
    parser.add_flag("dry-run", "", "Parse arguments and validate without processing");
    parser.add_flag("version", "", "Show version information");

    switch (parser.parse(argc, argv)) {
        case SimpleCommandLineParser::Outcome::RUN:
            break;
        case SimpleCommandLineParser::Outcome::HELP:
            exit_code_ = 0;
            return false;
        case SimpleCommandLineParser::Outcome::USAGE_ERROR:
            exit_code_ = 1;
            return false;
    }

    // Handle version flag
    if (parser.get_flag("version")) {
        std::cout << "Extent Tool v" << GEX_VERSION_STRING << std::endl;
        std::cout << "Extent aggregation and budgeted download selection" << std::endl;
        std::cout << "Built with GDAL/OGR and nlohmann/json" << std::endl;
        exit_code_ = 0;
        return false;
    }

    // Handle create-config flag
    if (auto config_path = parser.get("create-config")) {
        if (!create_default_config_file(config_path.value())) {
            std::cerr << "Failed to create configuration file: " << config_path.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
        std::cout << "Created default configuration file: " << config_path.value() << std::endl;
        exit_code_ = 0;
        return false;
    }

    // Load configuration file if specified; command line values override it
    if (auto config_file = parser.get("config")) {
        if (!load_config_file(config_file.value())) {
            std::cerr << "Failed to load configuration file: " << config_file.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
    }

    if (!parse_all_options(parser)) {
        exit_code_ = 1;
        return false;
    }

    if (!records_path_ && !candidates_path_ && !dry_run_) {
        std::cerr << "Nothing to do: provide --records and/or --candidates (see --help)" << std::endl;
        exit_code_ = 1;
        return false;
    }

    return true;
}

bool CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    // Inputs
    if (auto value = parser.get("records")) records_path_ = value.value();
    if (auto value = parser.get("candidates")) candidates_path_ = value.value();
    if (auto value = parser.get("source-name")) config_.source_name = value.value();

    // Extent options (flags only ever switch defaults)
    if (parser.get_flag("convex-hull")) config_.convex_hull = true;
    if (parser.get_flag("no-spatial")) config_.spatial = false;
    if (parser.get_flag("no-temporal")) config_.temporal = false;
    if (parser.get_flag("assume-wgs84")) config_.assume_wgs84 = true;
    if (parser.get_flag("repair-axis-order")) config_.repair_axis_order = true;

    // Download selection
    if (auto value = parser.get("max-download-size")) {
        try {
            config_.max_download_bytes = parse_byte_size(value.value());
        } catch (const ByteSizeParseError& e) {
            std::cerr << "Invalid --max-download-size: " << e.what() << std::endl;
            return false;
        }
    }
    if (auto value = parser.get("download-method")) {
        config_.selection_policy = parse_selection_policy(value.value());
    }
    if (auto value = parser.get("seed")) {
        auto seed = parse_seed(value.value());
        if (!seed) {
            std::cerr << "Invalid --seed: " << value.value()
                      << " (expected an integer from 0 to 4294967295)" << std::endl;
            return false;
        }
        config_.seed = seed.value();
    }
    if (parser.get_flag("hard-limit")) config_.hard_limit = true;
    if (auto value = parser.get("composite-extensions")) {
        config_.composite_extensions = split_list(value.value());
    }

    // Logging
    if (auto value = parser.get("log-level")) config_.log_level = value.value();
    if (auto value = parser.get("log-file")) config_.log_file = value.value();

    dry_run_ = parser.get_flag("dry-run");
    return true;
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) {
    ConfigurationManager manager;
    manager.from_extent_config(ExtentConfig());
    return manager.save_to_file(filename);
}

bool CommandLineInterface::load_config_file(const std::string& filename) {
    ConfigurationManager manager;
    if (!manager.load_from_file(filename)) {
        std::cerr << "Error: Could not open config file: " << filename << std::endl;
        return false;
    }

    try {
        config_ = manager.to_extent_config();
    } catch (const ByteSizeParseError& e) {
        std::cerr << "Error loading config file: " << e.what() << std::endl;
        return false;
    } catch (const ConfigurationError& e) {
        std::cerr << "Error loading config file: " << e.what() << std::endl;
        return false;
    }
    return true;
}

void CommandLineInterface::print_config() const {
    std::cerr << "\n=== Configuration ===\n";
    std::cerr << "Records: " << records_path_.value_or("(none)") << "\n";
    std::cerr << "Candidates: " << candidates_path_.value_or("(none)") << "\n";
    std::cerr << "Spatial: " << (config_.spatial ? (config_.convex_hull ? "convex hull" : "bounding box") : "off") << "\n";
    std::cerr << "Temporal: " << (config_.temporal ? "on" : "off") << "\n";
    std::cerr << "Assume WGS84: " << (config_.assume_wgs84 ? "yes" : "no") << "\n";
    std::cerr << "Repair axis order: " << (config_.repair_axis_order ? "yes" : "no") << "\n";
    std::cerr << "Point tolerance: " << config_.degeneracy_tolerance << "\n";
    std::cerr << "Rectangle epsilon: " << config_.rectangle_epsilon << "\n";
    std::cerr << "Download limit: "
              << (config_.max_download_bytes ? format_byte_size(*config_.max_download_bytes) : "unlimited")
              << (config_.hard_limit ? " (hard)" : "") << "\n";
    std::cerr << "Download method: " << selection_policy_name(config_.selection_policy);
    if (config_.selection_policy == SelectionPolicy::RANDOM) {
        std::cerr << " (seed " << config_.seed << ")";
    }
    std::cerr << "\nComposite extensions: ";
    for (size_t i = 0; i < config_.composite_extensions.size(); ++i) {
        if (i > 0) std::cerr << ", ";
        std::cerr << config_.composite_extensions[i];
    }
    std::cerr << "\nSource: " << config_.source_name << "\n";
    std::cerr << "===================\n\n";
}

} // namespace gex
