/**
 * @file main.cpp
 * @brief Main entry point for the extent tool
 *
 * Reads extent records and candidate file lists produced by extractors and
 * protocol clients, merges the extents, selects downloads under a byte
 * budget and prints the results as JSON on stdout.
 */

#include "extent_engine.hpp"
#include "core/InputValidator.hpp"
#include "core/Logger.hpp"
#include "cli/CommandLineInterface.hpp"
#include "cli/ExtentJson.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using namespace gex;

namespace {

constexpr int EXIT_HARD_LIMIT = 2;

/**
 * @brief Apply log level string and log file of the configuration
 */
bool configure_logging(const ExtentConfig& config) {
    Logger::parseLogConfig(config.log_level);
    if (config.log_file && !Logger::setSharedLogFile(config.log_file)) {
        std::cerr << "Error: Could not open log file: " << *config.log_file << "\n";
        return false;
    }
    return true;
}

} // namespace

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    try {
        CommandLineInterface cli;
        if (!cli.parse_arguments(argc, argv)) {
            return cli.exit_code();  // Help, version, create-config or usage error
        }

        const ExtentConfig& config = cli.get_config();
        if (!configure_logging(config)) {
            return 1;
        }
        Logger logger("ExtentTool");

        InputValidator validator;
        ValidationResult validation = validator.validate(config, cli.records_path().has_value());
        if (validation.has_errors()) {
            std::cerr << validation.format_error_message();
            return 1;
        }

        if (logger.shouldOutput(LogLevel::DETAILED)) {
            cli.print_config();
        }

        if (cli.is_dry_run()) {
            logger.info("Dry run mode - configuration validated successfully");
            return 0;
        }

        ExtentAggregator aggregator(config);
        nlohmann::json output = nlohmann::json::object();

        if (const auto& path = cli.records_path()) {
            std::vector<ExtentRecord> records = records_from_json(load_json_file(*path));
            output["extent"] = to_json(aggregator.aggregate(records, *path));
        }

        if (const auto& path = cli.candidates_path()) {
            std::vector<CandidateFile> files = candidates_from_json(load_json_file(*path));
            try {
                output["selection"] = to_json(aggregator.select_downloads(files));
            } catch (const DownloadSizeExceeded& e) {
                std::cerr << "Error: " << e.what() << "\n";
                logger.flush();
                return EXIT_HARD_LIMIT;
            }
        }

        std::cout << output.dump(2) << std::endl;
        logger.flush();
        return 0;

    } catch (const InputFormatError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
