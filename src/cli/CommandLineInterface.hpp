/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the extent tool
 */

#pragma once

#include "extent_engine.hpp"
#include "SimpleCommandLineParser.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gex {

/**
 * @brief Command line interface for parsing arguments and configuring the engine
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument vector
     * @return true if the tool should run, false when it should exit with exit_code()
     */
    bool parse_arguments(int argc, char* argv[]);

    /**
     * @brief Get the parsed configuration
     * @return ExtentConfig object
     */
    const ExtentConfig& get_config() const { return config_; }

    /**
     * @brief Check if this is a dry run
     * @return true if dry run mode is enabled
     */
    bool is_dry_run() const { return dry_run_; }

    /**
     * @brief Exit status when parse_arguments() returned false
     *
     * 0 after --help, --version or --create-config, 1 on errors.
     */
    int exit_code() const { return exit_code_; }

    const std::optional<std::string>& records_path() const { return records_path_; }
    const std::optional<std::string>& candidates_path() const { return candidates_path_; }

    /**
     * @brief Print the current configuration (DETAILED level and up)
     */
    void print_config() const;

private:
    ExtentConfig config_;
    bool dry_run_ = false;
    int exit_code_ = 0;
    std::optional<std::string> records_path_;
    std::optional<std::string> candidates_path_;

    // Main parsing method
    bool parse_all_options(const SimpleCommandLineParser& parser);

    // Configuration file methods
    bool create_default_config_file(const std::string& filename);
    bool load_config_file(const std::string& filename);
};

} // namespace gex
