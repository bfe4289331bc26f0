/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser for the extent tool
 */

#pragma once

#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gex {

/**
 * @brief Command-line parser for the extent tool
 *
 * Accepts --name VALUE, --name=VALUE, -x VALUE and flags. One bare
 * argument may be bound to a value option (the records document); any
 * other bare argument is a usage error.
 */
class SimpleCommandLineParser {
public:
    enum class Outcome {
        RUN,
        HELP,
        USAGE_ERROR
    };

    struct Option {
        std::string long_name;
        std::string description;
        bool takes_value = true;
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    void add_option(const std::string& long_name, const std::string& short_name,
                    const std::string& description) {
        register_option(long_name, short_name, description, true);
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        register_option(long_name, short_name, description, false);
    }

    /**
     * @brief Bind the single allowed bare argument to a value option
     */
    void set_positional(const std::string& long_name) { positional_target_ = long_name; }

    Outcome parse(int argc, char* argv[]) {
        values_.clear();
        std::vector<std::string> args(argv + 1, argv + argc);

        for (const auto& arg : args) {
            if (arg == "--help" || arg == "-h") {
                show_help();
                return Outcome::HELP;
            }
        }

        std::optional<std::string> positional;
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            if (arg.size() < 2 || arg[0] != '-') {
                if (positional || positional_target_.empty()) {
                    std::cerr << "Unexpected argument: " << arg << std::endl;
                    return Outcome::USAGE_ERROR;
                }
                positional = arg;
                continue;
            }

            std::string name;
            std::optional<std::string> inline_value;
            if (arg.starts_with("--")) {
                name = arg.substr(2);
                size_t eq_pos = name.find('=');
                if (eq_pos != std::string::npos) {
                    inline_value = name.substr(eq_pos + 1);
                    name.erase(eq_pos);
                }
            } else {
                auto alias = aliases_.find(arg.substr(1));
                if (alias == aliases_.end()) {
                    std::cerr << "Unknown option: " << arg << std::endl;
                    return Outcome::USAGE_ERROR;
                }
                name = alias->second;
            }

            auto it = options_.find(name);
            if (it == options_.end()) {
                std::cerr << "Unknown option: " << arg << std::endl;
                return Outcome::USAGE_ERROR;
            }

            if (!it->second.takes_value) {
                if (inline_value) {
                    std::cerr << "Flag --" << name << " does not take a value" << std::endl;
                    return Outcome::USAGE_ERROR;
                }
                values_[name] = "true";
            } else if (inline_value) {
                values_[name] = *inline_value;
            } else if (i + 1 < args.size() && !args[i + 1].starts_with("-")) {
                values_[name] = args[++i];
            } else {
                std::cerr << "Option " << arg << " requires a value" << std::endl;
                return Outcome::USAGE_ERROR;
            }
        }

        if (positional) {
            if (values_.count(positional_target_)) {
                std::cerr << "Both --" << positional_target_ << " and a bare path given: "
                          << *positional << std::endl;
                return Outcome::USAGE_ERROR;
            }
            values_[positional_target_] = *positional;
        }
        return Outcome::RUN;
    }

    std::optional<std::string> get(const std::string& long_name) const {
        auto it = values_.find(long_name);
        if (it == values_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool get_flag(const std::string& long_name) const {
        return values_.count(long_name) > 0;
    }

    void show_help() const {
        std::cout << program_name_ << " - " << description_ << "\n\n";

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " [OPTIONS] --records FILE\n";
        std::cout << "    " << program_name_ << " [OPTIONS] RECORDS_FILE\n";
        std::cout << "    " << program_name_ << " [OPTIONS] --candidates FILE --max-download-size SIZE\n\n";

        std::cout << "QUICK START:\n";
        std::cout << "    # Merge per-file extents into one bounding box and time range\n";
        std::cout << "    " << program_name_ << " --records extents.json\n";
        std::cout << "    \n";
        std::cout << "    # Choose which files of a repository fit into 100 MB\n";
        std::cout << "    " << program_name_ << " --candidates files.json --max-download-size 100MB\n";
        std::cout << "    \n";
        std::cout << "    # Create a configuration file with every setting\n";
        std::cout << "    " << program_name_ << " --create-config extent.conf\n\n";

        std::cout << "INPUT OPTIONS:\n";
        print_help_section("records");
        print_help_section("candidates");
        print_help_section("config");
        print_help_section("create-config");
        print_help_section("source-name");
        std::cout << "\n";

        std::cout << "EXTENT OPTIONS:\n";
        print_help_section("convex-hull");
        print_help_section("no-spatial");
        print_help_section("no-temporal");
        print_help_section("assume-wgs84");
        print_help_section("repair-axis-order");
        std::cout << "\n";

        std::cout << "DOWNLOAD SELECTION OPTIONS:\n";
        print_help_section("max-download-size");
        print_help_section("download-method");
        print_help_section("seed");
        print_help_section("hard-limit");
        print_help_section("composite-extensions");
        std::cout << "\n";

        std::cout << "LOGGING OPTIONS:\n";
        print_help_section("log-level");
        print_help_section("log-file");
        print_help_section("dry-run");
        print_help_section("version");
        std::cout << "\n";

        std::cout << "HELP:\n";
        std::cout << "    -h, --help               Show this help\n";
        std::cout << "\n";

        std::cout << "EXIT STATUS:\n";
        std::cout << "    0 success, 1 invalid input or configuration, 2 hard download limit exceeded\n\n";

        std::cout << "OUTPUT:\n";
        std::cout << "    One JSON object on stdout with \"extent\" and/or \"selection\" members.\n";
        std::cout << "    Log messages go to stderr.\n";
    }

private:
    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> aliases_;   // short -> long
    std::string positional_target_;
    std::map<std::string, std::string> values_;

    void register_option(const std::string& long_name, const std::string& short_name,
                         const std::string& description, bool takes_value) {
        options_[long_name] = Option{long_name, description, takes_value};
        if (!short_name.empty()) {
            aliases_[short_name] = long_name;
        }
    }

    void print_help_section(const std::string& long_name) const {
        auto it = options_.find(long_name);
        if (it == options_.end()) {
            return;
        }
        std::cout << "    --" << long_name << (it->second.takes_value ? " VALUE" : "")
                  << "            " << it->second.description << "\n";
    }
};

} // namespace gex
