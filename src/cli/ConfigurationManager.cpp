/**
 * @file ConfigurationManager.cpp
 * @brief Configuration management for the extent tool
 */

#include "ConfigurationManager.hpp"
#include "ByteSizeParser.hpp"
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace gex {

namespace {

std::string format_double(double value) {
    std::ostringstream oss;
    oss << std::setprecision(12) << value;
    return oss.str();
}

} // namespace

std::optional<std::uint32_t> parse_seed(const std::string& text) {
    if (text.empty() || text.size() > 10 ||
        text.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    std::uint64_t value = std::stoull(text);
    if (value > std::numeric_limits<std::uint32_t>::max()) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(value);
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> items;
    std::istringstream iss(text);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::vector<std::string> ConfigurationManager::get_list(const std::string& key) const {
    return split_list(get_string(key));
}

bool ConfigurationManager::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    // Simple key=value parser
    std::string line;
    while (std::getline(file, line)) {
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);

        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t\r") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r") + 1);

        config_values_[key] = value;
    }

    return true;
}

bool ConfigurationManager::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# Extent Tool Configuration" << std::endl;
    file << "# Generated automatically" << std::endl;
    file << std::endl;

    for (const auto& [key, value] : config_values_) {
        file << key << "=" << value << std::endl;
    }

    return true;
}

ExtentConfig ConfigurationManager::to_extent_config() const {
    ExtentConfig config;

    // Aggregation
    config.spatial = get_bool("spatial", config.spatial);
    config.temporal = get_bool("temporal", config.temporal);
    config.convex_hull = get_bool("convex_hull", config.convex_hull);
    config.assume_wgs84 = get_bool("assume_wgs84", config.assume_wgs84);
    config.repair_axis_order = get_bool("repair_axis_order", config.repair_axis_order);
    config.degeneracy_tolerance = get_double("degeneracy_tolerance", config.degeneracy_tolerance);
    config.rectangle_epsilon = get_double("rectangle_epsilon", config.rectangle_epsilon);

    // Download selection
    std::string size_str = get_string("max_download_size");
    if (!size_str.empty() && size_str != "none") {
        config.max_download_bytes = parse_byte_size(size_str);
    }
    if (has_value("download_method")) {
        config.selection_policy = parse_selection_policy(get_string("download_method"));
    }
    if (has_value("seed")) {
        auto seed = parse_seed(get_string("seed"));
        if (!seed) {
            throw ConfigurationError("seed '" + get_string("seed") +
                                     "' is not an integer from 0 to 4294967295");
        }
        config.seed = *seed;
    }
    config.hard_limit = get_bool("hard_limit", config.hard_limit);
    if (has_value("composite_extensions")) {
        config.composite_extensions = get_list("composite_extensions");
    }
    config.source_name = get_string("source_name", config.source_name);

    // Logging
    config.log_level = get_string("log_level", config.log_level);
    std::string log_file = get_string("log_file");
    if (!log_file.empty()) {
        config.log_file = log_file;
    }

    return config;
}

void ConfigurationManager::from_extent_config(const ExtentConfig& config) {
    set_value("spatial", config.spatial ? "true" : "false");
    set_value("temporal", config.temporal ? "true" : "false");
    set_value("convex_hull", config.convex_hull ? "true" : "false");
    set_value("assume_wgs84", config.assume_wgs84 ? "true" : "false");
    set_value("repair_axis_order", config.repair_axis_order ? "true" : "false");
    set_value("degeneracy_tolerance", format_double(config.degeneracy_tolerance));
    set_value("rectangle_epsilon", format_double(config.rectangle_epsilon));

    set_value("max_download_size", config.max_download_bytes
                                       ? std::to_string(*config.max_download_bytes)
                                       : "none");
    set_value("download_method", selection_policy_name(config.selection_policy));
    set_value("seed", std::to_string(config.seed));
    set_value("hard_limit", config.hard_limit ? "true" : "false");

    std::ostringstream extensions_ss;
    for (size_t i = 0; i < config.composite_extensions.size(); ++i) {
        if (i > 0) extensions_ss << ",";
        extensions_ss << config.composite_extensions[i];
    }
    set_value("composite_extensions", extensions_ss.str());
    set_value("source_name", config.source_name);

    set_value("log_level", config.log_level);
    if (config.log_file) {
        set_value("log_file", *config.log_file);
    }
}

} // namespace gex
