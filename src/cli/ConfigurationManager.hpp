/**
 * @file ConfigurationManager.hpp
 * @brief Configuration file management for the extent tool
 */

#pragma once

#include "extent_engine.hpp"
#include <cstdint>
#include <string>
#include <map>
#include <optional>
#include <stdexcept>
#include <vector>

namespace gex {

/**
 * @brief A configuration value is out of range or malformed
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

/**
 * @brief Configuration file manager for loading and saving settings
 *
 * Files hold one key=value pair per line; '#' starts a comment line.
 */
class ConfigurationManager {
public:
    ConfigurationManager() = default;

    /**
     * @brief Load configuration from file
     * @param filename Path to configuration file
     * @return true if successful, false otherwise
     */
    bool load_from_file(const std::string& filename);

    /**
     * @brief Save configuration to file
     * @param filename Path to configuration file
     * @return true if successful, false otherwise
     */
    bool save_to_file(const std::string& filename) const;

    /**
     * @brief Convert to ExtentConfig object
     * @return ExtentConfig with values from this manager, defaults elsewhere
     * @throws ByteSizeParseError if max_download_size is malformed
     * @throws ConfigurationError if seed is not a 32-bit unsigned integer
     */
    ExtentConfig to_extent_config() const;

    /**
     * @brief Load from ExtentConfig object
     * @param config ExtentConfig to load values from
     */
    void from_extent_config(const ExtentConfig& config);

    // Value setters and getters
    void set_value(const std::string& key, const std::string& value) {
        config_values_[key] = value;
    }

    bool has_value(const std::string& key) const {
        return config_values_.find(key) != config_values_.end();
    }

    std::string get_string(const std::string& key, const std::string& default_value = "") const {
        auto it = config_values_.find(key);
        return (it != config_values_.end()) ? it->second : default_value;
    }

    double get_double(const std::string& key, double default_value = 0.0) const {
        auto it = config_values_.find(key);
        if (it != config_values_.end()) {
            try {
                return std::stod(it->second);
            } catch (const std::exception&) {
                // Fall through to default
            }
        }
        return default_value;
    }

    bool get_bool(const std::string& key, bool default_value = false) const {
        auto it = config_values_.find(key);
        if (it != config_values_.end()) {
            const std::string& value = it->second;
            return value == "true" || value == "1" || value == "yes";
        }
        return default_value;
    }

    /**
     * @brief Comma separated list value, entries trimmed, empty entries dropped
     */
    std::vector<std::string> get_list(const std::string& key) const;

private:
    std::map<std::string, std::string> config_values_;
};

/**
 * @brief Decimal seed in [0, 2^32 - 1]; nullopt for anything else
 */
std::optional<std::uint32_t> parse_seed(const std::string& text);

/**
 * @brief Split "a, b,,c" into {"a", "b", "c"}
 */
std::vector<std::string> split_list(const std::string& text);

} // namespace gex
