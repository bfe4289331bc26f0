/**
 * @file InputValidator.cpp
 * @brief Implementation of input validation
 */

#include "InputValidator.hpp"
#include <sstream>
#include <iomanip>
#include <cmath>

namespace gex {

namespace {

std::string format_double(double value) {
    std::ostringstream oss;
    oss << std::setprecision(6) << value;
    return oss.str();
}

} // namespace

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Contradictory parameters detected:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Conflict " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    oss << "\nProgram terminated due to contradictory inputs.\n";
    return oss.str();
}

ValidationResult InputValidator::validate(const ExtentConfig& config, bool merges_extents) const {
    ValidationResult result;

    auto checks = {
        check_tolerances_positive(config),
        check_epsilon_below_tolerance(config),
        check_hard_limit_has_budget(config),
        check_composite_extensions(config),
        merges_extents ? check_extraction_enabled(config) : std::nullopt
    };

    for (const auto& conflict : checks) {
        if (conflict) {
            result.conflicts.push_back(*conflict);
            result.is_valid = false;
        }
    }

    return result;
}

std::optional<ParameterConflict> InputValidator::check_tolerances_positive(
    const ExtentConfig& config) const {

    bool tolerance_ok = std::isfinite(config.degeneracy_tolerance) && config.degeneracy_tolerance > 0.0;
    bool epsilon_ok = std::isfinite(config.rectangle_epsilon) && config.rectangle_epsilon > 0.0;
    if (tolerance_ok && epsilon_ok) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Geometry tolerances must be positive numbers";
    conflict.involved_params = {
        "degeneracy_tolerance = " + format_double(config.degeneracy_tolerance),
        "rectangle_epsilon = " + format_double(config.rectangle_epsilon)
    };
    conflict.suggestions = {
        "Use degeneracy_tolerance = 1e-6 (default)",
        "Use rectangle_epsilon = 1e-10 (default)"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_epsilon_below_tolerance(
    const ExtentConfig& config) const {

    if (!(config.rectangle_epsilon > 0.0) || !(config.degeneracy_tolerance > 0.0)) {
        return std::nullopt;  // reported by check_tolerances_positive
    }
    if (config.rectangle_epsilon < config.degeneracy_tolerance) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Rectangle epsilon is not smaller than the point detection tolerance";
    conflict.involved_params = {
        "rectangle_epsilon = " + format_double(config.rectangle_epsilon),
        "degeneracy_tolerance = " + format_double(config.degeneracy_tolerance),
        "A widened point would no longer be detected as a point"
    };
    conflict.suggestions = {
        "Use rectangle_epsilon = " + format_double(config.degeneracy_tolerance / 1e4),
        "Use degeneracy_tolerance = " + format_double(config.rectangle_epsilon * 1e4)
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_hard_limit_has_budget(
    const ExtentConfig& config) const {

    if (!config.hard_limit || config.max_download_bytes.has_value()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Hard download limit requested without a download size limit";
    conflict.involved_params = {
        "--hard-limit (user-provided)",
        "--max-download-size (not set)"
    };
    conflict.suggestions = {
        "Add --max-download-size, e.g. --max-download-size 1GB",
        "Remove --hard-limit"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_composite_extensions(
    const ExtentConfig& config) const {

    std::vector<std::string> malformed;
    for (const auto& extension : config.composite_extensions) {
        if (extension.size() < 2 || extension[0] != '.' ||
            extension.find_first_of(" \t/\\") != std::string::npos) {
            malformed.push_back("'" + extension + "'");
        }
    }
    if (malformed.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Malformed composite extensions";
    conflict.involved_params.push_back("--composite-extensions");
    for (const auto& m : malformed) {
        conflict.involved_params.push_back(m + " (must start with '.' and contain no separators)");
    }
    conflict.suggestions = {
        "Use a comma separated list such as .shp,.shx,.dbf,.prj"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_extraction_enabled(
    const ExtentConfig& config) const {

    if (config.spatial || config.temporal) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Both spatial and temporal extent extraction are disabled";
    conflict.involved_params = {
        "--no-spatial (user-provided)",
        "--no-temporal (user-provided)"
    };
    conflict.suggestions = {
        "Remove --no-spatial to merge bounding boxes",
        "Remove --no-temporal to merge time ranges"
    };
    return conflict;
}

} // namespace gex
