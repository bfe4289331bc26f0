/**
 * @file InputValidator.hpp
 * @brief Input validation for contradictory parameters
 *
 * Validates aggregation and selection settings for contradictions and
 * provides clear error messages with suggested solutions.
 */

#pragma once

#include "extent_engine.hpp"
#include <string>
#include <vector>
#include <optional>

namespace gex {

/**
 * @brief Represents a parameter conflict detected in user inputs
 */
struct ParameterConflict {
    std::string description;           // Description of the conflict
    std::vector<std::string> involved_params;  // Parameters involved
    std::vector<std::string> suggestions;      // Suggested resolutions
};

/**
 * @brief Result of input validation
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    std::string format_error_message() const;
};

/**
 * @brief Validates an ExtentConfig for contradictions and conflicts
 */
class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Validate all configuration parameters
     * @param config Configuration to validate
     * @param merges_extents Records will be aggregated; when false the
     *        spatial/temporal switches are not checked
     * @return Validation result with any conflicts found
     */
    ValidationResult validate(const ExtentConfig& config, bool merges_extents = true) const;

private:
    /**
     * @brief Tolerance and epsilon must be positive and finite
     */
    std::optional<ParameterConflict> check_tolerances_positive(
        const ExtentConfig& config) const;

    /**
     * @brief The widening epsilon must stay below the point tolerance,
     *        otherwise widened geometries could stop being points
     */
    std::optional<ParameterConflict> check_epsilon_below_tolerance(
        const ExtentConfig& config) const;

    /**
     * @brief A hard limit needs a download size limit to enforce
     */
    std::optional<ParameterConflict> check_hard_limit_has_budget(
        const ExtentConfig& config) const;

    /**
     * @brief Composite extensions must start with '.' and name something
     */
    std::optional<ParameterConflict> check_composite_extensions(
        const ExtentConfig& config) const;

    /**
     * @brief Spatial and temporal extraction cannot both be disabled
     */
    std::optional<ParameterConflict> check_extraction_enabled(
        const ExtentConfig& config) const;
};

} // namespace gex
