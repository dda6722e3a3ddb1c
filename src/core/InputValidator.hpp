/**
 * @file InputValidator.hpp
 * @brief Input validation for contradictory or out-of-range parameters
 *
 * Validates user inputs before any AOI is processed and provides clear
 * error messages with suggested solutions when problems are detected.
 */

#pragma once

#include "aoi_composite.hpp"
#include <string>
#include <vector>
#include <optional>

namespace aoi {

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
 * @brief Validates a CompositeConfig for contradictions and bad ranges
 */
class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Validate all configuration parameters
     * @param config Configuration to validate
     * @return Validation result with any conflicts found
     */
    ValidationResult validate(const CompositeConfig& config) const;

private:
    /**
     * @brief End year must not precede the start year
     */
    std::optional<ParameterConflict> check_year_range(const CompositeConfig& config) const;

    /**
     * @brief Gain threshold in [0,1), target in (0,1], gain below target
     */
    std::optional<ParameterConflict> check_selection_thresholds(const CompositeConfig& config) const;

    /**
     * @brief Cloud cover maximum is a percentage
     */
    std::optional<ParameterConflict> check_cloud_cover(const CompositeConfig& config) const;

    /**
     * @brief At least one band, no band listed twice
     */
    std::optional<ParameterConflict> check_bands(const CompositeConfig& config) const;

    /**
     * @brief At least one line; indices non-negative and unique since each
     * index owns a process log
     */
    std::optional<ParameterConflict> check_lines(const CompositeConfig& config) const;

    /**
     * @brief Catalog paging, buffer distance and thread counts
     */
    std::optional<ParameterConflict> check_processing_limits(const CompositeConfig& config) const;
};

} // namespace aoi
