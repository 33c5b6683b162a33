/**
 * @file InputValidator.hpp
 * @brief Input validation for out-of-range and contradictory parameters
 *
 * Validates user inputs and provides clear error messages with suggested
 * solutions when problems are detected. All problems are reported at once.
 */

#pragma once

#include "density_generator.hpp"
#include <string>
#include <vector>
#include <optional>

namespace dkmz {

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
    std::vector<std::string> warnings;         // Non-fatal findings

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    void add(const ParameterConflict& conflict) {
        conflicts.push_back(conflict);
        is_valid = false;
    }

    std::string format_error_message() const;
};

/**
 * @brief Validates run configuration before any raster work starts
 */
class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Validate a complete command-line run (inputs, outputs, palette)
     */
    ValidationResult validate(const GeneratorConfig& config) const;

    /**
     * @brief Validate only the numeric pipeline parameters
     */
    ValidationResult validate_processing(const ProcessingConfig& processing) const;

private:
    std::optional<ParameterConflict> check_grid_resolution(const ProcessingConfig& processing) const;
    std::optional<ParameterConflict> check_blur_radius(const ProcessingConfig& processing) const;
    std::optional<ParameterConflict> check_threshold_ratio(const ProcessingConfig& processing) const;

    std::optional<ParameterConflict> check_inputs(const GeneratorConfig& config) const;
    std::optional<ParameterConflict> check_output(const GeneratorConfig& config) const;

    /**
     * @brief Malformed colors are not fatal (they render black), only reported
     */
    void check_palette(const GeneratorConfig& config, ValidationResult& result) const;
    std::optional<ParameterConflict> check_threads(const GeneratorConfig& config) const;
};

} // namespace dkmz
