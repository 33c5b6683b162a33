/**
 * @file InputValidator.cpp
 * @brief Implementation of input validation
 */

#include "InputValidator.hpp"
#include "GaussianSmoother.hpp"
#include "../export/PixelEncoder.hpp"
#include <sstream>
#include <iomanip>
#include <cmath>

namespace dkmz {

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Invalid parameters detected:\n\n";

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

    oss << "\nProgram terminated due to invalid inputs.\n";
    return oss.str();
}

ValidationResult InputValidator::validate_processing(const ProcessingConfig& processing) const {
    ValidationResult result;

    if (auto conflict = check_grid_resolution(processing)) result.add(*conflict);
    if (auto conflict = check_blur_radius(processing)) result.add(*conflict);
    if (auto conflict = check_threshold_ratio(processing)) result.add(*conflict);

    return result;
}

ValidationResult InputValidator::validate(const GeneratorConfig& config) const {
    ValidationResult result = validate_processing(config.processing);

    if (auto conflict = check_inputs(config)) result.add(*conflict);
    if (auto conflict = check_output(config)) result.add(*conflict);
    check_palette(config, result);
    if (auto conflict = check_threads(config)) result.add(*conflict);

    return result;
}

std::optional<ParameterConflict> InputValidator::check_grid_resolution(
    const ProcessingConfig& processing) const {

    if (processing.grid_resolution > 0) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Grid resolution must be a positive number of cells";
    conflict.involved_params = {
        "--grid-resolution " + std::to_string(processing.grid_resolution)
    };
    conflict.suggestions = {
        "Use --grid-resolution 2000 (default)",
        "Use a smaller value such as --grid-resolution 500 for a quick preview"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_blur_radius(
    const ProcessingConfig& processing) const {

    if (std::isfinite(processing.blur_radius) && processing.blur_radius > 0.0 &&
        processing.blur_radius <= GaussianSmoother::MAX_SIGMA) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Blur radius must be greater than zero and at most " +
                           std::to_string(static_cast<long>(GaussianSmoother::MAX_SIGMA)) + " cells";
    conflict.involved_params = {
        "--blur-radius " + std::to_string(processing.blur_radius)
    };
    conflict.suggestions = {
        "Use --blur-radius 30 (default, in grid cells)"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_threshold_ratio(
    const ProcessingConfig& processing) const {

    const double ratio = processing.threshold_ratio;
    if (std::isfinite(ratio) && ratio >= 0.0 && ratio <= 1.0) {
        return std::nullopt;
    }

    std::ostringstream value;
    value << std::setprecision(6) << ratio;

    ParameterConflict conflict;
    conflict.description = "Threshold ratio must lie between 0 and 1";
    conflict.involved_params = {
        "--threshold-ratio " + value.str()
    };
    conflict.suggestions = {
        "Use --threshold-ratio 0.3 (default)",
        "Use --threshold-ratio 0 to keep every non-empty cell"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_inputs(const GeneratorConfig& config) const {
    if (!config.input_files.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "No input CSV files given";
    conflict.suggestions = {
        "Pass one or more CSV files as positional arguments",
        "List them under \"input_files\" in the --config file"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_output(const GeneratorConfig& config) const {
    if (!config.output_path.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Output path is empty";
    conflict.involved_params = {"--output \"\""};
    conflict.suggestions = {"Use --output heatmaps.kmz (default)"};
    return conflict;
}

void InputValidator::check_palette(const GeneratorConfig& config, ValidationResult& result) const {
    for (const auto& [category, code] : config.category_colors) {
        if (!try_parse_hex_color(code)) {
            result.warnings.push_back("Malformed color '" + code + "' for category " + category +
                                      ", layer will be drawn in black");
        }
    }
    if (!try_parse_hex_color(config.default_color)) {
        result.warnings.push_back("Malformed default color '" + config.default_color +
                                  "', unlisted categories will be drawn in black");
    }
}

std::optional<ParameterConflict> InputValidator::check_threads(const GeneratorConfig& config) const {
    if (config.num_threads >= 0) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Thread count cannot be negative";
    conflict.involved_params = {"--threads " + std::to_string(config.num_threads)};
    conflict.suggestions = {
        "Use --threads 0 to use every available core",
        "Use --no-parallel to process one category at a time"
    };
    return conflict;
}

} // namespace dkmz
