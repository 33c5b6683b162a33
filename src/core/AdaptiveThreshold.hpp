/**
 * @file AdaptiveThreshold.hpp
 * @brief Percentile-based saturation level and background cutoff
 */

#pragma once

#include "DensityGrid.hpp"
#include <vector>

namespace dkmz {

/**
 * @brief Saturation reference and background cutoff of a smoothed grid
 *
 * Invariant: 0 <= cutoff <= max_density.
 */
struct ThresholdResult {
    float cutoff = 0.0f;
    float max_density = 0.0f;
    size_t positive_cells = 0;

    bool is_empty() const { return max_density <= 0.0f; }
};

namespace threshold {

/// Percentile used as the saturation reference
constexpr double SATURATION_PERCENTILE = 0.995;

/**
 * @brief Value at index floor((n-1) * fraction) of the ascending order
 * @param values Sample values (reordered in place)
 * @param fraction Percentile in [0, 1]
 * @return 0 for an empty sample
 */
float percentile(std::vector<float>& values, double fraction);

/**
 * @brief Compute cutoff and saturation density for a smoothed grid
 * @param grid Smoothed density grid
 * @param threshold_ratio Fraction of max_density below which cells are background
 */
ThresholdResult compute(const DensityGrid& grid, double threshold_ratio);

} // namespace threshold

} // namespace dkmz
