/**
 * @file AdaptiveThreshold.cpp
 * @brief Implementation of adaptive thresholding
 */

#include "AdaptiveThreshold.hpp"
#include <algorithm>
#include <cmath>

namespace dkmz {
namespace threshold {

float percentile(std::vector<float>& values, double fraction) {
    if (values.empty()) {
        return 0.0f;
    }

    fraction = std::clamp(fraction, 0.0, 1.0);
    const size_t n = static_cast<size_t>(std::floor(static_cast<double>(values.size() - 1) * fraction));

    // Only the n-th element needs to be in its sorted position
    std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(n), values.end());
    return values[n];
}

ThresholdResult compute(const DensityGrid& grid, double threshold_ratio) {
    ThresholdResult result;

    std::vector<float> positive;
    for (float value : grid.cells()) {
        if (value > 0.0f) {
            positive.push_back(value);
        }
    }
    result.positive_cells = positive.size();

    if (positive.empty()) {
        return result;
    }

    const double ratio = std::isfinite(threshold_ratio) ? std::clamp(threshold_ratio, 0.0, 1.0) : 0.0;

    result.max_density = percentile(positive, SATURATION_PERCENTILE);
    result.cutoff = static_cast<float>(result.max_density * ratio);
    result.cutoff = std::min(result.cutoff, result.max_density);
    return result;
}

} // namespace threshold
} // namespace dkmz
