/**
 * @file BoundsCalculator.hpp
 * @brief Padded geographic bounding box of a point batch
 */

#pragma once

#include "density_generator.hpp"
#include <vector>

namespace dkmz {

/**
 * @brief Computes the shared extent used by every layer of a batch
 *
 * The raw min/max box is grown on each side by a fixed fraction of its span.
 * A batch with a single distinct location yields a zero-area box.
 */
class BoundsCalculator {
public:
    static constexpr double PADDING_FRACTION = 0.02;

    BoundsCalculator() = default;

    /**
     * @brief Compute padded bounds
     * @param points Validated points (all categories)
     * @return Bounds with north >= south and east >= west
     * @throws EmptyInputError if points is empty
     */
    GeoBounds compute(const std::vector<GeoPoint>& points) const;

    /**
     * @brief Tight min/max box without padding
     * @throws EmptyInputError if points is empty
     */
    GeoBounds compute_raw(const std::vector<GeoPoint>& points) const;
};

} // namespace dkmz
