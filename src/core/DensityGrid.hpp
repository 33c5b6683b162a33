/**
 * @file DensityGrid.hpp
 * @brief Square 2D histogram of point counts over a bounding box
 */

#pragma once

#include "density_generator.hpp"
#include <cstddef>
#include <vector>

namespace dkmz {

/**
 * @brief R x R grid of density values, row-major, row 0 = geographic south
 *
 * Owned by exactly one category pipeline; each smoothing stage produces a
 * new grid rather than mutating the one it reads.
 */
class DensityGrid {
public:
    /// Guards the affine mapping against zero-span bounds
    static constexpr double SPAN_EPSILON = 1e-9;

    explicit DensityGrid(int resolution);

    int resolution() const { return resolution_; }
    size_t size() const { return cells_.size(); }

    float at(int x, int y) const { return cells_[index(x, y)]; }
    float& at(int x, int y) { return cells_[index(x, y)]; }

    const std::vector<float>& cells() const { return cells_; }
    std::vector<float>& cells() { return cells_; }

    /**
     * @brief Sum of all cells (accumulated in double)
     */
    double total() const;

    /**
     * @brief Largest cell value, 0 for an empty grid
     */
    float max_value() const;

    /**
     * @brief Map a coordinate to grid indices
     * @return false if either index falls outside [0, R)
     *
     * Rounds half toward positive infinity. Points landing on index R are
     * reported out of range, not clamped.
     */
    bool map_to_cell(double latitude, double longitude, const GeoBounds& bounds,
                     int& xi, int& yi) const;

    /**
     * @brief Increment the cell of every in-range point by 1.0
     * @return Number of points that landed inside the grid
     */
    size_t accumulate(const std::vector<GeoPoint>& points, const GeoBounds& bounds);

    /**
     * @brief Build a histogram for one category's points
     */
    static DensityGrid from_points(const std::vector<GeoPoint>& points,
                                   const GeoBounds& bounds,
                                   int resolution);

private:
    int resolution_;
    std::vector<float> cells_;

    size_t index(int x, int y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(resolution_) + static_cast<size_t>(x);
    }
};

} // namespace dkmz
