/**
 * @file DensityGrid.cpp
 * @brief Implementation of point histogram accumulation
 */

#include "DensityGrid.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace dkmz {

DensityGrid::DensityGrid(int resolution)
    : resolution_(resolution) {
    if (resolution <= 0) {
        throw std::invalid_argument("grid resolution must be positive, got " +
                                    std::to_string(resolution));
    }
    cells_.assign(static_cast<size_t>(resolution) * static_cast<size_t>(resolution), 0.0f);
}

double DensityGrid::total() const {
    return std::accumulate(cells_.begin(), cells_.end(), 0.0);
}

float DensityGrid::max_value() const {
    if (cells_.empty()) return 0.0f;
    return *std::max_element(cells_.begin(), cells_.end());
}

bool DensityGrid::map_to_cell(double latitude, double longitude, const GeoBounds& bounds,
                              int& xi, int& yi) const {
    const double x_scale = (resolution_ - 1) / (bounds.east - bounds.west + SPAN_EPSILON);
    const double y_scale = (resolution_ - 1) / (bounds.north - bounds.south + SPAN_EPSILON);

    // floor(v + 0.5): half-way values round up, also for negative offsets
    const double fx = std::floor((longitude - bounds.west) * x_scale + 0.5);
    const double fy = std::floor((latitude - bounds.south) * y_scale + 0.5);

    if (!(fx >= 0.0 && fx < resolution_ && fy >= 0.0 && fy < resolution_)) {
        return false;
    }

    xi = static_cast<int>(fx);
    yi = static_cast<int>(fy);
    return true;
}

size_t DensityGrid::accumulate(const std::vector<GeoPoint>& points, const GeoBounds& bounds) {
    size_t accepted = 0;
    int xi = 0;
    int yi = 0;

    for (const auto& point : points) {
        if (map_to_cell(point.latitude, point.longitude, bounds, xi, yi)) {
            at(xi, yi) += 1.0f;
            ++accepted;
        }
    }

    return accepted;
}

DensityGrid DensityGrid::from_points(const std::vector<GeoPoint>& points,
                                     const GeoBounds& bounds,
                                     int resolution) {
    DensityGrid grid(resolution);
    grid.accumulate(points, bounds);
    return grid;
}

} // namespace dkmz
