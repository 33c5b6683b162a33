/**
 * @file BoundsCalculator.cpp
 * @brief Implementation of padded bounds computation
 */

#include "BoundsCalculator.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <limits>

namespace dkmz {

GeoBounds BoundsCalculator::compute_raw(const std::vector<GeoPoint>& points) const {
    if (points.empty()) {
        throw EmptyInputError("cannot compute bounds of an empty point set");
    }

    double xmin = std::numeric_limits<double>::infinity();
    double xmax = -std::numeric_limits<double>::infinity();
    double ymin = std::numeric_limits<double>::infinity();
    double ymax = -std::numeric_limits<double>::infinity();

    for (const auto& point : points) {
        xmin = std::min(xmin, point.longitude);
        xmax = std::max(xmax, point.longitude);
        ymin = std::min(ymin, point.latitude);
        ymax = std::max(ymax, point.latitude);
    }

    return GeoBounds(ymax, ymin, xmax, xmin);
}

GeoBounds BoundsCalculator::compute(const std::vector<GeoPoint>& points) const {
    Logger logger("BoundsCalculator");

    GeoBounds raw = compute_raw(points);
    double dx = raw.width();
    double dy = raw.height();

    if (dx == 0.0 || dy == 0.0) {
        logger.warning("Degenerate bounds: all points share a " +
                       std::string(dx == 0.0 && dy == 0.0 ? "single location" :
                                   (dx == 0.0 ? "longitude" : "latitude")));
    }

    GeoBounds padded(raw.north + dy * PADDING_FRACTION,
                     raw.south - dy * PADDING_FRACTION,
                     raw.east + dx * PADDING_FRACTION,
                     raw.west - dx * PADDING_FRACTION);

    logger.debug("Bounds over " + std::to_string(points.size()) + " points: N" +
                 std::to_string(padded.north) + " S" + std::to_string(padded.south) +
                 " E" + std::to_string(padded.east) + " W" + std::to_string(padded.west));
    return padded;
}

} // namespace dkmz
