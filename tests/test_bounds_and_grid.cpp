/**
 * @file test_bounds_and_grid.cpp
 * @brief Tests for bounds padding and histogram accumulation
 */

#include "density_generator.hpp"
#include "core/BoundsCalculator.hpp"
#include "core/DensityGrid.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <random>

using namespace dkmz;

namespace {

std::vector<GeoPoint> random_points(size_t count, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> lat(-12.2, -11.9);
    std::uniform_real_distribution<double> lon(-77.1, -76.8);

    std::vector<GeoPoint> points;
    for (size_t i = 0; i < count; ++i) {
        points.emplace_back(lat(rng), lon(rng), "ENTEL");
    }
    return points;
}

} // namespace

TEST(BoundsCalculatorTest, PadsEachSideByTwoPercentOfSpan) {
    std::vector<GeoPoint> points = {{0.0, 0.0, "A"}, {10.0, 20.0, "B"}};

    GeoBounds bounds = BoundsCalculator().compute(points);

    EXPECT_NEAR(bounds.north, 10.2, 1e-12);
    EXPECT_NEAR(bounds.south, -0.2, 1e-12);
    EXPECT_NEAR(bounds.east, 20.4, 1e-12);
    EXPECT_NEAR(bounds.west, -0.4, 1e-12);
}

TEST(BoundsCalculatorTest, ContainsEveryInputPoint) {
    auto points = random_points(500, 7);
    GeoBounds bounds = BoundsCalculator().compute(points);

    EXPECT_GE(bounds.north, bounds.south);
    EXPECT_GE(bounds.east, bounds.west);
    for (const auto& point : points) {
        EXPECT_TRUE(bounds.contains(point.latitude, point.longitude));
    }
}

TEST(BoundsCalculatorTest, RawBoundsAreTight) {
    std::vector<GeoPoint> points = {{1.0, 2.0, "A"}, {3.0, -4.0, "A"}, {-5.0, 6.0, "A"}};
    GeoBounds raw = BoundsCalculator().compute_raw(points);

    EXPECT_DOUBLE_EQ(raw.north, 3.0);
    EXPECT_DOUBLE_EQ(raw.south, -5.0);
    EXPECT_DOUBLE_EQ(raw.east, 6.0);
    EXPECT_DOUBLE_EQ(raw.west, -4.0);
}

TEST(BoundsCalculatorTest, SingleLocationGivesZeroArea) {
    std::vector<GeoPoint> points = {{-12.05, -77.04, "CLARO"}, {-12.05, -77.04, "CLARO"}};
    GeoBounds bounds = BoundsCalculator().compute(points);

    EXPECT_DOUBLE_EQ(bounds.north, -12.05);
    EXPECT_DOUBLE_EQ(bounds.south, -12.05);
    EXPECT_DOUBLE_EQ(bounds.east, -77.04);
    EXPECT_DOUBLE_EQ(bounds.west, -77.04);
}

TEST(BoundsCalculatorTest, EmptyInputThrows) {
    std::vector<GeoPoint> points;
    EXPECT_THROW(BoundsCalculator().compute(points), EmptyInputError);
}

TEST(DensityGridTest, RejectsNonPositiveResolution) {
    EXPECT_THROW(DensityGrid(0), std::invalid_argument);
    EXPECT_THROW(DensityGrid(-3), std::invalid_argument);
}

TEST(DensityGridTest, MassEqualsNumberOfPointsInside) {
    auto points = random_points(1000, 42);
    GeoBounds bounds = BoundsCalculator().compute(points);

    DensityGrid grid(50);
    size_t accepted = grid.accumulate(points, bounds);

    EXPECT_EQ(accepted, points.size());
    EXPECT_DOUBLE_EQ(grid.total(), static_cast<double>(points.size()));
}

TEST(DensityGridTest, CornersMapToFirstAndLastCells) {
    GeoBounds bounds(1.0, 0.0, 1.0, 0.0);
    DensityGrid grid(10);
    int xi = -1;
    int yi = -1;

    ASSERT_TRUE(grid.map_to_cell(0.0, 0.0, bounds, xi, yi));
    EXPECT_EQ(xi, 0);
    EXPECT_EQ(yi, 0);

    ASSERT_TRUE(grid.map_to_cell(1.0, 1.0, bounds, xi, yi));
    EXPECT_EQ(xi, 9);
    EXPECT_EQ(yi, 9);
}

TEST(DensityGridTest, RowZeroIsSouth) {
    GeoBounds bounds(1.0, 0.0, 1.0, 0.0);
    DensityGrid grid(10);
    int xi = -1;
    int yi = -1;

    ASSERT_TRUE(grid.map_to_cell(0.0, 0.5, bounds, xi, yi));
    EXPECT_EQ(yi, 0);
    ASSERT_TRUE(grid.map_to_cell(1.0, 0.5, bounds, xi, yi));
    EXPECT_EQ(yi, 9);
}

TEST(DensityGridTest, PointsBeyondLastIndexAreDroppedNotClamped) {
    GeoBounds bounds(1.0, 0.0, 1.0, 0.0);
    DensityGrid grid(10);

    // Scaled offset of 10.0 rounds to index R
    std::vector<GeoPoint> points = {{0.5, 1.0 + 1.0 / 9.0, "A"}};
    EXPECT_EQ(grid.accumulate(points, bounds), 0u);
    EXPECT_DOUBLE_EQ(grid.total(), 0.0);
}

TEST(DensityGridTest, NegativeOffsetsRoundHalfUp) {
    GeoBounds bounds(1.0, 0.0, 1.0, 0.0);
    DensityGrid grid(10);
    int xi = -1;
    int yi = -1;

    // -0.36 cells rounds to 0, -0.54 cells rounds to -1 (dropped)
    EXPECT_TRUE(grid.map_to_cell(0.5, -0.04, bounds, xi, yi));
    EXPECT_EQ(xi, 0);
    EXPECT_FALSE(grid.map_to_cell(0.5, -0.06, bounds, xi, yi));
}

TEST(DensityGridTest, DegenerateBoundsStayFinite) {
    GeoBounds bounds(5.0, 5.0, 5.0, 5.0);
    std::vector<GeoPoint> points(3, GeoPoint(5.0, 5.0, "A"));

    DensityGrid grid = DensityGrid::from_points(points, bounds, 8);

    EXPECT_FLOAT_EQ(grid.at(0, 0), 3.0f);
    EXPECT_DOUBLE_EQ(grid.total(), 3.0);
    for (float value : grid.cells()) {
        EXPECT_TRUE(std::isfinite(value));
    }
}

TEST(DensityGridTest, NonFiniteCoordinatesAreDropped) {
    GeoBounds bounds(1.0, 0.0, 1.0, 0.0);
    DensityGrid grid(4);
    std::vector<GeoPoint> points = {
        {std::numeric_limits<double>::quiet_NaN(), 0.5, "A"},
        {0.5, std::numeric_limits<double>::infinity(), "A"},
        {0.5, 0.5, "A"}
    };

    EXPECT_EQ(grid.accumulate(points, bounds), 1u);
}

TEST(DensityGridTest, RepeatedPointsStack) {
    GeoBounds bounds(1.0, 0.0, 1.0, 0.0);
    std::vector<GeoPoint> points(4, GeoPoint(0.5, 0.5, "A"));

    DensityGrid grid = DensityGrid::from_points(points, bounds, 3);

    EXPECT_FLOAT_EQ(grid.at(1, 1), 4.0f);
    EXPECT_FLOAT_EQ(grid.max_value(), 4.0f);
}
