/**
 * @file GaussianSmoother.hpp
 * @brief Separable Gaussian blur with edge replication
 */

#pragma once

#include "DensityGrid.hpp"
#include <vector>

namespace dkmz {

/**
 * @brief Applies a 2D Gaussian blur as a horizontal then a vertical 1D pass
 *
 * The kernel depends only on sigma and is built once in the constructor, so
 * a single smoother can be shared read-only by every category of a batch.
 * Samples outside the grid are clamped to the nearest edge cell.
 */
class GaussianSmoother {
public:
    /// Largest accepted sigma; keeps the kernel half-width well inside int
    static constexpr double MAX_SIGMA = 100000.0;

    /**
     * @param sigma Standard deviation in grid cells (finite, in (0, MAX_SIGMA])
     * @param parallel Split the rows of each pass across TBB workers
     * @throws std::invalid_argument for a sigma outside that range
     */
    explicit GaussianSmoother(double sigma, bool parallel = true);

    /**
     * @brief Build a normalized kernel of length 2*ceil(3*sigma)+1
     */
    static std::vector<float> build_kernel(double sigma);

    double sigma() const { return sigma_; }
    const std::vector<float>& kernel() const { return kernel_; }
    int half_width() const { return static_cast<int>(kernel_.size() / 2); }

    /**
     * @brief Smooth a grid; the input is left untouched
     */
    DensityGrid apply(const DensityGrid& input) const;

    DensityGrid convolve_horizontal(const DensityGrid& input) const;
    DensityGrid convolve_vertical(const DensityGrid& input) const;

private:
    double sigma_;
    bool parallel_;
    std::vector<float> kernel_;

    template<typename RowFn>
    void for_each_row(int rows, RowFn&& fn) const;
};

} // namespace dkmz
