/**
 * @file GaussianSmoother.cpp
 * @brief Implementation of the separable Gaussian convolution
 */

#include "GaussianSmoother.hpp"
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace dkmz {

GaussianSmoother::GaussianSmoother(double sigma, bool parallel)
    : sigma_(sigma), parallel_(parallel), kernel_(build_kernel(sigma)) {
}

std::vector<float> GaussianSmoother::build_kernel(double sigma) {
    if (!std::isfinite(sigma) || sigma <= 0.0) {
        throw std::invalid_argument("blur radius must be a positive number, got " +
                                    std::to_string(sigma));
    }
    if (sigma > MAX_SIGMA) {
        throw std::invalid_argument("blur radius " + std::to_string(sigma) +
                                    " exceeds the maximum of " + std::to_string(MAX_SIGMA));
    }

    const int half = static_cast<int>(std::ceil(sigma * 3.0));
    const int size = 2 * half + 1;
    std::vector<double> weights(size);

    double sum = 0.0;
    for (int i = 0; i < size; ++i) {
        const double k = static_cast<double>(i - half);
        weights[i] = std::exp(-(k * k) / (2.0 * sigma * sigma));
        sum += weights[i];
    }

    std::vector<float> kernel(size);
    for (int i = 0; i < size; ++i) {
        kernel[i] = static_cast<float>(weights[i] / sum);
    }
    return kernel;
}

template<typename RowFn>
void GaussianSmoother::for_each_row(int rows, RowFn&& fn) const {
    if (!parallel_) {
        for (int y = 0; y < rows; ++y) fn(y);
        return;
    }

    tbb::parallel_for(tbb::blocked_range<int>(0, rows),
        [&fn](const tbb::blocked_range<int>& range) {
            for (int y = range.begin(); y != range.end(); ++y) fn(y);
        });
}

DensityGrid GaussianSmoother::convolve_horizontal(const DensityGrid& input) const {
    const int n = input.resolution();
    const int half = half_width();
    const int k_size = static_cast<int>(kernel_.size());
    const std::vector<float>& src = input.cells();

    DensityGrid output(n);
    std::vector<float>& dst = output.cells();

    for_each_row(n, [&](int y) {
        const size_t row = static_cast<size_t>(y) * n;
        for (int x = 0; x < n; ++x) {
            double sum = 0.0;
            for (int k = 0; k < k_size; ++k) {
                const int px = std::clamp(x + k - half, 0, n - 1);
                sum += static_cast<double>(src[row + px]) * kernel_[k];
            }
            dst[row + x] = static_cast<float>(sum);
        }
    });

    return output;
}

DensityGrid GaussianSmoother::convolve_vertical(const DensityGrid& input) const {
    const int n = input.resolution();
    const int half = half_width();
    const int k_size = static_cast<int>(kernel_.size());
    const std::vector<float>& src = input.cells();

    DensityGrid output(n);
    std::vector<float>& dst = output.cells();

    // Accumulate whole source rows so the inner loop stays contiguous
    for_each_row(n, [&](int y) {
        std::vector<double> acc(n, 0.0);
        for (int k = 0; k < k_size; ++k) {
            const int py = std::clamp(y + k - half, 0, n - 1);
            const size_t src_row = static_cast<size_t>(py) * n;
            const double w = kernel_[k];
            for (int x = 0; x < n; ++x) {
                acc[x] += static_cast<double>(src[src_row + x]) * w;
            }
        }
        const size_t dst_row = static_cast<size_t>(y) * n;
        for (int x = 0; x < n; ++x) {
            dst[dst_row + x] = static_cast<float>(acc[x]);
        }
    });

    return output;
}

DensityGrid GaussianSmoother::apply(const DensityGrid& input) const {
    DensityGrid pass_h = convolve_horizontal(input);
    return convolve_vertical(pass_h);
}

} // namespace dkmz
