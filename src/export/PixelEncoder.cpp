/**
 * @file PixelEncoder.cpp
 * @brief Implementation of density to RGBA encoding
 */

#include "PixelEncoder.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace dkmz {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

uint8_t floor_to_byte(double value) {
    return static_cast<uint8_t>(std::clamp(std::floor(value), 0.0, 255.0));
}

} // namespace

std::optional<RgbColor> try_parse_hex_color(const std::string& hex_color) {
    std::string color = hex_color;
    if (!color.empty() && color[0] == '#') {
        color = color.substr(1);
    }

    if (color.length() != 6) {
        return std::nullopt;
    }

    std::array<uint8_t, 3> channels{};
    for (size_t i = 0; i < 3; ++i) {
        int hi = hex_digit(color[2 * i]);
        int lo = hex_digit(color[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        channels[i] = static_cast<uint8_t>(hi * 16 + lo);
    }

    return RgbColor{channels[0], channels[1], channels[2]};
}

RgbColor parse_hex_color(const std::string& hex_color) {
    return try_parse_hex_color(hex_color).value_or(RgbColor{0, 0, 0});
}

std::string format_hex_color(const RgbColor& color) {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "#%02X%02X%02X", color.r, color.g, color.b);
    return buffer;
}

PixelEncoder::PixelEncoder(const RgbColor& base_color)
    : base_color_(base_color) {
}

double PixelEncoder::normalize(float value, const ThresholdResult& threshold) {
    const double range = static_cast<double>(threshold.max_density) - threshold.cutoff;
    if (!(range > 0.0)) {
        return 0.0;
    }
    const double norm = (static_cast<double>(value) - threshold.cutoff) / range;
    return std::clamp(norm, 0.0, 1.0);
}

PixelValue PixelEncoder::encode_value(float value, const ThresholdResult& threshold) const {
    PixelValue pixel;

    // Background: nothing to show, or below the cutoff
    if (threshold.is_empty() || !(value >= threshold.cutoff)) {
        return pixel;
    }

    const double norm = normalize(value, threshold);
    const double glow = norm * MAX_GLOW;

    pixel.r = floor_to_byte(base_color_.r + (255.0 - base_color_.r) * glow);
    pixel.g = floor_to_byte(base_color_.g + (255.0 - base_color_.g) * glow);
    pixel.b = floor_to_byte(base_color_.b + (255.0 - base_color_.b) * glow);
    pixel.a = floor_to_byte(MIN_ALPHA + (255.0 - MIN_ALPHA) * norm);
    return pixel;
}

std::vector<uint8_t> PixelEncoder::encode(const DensityGrid& grid,
                                          const ThresholdResult& threshold) const {
    const int n = grid.resolution();
    std::vector<uint8_t> pixels(static_cast<size_t>(n) * n * 4, 0);

    for (int y = 0; y < n; ++y) {
        // Grid row 0 is the southern edge; image row 0 is the northern edge
        const size_t target_row = static_cast<size_t>(n - 1 - y) * n;
        for (int x = 0; x < n; ++x) {
            const PixelValue pixel = encode_value(grid.at(x, y), threshold);
            const size_t idx = (target_row + x) * 4;
            pixels[idx] = pixel.r;
            pixels[idx + 1] = pixel.g;
            pixels[idx + 2] = pixel.b;
            pixels[idx + 3] = pixel.a;
        }
    }

    return pixels;
}

RasterLayer PixelEncoder::encode_layer(const std::string& category,
                                       const DensityGrid& grid,
                                       const ThresholdResult& threshold,
                                       const GeoBounds& extent) const {
    RasterLayer layer;
    layer.category = category;
    layer.width = grid.resolution();
    layer.height = grid.resolution();
    layer.pixels = encode(grid, threshold);
    layer.extent = extent;
    return layer;
}

} // namespace dkmz
