/**
 * @file PixelEncoder.hpp
 * @brief Density to RGBA conversion for one category layer
 *
 * Produces the raw pixel buffer handed to the PNG codec. Cells below the
 * cutoff are fully transparent; denser cells ramp from the category color
 * at 30% opacity to a 60% white mix at full opacity.
 */

#pragma once

#include "density_generator.hpp"
#include "../core/AdaptiveThreshold.hpp"
#include "../core/DensityGrid.hpp"
#include <optional>
#include <string>
#include <vector>

namespace dkmz {

/**
 * @brief Parse a "RRGGBB" or "#RRGGBB" code (case-insensitive)
 * @return nullopt if the code is malformed
 */
std::optional<RgbColor> try_parse_hex_color(const std::string& hex_color);

/**
 * @brief Parse a hex color, falling back to black for malformed codes
 */
RgbColor parse_hex_color(const std::string& hex_color);

/**
 * @brief Format a color as "#RRGGBB"
 */
std::string format_hex_color(const RgbColor& color);

/**
 * @brief RGBA value of a single density sample
 */
struct PixelValue {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 0;
};

class PixelEncoder {
public:
    static constexpr double MIN_ALPHA = 77.0;   ///< 30% opacity at the cutoff
    static constexpr double MAX_GLOW = 0.6;     ///< White mix at saturation

    explicit PixelEncoder(const RgbColor& base_color);

    const RgbColor& base_color() const { return base_color_; }

    /**
     * @brief Normalized position of a value between cutoff and saturation
     * @return value in [0, 1]; 0 when cutoff == max_density
     */
    static double normalize(float value, const ThresholdResult& threshold);

    /**
     * @brief Encode one density value
     */
    PixelValue encode_value(float value, const ThresholdResult& threshold) const;

    /**
     * @brief Encode a whole grid to RGBA, rows ordered north to south
     * @return width * height * 4 bytes
     */
    std::vector<uint8_t> encode(const DensityGrid& grid, const ThresholdResult& threshold) const;

    /**
     * @brief Encode a grid into a RasterLayer tied to the given extent
     */
    RasterLayer encode_layer(const std::string& category,
                             const DensityGrid& grid,
                             const ThresholdResult& threshold,
                             const GeoBounds& extent) const;

private:
    RgbColor base_color_;
};

} // namespace dkmz
