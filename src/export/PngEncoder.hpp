/**
 * @file PngEncoder.hpp
 * @brief PNG codec for RGBA layers, backed by GDAL
 *
 * Pixels are loaded into an in-memory MEM dataset and copied through the
 * GDAL PNG driver, either into /vsimem/ (to obtain the bytes for the
 * archive) or onto disk together with a world file.
 */

#pragma once

#include "density_generator.hpp"
#include <gdal_priv.h>
#include <string>
#include <vector>

namespace dkmz {

class PngEncoder {
public:
    PngEncoder();

    /**
     * @brief Encode a layer to PNG bytes
     * @param layer RGBA layer (width * height * 4 bytes)
     * @return Compressed PNG bytes
     * @throws EncodingError if GDAL refuses to produce the image
     */
    std::vector<uint8_t> encode(const RasterLayer& layer) const;

    /**
     * @brief Encode a raw RGBA buffer to PNG bytes
     * @throws EncodingError on size mismatch or codec failure
     */
    std::vector<uint8_t> encode(int width, int height, const std::vector<uint8_t>& rgba) const;

    /**
     * @brief Write a layer as a PNG file with a .wld world file
     * @param layer RGBA layer with its geographic extent
     * @param filename Output PNG path
     * @return true if export succeeded
     */
    bool write_file(const RasterLayer& layer, const std::string& filename) const;

    /**
     * @brief Geotransform mapping pixel corners onto the layer extent
     */
    static std::array<double, 6> geotransform_for(const RasterLayer& layer);

private:
    /**
     * @brief Create a 4-band MEM dataset holding the RGBA buffer
     * @return Dataset (caller must GDALClose()) or nullptr on failure
     */
    GDALDataset* create_rgba_dataset(int width, int height,
                                     const std::vector<uint8_t>& rgba) const;

    /**
     * @brief Copy a dataset through the PNG driver
     */
    bool write_png_with_copy(GDALDataset* source, const std::string& filename,
                             bool world_file) const;
};

} // namespace dkmz
