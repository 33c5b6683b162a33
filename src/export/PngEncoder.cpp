/**
 * @file PngEncoder.cpp
 * @brief Implementation of GDAL-backed PNG encoding
 */

#include "PngEncoder.hpp"
#include "../core/Logger.hpp"
#include <cpl_conv.h>
#include <cpl_error.h>
#include <cpl_string.h>
#include <cpl_vsi.h>
#include <atomic>
#include <filesystem>

namespace dkmz {

namespace {

std::string next_vsimem_path(const char* stem) {
    static std::atomic<unsigned long> counter{0};
    return "/vsimem/dkmz_" + std::string(stem) + "_" + std::to_string(counter.fetch_add(1)) + ".png";
}

} // namespace

PngEncoder::PngEncoder() {
    GDALAllRegister();
}

std::array<double, 6> PngEncoder::geotransform_for(const RasterLayer& layer) {
    const double pixel_width = layer.width > 0 ? layer.extent.width() / layer.width : 0.0;
    const double pixel_height = layer.height > 0 ? layer.extent.height() / layer.height : 0.0;

    return {
        layer.extent.west,   // Top-left X
        pixel_width,         // Pixel width (degrees)
        0.0,                 // Rotation
        layer.extent.north,  // Top-left Y
        0.0,                 // Rotation
        -pixel_height        // Pixel height (negative for north-up)
    };
}

GDALDataset* PngEncoder::create_rgba_dataset(int width, int height,
                                             const std::vector<uint8_t>& rgba) const {
    Logger logger("PngEncoder");

    GDALDriver* mem_driver = GetGDALDriverManager()->GetDriverByName("MEM");
    if (!mem_driver) {
        logger.error("MEM driver not available");
        return nullptr;
    }

    GDALDataset* dataset = mem_driver->Create("", width, height, 4, GDT_Byte, nullptr);
    if (!dataset) {
        logger.error("Failed to create MEM dataset");
        return nullptr;
    }

    // Pixel-interleaved RGBA source buffer
    int band_map[4] = {1, 2, 3, 4};
    CPLErr err = dataset->RasterIO(GF_Write, 0, 0, width, height,
                                   const_cast<uint8_t*>(rgba.data()), width, height,
                                   GDT_Byte, 4, band_map,
                                   4, static_cast<GSpacing>(width) * 4, 1, nullptr);
    if (err != CE_None) {
        logger.error("Failed to write RGBA pixels into MEM dataset");
        GDALClose(dataset);
        return nullptr;
    }

    const GDALColorInterp interp[4] = {GCI_RedBand, GCI_GreenBand, GCI_BlueBand, GCI_AlphaBand};
    for (int band = 1; band <= 4; ++band) {
        dataset->GetRasterBand(band)->SetColorInterpretation(interp[band - 1]);
    }

    return dataset;
}

bool PngEncoder::write_png_with_copy(GDALDataset* source, const std::string& filename,
                                     bool world_file) const {
    Logger logger("PngEncoder");

    GDALDriver* png_driver = GetGDALDriverManager()->GetDriverByName("PNG");
    if (!png_driver) {
        logger.error("PNG driver not available");
        return false;
    }

    // No .aux.xml side files; thread-local so concurrent layers do not race
    CPLSetThreadLocalConfigOption("GDAL_PAM_ENABLED", "NO");

    char** options = nullptr;
    if (world_file) {
        options = CSLSetNameValue(options, "WORLDFILE", "YES");
    }

    GDALDataset* png_dataset = png_driver->CreateCopy(
        filename.c_str(),
        source,
        FALSE,      // Not strict
        options,
        nullptr,    // Progress function
        nullptr     // Progress data
    );

    CSLDestroy(options);
    CPLSetThreadLocalConfigOption("GDAL_PAM_ENABLED", nullptr);

    if (!png_dataset) {
        logger.error("Failed to create PNG: " + filename + " (" + CPLGetLastErrorMsg() + ")");
        return false;
    }

    GDALClose(png_dataset);
    return true;
}

std::vector<uint8_t> PngEncoder::encode(int width, int height,
                                        const std::vector<uint8_t>& rgba) const {
    Logger logger("PngEncoder");

    if (width <= 0 || height <= 0) {
        throw EncodingError("invalid raster size " + std::to_string(width) + "x" +
                            std::to_string(height));
    }
    if (rgba.size() != static_cast<size_t>(width) * height * 4) {
        throw EncodingError("RGBA buffer holds " + std::to_string(rgba.size()) +
                            " bytes, expected " +
                            std::to_string(static_cast<size_t>(width) * height * 4));
    }

    GDALDataset* dataset = create_rgba_dataset(width, height, rgba);
    if (!dataset) {
        throw EncodingError("could not build in-memory raster");
    }

    const std::string vsi_path = next_vsimem_path("layer");
    bool success = write_png_with_copy(dataset, vsi_path, false);
    GDALClose(dataset);

    if (!success) {
        VSIUnlink(vsi_path.c_str());
        throw EncodingError("PNG driver produced no output");
    }

    vsi_l_offset length = 0;
    GByte* buffer = VSIGetMemFileBuffer(vsi_path.c_str(), &length, TRUE);
    if (!buffer) {
        throw EncodingError("PNG output missing from " + vsi_path);
    }

    std::vector<uint8_t> bytes(buffer, buffer + length);
    CPLFree(buffer);

    logger.trace("Encoded PNG " + std::to_string(width) + "x" + std::to_string(height) +
                 ": " + std::to_string(bytes.size()) + " bytes");
    return bytes;
}

std::vector<uint8_t> PngEncoder::encode(const RasterLayer& layer) const {
    try {
        return encode(layer.width, layer.height, layer.pixels);
    } catch (const EncodingError& e) {
        throw EncodingError("layer '" + layer.category + "': " + e.what());
    }
}

bool PngEncoder::write_file(const RasterLayer& layer, const std::string& filename) const {
    Logger logger("PngEncoder");

    if (layer.pixels.size() != static_cast<size_t>(layer.width) * layer.height * 4 ||
        layer.width <= 0 || layer.height <= 0) {
        logger.error("Invalid raster for layer '" + layer.category + "'");
        return false;
    }

    std::filesystem::path path(filename);
    if (path.has_parent_path()) {
        try {
            std::filesystem::create_directories(path.parent_path());
        } catch (const std::filesystem::filesystem_error& e) {
            logger.error("Cannot create directory for " + filename + ": " + e.what());
            return false;
        }
    }

    GDALDataset* dataset = create_rgba_dataset(layer.width, layer.height, layer.pixels);
    if (!dataset) {
        return false;
    }

    std::array<double, 6> geotransform = geotransform_for(layer);
    dataset->SetGeoTransform(geotransform.data());

    bool success = write_png_with_copy(dataset, filename, true);
    GDALClose(dataset);

    if (success) {
        logger.info("Exported PNG: " + filename + " (" + std::to_string(layer.width) + "x" +
                    std::to_string(layer.height) + ")");
    }
    return success;
}

} // namespace dkmz
