#pragma once

/**
 * @file density_generator.hpp
 * @brief Main header for the density-kmz heatmap generator
 *
 * Turns categorized GPS samples into smoothed density rasters, one per
 * category, georeferenced to a shared bounding box and packaged as a KMZ
 * archive for map viewers.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace dkmz {

class CancellationToken;

// ============================================================================
// Error types
// ============================================================================

/**
 * @brief A batch (or a single input file) contained no usable points
 */
class EmptyInputError : public std::runtime_error {
public:
    explicit EmptyInputError(const std::string& message)
        : std::runtime_error("Empty input: " + message) {}
};

/**
 * @brief The PNG codec or the archive writer did not produce bytes
 */
class EncodingError : public std::runtime_error {
public:
    explicit EncodingError(const std::string& message)
        : std::runtime_error("Encoding failed: " + message) {}
};

/**
 * @brief The batch was cancelled or ran past its deadline
 */
class CancelledError : public std::runtime_error {
public:
    explicit CancelledError(const std::string& message)
        : std::runtime_error("Cancelled: " + message) {}
};

/**
 * @brief Invalid configuration file or configuration values
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

// ============================================================================
// Geographic types
// ============================================================================

/**
 * @brief Validated sample: WGS84 degrees plus a normalized category label
 */
struct GeoPoint {
    double latitude = 0.0;
    double longitude = 0.0;
    std::string category;

    GeoPoint() = default;
    GeoPoint(double lat, double lon, std::string cat)
        : latitude(lat), longitude(lon), category(std::move(cat)) {}
};

/**
 * @brief Geographic extent in degrees (north >= south, east >= west)
 *
 * Zero-extent boxes are legal and produce degenerate output downstream.
 */
struct GeoBounds {
    double north = 0.0;
    double south = 0.0;
    double east = 0.0;
    double west = 0.0;

    GeoBounds() = default;
    GeoBounds(double n, double s, double e, double w)
        : north(n), south(s), east(e), west(w) {}

    double width() const { return east - west; }
    double height() const { return north - south; }

    bool contains(double lat, double lon) const {
        return lat >= south && lat <= north && lon >= west && lon <= east;
    }
};

/**
 * @brief 8-bit RGB color
 */
struct RgbColor {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const RgbColor& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
};

// ============================================================================
// Raster layers
// ============================================================================

/**
 * @brief Raw RGBA raster for one category, rows ordered north to south
 */
struct RasterLayer {
    std::string category;
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;  ///< width * height * 4 bytes, RGBA
    GeoBounds extent;
};

/**
 * @brief PNG-encoded raster for one category, ready for the archive
 */
struct EncodedLayer {
    std::string category;
    std::vector<uint8_t> png;
    GeoBounds extent;
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Numeric parameters of the density pipeline
 */
struct ProcessingConfig {
    int grid_resolution = 2000;     ///< Grid side length in cells (R x R)
    double blur_radius = 30.0;      ///< Gaussian sigma in grid cells
    double threshold_ratio = 0.3;   ///< Fraction of the saturation density treated as background
};

/**
 * @brief What to do when a single layer fails to encode
 */
enum class LayerFailurePolicy {
    ABORT,  ///< Rethrow and abort the batch (default)
    SKIP    ///< Log the failure and leave the layer out of the archive
};

/**
 * @brief Full configuration for a generation run
 */
struct GeneratorConfig {
    ProcessingConfig processing;

    // Category palette (hex RGB, optional leading '#')
    std::map<std::string, std::string> category_colors = {
        {"ENTEL", "#0057A4"},
        {"MOVISTAR", "#00A65A"},
        {"CLARO", "#D40000"},
        {"BITEL", "#FFD500"}
    };
    std::string default_color = "#808080";

    // Input decoding
    std::vector<std::string> input_files;
    std::string latitude_column = "gps_latitude";
    std::string longitude_column = "gps_longitude";
    std::string category_column = "carrier";

    // Output
    std::string output_path = "heatmaps.kmz";
    std::string folder_name = "Operators Density Heatmaps";
    std::optional<std::string> layer_directory;  ///< Also write PNG + world file per layer

    // Processing options
    bool parallel_processing = true;
    int num_threads = 0;  // auto-detect
    LayerFailurePolicy failure_policy = LayerFailurePolicy::ABORT;
    std::optional<double> timeout_seconds;

    // Config file support
    std::optional<std::string> config_file;

    // Logging options
    int log_level = 3;  // 1=ERROR, 2=WARNING, 3=INFO, 4=DETAILED, 5=DEBUG, 6=TRACE
    std::optional<std::string> log_file;
    std::string log_config;  ///< Facility-level string, e.g. "4,PngEncoder=6"
};

/**
 * @brief Timing and volume counters for one batch
 */
struct PerformanceMetrics {
    std::chrono::milliseconds bounds_time{0};
    std::chrono::milliseconds rasterize_time{0};
    std::chrono::milliseconds encode_time{0};
    std::chrono::milliseconds archive_time{0};
    std::chrono::milliseconds total_time{0};

    size_t points_processed = 0;
    size_t categories_found = 0;
    size_t layers_generated = 0;
    size_t layers_skipped = 0;
};

// ============================================================================
// Generator
// ============================================================================

/**
 * @brief Runs the per-category density pipeline over one batch of points
 *
 * Bounds are computed once over the whole batch; every category is then
 * rasterized, smoothed, thresholded, colored and PNG-encoded independently.
 * The returned layers all carry the shared bounds as their extent.
 */
class DensityGenerator {
public:
    explicit DensityGenerator(const GeneratorConfig& config);
    ~DensityGenerator();

    DensityGenerator(const DensityGenerator&) = delete;
    DensityGenerator& operator=(const DensityGenerator&) = delete;

    /**
     * @brief Generate one encoded layer per category
     * @param points Validated points of the whole batch
     * @param cancel Optional token checked before each category
     * @return Encoded layers in first-appearance order of their category
     * @throws EmptyInputError if points is empty
     * @throws CancelledError if the token trips
     * @throws EncodingError if a layer fails and the policy is ABORT
     */
    std::vector<EncodedLayer> generate_layers(const std::vector<GeoPoint>& points,
                                              const CancellationToken* cancel = nullptr);

    /**
     * @brief Bounds computed by the last generate_layers() call
     */
    const GeoBounds& get_bounds() const;

    const PerformanceMetrics& get_metrics() const;
    const GeneratorConfig& get_config() const;

    /**
     * @brief Resolve the base color for a category from the palette
     *
     * Unknown categories use default_color; malformed codes log a warning
     * and resolve to black.
     */
    RgbColor resolve_color(const std::string& category) const;

    /// Turns a colored raster into the image bytes stored in the archive
    using LayerEncoder = std::function<std::vector<uint8_t>(const RasterLayer&)>;

    /**
     * @brief Replace the PNG codec used for archive layers
     *
     * The encoder may be called from several worker threads at once. It
     * reports failures by throwing EncodingError, which is then handled
     * according to the configured LayerFailurePolicy. An empty function
     * restores the built-in PNG codec.
     */
    void set_layer_encoder(LayerEncoder encoder);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dkmz
