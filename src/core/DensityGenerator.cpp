/**
 * @file DensityGenerator.cpp
 * @brief Batch orchestration of the per-category density pipeline
 */

#include "density_generator.hpp"
#include "AdaptiveThreshold.hpp"
#include "BoundsCalculator.hpp"
#include "CancellationToken.hpp"
#include "DensityGrid.hpp"
#include "GaussianSmoother.hpp"
#include "InputValidator.hpp"
#include "Logger.hpp"
#include "../export/ArchiveAssembler.hpp"
#include "../export/PixelEncoder.hpp"
#include "../export/PngEncoder.hpp"
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <numeric>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace dkmz {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds elapsed_ms(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

// Preview file names: unique per category and never leaving the layer directory
std::unordered_map<std::string, std::string> preview_filenames(const std::vector<std::string>& categories) {
    std::vector<EncodedLayer> stubs;
    stubs.reserve(categories.size());
    for (const auto& category : categories) {
        std::string safe = category;
        std::replace(safe.begin(), safe.end(), '/', '_');
        std::replace(safe.begin(), safe.end(), '\\', '_');
        stubs.push_back(EncodedLayer{safe, {}, GeoBounds()});
    }

    // Same order and suffixing as the archive entries
    std::vector<size_t> order(stubs.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&categories](size_t a, size_t b) {
        return categories[a] < categories[b];
    });

    std::vector<EncodedLayer> ordered;
    ordered.reserve(stubs.size());
    for (size_t index : order) {
        ordered.push_back(stubs[index]);
    }
    std::vector<std::string> names = ArchiveAssembler::assign_filenames(ordered);

    std::unordered_map<std::string, std::string> by_category;
    for (size_t i = 0; i < order.size(); ++i) {
        by_category[categories[order[i]]] = names[i];
    }
    return by_category;
}

} // namespace

// ============================================================================
// DensityGenerator::Impl - Private implementation
// ============================================================================

class DensityGenerator::Impl {
public:
    explicit Impl(const GeneratorConfig& config)
        : config_(config),
          logger_("DensityGenerator") {
        // Registers the GDAL drivers once, before any worker starts
        png_encoder_ = std::make_unique<PngEncoder>();
    }

    void set_layer_encoder(LayerEncoder encoder) {
        layer_encoder_ = std::move(encoder);
    }

    std::vector<EncodedLayer> generate_layers(const std::vector<GeoPoint>& points,
                                              const CancellationToken* cancel) {
        const auto start_time = Clock::now();
        metrics_ = {};

        InputValidator validator;
        auto validation = validator.validate_processing(config_.processing);
        if (validation.has_errors()) {
            throw ConfigError(validation.format_error_message());
        }

        if (points.empty()) {
            throw EmptyInputError("no points in batch");
        }

        // Stage 1: one extent shared by every layer
        const auto bounds_start = Clock::now();
        BoundsCalculator bounds_calculator;
        bounds_ = bounds_calculator.compute(points);
        metrics_.bounds_time = elapsed_ms(bounds_start);
        metrics_.points_processed = points.size();

        std::ostringstream bounds_msg;
        bounds_msg << std::fixed << std::setprecision(4)
                   << "Calculated global bounds: N" << bounds_.north
                   << " S" << bounds_.south
                   << " E" << bounds_.east
                   << " W" << bounds_.west;
        logger_.info(bounds_msg.str());

        // Stage 2: split by category, first appearance order
        std::vector<std::string> categories;
        std::unordered_map<std::string, std::vector<GeoPoint>> groups;
        for (const auto& point : points) {
            auto [it, inserted] = groups.try_emplace(point.category);
            if (inserted) {
                categories.push_back(point.category);
            }
            it->second.push_back(point);
        }
        metrics_.categories_found = categories.size();
        logger_.info("Found " + std::to_string(categories.size()) + " categories in " +
                     std::to_string(points.size()) + " points");

        // Stage 3: independent pipelines, one per category
        GaussianSmoother smoother(config_.processing.blur_radius, config_.parallel_processing);
        std::vector<std::optional<EncodedLayer>> slots(categories.size());

        std::unordered_map<std::string, std::string> previews;
        if (config_.layer_directory.has_value()) {
            previews = preview_filenames(categories);
        }

        std::atomic<long long> rasterize_ms{0};
        std::atomic<long long> encode_ms{0};
        std::atomic<size_t> skipped{0};

        auto run_category = [&](size_t index) {
            if (cancel && cancel->is_cancelled()) {
                throw CancelledError("batch stopped before category " + categories[index]);
            }

            const std::string& category = categories[index];
            try {
                const auto preview = previews.find(category);
                slots[index] = process_category(category, groups.at(category), smoother,
                                                preview != previews.end() ? &preview->second : nullptr,
                                                rasterize_ms, encode_ms);
            } catch (const EncodingError& e) {
                if (config_.failure_policy == LayerFailurePolicy::ABORT) {
                    throw;
                }
                logger_.error("Skipping layer " + category + ": " + e.what());
                skipped.fetch_add(1);
            }
        };

        if (config_.parallel_processing && categories.size() > 1) {
            const int concurrency = config_.num_threads > 0 ? config_.num_threads
                                                            : tbb::task_arena::automatic;
            tbb::task_arena arena(concurrency);
            arena.execute([&] {
                tbb::parallel_for(tbb::blocked_range<size_t>(0, categories.size(), 1),
                    [&](const tbb::blocked_range<size_t>& range) {
                        for (size_t i = range.begin(); i != range.end(); ++i) {
                            run_category(i);
                        }
                    });
            });
        } else {
            for (size_t i = 0; i < categories.size(); ++i) {
                run_category(i);
            }
        }

        std::vector<EncodedLayer> layers;
        layers.reserve(slots.size());
        for (auto& slot : slots) {
            if (slot.has_value()) {
                layers.push_back(std::move(*slot));
            }
        }

        metrics_.rasterize_time = std::chrono::milliseconds(rasterize_ms.load());
        metrics_.encode_time = std::chrono::milliseconds(encode_ms.load());
        metrics_.layers_generated = layers.size();
        metrics_.layers_skipped = skipped.load();
        metrics_.total_time = elapsed_ms(start_time);

        logger_.detailed("Generated " + std::to_string(layers.size()) + " layers in " +
                         std::to_string(metrics_.total_time.count()) + "ms");
        return layers;
    }

    RgbColor resolve_color(const std::string& category) const {
        auto it = config_.category_colors.find(category);
        const std::string& code = it != config_.category_colors.end() ? it->second
                                                                      : config_.default_color;

        auto color = try_parse_hex_color(code);
        if (!color) {
            logger_.warning("Malformed color '" + code + "' for category " + category +
                            ", using black");
            return RgbColor{};
        }
        return *color;
    }

    const GeneratorConfig& config() const { return config_; }
    const GeoBounds& bounds() const { return bounds_; }
    const PerformanceMetrics& metrics() const { return metrics_; }

private:
    GeneratorConfig config_;
    Logger logger_;
    GeoBounds bounds_;
    PerformanceMetrics metrics_;
    std::unique_ptr<PngEncoder> png_encoder_;
    LayerEncoder layer_encoder_;

    EncodedLayer process_category(const std::string& category,
                                  const std::vector<GeoPoint>& points,
                                  const GaussianSmoother& smoother,
                                  const std::string* preview_name,
                                  std::atomic<long long>& rasterize_ms,
                                  std::atomic<long long>& encode_ms) const {
        logger_.info("Processing layer: " + category + " (" + std::to_string(points.size()) +
                     " points)...");

        const auto raster_start = Clock::now();
        const int resolution = config_.processing.grid_resolution;

        DensityGrid grid(resolution);
        const size_t landed = grid.accumulate(points, bounds_);
        if (landed < points.size()) {
            logger_.debug(category + ": " + std::to_string(points.size() - landed) +
                          " points fell outside the grid");
        }

        DensityGrid smoothed = smoother.apply(grid);
        ThresholdResult threshold = threshold::compute(smoothed, config_.processing.threshold_ratio);
        if (threshold.is_empty()) {
            logger_.warning("Layer " + category + " has no density, emitting a transparent raster");
        }
        logger_.debug(category + ": max density " + std::to_string(threshold.max_density) +
                      ", cutoff " + std::to_string(threshold.cutoff));

        PixelEncoder pixel_encoder(resolve_color(category));
        RasterLayer raster = pixel_encoder.encode_layer(category, smoothed, threshold, bounds_);
        rasterize_ms.fetch_add(elapsed_ms(raster_start).count());

        const auto encode_start = Clock::now();
        std::vector<uint8_t> bytes = layer_encoder_ ? layer_encoder_(raster)
                                                    : png_encoder_->encode(raster);
        EncodedLayer layer{category, std::move(bytes), bounds_};

        if (config_.layer_directory.has_value() && preview_name) {
            std::filesystem::path path = std::filesystem::path(*config_.layer_directory) / *preview_name;
            if (!png_encoder_->write_file(raster, path.string())) {
                logger_.warning("Could not write preview raster " + path.string());
            }
        }
        encode_ms.fetch_add(elapsed_ms(encode_start).count());

        logger_.detailed(category + ": encoded " + std::to_string(layer.png.size()) + " bytes");
        return layer;
    }
};

// ============================================================================
// DensityGenerator - Public interface
// ============================================================================

DensityGenerator::DensityGenerator(const GeneratorConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

DensityGenerator::~DensityGenerator() = default;

std::vector<EncodedLayer> DensityGenerator::generate_layers(const std::vector<GeoPoint>& points,
                                                            const CancellationToken* cancel) {
    return impl_->generate_layers(points, cancel);
}

const GeoBounds& DensityGenerator::get_bounds() const {
    return impl_->bounds();
}

const PerformanceMetrics& DensityGenerator::get_metrics() const {
    return impl_->metrics();
}

const GeneratorConfig& DensityGenerator::get_config() const {
    return impl_->config();
}

RgbColor DensityGenerator::resolve_color(const std::string& category) const {
    return impl_->resolve_color(category);
}

void DensityGenerator::set_layer_encoder(LayerEncoder encoder) {
    impl_->set_layer_encoder(std::move(encoder));
}

} // namespace dkmz
