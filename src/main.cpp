/**
 * @file main.cpp
 * @brief Main entry point for the density-kmz heatmap generator
 *
 * Reads categorized GPS samples from CSV files and writes one KMZ archive
 * holding a density overlay per category.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "density_generator.hpp"
#include "cli/CommandLineInterface.hpp"
#include "core/CancellationToken.hpp"
#include "core/InputValidator.hpp"
#include "core/Logger.hpp"
#include "export/ArchiveAssembler.hpp"
#include "io/CsvPointReader.hpp"
#include "version.h"
#include <iostream>
#include <chrono>
#include <csignal>
#include <memory>

using namespace dkmz;

namespace {

// Token of the running batch, tripped by Ctrl-C
CancellationToken* g_active_token = nullptr;

void interrupt_handler(int) {
    if (g_active_token) {
        g_active_token->cancel();
    }
}

} // namespace

/**
 * @brief Print performance summary
 */
void print_performance_summary(const PerformanceMetrics& metrics) {
    std::cout << "\n=== Performance Summary ===\n";
    std::cout << "Bounds: " << metrics.bounds_time.count() << "ms\n";
    std::cout << "Rasterize (all layers): " << metrics.rasterize_time.count() << "ms\n";
    std::cout << "PNG encoding (all layers): " << metrics.encode_time.count() << "ms\n";
    std::cout << "Archive: " << metrics.archive_time.count() << "ms\n";
    std::cout << "Total time: " << metrics.total_time.count() << "ms\n";
    std::cout << "Points processed: " << metrics.points_processed << "\n";
    std::cout << "Categories found: " << metrics.categories_found << "\n";
    std::cout << "Layers generated: " << metrics.layers_generated << "\n";
    if (metrics.layers_skipped > 0) {
        std::cout << "Layers skipped: " << metrics.layers_skipped << "\n";
    }
    std::cout << "============================\n";
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    auto start_time = std::chrono::steady_clock::now();

    try {
        CommandLineInterface cli;
        if (!cli.parse_arguments(argc, argv)) {
            return cli.exit_code();  // Help, version, create-config or bad arguments
        }

        const GeneratorConfig& config = cli.get_config();
        Logger::setGlobalLogFile(config.log_file);
        Logger logger("main");

        if (config.log_level >= 3) {
            std::cout << "density-kmz v" << DKMZ_VERSION_STRING << "\n";
            std::cout << "Per-category GPS density heatmaps packaged as KMZ\n";
        }
        cli.print_config();

        InputValidator validator;
        auto validation = validator.validate(config);
        for (const auto& warning : validation.warnings) {
            logger.warning(warning);
        }
        if (validation.has_errors()) {
            std::cerr << validation.format_error_message();
            return 1;
        }

        if (cli.is_dry_run()) {
            logger.info("Dry run mode - configuration validated successfully");
            return 0;
        }

        CsvPointReader reader(config.latitude_column, config.longitude_column, config.category_column);
        std::vector<GeoPoint> points = reader.read_files(config.input_files);
        logger.info("Total points: " + std::to_string(points.size()));

        std::unique_ptr<CancellationToken> token;
        if (config.timeout_seconds.has_value()) {
            token = std::make_unique<CancellationToken>(std::chrono::milliseconds(
                static_cast<long long>(*config.timeout_seconds * 1000.0)));
        } else {
            token = std::make_unique<CancellationToken>();
        }
        g_active_token = token.get();
        std::signal(SIGINT, interrupt_handler);

        DensityGenerator generator(config);
        std::vector<EncodedLayer> layers;
        try {
            layers = generator.generate_layers(points, token.get());
        } catch (...) {
            std::signal(SIGINT, SIG_DFL);
            g_active_token = nullptr;
            throw;
        }
        std::signal(SIGINT, SIG_DFL);
        g_active_token = nullptr;

        logger.info("Generating KMZ...");
        auto archive_start = std::chrono::steady_clock::now();
        ArchiveAssembler assembler(config.folder_name);
        if (!assembler.write_file(layers, config.output_path)) {
            std::cerr << "Error: Could not write " << config.output_path << "\n";
            return 1;
        }

        PerformanceMetrics metrics = generator.get_metrics();
        metrics.archive_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - archive_start);
        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        metrics.total_time = total_duration;

        if (config.log_level >= 4) {
            print_performance_summary(metrics);
        }

        logger.info("Done. Wrote " + std::to_string(layers.size()) + " layers to " +
                    config.output_path + " in " + std::to_string(total_duration.count()) + "ms");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
