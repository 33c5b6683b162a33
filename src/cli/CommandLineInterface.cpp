/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "SimpleCommandLineParser.hpp"
#include "../core/Logger.hpp"
#include "../io/CsvPointReader.hpp"
#include "version.h"
#include <algorithm>
#include <iostream>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <type_traits>

using json = nlohmann::json;

namespace dkmz {

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("density-kmz",
        "DENSITY KMZ - Per-category GPS density heatmaps for Google Earth\n"
        "\n"
        "Bins geolocated samples into a grid, smooths them with a Gaussian blur,\n"
        "keeps the dense areas and packages one colored overlay per category\n"
        "(e.g. per mobile carrier) into a single KMZ archive.");

    // Configuration file options
    parser.add_option("config", "c", "Path to JSON configuration file");
    parser.add_option("create-config", "", "Create default configuration file at path");

    // Processing options
    parser.add_option("grid-resolution", "r", "Grid side length in cells", false, "2000");
    parser.add_option("blur-radius", "b", "Gaussian sigma in grid cells", false, "30");
    parser.add_option("threshold-ratio", "t", "Fraction of peak density treated as background", false, "0.3");

    // Input options
    parser.add_option("lat-column", "", "Latitude column name", false, "gps_latitude");
    parser.add_option("lon-column", "", "Longitude column name", false, "gps_longitude");
    parser.add_option("category-column", "", "Category column name", false, "carrier");

    // Output options
    parser.add_option("output", "o", "Output KMZ path", false, "heatmaps.kmz");
    parser.add_option("folder-name", "", "Folder title shown in the map viewer", false, "Operators Density Heatmaps");
    parser.add_option("color", "", "Category colors as CAT=HEX[,CAT=HEX...], e.g. ENTEL=#0057A4");
    parser.add_option("default-color", "", "Color of categories missing from the palette", false, "#808080");
    parser.add_option("layer-dir", "", "Also write every layer as PNG + world file into this directory");

    // Execution options
    parser.add_option("threads", "j", "Worker threads for category processing, 0 = all cores", false, "0");
    parser.add_flag("no-parallel", "", "Process categories and grid rows sequentially");
    parser.add_flag("skip-failed-layers", "", "Leave out layers that fail to encode instead of aborting");
    parser.add_option("timeout", "", "Abandon the batch after this many seconds");

    // Logging and utility options
    parser.add_flag("silent", "s", "Only report errors");
    parser.add_flag("verbose", "v", "Enable verbose logging (same as --log-level 6)");
    parser.add_option("log-level", "", "1=ERROR, 2=WARNING, 3=INFO (default), 4=DETAILED, 5=DEBUG, 6=TRACE; "
                                       "per facility: \"3,PngEncoder=6\"");
    parser.add_option("log-file", "", "Log to file (append if exists)");
    parser.add_flag("dry-run", "", "Parse arguments and validate without processing");
    parser.add_flag("version", "", "Show version information");

    if (!parser.parse(argc, argv)) {
        exit_code_ = parser.help_shown() ? 0 : 1;
        return false;
    }

    if (parser.get_flag("version")) {
        std::cout << "density-kmz v" << DKMZ_VERSION_STRING << std::endl;
        std::cout << "Built with GDAL, oneTBB, nlohmann/json" << std::endl;
        std::cout << "Copyright (c) 2025 Matthew Block" << std::endl;
        exit_code_ = 0;
        return false;
    }

    if (auto config_path = parser.get("create-config")) {
        if (!create_default_config_file(config_path.value())) {
            std::cerr << "Failed to create configuration file: " << config_path.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
        std::cout << "Created default configuration file: " << config_path.value() << std::endl;
        exit_code_ = 0;
        return false;
    }

    if (auto config_file = parser.get("config")) {
        load_config_file(config_file.value());
        config_.config_file = config_file.value();
    }

    parse_all_options(parser);
    return true;
}

template<typename T>
T CommandLineInterface::require_value(const SimpleCommandLineParser& parser,
                                      const std::string& name) const {
    auto value = parser.get_as<T>(name);
    if (!value.has_value()) {
        throw ConfigError("invalid value for --" + name + ": '" + parser.get(name).value_or("") + "'");
    }
    return value.value();
}

void CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    // Only explicit arguments override the config file
    if (parser.was_given("grid-resolution")) {
        config_.processing.grid_resolution = require_value<int>(parser, "grid-resolution");
    }
    if (parser.was_given("blur-radius")) {
        config_.processing.blur_radius = require_value<double>(parser, "blur-radius");
    }
    if (parser.was_given("threshold-ratio")) {
        config_.processing.threshold_ratio = require_value<double>(parser, "threshold-ratio");
    }

    if (parser.was_given("lat-column")) config_.latitude_column = parser.get("lat-column").value();
    if (parser.was_given("lon-column")) config_.longitude_column = parser.get("lon-column").value();
    if (parser.was_given("category-column")) config_.category_column = parser.get("category-column").value();

    if (parser.was_given("output")) config_.output_path = parser.get("output").value();
    if (parser.was_given("folder-name")) config_.folder_name = parser.get("folder-name").value();
    if (parser.was_given("default-color")) config_.default_color = parser.get("default-color").value();
    if (auto value = parser.get("layer-dir")) config_.layer_directory = value.value();

    if (auto value = parser.get("color")) {
        for (const auto& [category, code] : parse_color_list(value.value())) {
            config_.category_colors[category] = code;
        }
    }

    if (parser.was_given("threads")) {
        config_.num_threads = require_value<int>(parser, "threads");
    }
    if (parser.get_flag("no-parallel")) {
        config_.parallel_processing = false;
    }
    if (parser.get_flag("skip-failed-layers")) {
        config_.failure_policy = LayerFailurePolicy::SKIP;
    }
    if (parser.get("timeout")) {
        double seconds = require_value<double>(parser, "timeout");
        if (!(seconds > 0.0)) {
            throw ConfigError("--timeout must be a positive number of seconds");
        }
        config_.timeout_seconds = seconds;
    }

    // Positional arguments replace the file list of a config file
    if (!parser.get_positional().empty()) {
        config_.input_files = parser.get_positional();
    }

    dry_run_ = parser.get_flag("dry-run");

    parse_logging_options(parser);
}

void CommandLineInterface::parse_logging_options(const SimpleCommandLineParser& parser) {
    // Config file level first, then CLI > ENV
    Logger::setDefaultLevel(static_cast<LogLevel>(config_.log_level));
    if (!config_.log_config.empty()) {
        Logger::parseLogConfig(config_.log_config);
    }

    auto apply_level_spec = [this](const std::string& spec) {
        Logger::parseLogConfig(spec);
        config_.log_config = spec;

        // The first bare number, if any, is the default level
        std::istringstream iss(spec);
        std::string token;
        while (std::getline(iss, token, ',')) {
            if (token.find('=') == std::string::npos) {
                try {
                    config_.log_level = std::clamp(std::stoi(token), 1, 6);
                } catch (const std::exception&) {
                    // parseLogConfig already reported it
                }
                break;
            }
        }
    };

    const char* env_log_level = std::getenv("DKMZ_LOG_LEVEL");
    if (env_log_level) {
        apply_level_spec(env_log_level);
    }
    if (auto value = parser.get("log-level")) {
        apply_level_spec(value.value());
    }

    if (parser.get_flag("silent")) {
        config_.log_level = 1;
        Logger::setDefaultLevel(LogLevel::ERROR);
    }
    if (parser.get_flag("verbose")) {
        config_.log_level = 6;
        Logger::setDefaultLevel(LogLevel::TRACE);
    }

    const char* env_log_file = std::getenv("DKMZ_LOG_FILE");
    if (env_log_file) {
        config_.log_file = std::string(env_log_file);
    }
    if (auto value = parser.get("log-file")) {
        config_.log_file = value.value();  // CLI overrides environment
    }
}

std::map<std::string, std::string> CommandLineInterface::parse_color_list(const std::string& list) {
    std::map<std::string, std::string> colors;
    std::istringstream iss(list);
    std::string entry;

    while (std::getline(iss, entry, ',')) {
        if (entry.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        size_t eq_pos = entry.find('=');
        if (eq_pos == std::string::npos) {
            throw ConfigError("color entry '" + entry + "' is not CATEGORY=HEX");
        }

        std::string category = CsvPointReader::normalize_category(entry.substr(0, eq_pos));
        std::string code = entry.substr(eq_pos + 1);
        code.erase(0, code.find_first_not_of(" \t"));
        code.erase(code.find_last_not_of(" \t") + 1);

        if (category.empty()) {
            throw ConfigError("color entry '" + entry + "' has no category");
        }
        colors[category] = code;
    }

    return colors;
}

nlohmann::ordered_json CommandLineInterface::to_json(const GeneratorConfig& config) {
    nlohmann::ordered_json document;

    document["input_files"] = config.input_files;
    document["latitude_column"] = config.latitude_column;
    document["longitude_column"] = config.longitude_column;
    document["category_column"] = config.category_column;

    document["grid_resolution"] = config.processing.grid_resolution;
    document["blur_radius"] = config.processing.blur_radius;
    document["threshold_ratio"] = config.processing.threshold_ratio;

    nlohmann::ordered_json colors = nlohmann::ordered_json::object();
    for (const auto& [category, code] : config.category_colors) {
        colors[category] = code;
    }
    document["colors"] = colors;
    document["default_color"] = config.default_color;

    document["output"] = config.output_path;
    document["folder_name"] = config.folder_name;
    document["layer_dir"] = config.layer_directory.has_value()
        ? nlohmann::ordered_json(*config.layer_directory) : nlohmann::ordered_json(nullptr);

    document["parallel_processing"] = config.parallel_processing;
    document["num_threads"] = config.num_threads;
    document["skip_failed_layers"] = config.failure_policy == LayerFailurePolicy::SKIP;
    document["timeout_seconds"] = config.timeout_seconds.has_value()
        ? nlohmann::ordered_json(*config.timeout_seconds) : nlohmann::ordered_json(nullptr);

    document["log_level"] = config.log_level;
    document["log_file"] = config.log_file.has_value()
        ? nlohmann::ordered_json(*config.log_file) : nlohmann::ordered_json(nullptr);

    return document;
}

void CommandLineInterface::apply_json(const json& document, GeneratorConfig& config) {
    if (!document.is_object()) {
        throw ConfigError("top level of the config file must be an object");
    }

    // Absent and null keys keep the current value
    auto read = [&document](const char* key, auto& target) {
        if (!document.contains(key) || document[key].is_null()) return;
        try {
            target = document[key].get<std::decay_t<decltype(target)>>();
        } catch (const json::exception& e) {
            throw ConfigError(std::string("key '") + key + "': " + e.what());
        }
    };

    read("input_files", config.input_files);
    read("latitude_column", config.latitude_column);
    read("longitude_column", config.longitude_column);
    read("category_column", config.category_column);

    read("grid_resolution", config.processing.grid_resolution);
    read("blur_radius", config.processing.blur_radius);
    read("threshold_ratio", config.processing.threshold_ratio);

    if (document.contains("colors") && !document["colors"].is_null()) {
        std::map<std::string, std::string> colors;
        read("colors", colors);
        config.category_colors.clear();
        for (const auto& [category, code] : colors) {
            config.category_colors[CsvPointReader::normalize_category(category)] = code;
        }
    }
    read("default_color", config.default_color);

    read("output", config.output_path);
    read("folder_name", config.folder_name);

    std::string layer_dir;
    read("layer_dir", layer_dir);
    if (!layer_dir.empty()) config.layer_directory = layer_dir;

    read("parallel_processing", config.parallel_processing);
    read("num_threads", config.num_threads);

    bool skip_failed = config.failure_policy == LayerFailurePolicy::SKIP;
    read("skip_failed_layers", skip_failed);
    config.failure_policy = skip_failed ? LayerFailurePolicy::SKIP : LayerFailurePolicy::ABORT;

    double timeout = 0.0;
    read("timeout_seconds", timeout);
    if (timeout > 0.0) config.timeout_seconds = timeout;

    read("log_level", config.log_level);
    config.log_level = std::clamp(config.log_level, 1, 6);

    std::string log_file;
    read("log_file", log_file);
    if (!log_file.empty()) config.log_file = log_file;
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) {
    try {
        std::ofstream file(filename);
        if (!file.is_open()) {
            return false;
        }
        file << to_json(GeneratorConfig{}).dump(2) << "\n";
        return static_cast<bool>(file);
    } catch (const std::exception&) {
        return false;
    }
}

void CommandLineInterface::load_config_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw ConfigError("could not open config file: " + filename);
    }

    json document;
    try {
        file >> document;
    } catch (const json::exception& e) {
        throw ConfigError("error parsing JSON config file " + filename + ": " + e.what());
    }

    apply_json(document, config_);
}

void CommandLineInterface::print_config() const {
    if (config_.log_level < 4) return;  // Only print at DETAILED level or higher

    std::cout << "\n=== Configuration ===\n";
    std::cout << "Inputs: ";
    for (size_t i = 0; i < config_.input_files.size(); ++i) {
        if (i > 0) std::cout << ", ";
        std::cout << config_.input_files[i];
    }
    std::cout << "\nColumns: " << config_.latitude_column << ", " << config_.longitude_column
              << ", " << config_.category_column << "\n";
    std::cout << "Grid resolution: " << config_.processing.grid_resolution << "\n";
    std::cout << "Blur radius: " << config_.processing.blur_radius << " cells\n";
    std::cout << "Threshold ratio: " << config_.processing.threshold_ratio << "\n";
    std::cout << "Palette:";
    for (const auto& [category, code] : config_.category_colors) {
        std::cout << " " << category << "=" << code;
    }
    std::cout << " (other: " << config_.default_color << ")\n";
    std::cout << "Output: " << config_.output_path << "\n";
    if (config_.layer_directory.has_value()) {
        std::cout << "Layer directory: " << *config_.layer_directory << "\n";
    }
    std::cout << "Parallel processing: " << (config_.parallel_processing ? "yes" : "no") << "\n";
    if (config_.parallel_processing && config_.num_threads > 0) {
        std::cout << "Threads: " << config_.num_threads << "\n";
    }
    std::cout << "Failed layers: "
              << (config_.failure_policy == LayerFailurePolicy::SKIP ? "skip" : "abort") << "\n";
    if (config_.timeout_seconds.has_value()) {
        std::cout << "Timeout: " << *config_.timeout_seconds << "s\n";
    }
    std::cout << "===================\n\n";
}

} // namespace dkmz
