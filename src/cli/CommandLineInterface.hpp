/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the density heatmap generator
 */

#pragma once

#include "density_generator.hpp"
#include "SimpleCommandLineParser.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace dkmz {

/**
 * @brief Parses arguments and an optional JSON file into a GeneratorConfig
 *
 * Priority, lowest first: built-in defaults, config file, environment
 * (DKMZ_LOG_LEVEL, DKMZ_LOG_FILE), command line.
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @return true if the program should go on and process the inputs
     * @throws ConfigError for unreadable config files or malformed values
     */
    bool parse_arguments(int argc, char* argv[]);

    const GeneratorConfig& get_config() const { return config_; }

    bool is_dry_run() const { return dry_run_; }

    /**
     * @brief Process exit code when parse_arguments() returned false
     */
    int exit_code() const { return exit_code_; }

    /**
     * @brief Print the current configuration (DETAILED level and above)
     */
    void print_config() const;

    /**
     * @brief Parse "CAT=HEX,CAT=HEX" into a palette; labels are normalized
     * @throws ConfigError on an entry without '=' or with an empty label
     */
    static std::map<std::string, std::string> parse_color_list(const std::string& list);

    /**
     * @brief Serialize the settings a config file can hold
     */
    static nlohmann::ordered_json to_json(const GeneratorConfig& config);

    /**
     * @brief Apply the keys present in a parsed config file
     * @throws ConfigError on a key with the wrong type
     */
    static void apply_json(const nlohmann::json& document, GeneratorConfig& config);

    /**
     * @brief Write a config file holding every default value
     */
    static bool create_default_config_file(const std::string& filename);

    /**
     * @brief Load a JSON config file into the current configuration
     * @throws ConfigError if the file is missing or not valid JSON
     */
    void load_config_file(const std::string& filename);

private:
    GeneratorConfig config_;
    bool dry_run_ = false;
    int exit_code_ = 0;

    void parse_all_options(const SimpleCommandLineParser& parser);
    void parse_logging_options(const SimpleCommandLineParser& parser);

    template<typename T>
    T require_value(const SimpleCommandLineParser& parser, const std::string& name) const;
};

} // namespace dkmz
