/**
 * @file test_cli.cpp
 * @brief Tests for argument parsing, config files, validation and log levels
 */

#include "cli/CommandLineInterface.hpp"
#include "core/InputValidator.hpp"
#include "core/Logger.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace dkmz;

namespace {

// Keeps argument strings alive for the duration of a parse
class Argv {
public:
    Argv(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "density-kmz");
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

} // namespace

class CommandLineTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("DKMZ_LOG_LEVEL");
        unsetenv("DKMZ_LOG_FILE");
        dir_ = std::filesystem::temp_directory_path() /
               ("dkmz_cli_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
        unsetenv("DKMZ_LOG_LEVEL");
        Logger::clearFacilityLevels();
        Logger::setDefaultLevel(LogLevel::INFO);
    }

    bool parse(CommandLineInterface& cli, Argv args) {
        return cli.parse_arguments(args.argc(), args.argv());
    }

    std::string write_file(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream(path) << content;
        return path.string();
    }

    std::filesystem::path dir_;
};

TEST_F(CommandLineTest, DefaultsWithOnlyInputs) {
    CommandLineInterface cli;
    ASSERT_TRUE(parse(cli, {"a.csv", "b.csv"}));

    const auto& config = cli.get_config();
    EXPECT_EQ(config.input_files, (std::vector<std::string>{"a.csv", "b.csv"}));
    EXPECT_EQ(config.processing.grid_resolution, 2000);
    EXPECT_DOUBLE_EQ(config.processing.blur_radius, 30.0);
    EXPECT_DOUBLE_EQ(config.processing.threshold_ratio, 0.3);
    EXPECT_EQ(config.output_path, "heatmaps.kmz");
    EXPECT_EQ(config.folder_name, "Operators Density Heatmaps");
    EXPECT_TRUE(config.parallel_processing);
    EXPECT_EQ(config.failure_policy, LayerFailurePolicy::ABORT);
    EXPECT_FALSE(config.timeout_seconds.has_value());
    EXPECT_FALSE(cli.is_dry_run());
}

TEST_F(CommandLineTest, ParsesProcessingAndOutputOptions) {
    CommandLineInterface cli;
    ASSERT_TRUE(parse(cli, {"-r", "500", "--blur-radius=12.5", "-t", "0.1",
                            "-o", "out.kmz", "--folder-name", "Lima",
                            "--no-parallel", "--skip-failed-layers", "--timeout", "2.5",
                            "--layer-dir", "layers", "--dry-run", "input.csv"}));

    const auto& config = cli.get_config();
    EXPECT_EQ(config.processing.grid_resolution, 500);
    EXPECT_DOUBLE_EQ(config.processing.blur_radius, 12.5);
    EXPECT_DOUBLE_EQ(config.processing.threshold_ratio, 0.1);
    EXPECT_EQ(config.output_path, "out.kmz");
    EXPECT_EQ(config.folder_name, "Lima");
    EXPECT_FALSE(config.parallel_processing);
    EXPECT_EQ(config.failure_policy, LayerFailurePolicy::SKIP);
    ASSERT_TRUE(config.timeout_seconds.has_value());
    EXPECT_DOUBLE_EQ(*config.timeout_seconds, 2.5);
    EXPECT_EQ(config.layer_directory, std::optional<std::string>("layers"));
    EXPECT_TRUE(cli.is_dry_run());
    EXPECT_EQ(config.input_files, std::vector<std::string>{"input.csv"});
}

TEST_F(CommandLineTest, ColorOptionExtendsPalette) {
    CommandLineInterface cli;
    ASSERT_TRUE(parse(cli, {"--color", "entel=#112233, wom = 445566", "x.csv"}));

    const auto& colors = cli.get_config().category_colors;
    EXPECT_EQ(colors.at("ENTEL"), "#112233");
    EXPECT_EQ(colors.at("WOM"), "445566");
    EXPECT_EQ(colors.at("CLARO"), "#D40000");
}

TEST_F(CommandLineTest, MalformedNumbersThrow) {
    CommandLineInterface cli;
    EXPECT_THROW(parse(cli, {"-r", "12abc", "x.csv"}), ConfigError);

    CommandLineInterface negative_timeout;
    EXPECT_THROW(parse(negative_timeout, {"--timeout", "-1", "x.csv"}), ConfigError);
}

TEST_F(CommandLineTest, MissingValueFailsWithExitCodeOne) {
    CommandLineInterface cli;
    EXPECT_FALSE(parse(cli, {"x.csv", "--output"}));
    EXPECT_EQ(cli.exit_code(), 1);
}

TEST_F(CommandLineTest, VersionAndHelpExitCleanly) {
    CommandLineInterface version;
    EXPECT_FALSE(parse(version, {"--version"}));
    EXPECT_EQ(version.exit_code(), 0);

    CommandLineInterface help;
    EXPECT_FALSE(parse(help, {"--help"}));
    EXPECT_EQ(help.exit_code(), 0);
}

TEST_F(CommandLineTest, ParseColorList) {
    auto colors = CommandLineInterface::parse_color_list(" Bitel=#FFD500,,movistar=00A65A ");
    ASSERT_EQ(colors.size(), 2u);
    EXPECT_EQ(colors.at("BITEL"), "#FFD500");
    EXPECT_EQ(colors.at("MOVISTAR"), "00A65A");

    EXPECT_THROW(CommandLineInterface::parse_color_list("ENTEL"), ConfigError);
    EXPECT_THROW(CommandLineInterface::parse_color_list("=#FFFFFF"), ConfigError);
}

TEST_F(CommandLineTest, DefaultConfigFileRoundTrips) {
    auto path = (dir_ / "config.json").string();

    CommandLineInterface creator;
    EXPECT_FALSE(parse(creator, {"--create-config", path}));
    EXPECT_EQ(creator.exit_code(), 0);
    ASSERT_TRUE(std::filesystem::exists(path));

    CommandLineInterface loader;
    loader.load_config_file(path);
    const auto& config = loader.get_config();
    GeneratorConfig defaults;
    EXPECT_EQ(config.processing.grid_resolution, defaults.processing.grid_resolution);
    EXPECT_DOUBLE_EQ(config.processing.blur_radius, defaults.processing.blur_radius);
    EXPECT_EQ(config.category_colors, defaults.category_colors);
    EXPECT_EQ(config.output_path, defaults.output_path);
    EXPECT_FALSE(config.layer_directory.has_value());
    EXPECT_FALSE(config.timeout_seconds.has_value());
}

TEST_F(CommandLineTest, CommandLineOverridesConfigFile) {
    auto path = write_file("run.json", R"({
        "input_files": ["from_config.csv"],
        "grid_resolution": 800,
        "blur_radius": 10,
        "colors": {"entel": "#000001"},
        "output": "config.kmz",
        "skip_failed_layers": true
    })");

    CommandLineInterface cli;
    ASSERT_TRUE(parse(cli, {"--config", path, "-r", "300"}));

    const auto& config = cli.get_config();
    EXPECT_EQ(config.processing.grid_resolution, 300);
    EXPECT_DOUBLE_EQ(config.processing.blur_radius, 10.0);
    EXPECT_EQ(config.output_path, "config.kmz");
    EXPECT_EQ(config.input_files, std::vector<std::string>{"from_config.csv"});
    EXPECT_EQ(config.failure_policy, LayerFailurePolicy::SKIP);

    // A palette in the file replaces the built-in one
    ASSERT_EQ(config.category_colors.size(), 1u);
    EXPECT_EQ(config.category_colors.at("ENTEL"), "#000001");
}

TEST_F(CommandLineTest, BadConfigFilesThrow) {
    CommandLineInterface cli;
    EXPECT_THROW(cli.load_config_file((dir_ / "missing.json").string()), ConfigError);
    EXPECT_THROW(cli.load_config_file(write_file("broken.json", "{ \"grid_resolution\": ")), ConfigError);
    EXPECT_THROW(cli.load_config_file(write_file("array.json", "[1, 2]")), ConfigError);
    EXPECT_THROW(cli.load_config_file(write_file("typed.json", R"({"grid_resolution": "big"})")), ConfigError);
}

TEST_F(CommandLineTest, LogLevelOptions) {
    CommandLineInterface cli;
    ASSERT_TRUE(parse(cli, {"--log-level", "4,PngEncoder=6", "x.csv"}));
    EXPECT_EQ(cli.get_config().log_level, 4);
    EXPECT_EQ(Logger::getFacilityLevel("PngEncoder"), LogLevel::TRACE);
    EXPECT_EQ(Logger::getFacilityLevel("CsvPointReader"), LogLevel::DETAILED);

    CommandLineInterface silent;
    ASSERT_TRUE(parse(silent, {"--silent", "x.csv"}));
    EXPECT_EQ(silent.get_config().log_level, 1);
}

TEST_F(CommandLineTest, EnvironmentLogLevelYieldsToCommandLine) {
    setenv("DKMZ_LOG_LEVEL", "5", 1);

    CommandLineInterface from_env;
    ASSERT_TRUE(parse(from_env, {"x.csv"}));
    EXPECT_EQ(from_env.get_config().log_level, 5);

    CommandLineInterface from_cli;
    ASSERT_TRUE(parse(from_cli, {"--log-level", "2", "x.csv"}));
    EXPECT_EQ(from_cli.get_config().log_level, 2);
}

TEST(LoggerTest, ParseLogConfigClampsAndSkipsGarbage) {
    Logger::parseLogConfig("2, Archive=9, Broken=x");
    EXPECT_EQ(Logger::getFacilityLevel("Unlisted"), LogLevel::WARNING);
    EXPECT_EQ(Logger::getFacilityLevel("Archive"), LogLevel::TRACE);
    EXPECT_EQ(Logger::getFacilityLevel("Broken"), LogLevel::WARNING);

    Logger::clearFacilityLevels();
    Logger::setDefaultLevel(LogLevel::INFO);
    EXPECT_EQ(Logger::getFacilityLevel("Archive"), LogLevel::INFO);
}

TEST(InputValidatorTest, AcceptsDefaultsWithInputs) {
    GeneratorConfig config;
    config.input_files = {"a.csv"};

    auto result = InputValidator().validate(config);
    EXPECT_FALSE(result.has_errors());
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(result.format_error_message(), "");
}

TEST(InputValidatorTest, ReportsEveryProblemAtOnce) {
    GeneratorConfig config;
    config.processing.grid_resolution = 0;
    config.processing.blur_radius = -1.0;
    config.processing.threshold_ratio = 1.5;
    config.num_threads = -2;

    auto result = InputValidator().validate(config);
    EXPECT_TRUE(result.has_errors());
    EXPECT_EQ(result.conflicts.size(), 5u);  // three parameters, no inputs, threads

    std::string message = result.format_error_message();
    EXPECT_NE(message.find("ERROR: Invalid parameters detected"), std::string::npos);
    EXPECT_NE(message.find("--grid-resolution 0"), std::string::npos);
    EXPECT_NE(message.find("Threshold ratio must lie between 0 and 1"), std::string::npos);
    EXPECT_NE(message.find("Program terminated due to invalid inputs."), std::string::npos);
}

TEST(InputValidatorTest, RejectsOversizedBlurRadius) {
    ProcessingConfig processing;
    processing.blur_radius = 1e10;

    auto result = InputValidator().validate_processing(processing);
    ASSERT_TRUE(result.has_errors());
    EXPECT_NE(result.format_error_message().find("--blur-radius"), std::string::npos);

    processing.blur_radius = 500.0;
    EXPECT_FALSE(InputValidator().validate_processing(processing).has_errors());
}

TEST(InputValidatorTest, RatioBoundsAreInclusive) {
    ProcessingConfig processing;
    processing.threshold_ratio = 0.0;
    EXPECT_FALSE(InputValidator().validate_processing(processing).has_errors());
    processing.threshold_ratio = 1.0;
    EXPECT_FALSE(InputValidator().validate_processing(processing).has_errors());
}

TEST(InputValidatorTest, MalformedColorsAreOnlyWarnings) {
    GeneratorConfig config;
    config.input_files = {"a.csv"};
    config.category_colors["WOM"] = "#12345";
    config.default_color = "grey";

    auto result = InputValidator().validate(config);
    EXPECT_FALSE(result.has_errors());
    EXPECT_EQ(result.warnings.size(), 2u);
}
