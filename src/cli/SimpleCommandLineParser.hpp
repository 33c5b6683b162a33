/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser with no external dependency
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <sstream>
#include <iostream>

namespace dkmz {

/**
 * @brief Simple command-line argument parser
 *
 * Supports --name VALUE, --name=VALUE, short aliases, boolean flags and
 * positional arguments (the input files).
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool required;
        bool has_value;
        std::string default_value;

        // Default constructor for std::map
        Option() : required(false), has_value(true) {}

        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, bool required = false,
               bool has_value = true, const std::string& default_value = "")
            : long_name(long_name), short_name(short_name), description(description),
              required(required), has_value(has_value), default_value(default_value) {}
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    void add_option(const std::string& long_name, const std::string& short_name,
                   const std::string& description, bool required = false,
                   const std::string& default_value = "") {
        options_[long_name] = Option(long_name, short_name, description, required, true, default_value);
        order_.push_back(long_name);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        options_[long_name] = Option(long_name, short_name, description, false, false);
        order_.push_back(long_name);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    /**
     * @brief Parse arguments
     * @return false if help was shown or an argument was rejected
     */
    bool parse(int argc, char* argv[]) {
        args_.clear();
        parsed_values_.clear();
        explicit_.clear();
        positional_args_.clear();
        help_shown_ = false;

        for (int i = 1; i < argc; ++i) {
            args_.push_back(argv[i]);
        }

        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h") {
                show_help();
                help_shown_ = true;
                return false;
            }
        }

        for (size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                // Handle --option=value format
                size_t eq_pos = option_name.find('=');
                std::string value;
                bool inline_value = false;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                    inline_value = true;
                }

                if (options_.find(option_name) == options_.end()) {
                    std::cerr << "Unknown option: --" << option_name << std::endl;
                    return false;
                }

                const auto& option = options_[option_name];
                if (option.has_value) {
                    if (!inline_value) {
                        if (i + 1 >= args_.size() || args_[i + 1].starts_with("--")) {
                            std::cerr << "Option --" << option_name << " requires a value" << std::endl;
                            return false;
                        }
                        value = args_[++i];
                    }
                    parsed_values_[option_name] = value;
                } else {
                    parsed_values_[option_name] = "true";
                }
                explicit_[option_name] = true;

            } else if (arg.starts_with("-") && arg.size() > 1) {
                std::string short_name = arg.substr(1);

                if (short_to_long_.find(short_name) == short_to_long_.end()) {
                    std::cerr << "Unknown option: -" << short_name << std::endl;
                    return false;
                }

                std::string option_name = short_to_long_[short_name];
                const auto& option = options_[option_name];

                if (option.has_value) {
                    if (i + 1 >= args_.size() || args_[i + 1].starts_with("--")) {
                        std::cerr << "Option -" << short_name << " requires a value" << std::endl;
                        return false;
                    }
                    parsed_values_[option_name] = args_[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
                explicit_[option_name] = true;
            } else {
                positional_args_.push_back(arg);
            }
        }

        for (const auto& [name, option] : options_) {
            if (option.required && parsed_values_.find(name) == parsed_values_.end()) {
                std::cerr << "Required option --" << name << " not provided" << std::endl;
                return false;
            }
        }

        // Defaults never count as explicitly given
        for (const auto& [name, option] : options_) {
            if (parsed_values_.find(name) == parsed_values_.end() && !option.default_value.empty()) {
                parsed_values_[name] = option.default_value;
            }
        }

        return true;
    }

    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    /**
     * @brief True if the option appeared on the command line (not a default)
     */
    bool was_given(const std::string& option_name) const {
        return explicit_.find(option_name) != explicit_.end();
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }

        std::istringstream iss(value.value());
        T result;
        if (iss >> result && (iss >> std::ws).eof()) {
            return result;
        }
        return std::nullopt;
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    bool help_shown() const { return help_shown_; }

    void show_help() const {
        std::cout << description_ << "\n\n";

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " [OPTIONS] FILE.csv [FILE.csv ...]\n\n";

        std::cout << "QUICK START:\n";
        std::cout << "    # One KMZ with a layer per carrier\n";
        std::cout << "    " << program_name_ << " drive_test.csv\n";
        std::cout << "    \n";
        std::cout << "    # Create a configuration file, edit it, then run from it\n";
        std::cout << "    " << program_name_ << " --create-config lima.json\n";
        std::cout << "    " << program_name_ << " --config lima.json\n\n";

        std::cout << "INPUT:\n";
        std::cout << "    CSV files with the columns gps_latitude, gps_longitude and carrier.\n";
        std::cout << "    Rows with unreadable coordinates or an empty carrier are skipped.\n\n";

        std::cout << "OPTIONS:\n";
        for (const auto& name : order_) {
            print_help_section(options_.at(name));
        }
        std::cout << "    -h, --help                        Show this help\n\n";

        std::cout << "OUTPUT:\n";
        std::cout << "    A KMZ archive (default: heatmaps.kmz) holding doc.kml and one\n";
        std::cout << "    transparent PNG ground overlay per category.\n";
    }

private:
    void print_help_section(const Option& option) const {
        std::string usage = "    ";
        if (!option.short_name.empty()) {
            usage += "-" + option.short_name + ", ";
        }
        usage += "--" + option.long_name;
        if (option.has_value) {
            usage += " VALUE";
        }

        std::cout << usage;
        if (usage.size() < 38) {
            std::cout << std::string(38 - usage.size(), ' ');
        } else {
            std::cout << "\n" << std::string(38, ' ');
        }
        std::cout << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }

    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::vector<std::string> order_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::map<std::string, bool> explicit_;
    std::vector<std::string> positional_args_;
    bool help_shown_ = false;
};

} // namespace dkmz
