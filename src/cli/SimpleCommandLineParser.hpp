/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser for the composite generator
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <sstream>
#include <iostream>

namespace aoi {

/**
 * @brief Simple command-line argument parser
 *
 * Supports --name VALUE, --name=VALUE, short aliases and boolean flags.
 * Options without a value on the command line stay unset unless a default
 * was registered, so configuration files can supply them instead.
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
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        options_[long_name] = Option(long_name, short_name, description, false, false);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    /**
     * @brief Parse command line arguments
     * @return false when help was shown or an argument was invalid
     */
    bool parse(int argc, char* argv[]) {
        args_.clear();
        parsed_values_.clear();
        positional_args_.clear();

        for (int i = 1; i < argc; ++i) {
            args_.push_back(argv[i]);
        }

        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h") {
                show_help();
                return false;
            }
        }

        for (size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                // --option=value
                size_t eq_pos = option_name.find('=');
                std::string value;
                bool inline_value = false;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                    inline_value = true;
                }

                auto it = options_.find(option_name);
                if (it == options_.end()) {
                    std::cerr << "Unknown option: --" << option_name << std::endl;
                    return false;
                }

                const auto& option = it->second;
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

            } else if (arg.starts_with("-") && arg.size() > 1) {
                std::string short_name = arg.substr(1);

                auto alias = short_to_long_.find(short_name);
                if (alias == short_to_long_.end()) {
                    std::cerr << "Unknown option: -" << short_name << std::endl;
                    return false;
                }

                const std::string& option_name = alias->second;
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

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    /**
     * @brief Value converted with operator>>; nullopt when unset or when
     * trailing characters remain
     */
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

    void show_help() const {
        std::cout << "AOI COMPOSITE GENERATOR - Yearly low-cloud satellite composites per area of interest\n\n";

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " [OPTIONS]\n\n";

        if (!description_.empty()) {
            std::cout << description_ << "\n\n";
        }

        std::cout << "QUICK START:\n";
        std::cout << "    # Create a configuration file to edit\n";
        std::cout << "    " << program_name_ << " --create-config lines.json\n";
        std::cout << "    \n";
        std::cout << "    # Run from the configuration file\n";
        std::cout << "    " << program_name_ << " --config lines.json\n\n";

        std::cout << "AOI OPTIONS:\n";
        print_help_section("aoi-file", "Vector file holding one AOI polygon per feature");
        print_help_section("buffer-file", "Vector file holding the buffer geometries used for clipping");
        print_help_section("line", "Lines to process as NAME=INDEX[,NAME=INDEX...] (default: Buffer1=0,Buffer2=1)");
        print_help_section("buffer-distance", "Buffer applied to matching geometries in meters (default: 100)");
        std::cout << "\n";

        std::cout << "WINDOW OPTIONS:\n";
        print_help_section("start-year", "First yearly window, July 1 to June 30 (default: 2015)");
        print_help_section("end-year", "Last yearly window (default: current year)");
        std::cout << "\n";

        std::cout << "CATALOG OPTIONS:\n";
        print_help_section("catalog-url", "STAC API root (default: Planetary Computer)");
        print_help_section("items-file", "Search a local STAC ItemCollection instead of the API");
        print_help_section("collection", "Collection to search (default: sentinel-2-l2a)");
        print_help_section("max-cloud", "Maximum cloud cover percent (default: 10)");
        print_help_section("bands", "Comma-separated bands to stack, in order (default: B04,B08)");
        print_help_section("no-sign", "Use asset URLs as published, without SAS tokens");
        std::cout << "\n";

        std::cout << "OUTPUT OPTIONS:\n";
        print_help_section("output-dir", "Output root; one folder per line id (default: data/raw/satellital_image)");
        print_help_section("threads", "Process lines on N worker threads (0 = sequential)");
        std::cout << "\n";

        std::cout << "CONFIGURATION & LOGGING:\n";
        print_help_section("config", "Load configuration from JSON file");
        print_help_section("create-config", "Write the default configuration to a file and exit");
        print_help_section("silent", "Suppress all output (same as --log-level 0)");
        print_help_section("verbose", "Enable verbose logging (same as --log-level 6)");
        print_help_section("log-level", "1=ERROR, 2=WARNING, 3=INFO (default), 4=DETAILED, 5=DEBUG, 6=TRACE");
        print_help_section("log-file", "Also log to this file (append if exists)");
        print_help_section("dry-run", "Validate configuration without processing");
        print_help_section("version", "Show version information");
        std::cout << "\n";

        std::cout << "ENVIRONMENT:\n";
        std::cout << "    AOI_LOG_LEVEL            Same syntax as --log-level, e.g. \"4,StacCatalogClient=6\"\n";
        std::cout << "    AOI_LOG_FILE             Same as --log-file\n\n";

        std::cout << "EXAMPLES:\n";
        std::cout << "    " << program_name_ << " --line Buffer1=0 --start-year 2020 --end-year 2022\n";
        std::cout << "    " << program_name_ << " --items-file items.json --no-sign --bands B02,B03,B04\n\n";

        std::cout << "OUTPUT:\n";
        std::cout << "    <output-dir>/<line id>/composite_<year>_<date>_img<n>.tif for every selected scene\n";
        std::cout << "    <output-dir>/process_log<index>.txt for every line\n";
    }

private:
    void print_help_section(const std::string& option_name, const std::string& description) const {
        auto it = options_.find(option_name);
        if (it != options_.end()) {
            const auto& option = it->second;
            std::string usage = "--" + option.long_name;
            if (!option.short_name.empty()) {
                usage = "-" + option.short_name + ", " + usage;
            }
            if (option.has_value) {
                usage += " VALUE";
            }
            std::cout << "    " << usage;
            if (usage.size() < 28) {
                std::cout << std::string(28 - usage.size(), ' ');
            } else {
                std::cout << "  ";
            }
            std::cout << description << "\n";
        }
    }

    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
};

} // namespace aoi
