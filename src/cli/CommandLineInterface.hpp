/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the AOI composite generator
 */

#pragma once

#include "aoi_composite.hpp"
#include "SimpleCommandLineParser.hpp"
#include <optional>
#include <string>
#include <vector>

namespace aoi {

/**
 * @brief Command line interface for parsing arguments and building the configuration
 *
 * Precedence: command line > environment (AOI_LOG_LEVEL, AOI_LOG_FILE) >
 * configuration file > built-in defaults.
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument vector
     * @return true if processing should continue; false after --help,
     *         --version, --create-config or an error (see exit_code())
     */
    bool parse_arguments(int argc, char* argv[]);

    const CompositeConfig& get_config() const { return config_; }

    bool is_dry_run() const { return dry_run_; }

    /**
     * @brief Process exit status when parse_arguments returned false
     */
    int exit_code() const { return exit_code_; }

    /**
     * @brief Print the current configuration (DETAILED level or higher)
     */
    void print_config() const;

    /**
     * @brief Parse "NAME=INDEX[,NAME=INDEX...]"
     * @return Jobs in the order given, or nullopt on a malformed entry
     */
    static std::optional<std::vector<AoiJob>> parse_line_list(const std::string& lines_str);

    /**
     * @brief Split a comma-separated list, trimming whitespace and dropping empty entries
     */
    static std::vector<std::string> parse_list(const std::string& list_str);

private:
    CompositeConfig config_;
    bool dry_run_ = false;
    int exit_code_ = 0;

    bool parse_all_options(const SimpleCommandLineParser& parser);
    void parse_logging_options(const SimpleCommandLineParser& parser);

    template<typename T>
    bool read_number(const SimpleCommandLineParser& parser, const std::string& name, T& target);

    // Configuration file methods
    bool create_default_config_file(const std::string& filename);
    bool load_config_file(const std::string& filename);
};

} // namespace aoi
