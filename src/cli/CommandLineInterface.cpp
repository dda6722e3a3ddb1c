/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "ConfigurationManager.hpp"
#include "../core/Logger.hpp"
#include "version.h"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <sstream>

namespace aoi {

namespace {

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

// Leading plain level of a log configuration ("4" or "4,Facility=6")
std::optional<int> default_level_of(const std::string& log_config) {
    std::string first = log_config.substr(0, log_config.find(','));
    if (first.empty() || first.find('=') != std::string::npos) {
        return std::nullopt;
    }
    try {
        return std::stoi(first);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

LogLevel clamp_level(int level) {
    return static_cast<LogLevel>(std::clamp(level, 1, 6));
}

} // namespace

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("aoi-composite",
        "For every line and every yearly window (July 1 through June 30) the generator\n"
        "searches a STAC catalog for low-cloud scenes, selects the fewest that cover\n"
        "the AOI, stacks the requested bands and clips them to the buffered line.");

    // Configuration file option
    parser.add_option("config", "c", "Path to JSON configuration file");
    parser.add_option("create-config", "", "Create default configuration file at path");

    // AOI options
    parser.add_option("aoi-file", "", "Vector file with one AOI per feature");
    parser.add_option("buffer-file", "", "Vector file with buffer geometries");
    parser.add_option("line", "l", "Lines as NAME=INDEX[,NAME=INDEX...]");
    parser.add_option("buffer-distance", "", "Buffer distance in meters");

    // Window options
    parser.add_option("start-year", "", "First yearly window");
    parser.add_option("end-year", "", "Last yearly window");

    // Catalog options
    parser.add_option("catalog-url", "", "STAC API root URL");
    parser.add_option("items-file", "", "Local STAC ItemCollection");
    parser.add_option("collection", "", "Collection id");
    parser.add_option("max-cloud", "", "Maximum cloud cover percent");
    parser.add_option("bands", "b", "Bands to stack, comma-separated");
    parser.add_flag("no-sign", "", "Do not sign asset URLs");

    // Output and processing
    parser.add_option("output-dir", "o", "Output directory");
    parser.add_option("threads", "j", "Worker threads (0 = sequential)");

    // Logging and utility options
    parser.add_flag("silent", "s", "Suppress all output (same as --log-level 0)");
    parser.add_flag("verbose", "v", "Enable verbose logging (same as --log-level 6)");
    parser.add_option("log-level", "", "Logging level, optionally per facility");
    parser.add_option("log-file", "", "Log to file (append if exists)");
    parser.add_flag("dry-run", "", "Parse arguments and validate without processing");
    parser.add_flag("version", "", "Show version information");

    if (!parser.parse(argc, argv)) {
        // parse() returns false for --help as well; only real errors print to stderr
        bool help_requested = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);
            if (arg == "--help" || arg == "-h") {
                help_requested = true;
            }
        }
        exit_code_ = help_requested ? 0 : 1;
        return false;
    }

    if (parser.get_flag("version")) {
        std::cout << "AOI Composite Generator v" << AOI_VERSION_STRING << std::endl;
        std::cout << "Yearly satellite scene selection, band stacking and AOI clipping" << std::endl;
        std::cout << "Built with GDAL/OGR, libcurl, nlohmann/json" << std::endl;
        std::cout << "Copyright (c) 2025 Matthew Block" << std::endl;
        return false;
    }

    if (auto config_path = parser.get("create-config")) {
        if (!create_default_config_file(config_path.value())) {
            std::cerr << "Failed to create configuration file: " << config_path.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
        std::cout << "Created default configuration file: " << config_path.value() << std::endl;
        return false;
    }

    if (auto config_file = parser.get("config")) {
        if (!load_config_file(config_file.value())) {
            std::cerr << "Failed to load configuration file: " << config_file.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
    }

    if (!parse_all_options(parser)) {
        exit_code_ = 1;
        return false;
    }

    return true;
}

template<typename T>
bool CommandLineInterface::read_number(const SimpleCommandLineParser& parser, const std::string& name,
                                       T& target) {
    if (!parser.get(name).has_value()) {
        return true;
    }
    auto value = parser.get_as<T>(name);
    if (!value.has_value()) {
        std::cerr << "Invalid value for --" << name << ": " << parser.get(name).value() << std::endl;
        return false;
    }
    target = value.value();
    return true;
}

bool CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    bool ok = true;

    // AOI options
    if (auto value = parser.get("aoi-file")) config_.aoi_file = value.value();
    if (auto value = parser.get("buffer-file")) config_.buffer_file = value.value();
    if (auto value = parser.get("line")) {
        auto jobs = parse_line_list(value.value());
        if (!jobs) {
            std::cerr << "Invalid --line value: " << value.value() << " (use NAME=INDEX[,NAME=INDEX...])" << std::endl;
            ok = false;
        } else {
            config_.lines = jobs.value();
        }
    }
    ok &= read_number(parser, "buffer-distance", config_.buffer_distance_m);

    // Window options
    ok &= read_number(parser, "start-year", config_.start_year);
    if (parser.get("end-year")) {
        int end_year = 0;
        if (read_number(parser, "end-year", end_year)) {
            config_.end_year = end_year;
        } else {
            ok = false;
        }
    }

    // Catalog options
    if (auto value = parser.get("catalog-url")) config_.catalog_url = value.value();
    if (auto value = parser.get("items-file")) config_.items_file = value.value();
    if (auto value = parser.get("collection")) config_.collection = value.value();
    ok &= read_number(parser, "max-cloud", config_.max_cloud_cover);
    if (auto value = parser.get("bands")) config_.bands = parse_list(value.value());
    if (parser.get_flag("no-sign")) config_.sign_assets = false;

    // Output and processing
    if (auto value = parser.get("output-dir")) {
        std::string path = value.value();
        if (path.size() > 1 && path.back() == '/') {
            path.pop_back();
        }
        config_.output_directory = path;
    }
    if (parser.get("threads")) {
        int threads = 0;
        if (read_number(parser, "threads", threads)) {
            config_.num_threads = threads;
            config_.parallel_processing = threads > 0;
        } else {
            ok = false;
        }
    }

    parse_logging_options(parser);

    // Utility flags
    dry_run_ = parser.get_flag("dry-run");

    return ok;
}

void CommandLineInterface::parse_logging_options(const SimpleCommandLineParser& parser) {
    // Priority: flags > CLI > ENV > config file > defaults
    // 0. Level from the configuration file (or the built-in default)
    if (config_.log_level > 0) {
        Logger::setDefaultLevel(clamp_level(config_.log_level));
    }

    // 1. Environment
    if (const char* env_log_level = std::getenv("AOI_LOG_LEVEL")) {
        std::string env_config(env_log_level);
        Logger::parseLogConfig(env_config);
        if (auto level = default_level_of(env_config)) {
            config_.log_level = level.value();
        }
    }

    // 2. CLI arguments override environment
    if (auto value = parser.get("log-level")) {
        std::string log_config = value.value();
        Logger::parseLogConfig(log_config);
        if (auto level = default_level_of(log_config)) {
            config_.log_level = level.value();
        }
    }

    // 3. Flags override everything
    if (parser.get_flag("silent")) {
        config_.log_level = 0;
        Logger::setDefaultLevel(LogLevel::ERROR);
    }
    if (parser.get_flag("verbose")) {
        config_.log_level = 6;
        Logger::setDefaultLevel(LogLevel::TRACE);
    }

    // 4. Log file
    if (const char* env_log_file = std::getenv("AOI_LOG_FILE")) {
        config_.log_file = std::string(env_log_file);
    }
    if (auto value = parser.get("log-file")) {
        config_.log_file = value.value();
    }
}

std::optional<std::vector<AoiJob>> CommandLineInterface::parse_line_list(const std::string& lines_str) {
    std::vector<AoiJob> jobs;
    for (const auto& entry : parse_list(lines_str)) {
        auto eq_pos = entry.find('=');
        if (eq_pos == std::string::npos) {
            return std::nullopt;
        }

        AoiJob job;
        job.name = trim(entry.substr(0, eq_pos));
        std::string index_str = trim(entry.substr(eq_pos + 1));
        if (job.name.empty() || index_str.empty()) {
            return std::nullopt;
        }

        try {
            size_t consumed = 0;
            job.index = std::stoi(index_str, &consumed);
            if (consumed != index_str.size()) {
                return std::nullopt;
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }
        jobs.push_back(job);
    }

    if (jobs.empty()) {
        return std::nullopt;
    }
    return jobs;
}

std::vector<std::string> CommandLineInterface::parse_list(const std::string& list_str) {
    std::vector<std::string> items;
    std::istringstream iss(list_str);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) {
    ConfigurationManager manager{CompositeConfig()};
    if (!manager.save_to_file(filename)) {
        std::cerr << "Error: " << manager.last_error() << std::endl;
        return false;
    }
    return true;
}

bool CommandLineInterface::load_config_file(const std::string& filename) {
    ConfigurationManager manager(config_);
    if (!manager.load_from_file(filename)) {
        std::cerr << "Error: " << manager.last_error() << std::endl;
        return false;
    }
    config_ = manager.to_composite_config();
    return true;
}

void CommandLineInterface::print_config() const {
    if (config_.log_level < 4) return;  // Only print at DETAILED level or higher

    std::cout << "\n=== Configuration ===\n";
    if (config_.config_file) {
        std::cout << "Config file: " << *config_.config_file << "\n";
    }
    std::cout << "Years: " << config_.start_year << " to ";
    if (config_.end_year) {
        std::cout << *config_.end_year << "\n";
    } else {
        std::cout << current_year() << " (current)\n";
    }
    std::cout << "AOI file: " << config_.aoi_file << "\n";
    std::cout << "Buffer file: " << config_.buffer_file
              << " (" << config_.buffer_distance_m << "m)\n";
    std::cout << "Lines: ";
    for (size_t i = 0; i < config_.lines.size(); ++i) {
        if (i > 0) std::cout << ", ";
        std::cout << config_.lines[i].name << "=" << config_.lines[i].index;
    }
    std::cout << "\nCatalog: " << (config_.items_file ? *config_.items_file : config_.catalog_url) << "\n";
    std::cout << "Collection: " << config_.collection
              << " (" << config_.cloud_cover_field << " <= " << config_.max_cloud_cover << ")\n";
    std::cout << "Bands: ";
    for (size_t i = 0; i < config_.bands.size(); ++i) {
        if (i > 0) std::cout << ", ";
        std::cout << config_.bands[i];
    }
    std::cout << "\nSign assets: " << (config_.sign_assets ? "yes" : "no") << "\n";
    std::cout << "Output directory: " << config_.output_directory << "\n";
    std::cout << "Parallel processing: " << (config_.parallel_processing ? "yes" : "no") << "\n";
    std::cout << "===================\n\n";
}

} // namespace aoi
