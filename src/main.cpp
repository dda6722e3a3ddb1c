/**
 * @file main.cpp
 * @brief Main entry point for the AOI Composite Generator
 *
 * Selects low-cloud satellite scenes covering each line's area of interest
 * for every yearly observation window, stacks their bands and clips the
 * composites to the buffered line geometry.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "aoi_composite.hpp"
#include "cli/BatchRunner.hpp"
#include "cli/CommandLineInterface.hpp"
#include "version.h"
#include <chrono>
#include <iostream>

using namespace aoi;

/**
 * @brief Parse command line arguments using built-in parser
 */
bool parse_command_line(int argc, char* argv[], CompositeConfig& config, bool& dry_run, int& exit_code) {
    CommandLineInterface cli;

    if (!cli.parse_arguments(argc, argv)) {
        exit_code = cli.exit_code();
        return false;  // Help shown or error occurred
    }

    config = cli.get_config();
    dry_run = cli.is_dry_run();
    cli.print_config();

    return true;
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    auto start_time = std::chrono::high_resolution_clock::now();

    try {
        CompositeConfig config;
        bool dry_run = false;
        int exit_code = 0;

        if (!parse_command_line(argc, argv, config, dry_run, exit_code)) {
            return exit_code;
        }

        if (config.log_level > 0) {
            std::cout << "AOI Composite Generator v" << AOI_VERSION_STRING << "\n";
        }

        BatchRunner runner(config);

        if (dry_run) {
            if (!runner.validate()) {
                return 1;
            }
            if (config.log_level > 0) {
                std::cout << "Dry run mode - configuration validated successfully\n";
            }
            return 0;
        }

        bool success = runner.run();

        const auto& report = runner.report();
        if (config.log_level > 0) {
            report.printSummary();
        }
        if (config.log_level >= 4) {
            report.printDetailedReport();
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

        if (!success) {
            std::cerr << "Error: one or more lines could not be processed\n";
            return 1;
        }

        if (config.log_level > 0) {
            std::cout << "\nCompleted in " << total_duration.count() << "ms\n";
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}

// Example usage commands:
//
// Default lines, Planetary Computer catalog:
// ./aoi-composite --start-year 2018
//
// Offline item file, unsigned assets, three bands:
// ./aoi-composite --items-file items.json --no-sign --bands B02,B03,B04 \
//                 --line Buffer1=0 --end-year 2020
