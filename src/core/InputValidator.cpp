/**
 * @file InputValidator.cpp
 * @brief Implementation of input validation
 */

#include "InputValidator.hpp"
#include <sstream>
#include <iomanip>
#include <map>
#include <set>

namespace aoi {

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Invalid parameters detected:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Conflict " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    oss << "\nProgram terminated due to invalid inputs.\n";
    return oss.str();
}

ValidationResult InputValidator::validate(const CompositeConfig& config) const {
    ValidationResult result;
    result.is_valid = true;

    const std::optional<ParameterConflict> checks[] = {
        check_year_range(config),
        check_selection_thresholds(config),
        check_cloud_cover(config),
        check_bands(config),
        check_lines(config),
        check_processing_limits(config)
    };

    for (const auto& conflict : checks) {
        if (conflict) {
            result.conflicts.push_back(*conflict);
            result.is_valid = false;
        }
    }

    return result;
}

std::optional<ParameterConflict> InputValidator::check_year_range(const CompositeConfig& config) const {
    if (!config.end_year.has_value() || config.end_year.value() >= config.start_year) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "End year precedes start year";
    conflict.involved_params = {
        "--start-year " + std::to_string(config.start_year),
        "--end-year " + std::to_string(config.end_year.value())
    };
    conflict.suggestions = {
        "Use --end-year " + std::to_string(config.start_year) + " or later",
        "Omit --end-year to process through the current year"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_selection_thresholds(const CompositeConfig& config) const {
    const double gain = config.marginal_gain_threshold;
    const double target = config.target_coverage;

    bool gain_ok = gain >= 0.0 && gain < 1.0;
    bool target_ok = target > 0.0 && target <= 1.0;
    if (gain_ok && target_ok && gain < target) {
        return std::nullopt;
    }

    std::ostringstream gain_str, target_str;
    gain_str << std::fixed << std::setprecision(3) << gain;
    target_str << std::fixed << std::setprecision(3) << target;

    ParameterConflict conflict;
    conflict.description = "Coverage selection thresholds are out of range";
    conflict.involved_params = {
        "marginal_gain_threshold " + gain_str.str() + " (must be in [0, 1))",
        "target_coverage " + target_str.str() + " (must be in (0, 1])"
    };
    conflict.suggestions = {
        "Use the defaults: marginal_gain_threshold 0.05, target_coverage 0.98",
        "Keep marginal_gain_threshold below target_coverage"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_cloud_cover(const CompositeConfig& config) const {
    if (config.max_cloud_cover >= 0.0 && config.max_cloud_cover <= 100.0) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Maximum cloud cover must be a percentage";
    conflict.involved_params = {"--max-cloud " + std::to_string(config.max_cloud_cover)};
    conflict.suggestions = {"Use a value between 0 and 100 (default: 10)"};
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_bands(const CompositeConfig& config) const {
    std::set<std::string> seen;
    std::vector<std::string> duplicates;
    for (const auto& band : config.bands) {
        if (!seen.insert(band).second) {
            duplicates.push_back(band);
        }
    }

    if (!config.bands.empty() && duplicates.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    if (config.bands.empty()) {
        conflict.description = "No bands requested";
        conflict.suggestions = {"Use --bands B04,B08"};
    } else {
        conflict.description = "Band listed more than once";
        for (const auto& band : duplicates) {
            conflict.involved_params.push_back("--bands ... " + band + " ...");
        }
        conflict.suggestions = {"List each band once, in the order the output should stack them"};
    }
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_lines(const CompositeConfig& config) const {
    ParameterConflict conflict;

    if (config.lines.empty()) {
        conflict.description = "No lines to process";
        conflict.suggestions = {"Use --line Buffer1=0,Buffer2=1"};
        return conflict;
    }

    std::map<int, std::string> owners;
    for (const auto& line : config.lines) {
        if (line.index < 0) {
            conflict.involved_params.push_back("--line " + line.name + "=" + std::to_string(line.index) +
                                               " (negative index)");
            continue;
        }
        auto [it, inserted] = owners.emplace(line.index, line.name);
        if (!inserted) {
            conflict.involved_params.push_back("--line " + it->second + "=" + std::to_string(line.index) +
                                               " and " + line.name + "=" + std::to_string(line.index));
        }
    }

    if (conflict.involved_params.empty()) {
        return std::nullopt;
    }

    conflict.description = "Invalid or duplicate AOI feature indices";
    conflict.suggestions = {
        "Use a distinct non-negative feature index for every line",
        "Each index writes process_log<index>.txt, so indices cannot be shared"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_processing_limits(const CompositeConfig& config) const {
    ParameterConflict conflict;

    if (config.page_limit <= 0) {
        conflict.involved_params.push_back("page_limit " + std::to_string(config.page_limit));
    }
    if (config.max_pages <= 0) {
        conflict.involved_params.push_back("max_pages " + std::to_string(config.max_pages));
    }
    if (config.timeout_seconds <= 0) {
        conflict.involved_params.push_back("timeout_seconds " + std::to_string(config.timeout_seconds));
    }
    if (config.buffer_distance_m < 0.0) {
        conflict.involved_params.push_back("--buffer-distance " + std::to_string(config.buffer_distance_m));
    }
    if (config.num_threads < 0) {
        conflict.involved_params.push_back("--threads " + std::to_string(config.num_threads));
    }

    if (conflict.involved_params.empty()) {
        return std::nullopt;
    }

    conflict.description = "Processing limits must be positive";
    conflict.suggestions = {
        "Use positive page_limit, max_pages and timeout_seconds",
        "Use a buffer distance of 0 or more meters",
        "Use --threads 0 to auto-detect"
    };
    return conflict;
}

} // namespace aoi
