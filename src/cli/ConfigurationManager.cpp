/**
 * @file ConfigurationManager.cpp
 * @brief Configuration management for the composite generator
 */

#include "ConfigurationManager.hpp"
#include "../core/Logger.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace aoi {

namespace {

template<typename T>
void read_if_present(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = j[key].get<T>();
    }
}

template<typename T>
void read_optional(const json& j, const char* key, std::optional<T>& target) {
    if (j.contains(key)) {
        if (j[key].is_null()) {
            target.reset();
        } else {
            target = j[key].get<T>();
        }
    }
}

std::vector<AoiJob> parse_lines(const json& lines) {
    std::vector<AoiJob> jobs;
    if (lines.is_object()) {
        // {"Buffer1": 0, "Buffer2": 1}
        for (const auto& [name, index] : lines.items()) {
            jobs.push_back({name, index.get<int>()});
        }
    } else if (lines.is_array()) {
        // [{"name": "Buffer1", "index": 0}, ...]
        for (const auto& entry : lines) {
            jobs.push_back({entry.at("name").get<std::string>(), entry.at("index").get<int>()});
        }
    } else {
        throw std::invalid_argument("\"lines\" must be an object or an array");
    }
    return jobs;
}

} // namespace

json ConfigurationManager::to_json(const CompositeConfig& config) {
    json lines = json::array();
    for (const auto& line : config.lines) {
        lines.push_back({{"name", line.name}, {"index", line.index}});
    }

    return json{
        {"start_year", config.start_year},
        {"end_year", config.end_year ? json(*config.end_year) : json(nullptr)},
        {"aoi_file", config.aoi_file},
        {"buffer_file", config.buffer_file},
        {"lines", lines},
        {"line_id_attribute", config.line_id_attribute},
        {"buffer_id_attribute", config.buffer_id_attribute},
        {"nested_properties_key", config.nested_properties_key},
        {"missing_line_id", config.missing_line_id},
        {"buffer_distance_m", config.buffer_distance_m},
        {"output_directory", config.output_directory},
        {"working_directory", config.working_directory},
        {"composite_in_memory", config.composite_in_memory},
        {"catalog_url", config.catalog_url},
        {"items_file", config.items_file ? json(*config.items_file) : json(nullptr)},
        {"collection", config.collection},
        {"cloud_cover_field", config.cloud_cover_field},
        {"max_cloud_cover", config.max_cloud_cover},
        {"page_limit", config.page_limit},
        {"max_pages", config.max_pages},
        {"timeout_seconds", config.timeout_seconds},
        {"sign_assets", config.sign_assets},
        {"sas_url", config.sas_url},
        {"bands", config.bands},
        {"marginal_gain_threshold", config.marginal_gain_threshold},
        {"target_coverage", config.target_coverage},
        {"parallel_processing", config.parallel_processing},
        {"num_threads", config.num_threads},
        {"log_level", config.log_level},
        {"log_file", config.log_file ? json(*config.log_file) : json(nullptr)}
    };
}

void ConfigurationManager::apply_json(const json& j, CompositeConfig& config) {
    if (!j.is_object()) {
        throw std::invalid_argument("configuration must be a JSON object");
    }

    read_if_present(j, "start_year", config.start_year);
    read_optional(j, "end_year", config.end_year);

    read_if_present(j, "aoi_file", config.aoi_file);
    read_if_present(j, "buffer_file", config.buffer_file);
    if (j.contains("lines") && !j["lines"].is_null()) {
        config.lines = parse_lines(j["lines"]);
    }
    read_if_present(j, "line_id_attribute", config.line_id_attribute);
    read_if_present(j, "buffer_id_attribute", config.buffer_id_attribute);
    read_if_present(j, "nested_properties_key", config.nested_properties_key);
    read_if_present(j, "missing_line_id", config.missing_line_id);
    read_if_present(j, "buffer_distance_m", config.buffer_distance_m);

    read_if_present(j, "output_directory", config.output_directory);
    read_if_present(j, "working_directory", config.working_directory);
    read_if_present(j, "composite_in_memory", config.composite_in_memory);

    read_if_present(j, "catalog_url", config.catalog_url);
    read_optional(j, "items_file", config.items_file);
    read_if_present(j, "collection", config.collection);
    read_if_present(j, "cloud_cover_field", config.cloud_cover_field);
    read_if_present(j, "max_cloud_cover", config.max_cloud_cover);
    read_if_present(j, "page_limit", config.page_limit);
    read_if_present(j, "max_pages", config.max_pages);
    read_if_present(j, "timeout_seconds", config.timeout_seconds);

    read_if_present(j, "sign_assets", config.sign_assets);
    read_if_present(j, "sas_url", config.sas_url);
    read_if_present(j, "bands", config.bands);

    read_if_present(j, "marginal_gain_threshold", config.marginal_gain_threshold);
    read_if_present(j, "target_coverage", config.target_coverage);

    read_if_present(j, "parallel_processing", config.parallel_processing);
    read_if_present(j, "num_threads", config.num_threads);

    read_if_present(j, "log_level", config.log_level);
    read_optional(j, "log_file", config.log_file);
}

bool ConfigurationManager::load_from_file(const std::string& filename) {
    Logger logger("ConfigurationManager");
    last_error_.clear();

    std::ifstream file(filename);
    if (!file.is_open()) {
        last_error_ = "Could not open config file: " + filename;
        return false;
    }

    try {
        json j;
        file >> j;

        CompositeConfig updated = config_;
        apply_json(j, updated);
        config_ = updated;
        config_.config_file = filename;

    } catch (const json::exception& e) {
        last_error_ = "Invalid configuration in " + filename + ": " + e.what();
        return false;
    } catch (const std::invalid_argument& e) {
        last_error_ = "Invalid configuration in " + filename + ": " + e.what();
        return false;
    }

    logger.debug("Loaded configuration from " + filename);
    return true;
}

bool ConfigurationManager::save_to_file(const std::string& filename) const {
    last_error_.clear();

    std::ofstream file(filename);
    if (!file.is_open()) {
        last_error_ = "Could not write config file: " + filename;
        return false;
    }

    file << to_json(config_).dump(2) << std::endl;
    if (!file.good()) {
        last_error_ = "Failed writing config file: " + filename;
        return false;
    }
    return true;
}

} // namespace aoi
