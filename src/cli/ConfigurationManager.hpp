/**
 * @file ConfigurationManager.hpp
 * @brief JSON configuration file management for the composite generator
 */

#pragma once

#include "aoi_composite.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace aoi {

/**
 * @brief Loads and saves CompositeConfig as JSON
 *
 * Keys absent from a file keep the value already held, so a file only
 * needs the settings it changes.
 */
class ConfigurationManager {
public:
    ConfigurationManager() = default;
    explicit ConfigurationManager(const CompositeConfig& config) : config_(config) {}

    /**
     * @brief Load configuration from file
     * @param filename Path to JSON configuration file
     * @return true if successful, false otherwise (see last_error())
     */
    bool load_from_file(const std::string& filename);

    /**
     * @brief Save configuration to file
     * @param filename Path to configuration file
     * @return true if successful, false otherwise
     */
    bool save_to_file(const std::string& filename) const;

    const CompositeConfig& to_composite_config() const { return config_; }
    void from_composite_config(const CompositeConfig& config) { config_ = config; }

    /**
     * @brief Serialize a configuration
     */
    static nlohmann::json to_json(const CompositeConfig& config);

    /**
     * @brief Overlay the keys present in j onto config
     * @throws nlohmann::json::exception when a key has the wrong type,
     *         std::invalid_argument when the document has the wrong shape
     */
    static void apply_json(const nlohmann::json& j, CompositeConfig& config);

    const std::string& last_error() const { return last_error_; }

private:
    CompositeConfig config_;
    mutable std::string last_error_;
};

} // namespace aoi
