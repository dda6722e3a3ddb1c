#pragma once

/**
 * @file aoi_composite.hpp
 * @brief Main header for the AOI Composite Generator
 *
 * Selects the smallest low-cloud set of satellite scenes covering an area
 * of interest for each yearly observation window, stacks their bands and
 * clips the result to the AOI.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <memory>
#include <vector>
#include <string>
#include <map>
#include <optional>

class OGRGeometry;

namespace aoi {

// Forward declarations
class SceneCatalog;
class AssetSigner;
class YearlyOrchestrator;

/**
 * @brief Bounding box for spatial queries
 */
struct BoundingBox {
    double min_x, min_y, max_x, max_y;

    BoundingBox() : min_x(0.0), min_y(0.0), max_x(0.0), max_y(0.0) {}
    BoundingBox(double minx, double miny, double maxx, double maxy)
        : min_x(minx), min_y(miny), max_x(maxx), max_y(maxy) {}

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
    bool empty() const { return width() <= 0.0 || height() <= 0.0; }
};

/**
 * @brief Closed datetime interval in ISO-8601 UTC (e.g. "2020-07-01T00:00:00Z")
 */
struct DateInterval {
    std::string start;
    std::string end;
};

/**
 * @brief One candidate satellite observation returned by a catalog
 *
 * The footprint is shared between copies; a Scene is never mutated after
 * the catalog produced it (signing returns a new Scene).
 */
struct Scene {
    std::string id;
    std::string collection;
    std::shared_ptr<const OGRGeometry> footprint;   // EPSG:4326
    std::string datetime;                           // ISO-8601 capture time
    double cloud_cover = 100.0;                     // percent, 100 when unknown
    std::map<std::string, std::string> assets;      // band name -> href
    size_t catalog_index = 0;                       // position in catalog response

    /**
     * @brief Capture date portion of the datetime ("2021-03-14")
     */
    std::string capture_date() const {
        auto pos = datetime.find('T');
        return pos == std::string::npos ? datetime : datetime.substr(0, pos);
    }

    bool has_asset(const std::string& band) const {
        return assets.find(band) != assets.end();
    }
};

/**
 * @brief AOI to process: line name and feature index in the AOI file
 */
struct AoiJob {
    std::string name;
    int index = 0;
};

/**
 * @brief Configuration for composite generation
 */
struct CompositeConfig {
    // Observation windows (July 1 of year through June 30 of year+1)
    int start_year = 2015;
    std::optional<int> end_year;   // defaults to the current year

    // AOI inputs
    std::string aoi_file = "data/raw/ArchivoGeojson/contenedor.geojson";
    std::string buffer_file = "data/processed/BufferTransformado.geojson";
    std::vector<AoiJob> lines = {{"Buffer1", 0}, {"Buffer2", 1}};
    std::string line_id_attribute = "ID_Linea";
    std::string buffer_id_attribute = "UBITEC";
    std::string nested_properties_key = "original_properties";
    std::string missing_line_id = "Sin ID";
    double buffer_distance_m = 100.0;

    // Output
    std::string output_directory = "data/raw/satellital_image";
    std::string working_directory = "";   // empty = system temp directory
    bool composite_in_memory = false;     // skip the working GeoTIFF entirely

    // Catalog
    std::string catalog_url = "https://planetarycomputer.microsoft.com/api/stac/v1";
    std::optional<std::string> items_file;   // offline STAC ItemCollection
    std::string collection = "sentinel-2-l2a";
    std::string cloud_cover_field = "eo:cloud_cover";
    double max_cloud_cover = 10.0;
    int page_limit = 100;
    int max_pages = 20;
    int timeout_seconds = 60;

    // Asset signing
    bool sign_assets = true;
    std::string sas_url = "https://planetarycomputer.microsoft.com/api/sas/v1";

    // Bands stacked in this order
    std::vector<std::string> bands = {"B04", "B08"};

    // Selection thresholds
    double marginal_gain_threshold = 0.05;
    double target_coverage = 0.98;

    // Processing
    bool parallel_processing = false;
    int num_threads = 0;   // auto-detect when parallel

    // Config file support
    std::optional<std::string> config_file;

    // Logging options
    int log_level = 3;   // 1=ERROR .. 6=TRACE, 0=silent
    std::optional<std::string> log_file;
};

/**
 * @brief Year used when no end year is configured
 */
int current_year();

/**
 * @brief Observation window for a year: July 1 of year through June 30 of year+1
 */
DateInterval observation_window(int year);

} // namespace aoi
