/**
 * @file SceneCatalog.hpp
 * @brief Scene catalog gateway interface and STAC item helpers
 */

#pragma once

#include "aoi_composite.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace aoi {

/**
 * @brief Transport or service failure while querying a catalog
 */
class CatalogError : public std::runtime_error {
public:
    explicit CatalogError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Catalog query for one observation window
 */
struct SearchRequest {
    std::string intersects_geojson;          // GeoJSON geometry in EPSG:4326
    DateInterval interval;
    std::string collection = "sentinel-2-l2a";
    std::string cloud_cover_field = "eo:cloud_cover";
    double max_cloud_cover = 10.0;
};

/**
 * @brief Source of candidate scenes
 *
 * Implementations return scenes in catalog order with catalog_index set
 * to that position. Failures to reach or understand the service throw
 * CatalogError; "nothing matched" is an empty vector.
 */
class SceneCatalog {
public:
    virtual ~SceneCatalog() = default;

    virtual std::vector<Scene> search(const SearchRequest& request) = 0;

    /**
     * @brief Short description used in log lines
     */
    virtual std::string describe() const = 0;
};

/**
 * @brief CQL2-JSON filter expressing a SearchRequest
 *
 * {"op":"and","args":[intersects, anyinteracts, =collection, <=cloud]}
 */
nlohmann::json build_cql2_filter(const SearchRequest& request);

/**
 * @brief Convert one STAC Item (GeoJSON Feature) into a Scene
 * @param item STAC Item JSON
 * @param cloud_cover_field Property holding cloud cover percent
 * @param index Position of the item in the catalog response
 * @return Scene, or nullopt when the item has no usable geometry
 * @throws CatalogError when the id or collection is not a string
 */
std::optional<Scene> scene_from_stac_item(const nlohmann::json& item,
                                          const std::string& cloud_cover_field,
                                          size_t index);

} // namespace aoi
