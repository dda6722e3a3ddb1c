/**
 * @file SceneCatalog.cpp
 * @brief STAC item conversion and CQL2 filter construction
 */

#include "SceneCatalog.hpp"
#include "GeometryUtils.hpp"
#include "Logger.hpp"

using json = nlohmann::json;

namespace aoi {

json build_cql2_filter(const SearchRequest& request) {
    json geometry = json::parse(request.intersects_geojson);

    return json{
        {"op", "and"},
        {"args", json::array({
            json{{"op", "intersects"},
                 {"args", json::array({json{{"property", "geometry"}}, geometry})}},
            json{{"op", "anyinteracts"},
                 {"args", json::array({json{{"property", "datetime"}},
                                       json{{"interval", json::array({request.interval.start,
                                                                      request.interval.end})}}})}},
            json{{"op", "="},
                 {"args", json::array({json{{"property", "collection"}}, request.collection})}},
            json{{"op", "<="},
                 {"args", json::array({json{{"property", request.cloud_cover_field}},
                                       request.max_cloud_cover})}}
        })}
    };
}

std::optional<Scene> scene_from_stac_item(const json& item,
                                          const std::string& cloud_cover_field,
                                          size_t index) {
    Logger logger("SceneCatalog");

    if (!item.is_object() || !item.contains("geometry") || item["geometry"].is_null()) {
        logger.debug("Skipping catalog item without geometry at position " + std::to_string(index));
        return std::nullopt;
    }

    auto footprint = geometry::from_geojson(item["geometry"].dump());
    if (!footprint) {
        logger.warning("Skipping catalog item with invalid geometry at position " + std::to_string(index));
        return std::nullopt;
    }

    for (const char* key : {"id", "collection"}) {
        if (item.contains(key) && !item[key].is_string()) {
            throw CatalogError("Malformed catalog item at position " + std::to_string(index) +
                               ": '" + key + "' is not a string");
        }
    }

    Scene scene;
    scene.id = item.value("id", "");
    scene.collection = item.value("collection", "");
    scene.footprint = std::shared_ptr<const OGRGeometry>(std::move(footprint));
    scene.catalog_index = index;

    if (item.contains("properties") && item["properties"].is_object()) {
        const auto& props = item["properties"];
        if (props.contains("datetime") && props["datetime"].is_string()) {
            scene.datetime = props["datetime"].get<std::string>();
        } else if (props.contains("start_datetime") && props["start_datetime"].is_string()) {
            scene.datetime = props["start_datetime"].get<std::string>();
        }
        if (props.contains(cloud_cover_field) && props[cloud_cover_field].is_number()) {
            scene.cloud_cover = props[cloud_cover_field].get<double>();
        }
    }

    if (item.contains("assets") && item["assets"].is_object()) {
        for (const auto& [name, asset] : item["assets"].items()) {
            if (asset.is_object() && asset.contains("href") && asset["href"].is_string()) {
                scene.assets[name] = asset["href"].get<std::string>();
            }
        }
    }

    return scene;
}

} // namespace aoi
