/**
 * @file ItemFileCatalog.cpp
 * @brief Implementation of the local item file catalog
 */

#include "ItemFileCatalog.hpp"
#include "GeometryUtils.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <fstream>

using json = nlohmann::json;

namespace aoi {

namespace {

// "YYYY-MM-DDTHH:MM:SS" prefix; a bare date compares as midnight
std::string comparable_datetime(const std::string& value) {
    std::string normalized = value.substr(0, std::min<size_t>(value.size(), 19));
    if (normalized.size() == 10) {
        normalized += "T00:00:00";
    }
    return normalized;
}

// Same precedence as scene_from_stac_item: datetime, then start_datetime
std::string item_datetime(const json& props) {
    for (const char* key : {"datetime", "start_datetime"}) {
        if (props.contains(key) && props[key].is_string()) {
            return props[key].get<std::string>();
        }
    }
    return "";
}

} // namespace

ItemFileCatalog::ItemFileCatalog(const std::string& items_file)
    : items_file_(items_file), loaded_(false) {
}

void ItemFileCatalog::load() {
    Logger logger("ItemFileCatalog");

    std::ifstream file(items_file_);
    if (!file.is_open()) {
        throw CatalogError("Cannot open item file: " + items_file_);
    }

    json document;
    try {
        file >> document;
    } catch (const json::exception& e) {
        throw CatalogError("Malformed item file " + items_file_ + ": " + e.what());
    }

    if (document.is_array()) {
        items_ = document;
    } else if (document.is_object() && document.contains("features") && document["features"].is_array()) {
        items_ = document["features"];
    } else if (document.is_object() && document.contains("type") && document["type"] == "Feature") {
        items_ = json::array({document});
    } else {
        throw CatalogError("Item file is not a STAC ItemCollection: " + items_file_);
    }

    loaded_ = true;
    logger.detailed("Loaded " + std::to_string(items_.size()) + " items from " + items_file_);
}

bool ItemFileCatalog::in_interval(const std::string& datetime, const DateInterval& interval) {
    if (datetime.empty()) {
        return false;
    }
    std::string value = comparable_datetime(datetime);
    return value >= comparable_datetime(interval.start) && value <= comparable_datetime(interval.end);
}

std::vector<Scene> ItemFileCatalog::search(const SearchRequest& request) {
    Logger logger("ItemFileCatalog");

    if (!loaded_) {
        load();
    }

    auto query_geometry = geometry::from_geojson(request.intersects_geojson);
    if (!query_geometry) {
        throw CatalogError("Invalid search geometry");
    }

    std::vector<Scene> scenes;
    size_t position = 0;

    for (const auto& item : items_) {
        size_t index = position++;

        if (!item.is_object() || !item.contains("collection")) {
            continue;
        }
        if (!item["collection"].is_string()) {
            throw CatalogError("Malformed item " + std::to_string(index) + " in " + items_file_ +
                               ": 'collection' is not a string");
        }
        if (item["collection"].get<std::string>() != request.collection) {
            continue;
        }

        const json* props = (item.contains("properties") && item["properties"].is_object())
            ? &item["properties"] : nullptr;
        if (!props || !props->contains(request.cloud_cover_field) ||
            !(*props)[request.cloud_cover_field].is_number()) {
            continue;
        }

        // Date and cloud predicates run before the item is converted
        if (!in_interval(item_datetime(*props), request.interval)) {
            logger.trace("Item at file position " + std::to_string(index) + " rejected by datetime");
            continue;
        }
        if ((*props)[request.cloud_cover_field].get<double>() > request.max_cloud_cover) {
            logger.trace("Item at file position " + std::to_string(index) + " rejected by cloud cover");
            continue;
        }

        auto scene = scene_from_stac_item(item, request.cloud_cover_field, scenes.size());
        if (!scene) {
            continue;
        }
        if (!geometry::intersects(scene->footprint.get(), query_geometry.get())) {
            logger.trace("Item " + scene->id + " rejected by footprint");
            continue;
        }

        logger.trace("Item " + scene->id + " at file position " + std::to_string(index) + " matched");
        scenes.push_back(std::move(*scene));
    }

    logger.detailed("Item file search matched " + std::to_string(scenes.size()) + " scenes");
    return scenes;
}

} // namespace aoi
