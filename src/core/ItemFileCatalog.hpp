/**
 * @file ItemFileCatalog.hpp
 * @brief Scene catalog over a local STAC ItemCollection file
 */

#pragma once

#include "SceneCatalog.hpp"
#include <string>

namespace aoi {

/**
 * @brief Offline catalog: the search predicates are evaluated locally
 *
 * Accepts a FeatureCollection of STAC Items, a bare array of Items or a
 * single Item. Items are kept when the collection matches, the cloud cover
 * property exists and is at or below the maximum, the capture datetime
 * falls in the interval and the footprint intersects the query geometry.
 */
class ItemFileCatalog : public SceneCatalog {
public:
    explicit ItemFileCatalog(const std::string& items_file);

    std::vector<Scene> search(const SearchRequest& request) override;

    std::string describe() const override { return "item file " + items_file_; }

    /**
     * @brief Datetime overlap test on ISO-8601 strings at second precision
     */
    static bool in_interval(const std::string& datetime, const DateInterval& interval);

private:
    std::string items_file_;
    nlohmann::json items_;
    bool loaded_;

    void load();
};

} // namespace aoi
