/**
 * @file StacCatalogClient.hpp
 * @brief STAC API item search client (POST /search with CQL2-JSON)
 */

#pragma once

#include "SceneCatalog.hpp"
#include "HttpClient.hpp"
#include <string>

namespace aoi {

/**
 * @brief Scene catalog backed by a STAC API endpoint
 *
 * Pages are followed through the "next" link of each response until the
 * service stops returning one or max_pages responses were read.
 */
class StacCatalogClient : public SceneCatalog {
public:
    struct Options {
        std::string api_url;
        int page_limit;
        int max_pages;
        int timeout_seconds;

        Options()
            : api_url("https://planetarycomputer.microsoft.com/api/stac/v1"),
              page_limit(100),
              max_pages(20),
              timeout_seconds(60) {}
    };

    StacCatalogClient();
    explicit StacCatalogClient(const Options& options);

    std::vector<Scene> search(const SearchRequest& request) override;

    std::string describe() const override { return "STAC API " + options_.api_url; }

    /**
     * @brief Request body for the first search page
     */
    nlohmann::json build_search_body(const SearchRequest& request) const;

private:
    Options options_;
    HttpClient http_;

    std::string search_url() const;
};

} // namespace aoi
