/**
 * @file StacCatalogClient.cpp
 * @brief Implementation of the STAC API search client
 */

#include "StacCatalogClient.hpp"
#include "Logger.hpp"

using json = nlohmann::json;

namespace aoi {

namespace {

HttpClient::Options http_options_for(const StacCatalogClient::Options& options) {
    HttpClient::Options http_options;
    http_options.timeout_seconds = options.timeout_seconds;
    return http_options;
}

// The "next" link of a STAC ItemCollection, or null when there is none
const json* find_next_link(const json& page) {
    if (!page.contains("links") || !page["links"].is_array()) {
        return nullptr;
    }
    for (const auto& link : page["links"]) {
        if (link.is_object() && link.contains("rel") && link["rel"].is_string() &&
            link["rel"].get<std::string>() == "next") {
            if (!link.contains("href") || !link["href"].is_string()) {
                throw CatalogError("STAC next link has no string href");
            }
            return &link;
        }
    }
    return nullptr;
}

} // namespace

StacCatalogClient::StacCatalogClient()
    : options_(), http_(http_options_for(options_)) {
}

StacCatalogClient::StacCatalogClient(const Options& options)
    : options_(options), http_(http_options_for(options)) {
}

std::string StacCatalogClient::search_url() const {
    std::string url = options_.api_url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + "/search";
}

json StacCatalogClient::build_search_body(const SearchRequest& request) const {
    return json{
        {"collections", json::array({request.collection})},
        {"filter-lang", "cql2-json"},
        {"filter", build_cql2_filter(request)},
        {"limit", options_.page_limit}
    };
}

std::vector<Scene> StacCatalogClient::search(const SearchRequest& request) {
    Logger logger("StacCatalogClient");

    json body;
    try {
        body = build_search_body(request);
    } catch (const json::exception& e) {
        throw CatalogError("Invalid search geometry: " + std::string(e.what()));
    }

    std::vector<Scene> scenes;
    std::string url = search_url();
    std::string method = "POST";
    int pages = 0;
    bool has_more = true;

    while (has_more && pages < options_.max_pages) {
        HttpResponse response = (method == "POST")
            ? http_.post_json(url, body.dump())
            : http_.get(url);
        pages++;

        if (!response.error.empty()) {
            throw CatalogError(response.error);
        }
        if (!response.ok()) {
            throw CatalogError("STAC search returned HTTP " + std::to_string(response.status) +
                               (response.body.empty() ? "" : ": " + response.body.substr(0, 200)));
        }

        json page;
        try {
            page = json::parse(response.body);
        } catch (const json::exception& e) {
            throw CatalogError("Malformed STAC search response: " + std::string(e.what()));
        }

        if (!page.contains("features") || !page["features"].is_array()) {
            throw CatalogError("STAC search response has no feature array");
        }

        for (const auto& item : page["features"]) {
            auto scene = scene_from_stac_item(item, request.cloud_cover_field, scenes.size());
            if (scene) {
                scenes.push_back(std::move(*scene));
            }
        }

        logger.debug("Page " + std::to_string(pages) + ": " +
                     std::to_string(page["features"].size()) + " items");

        const json* next = find_next_link(page);
        if (!next) {
            has_more = false;
            break;
        }

        try {
            url = (*next)["href"].get<std::string>();
            method = next->value("method", "GET");
            if (next->contains("body") && (*next)["body"].is_object()) {
                if (next->value("merge", false)) {
                    body.update((*next)["body"]);
                } else {
                    body = (*next)["body"];
                }
            }
        } catch (const json::exception& e) {
            throw CatalogError("Malformed STAC next link: " + std::string(e.what()));
        }
    }

    if (has_more) {
        logger.warning("Stopped paging after " + std::to_string(pages) +
                       " pages; results may be incomplete");
    }

    logger.detailed("STAC search returned " + std::to_string(scenes.size()) + " scenes");
    return scenes;
}

} // namespace aoi
