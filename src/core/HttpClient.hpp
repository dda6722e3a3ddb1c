/**
 * @file HttpClient.hpp
 * @brief Minimal blocking HTTP client over libcurl
 *
 * Used by the STAC catalog client for searches and by the Planetary
 * Computer signer for SAS token retrieval.
 */

#pragma once

#include <string>

namespace aoi {

/**
 * @brief Outcome of one HTTP exchange
 */
struct HttpResponse {
    long status = 0;        // HTTP status, 0 when the transfer itself failed
    std::string body;
    std::string error;      // transport error text

    bool ok() const { return error.empty() && status >= 200 && status < 300; }
};

/**
 * @brief Blocking HTTP client
 *
 * One instance per worker; instances are not shared between threads.
 */
class HttpClient {
public:
    struct Options {
        std::string user_agent;
        int timeout_seconds;
        bool follow_redirects;

        Options()
            : user_agent("AoiCompositeGenerator/1.0"),
              timeout_seconds(60),
              follow_redirects(true) {}
    };

    HttpClient();
    explicit HttpClient(const Options& options);

    HttpResponse get(const std::string& url) const;

    /**
     * @brief POST a JSON document
     * @param url Target URL
     * @param json_body Serialized JSON request body
     */
    HttpResponse post_json(const std::string& url, const std::string& json_body) const;

private:
    Options options_;

    HttpResponse perform(const std::string& url, const std::string* json_body) const;
};

} // namespace aoi
