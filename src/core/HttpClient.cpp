/**
 * @file HttpClient.cpp
 * @brief Implementation of the libcurl HTTP client
 */

#include "HttpClient.hpp"
#include "Logger.hpp"
#include <curl/curl.h>
#include <mutex>

namespace aoi {

namespace {

std::once_flag curl_init_flag;

// Callback for CURL to write response data
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

void ensure_curl_initialized() {
    std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // namespace

HttpClient::HttpClient() : options_() {
    ensure_curl_initialized();
}

HttpClient::HttpClient(const Options& options) : options_(options) {
    ensure_curl_initialized();
}

HttpResponse HttpClient::get(const std::string& url) const {
    return perform(url, nullptr);
}

HttpResponse HttpClient::post_json(const std::string& url, const std::string& json_body) const {
    return perform(url, &json_body);
}

HttpResponse HttpClient::perform(const std::string& url, const std::string* json_body) const {
    Logger logger("HttpClient");
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "Failed to initialize CURL";
        logger.error(response.error);
        return response;
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(options_.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options_.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (json_body) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body->size()));
        logger.debug("POST " + url);
        logger.trace("Request body: " + *json_body);
    } else {
        logger.debug("GET " + url);
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);

    if (res != CURLE_OK) {
        response.error = "CURL request failed: " + std::string(curl_easy_strerror(res));
    } else {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (!response.error.empty()) {
        logger.warning(response.error);
    } else if (!response.ok()) {
        logger.warning("HTTP error " + std::to_string(response.status) + " from " + url);
    }

    return response;
}

} // namespace aoi
