/**
 * @file AssetSigner.cpp
 * @brief Implementation of the Planetary Computer SAS signer
 */

#include "AssetSigner.hpp"
#include "Logger.hpp"
#include <nlohmann/json.hpp>
#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace aoi {

namespace {

const std::string BLOB_STORAGE_SUFFIX = ".blob.core.windows.net";

// "2024-05-01T12:34:56Z" (fractional seconds ignored); nullopt when unparseable
std::optional<std::chrono::system_clock::time_point> parse_expiry(const std::string& value) {
    std::tm tm{};
    std::istringstream stream(value.substr(0, 19));
    stream >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (stream.fail()) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

HttpClient::Options http_options_for(const PlanetaryComputerSigner::Options& options) {
    HttpClient::Options http_options;
    http_options.timeout_seconds = options.timeout_seconds;
    return http_options;
}

} // namespace

PlanetaryComputerSigner::PlanetaryComputerSigner()
    : options_(), http_(http_options_for(options_)) {
}

PlanetaryComputerSigner::PlanetaryComputerSigner(const Options& options)
    : options_(options), http_(http_options_for(options)) {
}

bool PlanetaryComputerSigner::needs_signing(const std::string& href) {
    auto scheme_end = href.find("://");
    if (scheme_end == std::string::npos) {
        return false;
    }
    auto host_start = scheme_end + 3;
    auto host_end = href.find_first_of("/?:", host_start);
    std::string host = href.substr(host_start,
        host_end == std::string::npos ? std::string::npos : host_end - host_start);

    return host.size() > BLOB_STORAGE_SUFFIX.size() &&
           host.compare(host.size() - BLOB_STORAGE_SUFFIX.size(),
                        BLOB_STORAGE_SUFFIX.size(), BLOB_STORAGE_SUFFIX) == 0;
}

std::string PlanetaryComputerSigner::append_token(const std::string& href, const std::string& token) {
    return href + (href.find('?') == std::string::npos ? "?" : "&") + token;
}

std::optional<std::string> PlanetaryComputerSigner::token_for(const std::string& collection) {
    Logger logger("PlanetaryComputerSigner");

    auto now = std::chrono::system_clock::now();
    auto cached = tokens_.find(collection);
    if (cached != tokens_.end() &&
        cached->second.expiry - std::chrono::seconds(options_.expiry_margin_seconds) > now) {
        return cached->second.token;
    }

    std::string url = options_.sas_url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    url += "/token/" + collection;

    HttpResponse response = http_.get(url);
    if (!response.ok()) {
        logger.error("SAS token request failed for collection " + collection);
        return std::nullopt;
    }

    try {
        auto j = json::parse(response.body);
        std::string token = j.value("token", "");
        if (token.empty()) {
            logger.error("SAS token response has no token for collection " + collection);
            return std::nullopt;
        }

        // Without a readable expiry the token is used for this request only
        auto expiry = parse_expiry(j.value("msft:expiry", ""));
        if (expiry) {
            tokens_[collection] = CachedToken{token, *expiry};
        } else {
            logger.debug("SAS token for " + collection + " has no readable expiry");
        }
        return token;

    } catch (const json::exception& e) {
        logger.error("JSON parsing error in SAS token response: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::optional<Scene> PlanetaryComputerSigner::sign(const Scene& scene) {
    Logger logger("PlanetaryComputerSigner");

    Scene signed_scene = scene;
    std::optional<std::string> token;

    for (auto& [band, href] : signed_scene.assets) {
        if (!needs_signing(href)) {
            continue;
        }
        if (!token) {
            token = token_for(scene.collection);
            if (!token) {
                return std::nullopt;
            }
        }
        href = append_token(href, *token);
    }

    logger.trace("Signed assets of scene " + scene.id);
    return signed_scene;
}

} // namespace aoi
