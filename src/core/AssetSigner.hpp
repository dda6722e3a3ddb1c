/**
 * @file AssetSigner.hpp
 * @brief Turns asset references into fetchable URLs
 */

#pragma once

#include "aoi_composite.hpp"
#include "HttpClient.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace aoi {

/**
 * @brief Asset signing interface
 *
 * sign() returns a copy of the scene with fetchable hrefs, or nullopt
 * when the scene cannot be signed.
 */
class AssetSigner {
public:
    virtual ~AssetSigner() = default;

    virtual std::optional<Scene> sign(const Scene& scene) = 0;
};

/**
 * @brief Signer for catalogs whose hrefs are already fetchable
 */
class PassthroughSigner : public AssetSigner {
public:
    std::optional<Scene> sign(const Scene& scene) override { return scene; }
};

/**
 * @brief Microsoft Planetary Computer SAS token signer
 *
 * Requests an anonymous token per collection from <sas_url>/token/<collection>
 * and appends it as the query string of every Azure Blob Storage href. Tokens
 * are reused until shortly before their "msft:expiry".
 */
class PlanetaryComputerSigner : public AssetSigner {
public:
    struct Options {
        std::string sas_url;
        int timeout_seconds;
        int expiry_margin_seconds;

        Options()
            : sas_url("https://planetarycomputer.microsoft.com/api/sas/v1"),
              timeout_seconds(30),
              expiry_margin_seconds(300) {}
    };

    PlanetaryComputerSigner();
    explicit PlanetaryComputerSigner(const Options& options);

    std::optional<Scene> sign(const Scene& scene) override;

    /**
     * @brief True for hrefs served from Azure Blob Storage
     */
    static bool needs_signing(const std::string& href);

    /**
     * @brief Append a SAS token to an href
     */
    static std::string append_token(const std::string& href, const std::string& token);

private:
    struct CachedToken {
        std::string token;
        std::chrono::system_clock::time_point expiry;
    };

    Options options_;
    HttpClient http_;
    std::map<std::string, CachedToken> tokens_;

    std::optional<std::string> token_for(const std::string& collection);
};

} // namespace aoi
