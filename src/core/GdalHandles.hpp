#pragma once

/**
 * @file GdalHandles.hpp
 * @brief RAII ownership for GDAL datasets and shared helpers around GDAL errors
 */

#include <gdal_priv.h>
#include <cpl_error.h>
#include <memory>
#include <string>

namespace aoi {

// RAII wrapper for GDAL dataset
struct GDALDatasetDeleter {
    void operator()(GDALDataset* dataset) {
        if (dataset) {
            GDALClose(dataset);
        }
    }
};

using GDALDatasetPtr = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

/**
 * @brief Last GDAL/CPL error message, or a fallback when GDAL recorded none
 */
inline std::string last_gdal_error(const std::string& fallback) {
    const char* msg = CPLGetLastErrorMsg();
    if (msg && *msg) {
        return fallback + ": " + msg;
    }
    return fallback;
}

/**
 * @brief Path GDAL should open for an asset reference
 *
 * Remote http(s) references are read through /vsicurl/.
 */
inline std::string gdal_path_for(const std::string& href) {
    if (href.rfind("http://", 0) == 0 || href.rfind("https://", 0) == 0) {
        return "/vsicurl/" + href;
    }
    return href;
}

} // namespace aoi
