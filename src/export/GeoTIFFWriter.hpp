/**
 * @file GeoTIFFWriter.hpp
 * @brief Lossless GeoTIFF persistence of in-memory rasters
 */

#pragma once

#include <gdal_priv.h>
#include <string>

namespace aoi {

/**
 * @brief Copies a georeferenced dataset to a GeoTIFF file
 *
 * Georeferencing, band order, data type and nodata values are taken from
 * the source dataset unchanged.
 */
class GeoTIFFWriter {
public:
    GeoTIFFWriter();

    /**
     * @brief Write dataset to filename as an LZW-compressed GeoTIFF,
     *        replacing any existing file
     * @return true if the file was written
     */
    bool write(GDALDataset* dataset, const std::string& filename) const;

    /**
     * @brief Last error message from a failed write
     */
    const std::string& last_error() const { return last_error_; }

private:
    mutable std::string last_error_;
};

} // namespace aoi
