/**
 * @file AoiClipper.hpp
 * @brief Masks and crops a band stack to AOI geometries
 */

#pragma once

#include "aoi_composite.hpp"
#include "AoiSource.hpp"
#include "BandCompositor.hpp"
#include "GdalHandles.hpp"
#include <array>
#include <optional>
#include <string>

namespace aoi {

/**
 * @brief Cropped multi-band raster, zero (nodata) outside the mask
 */
struct ClippedRaster {
    GDALDatasetPtr dataset;                 // in-memory
    int width = 0;
    int height = 0;
    std::array<double, 6> geotransform{};
};

enum class ClipStatus {
    OK,
    EMPTY_RESULT,   // no pixel window, or every value is nodata
    RASTER_IO
};

struct ClipResult {
    ClipStatus status = ClipStatus::RASTER_IO;
    std::string message;
    std::optional<ClippedRaster> raster;

    bool ok() const { return status == ClipStatus::OK && raster.has_value(); }
};

/**
 * @brief Crop to the smallest pixel window holding the mask geometries and
 * zero every pixel whose centre falls outside them
 *
 * Mask geometries are reprojected to the raster's CRS when they differ;
 * the raster itself is never resampled.
 */
class AoiClipper {
public:
    static constexpr double NODATA_VALUE = 0.0;

    AoiClipper();

    ClipResult clip(const BandStack& stack, const AoiMask& mask) const;

    /**
     * @brief Pixel window [col_min, col_max) x [row_min, row_max) of an
     * envelope on a north-up raster, clamped to the raster
     * @return {col, row, width, height}; width or height 0 when disjoint
     */
    static std::array<int, 4> pixel_window(const BoundingBox& bounds,
                                           const double geotransform[6],
                                           int raster_width, int raster_height);
};

} // namespace aoi
