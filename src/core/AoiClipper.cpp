/**
 * @file AoiClipper.cpp
 * @brief Implementation of AOI masking and cropping
 */

#include "AoiClipper.hpp"
#include "GeometryUtils.hpp"
#include "Logger.hpp"
#include <gdal_alg.h>
#include <algorithm>
#include <cmath>
#include <vector>

namespace aoi {

namespace {

ClipResult failure(ClipStatus status, const std::string& message) {
    ClipResult result;
    result.status = status;
    result.message = message;
    return result;
}

GDALDatasetPtr create_mem(int width, int height, int bands, GDALDataType type) {
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("MEM");
    if (!driver) {
        return nullptr;
    }
    return GDALDatasetPtr(driver->Create("", width, height, bands, type, nullptr));
}

} // namespace

AoiClipper::AoiClipper() {
    GDALAllRegister();
}

std::array<int, 4> AoiClipper::pixel_window(const BoundingBox& bounds,
                                            const double geotransform[6],
                                            int raster_width, int raster_height) {
    double col_a = (bounds.min_x - geotransform[0]) / geotransform[1];
    double col_b = (bounds.max_x - geotransform[0]) / geotransform[1];
    double row_a = (bounds.max_y - geotransform[3]) / geotransform[5];
    double row_b = (bounds.min_y - geotransform[3]) / geotransform[5];

    int col_min = static_cast<int>(std::floor(std::min(col_a, col_b)));
    int col_max = static_cast<int>(std::ceil(std::max(col_a, col_b)));
    int row_min = static_cast<int>(std::floor(std::min(row_a, row_b)));
    int row_max = static_cast<int>(std::ceil(std::max(row_a, row_b)));

    col_min = std::clamp(col_min, 0, raster_width);
    col_max = std::clamp(col_max, 0, raster_width);
    row_min = std::clamp(row_min, 0, raster_height);
    row_max = std::clamp(row_max, 0, raster_height);

    return {col_min, row_min, std::max(0, col_max - col_min), std::max(0, row_max - row_min)};
}

ClipResult AoiClipper::clip(const BandStack& stack, const AoiMask& mask) const {
    Logger logger("AoiClipper");

    GDALDataset* source = stack.dataset();
    if (!source || source->GetRasterCount() < 1) {
        return failure(ClipStatus::RASTER_IO, "Band stack has no raster data");
    }
    if (mask.geometries.empty()) {
        return failure(ClipStatus::EMPTY_RESULT, "No mask geometries");
    }

    double gt[6];
    if (source->GetGeoTransform(gt) != CE_None) {
        return failure(ClipStatus::RASTER_IO, "Band stack has no geotransform");
    }
    if (gt[2] != 0.0 || gt[4] != 0.0) {
        return failure(ClipStatus::RASTER_IO, "Rotated rasters are not supported");
    }

    // Bring the mask into the raster CRS
    std::vector<OGRGeometryUniquePtr> reprojected;
    std::vector<const OGRGeometry*> shapes;
    const OGRSpatialReference* raster_srs = source->GetSpatialRef();
    if (raster_srs && !raster_srs->IsEmpty() && !raster_srs->IsSame(&mask.srs)) {
        for (const auto& geom : mask.geometries) {
            auto projected = geometry::reproject(geom.get(), mask.srs, *raster_srs);
            if (!projected) {
                return failure(ClipStatus::RASTER_IO, "Failed to reproject mask to raster CRS");
            }
            reprojected.push_back(std::move(projected));
            shapes.push_back(reprojected.back().get());
        }
        logger.trace("Reprojected " + std::to_string(shapes.size()) + " mask geometries");
    } else {
        for (const auto& geom : mask.geometries) {
            shapes.push_back(geom.get());
        }
    }

    BoundingBox bounds = geometry::envelope(shapes.front());
    for (const OGRGeometry* shape : shapes) {
        BoundingBox b = geometry::envelope(shape);
        bounds.min_x = std::min(bounds.min_x, b.min_x);
        bounds.min_y = std::min(bounds.min_y, b.min_y);
        bounds.max_x = std::max(bounds.max_x, b.max_x);
        bounds.max_y = std::max(bounds.max_y, b.max_y);
    }

    auto window = pixel_window(bounds, gt, source->GetRasterXSize(), source->GetRasterYSize());
    const int col = window[0], row = window[1], width = window[2], height = window[3];
    if (width == 0 || height == 0) {
        return failure(ClipStatus::EMPTY_RESULT, "Mask does not overlap the raster");
    }

    ClippedRaster clipped;
    clipped.width = width;
    clipped.height = height;
    clipped.geotransform = {gt[0] + col * gt[1], gt[1], 0.0,
                            gt[3] + row * gt[5], 0.0, gt[5]};

    // Burn the mask at pixel centres
    GDALDatasetPtr mask_ds = create_mem(width, height, 1, GDT_Byte);
    if (!mask_ds) {
        return failure(ClipStatus::RASTER_IO, last_gdal_error("Failed to create mask raster"));
    }
    mask_ds->SetGeoTransform(clipped.geotransform.data());

    std::vector<OGRGeometryH> handles;
    for (const OGRGeometry* shape : shapes) {
        handles.push_back(OGRGeometry::ToHandle(const_cast<OGRGeometry*>(shape)));
    }
    std::vector<double> burn_values(handles.size(), 1.0);
    int band_list[1] = {1};

    CPLErr err = GDALRasterizeGeometries(
        GDALDataset::ToHandle(mask_ds.get()),
        1, band_list,
        static_cast<int>(handles.size()), handles.data(),
        nullptr, nullptr,
        burn_values.data(),
        nullptr,
        nullptr, nullptr);
    if (err != CE_None) {
        return failure(ClipStatus::RASTER_IO, last_gdal_error("Failed to rasterize mask"));
    }

    const size_t pixel_count = static_cast<size_t>(width) * height;
    std::vector<unsigned char> inside(pixel_count);
    if (mask_ds->GetRasterBand(1)->RasterIO(GF_Read, 0, 0, width, height, inside.data(),
                                            width, height, GDT_Byte, 0, 0) != CE_None) {
        return failure(ClipStatus::RASTER_IO, last_gdal_error("Failed to read mask raster"));
    }

    const int band_count = source->GetRasterCount();
    const GDALDataType data_type = source->GetRasterBand(1)->GetRasterDataType();
    clipped.dataset = create_mem(width, height, band_count, data_type);
    if (!clipped.dataset) {
        return failure(ClipStatus::RASTER_IO, last_gdal_error("Failed to create clipped raster"));
    }
    clipped.dataset->SetGeoTransform(clipped.geotransform.data());
    if (raster_srs) {
        clipped.dataset->SetSpatialRef(raster_srs);
    }

    bool has_data = false;
    std::vector<double> values(pixel_count);

    for (int b = 1; b <= band_count; ++b) {
        GDALRasterBand* input = source->GetRasterBand(b);
        if (input->RasterIO(GF_Read, col, row, width, height, values.data(),
                            width, height, GDT_Float64, 0, 0) != CE_None) {
            return failure(ClipStatus::RASTER_IO,
                           last_gdal_error("Failed to read band " + std::to_string(b)));
        }

        for (size_t i = 0; i < pixel_count; ++i) {
            if (!inside[i]) {
                values[i] = NODATA_VALUE;
            } else if (values[i] != NODATA_VALUE) {
                has_data = true;
            }
        }

        GDALRasterBand* output = clipped.dataset->GetRasterBand(b);
        output->SetNoDataValue(NODATA_VALUE);
        if (output->RasterIO(GF_Write, 0, 0, width, height, values.data(),
                             width, height, GDT_Float64, 0, 0) != CE_None) {
            return failure(ClipStatus::RASTER_IO,
                           last_gdal_error("Failed to write band " + std::to_string(b)));
        }
    }

    if (!has_data) {
        return failure(ClipStatus::EMPTY_RESULT, "All clipped values are nodata");
    }

    logger.debug("Clipped to window " + std::to_string(col) + "," + std::to_string(row) +
                 " size " + std::to_string(width) + "x" + std::to_string(height));

    ClipResult result;
    result.status = ClipStatus::OK;
    result.raster = std::move(clipped);
    return result;
}

} // namespace aoi
