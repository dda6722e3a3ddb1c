/**
 * @file BandCompositor.cpp
 * @brief Implementation of per-scene band stacking
 */

#include "BandCompositor.hpp"
#include "Logger.hpp"
#include <cpl_string.h>
#include <ogr_spatialref.h>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace aoi {

namespace {

std::atomic<unsigned long> working_file_counter{0};

CompositeResult failure(CompositeStatus status, const std::string& message) {
    CompositeResult result;
    result.status = status;
    result.message = message;
    return result;
}

// Equal within a small fraction of a pixel
bool same_geotransform(const double a[6], const double b[6]) {
    const double pixel = std::max(std::abs(a[1]), std::abs(a[5]));
    const double tolerance = std::max(pixel, 1e-12) * 1e-6;
    for (int i = 0; i < 6; ++i) {
        if (std::abs(a[i] - b[i]) > tolerance) {
            return false;
        }
    }
    return true;
}

} // namespace

// ============================================================================
// BandStack
// ============================================================================

BandStack::BandStack(GDALDatasetPtr dataset, const std::string& working_file)
    : dataset_(std::move(dataset)), working_file_(working_file) {
}

BandStack::~BandStack() {
    // Close before removing so the file handle is released
    dataset_.reset();

    if (!working_file_.empty()) {
        std::error_code ec;
        std::filesystem::remove(working_file_, ec);
        if (ec) {
            Logger logger("BandCompositor");
            logger.warning("Failed to remove working file " + working_file_ + ": " + ec.message());
        }
    }
}

// ============================================================================
// BandCompositor
// ============================================================================

BandCompositor::BandCompositor() : options_() {
    GDALAllRegister();
}

BandCompositor::BandCompositor(const Options& options) : options_(options) {
    GDALAllRegister();
}

std::string BandCompositor::next_working_file() const {
    std::filesystem::path directory(options_.working_directory);
    if (directory.empty()) {
        std::error_code ec;
        directory = std::filesystem::temp_directory_path(ec);
        if (ec) {
            return "";
        }
    }

    std::string name = "aoi_composite_" + std::to_string(::getpid()) + "_" +
                       std::to_string(working_file_counter.fetch_add(1)) + ".tif";
    return (directory / name).string();
}

CompositeResult BandCompositor::compose(const Scene& scene, const std::vector<std::string>& bands) const {
    Logger logger("BandCompositor");

    if (bands.empty()) {
        return failure(CompositeStatus::RASTER_IO, "No bands requested");
    }

    for (const auto& band : bands) {
        if (!scene.has_asset(band)) {
            return failure(CompositeStatus::MISSING_BAND,
                           "Scene " + scene.id + " has no asset for band " + band);
        }
    }

    CPLErrorReset();
    GDALDatasetPtr first(static_cast<GDALDataset*>(
        GDALOpen(gdal_path_for(scene.assets.at(bands[0])).c_str(), GA_ReadOnly)));
    if (!first || first->GetRasterCount() < 1) {
        return failure(CompositeStatus::RASTER_IO,
                       last_gdal_error("Cannot open band " + bands[0] + " of scene " + scene.id));
    }

    const int width = first->GetRasterXSize();
    const int height = first->GetRasterYSize();
    GDALRasterBand* first_band = first->GetRasterBand(1);
    const GDALDataType data_type = first_band->GetRasterDataType();
    const int pixel_bytes = GDALGetDataTypeSizeBytes(data_type);

    std::string working_file;
    GDALDriver* driver = nullptr;
    char** creation_options = nullptr;

    if (options_.in_memory) {
        driver = GetGDALDriverManager()->GetDriverByName("MEM");
    } else {
        driver = GetGDALDriverManager()->GetDriverByName("GTiff");
        working_file = next_working_file();
        if (working_file.empty()) {
            return failure(CompositeStatus::RASTER_IO, "No temporary directory for the working file");
        }
        creation_options = CSLSetNameValue(creation_options, "COMPRESS", "LZW");
    }

    if (!driver) {
        CSLDestroy(creation_options);
        return failure(CompositeStatus::RASTER_IO, "Raster driver not available");
    }

    GDALDatasetPtr target(driver->Create(working_file.c_str(), width, height,
                                         static_cast<int>(bands.size()), data_type,
                                         creation_options));
    CSLDestroy(creation_options);

    // Owned from here on so the working file is removed on every exit path
    auto stack = std::make_unique<BandStack>(std::move(target), working_file);
    if (!stack->dataset()) {
        return failure(CompositeStatus::RASTER_IO, last_gdal_error("Failed to create band stack"));
    }

    double geotransform[6];
    const bool has_geotransform = first->GetGeoTransform(geotransform) == CE_None;
    if (has_geotransform) {
        stack->dataset()->SetGeoTransform(geotransform);
    }
    const OGRSpatialReference* first_srs = first->GetSpatialRef();
    if (first_srs) {
        stack->dataset()->SetSpatialRef(first_srs);
    }

    int has_nodata = FALSE;
    double nodata = first_band->GetNoDataValue(&has_nodata);

    const int chunk_rows = std::max(1, std::min(options_.rows_per_chunk, height));
    std::vector<unsigned char> buffer(static_cast<size_t>(width) * chunk_rows * pixel_bytes);

    for (size_t b = 0; b < bands.size(); ++b) {
        GDALDatasetPtr opened;
        GDALDataset* source = first.get();
        if (b > 0) {
            opened.reset(static_cast<GDALDataset*>(
                GDALOpen(gdal_path_for(scene.assets.at(bands[b])).c_str(), GA_ReadOnly)));
            source = opened.get();
        }

        if (!source || source->GetRasterCount() < 1) {
            return failure(CompositeStatus::RASTER_IO,
                           last_gdal_error("Cannot open band " + bands[b] + " of scene " + scene.id));
        }
        if (source->GetRasterXSize() != width || source->GetRasterYSize() != height) {
            return failure(CompositeStatus::RASTER_IO,
                           "Band " + bands[b] + " is " + std::to_string(source->GetRasterXSize()) + "x" +
                           std::to_string(source->GetRasterYSize()) + ", expected " +
                           std::to_string(width) + "x" + std::to_string(height));
        }
        if (b > 0) {
            double band_geotransform[6];
            const bool band_has_geotransform = source->GetGeoTransform(band_geotransform) == CE_None;
            if (band_has_geotransform != has_geotransform ||
                (has_geotransform && !same_geotransform(geotransform, band_geotransform))) {
                return failure(CompositeStatus::RASTER_IO,
                               "Band " + bands[b] + " geotransform differs from band " + bands[0]);
            }

            const OGRSpatialReference* band_srs = source->GetSpatialRef();
            if ((band_srs == nullptr) != (first_srs == nullptr) ||
                (first_srs && !first_srs->IsSame(band_srs))) {
                return failure(CompositeStatus::RASTER_IO,
                               "Band " + bands[b] + " spatial reference differs from band " + bands[0]);
            }
        }

        GDALRasterBand* input = source->GetRasterBand(1);
        GDALRasterBand* output = stack->dataset()->GetRasterBand(static_cast<int>(b) + 1);

        for (int row = 0; row < height; row += chunk_rows) {
            int rows = std::min(chunk_rows, height - row);
            if (input->RasterIO(GF_Read, 0, row, width, rows, buffer.data(),
                                width, rows, data_type, 0, 0) != CE_None) {
                return failure(CompositeStatus::RASTER_IO,
                               last_gdal_error("Failed to read band " + bands[b]));
            }
            if (output->RasterIO(GF_Write, 0, row, width, rows, buffer.data(),
                                 width, rows, data_type, 0, 0) != CE_None) {
                return failure(CompositeStatus::RASTER_IO,
                               last_gdal_error("Failed to write band " + bands[b]));
            }
        }

        if (has_nodata) {
            output->SetNoDataValue(nodata);
        }
        logger.trace("Stacked band " + bands[b] + " as band " + std::to_string(b + 1));
    }

    stack->dataset()->FlushCache();

    logger.debug("Composed " + std::to_string(bands.size()) + " bands of scene " + scene.id +
                 " (" + std::to_string(width) + "x" + std::to_string(height) + ")");

    CompositeResult result;
    result.status = CompositeStatus::OK;
    result.stack = std::move(stack);
    return result;
}

} // namespace aoi
