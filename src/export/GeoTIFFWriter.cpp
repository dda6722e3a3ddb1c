/**
 * @file GeoTIFFWriter.cpp
 * @brief Implementation of GeoTIFF persistence
 */

#include "GeoTIFFWriter.hpp"
#include "../core/GdalHandles.hpp"
#include "../core/Logger.hpp"
#include <cpl_string.h>

namespace aoi {

GeoTIFFWriter::GeoTIFFWriter() {
    GDALAllRegister();
}

bool GeoTIFFWriter::write(GDALDataset* dataset, const std::string& filename) const {
    Logger logger("GeoTIFFWriter");
    last_error_.clear();

    if (!dataset) {
        last_error_ = "Null source dataset";
        logger.error(last_error_);
        return false;
    }

    GDALDriver* gtiff_driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    if (!gtiff_driver) {
        last_error_ = "GeoTIFF driver not available";
        logger.error(last_error_);
        return false;
    }

    char** options = nullptr;
    options = CSLSetNameValue(options, "COMPRESS", "LZW");

    CPLErrorReset();
    GDALDatasetPtr gtiff_dataset(gtiff_driver->CreateCopy(
        filename.c_str(),
        dataset,
        FALSE,      // Not strict
        options,    // Creation options
        nullptr,    // Progress function
        nullptr     // Progress data
    ));

    CSLDestroy(options);

    if (!gtiff_dataset) {
        last_error_ = last_gdal_error("Failed to create GeoTIFF file " + filename);
        logger.error(last_error_);
        return false;
    }

    logger.detailed("Wrote GeoTIFF: " + filename + " (" +
                    std::to_string(dataset->GetRasterXSize()) + "x" +
                    std::to_string(dataset->GetRasterYSize()) + ", " +
                    std::to_string(dataset->GetRasterCount()) + " bands)");
    return true;
}

} // namespace aoi
