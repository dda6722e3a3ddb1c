/**
 * @file BandCompositor.hpp
 * @brief Stacks the per-band rasters of one scene into a multi-band raster
 */

#pragma once

#include "aoi_composite.hpp"
#include "GdalHandles.hpp"
#include <memory>
#include <string>
#include <vector>

namespace aoi {

/**
 * @brief Multi-band raster produced for one scene
 *
 * Owns its dataset and, when one was used, the working GeoTIFF behind it.
 * The dataset is closed and the working file removed when the stack is
 * destroyed.
 */
class BandStack {
public:
    BandStack(GDALDatasetPtr dataset, const std::string& working_file);
    ~BandStack();

    BandStack(const BandStack&) = delete;
    BandStack& operator=(const BandStack&) = delete;

    GDALDataset* dataset() const { return dataset_.get(); }
    const std::string& working_file() const { return working_file_; }

    int width() const { return dataset_->GetRasterXSize(); }
    int height() const { return dataset_->GetRasterYSize(); }
    int band_count() const { return dataset_->GetRasterCount(); }

private:
    GDALDatasetPtr dataset_;
    std::string working_file_;
};

enum class CompositeStatus {
    OK,
    MISSING_BAND,   // scene lacks an asset for a required band
    RASTER_IO       // a band could not be read or the stack not written
};

struct CompositeResult {
    CompositeStatus status = CompositeStatus::RASTER_IO;
    std::string message;
    std::unique_ptr<BandStack> stack;

    bool ok() const { return status == CompositeStatus::OK && stack != nullptr; }
};

/**
 * @brief Reads each required band of a scene and stacks them in order
 *
 * The stack takes the first band's size, geotransform, CRS, data type and
 * nodata value. Every band must match the first band's size, geotransform
 * and spatial reference.
 */
class BandCompositor {
public:
    struct Options {
        std::string working_directory;   // empty = system temp directory
        bool in_memory;                  // stack in a MEM dataset, no working file
        int rows_per_chunk;

        Options()
            : working_directory(""),
              in_memory(false),
              rows_per_chunk(512) {}
    };

    BandCompositor();
    explicit BandCompositor(const Options& options);

    CompositeResult compose(const Scene& scene, const std::vector<std::string>& bands) const;

private:
    Options options_;

    // Unique file in the working directory, empty when no directory is available
    std::string next_working_file() const;
};

} // namespace aoi
