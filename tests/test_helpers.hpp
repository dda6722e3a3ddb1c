/**
 * @file test_helpers.hpp
 * @brief Fixtures shared by the test suite: geometries, rasters, catalogs
 */

#pragma once

#include "aoi_composite.hpp"
#include "core/SceneCatalog.hpp"
#include <gdal_priv.h>
#include <ogr_geometry.h>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace aoi::test {

/**
 * @brief Axis-aligned rectangle polygon
 */
OGRGeometryUniquePtr rectangle(double min_x, double min_y, double max_x, double max_y);

/**
 * @brief Scene with a rectangular footprint and no assets
 */
Scene make_scene(const std::string& id, double min_x, double min_y, double max_x, double max_y,
                 double cloud_cover, const std::string& datetime = "2020-08-01T15:00:00Z");

/**
 * @brief Directory under the system temp path, removed with its contents on destruction
 */
class TempDirectory {
public:
    explicit TempDirectory(const std::string& prefix);
    ~TempDirectory();

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

/**
 * @brief Pixel value as a function of column and row
 */
using PixelFunction = std::function<double(int col, int row)>;

/**
 * @brief Write a single-band UInt16 GeoTIFF
 * @param geotransform Six GDAL geotransform coefficients
 * @return filename
 */
std::string write_band(const std::string& filename, int width, int height,
                       const std::vector<double>& geotransform, int epsg, const PixelFunction& value);

/**
 * @brief Write a single-band UInt16 GeoTIFF filled with one value
 */
std::string write_band(const std::string& filename, int width, int height,
                       const std::vector<double>& geotransform, int epsg, double value);

/**
 * @brief Read band b of a dataset as doubles
 */
std::vector<double> read_band(GDALDataset* dataset, int band);

std::string write_text(const std::string& filename, const std::string& content);

std::string read_text(const std::string& filename);

/**
 * @brief Catalog answering from a per-year table
 *
 * Years listed in failing_years throw CatalogError, years listed in
 * throwing_years throw std::runtime_error. Every request is recorded so
 * tests can inspect what was asked.
 */
class MemorySceneCatalog : public SceneCatalog {
public:
    std::vector<Scene> search(const SearchRequest& request) override;

    std::string describe() const override { return "memory catalog"; }

    std::map<int, std::vector<Scene>> scenes_by_year;
    std::vector<int> failing_years;
    std::vector<int> throwing_years;
    std::vector<SearchRequest> requests;
};

} // namespace aoi::test
