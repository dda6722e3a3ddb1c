#include "core/AoiClipper.hpp"
#include "core/GeometryUtils.hpp"
#include "export/GeoTIFFWriter.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

namespace aoi::test {

// 100x100 pixels of 10 m covering [0,1000] x [0,1000] in EPSG:3857
class AoiClipperTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<TempDirectory>("aoi_clipper");
        write_band(dir_->file("band.tif"), 100, 100, gt_, 3857,
                   [](int col, int row) { return 1000 + row * 100 + col; });
        write_band(dir_->file("zeros.tif"), 100, 100, gt_, 3857, 0.0);
    }

    std::unique_ptr<BandStack> open_stack(const std::string& name) const {
        GDALAllRegister();
        GDALDatasetPtr dataset(static_cast<GDALDataset*>(
            GDALOpen(dir_->file(name).c_str(), GA_ReadOnly)));
        return std::make_unique<BandStack>(std::move(dataset), "");
    }

    static AoiMask mask_of(std::vector<OGRGeometryUniquePtr> shapes) {
        AoiMask mask;
        mask.geometries = std::move(shapes);
        mask.srs = geometry::srs_from_epsg(3857);
        return mask;
    }

    static AoiMask mask_of(OGRGeometryUniquePtr shape) {
        std::vector<OGRGeometryUniquePtr> shapes;
        shapes.push_back(std::move(shape));
        return mask_of(std::move(shapes));
    }

    std::unique_ptr<TempDirectory> dir_;
    const std::vector<double> gt_ = {0.0, 10.0, 0.0, 1000.0, 0.0, -10.0};
    AoiClipper clipper_;
};

TEST_F(AoiClipperTest, PixelWindowCoversBoundsOutward) {
    const double gt[6] = {0.0, 1.0, 0.0, 100.0, 0.0, -1.0};
    auto window = AoiClipper::pixel_window(BoundingBox(10.5, 20.2, 30.1, 50.7), gt, 100, 100);
    EXPECT_EQ(window[0], 10);
    EXPECT_EQ(window[1], 49);
    EXPECT_EQ(window[2], 21);
    EXPECT_EQ(window[3], 31);
}

TEST_F(AoiClipperTest, PixelWindowClampedToRaster) {
    const double gt[6] = {0.0, 1.0, 0.0, 100.0, 0.0, -1.0};
    auto window = AoiClipper::pixel_window(BoundingBox(-20, -20, 50, 150), gt, 100, 100);
    EXPECT_EQ(window[0], 0);
    EXPECT_EQ(window[1], 0);
    EXPECT_EQ(window[2], 50);
    EXPECT_EQ(window[3], 100);

    auto outside = AoiClipper::pixel_window(BoundingBox(200, 200, 300, 300), gt, 100, 100);
    EXPECT_EQ(outside[2] * outside[3], 0);
}

TEST_F(AoiClipperTest, CropsToMaskWindow) {
    auto stack = open_stack("band.tif");
    auto result = clipper_.clip(*stack, mask_of(rectangle(200, 300, 600, 700)));

    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.raster->width, 40);
    EXPECT_EQ(result.raster->height, 40);
    EXPECT_DOUBLE_EQ(result.raster->geotransform[0], 200.0);
    EXPECT_DOUBLE_EQ(result.raster->geotransform[3], 700.0);
    EXPECT_DOUBLE_EQ(result.raster->geotransform[1], 10.0);

    // Window starts at column 20, row 30 of the source
    auto values = read_band(result.raster->dataset.get(), 1);
    EXPECT_DOUBLE_EQ(values[0], 1000 + 30 * 100 + 20);
    EXPECT_DOUBLE_EQ(values.back(), 1000 + 69 * 100 + 59);

    int has_nodata = 0;
    double nodata = result.raster->dataset->GetRasterBand(1)->GetNoDataValue(&has_nodata);
    EXPECT_TRUE(has_nodata);
    EXPECT_DOUBLE_EQ(nodata, AoiClipper::NODATA_VALUE);
}

TEST_F(AoiClipperTest, PixelsOutsideMaskBecomeNodata) {
    std::vector<OGRGeometryUniquePtr> shapes;
    shapes.push_back(rectangle(0, 900, 100, 1000));   // top-left 10x10 pixels
    shapes.push_back(rectangle(900, 0, 1000, 100));   // bottom-right 10x10 pixels

    auto stack = open_stack("band.tif");
    auto result = clipper_.clip(*stack, mask_of(std::move(shapes)));

    ASSERT_TRUE(result.ok()) << result.message;
    ASSERT_EQ(result.raster->width, 100);
    ASSERT_EQ(result.raster->height, 100);

    auto values = read_band(result.raster->dataset.get(), 1);
    EXPECT_DOUBLE_EQ(values[5 * 100 + 5], 1000 + 5 * 100 + 5);
    EXPECT_DOUBLE_EQ(values[95 * 100 + 95], 1000 + 95 * 100 + 95);
    EXPECT_DOUBLE_EQ(values[50 * 100 + 50], 0.0);
    EXPECT_DOUBLE_EQ(values[5 * 100 + 95], 0.0);
}

TEST_F(AoiClipperTest, DisjointMaskIsEmptyResult) {
    auto stack = open_stack("band.tif");
    auto result = clipper_.clip(*stack, mask_of(rectangle(5000, 5000, 6000, 6000)));

    EXPECT_EQ(result.status, ClipStatus::EMPTY_RESULT);
    EXPECT_FALSE(result.raster.has_value());
}

TEST_F(AoiClipperTest, AllNodataIsEmptyResult) {
    auto stack = open_stack("zeros.tif");
    auto result = clipper_.clip(*stack, mask_of(rectangle(200, 200, 800, 800)));

    EXPECT_EQ(result.status, ClipStatus::EMPTY_RESULT);
    EXPECT_FALSE(result.ok());
}

TEST_F(AoiClipperTest, NoMaskGeometriesIsEmptyResult) {
    auto stack = open_stack("band.tif");
    AoiMask mask;
    mask.srs = geometry::srs_from_epsg(3857);

    auto result = clipper_.clip(*stack, mask);
    EXPECT_EQ(result.status, ClipStatus::EMPTY_RESULT);
}

TEST_F(AoiClipperTest, MaskReprojectedToRasterCrs) {
    // Edges fall mid-pixel so the window survives round-off from the transform
    OGRSpatialReference mercator = geometry::srs_from_epsg(3857);
    OGRSpatialReference wgs84 = geometry::srs_from_epsg(4326);
    auto square = rectangle(205, 305, 595, 695);
    auto geographic = geometry::reproject(square.get(), mercator, wgs84);
    ASSERT_NE(geographic, nullptr);

    AoiMask mask;
    mask.geometries.push_back(std::move(geographic));
    mask.srs = wgs84;

    auto stack = open_stack("band.tif");
    auto result = clipper_.clip(*stack, mask);

    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.raster->width, 40);
    EXPECT_EQ(result.raster->height, 40);
}

// Compose, clip and write the same scene twice: the files must match byte for byte
TEST_F(AoiClipperTest, ProcessingTwiceGivesIdenticalFiles) {
    write_band(dir_->file("nir.tif"), 100, 100, gt_, 3857,
               [](int col, int) { return 20000 + col; });
    Scene scene = make_scene("S2A_REPEAT", 0, 0, 1000, 1000, 1.0);
    scene.assets["B04"] = dir_->file("band.tif");
    scene.assets["B08"] = dir_->file("nir.tif");

    BandCompositor::Options options;
    options.working_directory = dir_->path().string();
    BandCompositor compositor(options);
    GeoTIFFWriter writer;
    auto mask = mask_of(rectangle(150, 150, 850, 450));

    std::vector<std::string> outputs;
    for (const std::string name : {"first.tif", "second.tif"}) {
        auto composite = compositor.compose(scene, {"B04", "B08"});
        ASSERT_TRUE(composite.ok()) << composite.message;
        auto clip = clipper_.clip(*composite.stack, mask);
        ASSERT_TRUE(clip.ok()) << clip.message;
        ASSERT_TRUE(writer.write(clip.raster->dataset.get(), dir_->file(name))) << writer.last_error();
        outputs.push_back(dir_->file(name));
    }

    std::string first_bytes = read_text(outputs[0]);
    ASSERT_FALSE(first_bytes.empty());
    EXPECT_TRUE(first_bytes == read_text(outputs[1]));

    GDALDatasetPtr written(static_cast<GDALDataset*>(GDALOpen(outputs[0].c_str(), GA_ReadOnly)));
    ASSERT_NE(written, nullptr);
    ASSERT_EQ(written->GetRasterCount(), 2);
    EXPECT_STREQ(written->GetMetadataItem("COMPRESSION", "IMAGE_STRUCTURE"), "LZW");

    // Window starts at column 15, row 55: band order follows the requested bands
    auto red = read_band(written.get(), 1);
    auto nir = read_band(written.get(), 2);
    EXPECT_DOUBLE_EQ(red.front(), 1000 + 55 * 100 + 15);
    EXPECT_DOUBLE_EQ(nir.front(), 20000 + 15);
}

} // namespace aoi::test
