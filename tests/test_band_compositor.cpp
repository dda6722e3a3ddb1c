#include "core/BandCompositor.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <filesystem>

namespace aoi::test {

class BandCompositorTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<TempDirectory>("aoi_compositor");
        work_ = dir_->path() / "work";
        std::filesystem::create_directories(work_);

        const std::vector<double> gt = {500000.0, 10.0, 0.0, 4500000.0, 0.0, -10.0};
        scene_ = make_scene("S2A_TEST", 0, 0, 1, 1, 2.0);
        scene_.assets["B04"] = write_band(dir_->file("B04.tif"), 32, 24, gt, 32618, 400.0);
        scene_.assets["B08"] = write_band(dir_->file("B08.tif"), 32, 24, gt, 32618, 800.0);
        scene_.assets["B02"] = write_band(dir_->file("B02.tif"), 16, 12, gt, 32618, 200.0);

        options_.working_directory = work_.string();
    }

    bool work_is_empty() const {
        return std::filesystem::is_empty(work_);
    }

    std::unique_ptr<TempDirectory> dir_;
    std::filesystem::path work_;
    Scene scene_;
    BandCompositor::Options options_;
};

TEST_F(BandCompositorTest, StacksBandsInRequestedOrder) {
    BandCompositor compositor(options_);
    auto result = compositor.compose(scene_, {"B08", "B04"});

    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.stack->band_count(), 2);
    EXPECT_EQ(result.stack->width(), 32);
    EXPECT_EQ(result.stack->height(), 24);

    auto first = read_band(result.stack->dataset(), 1);
    auto second = read_band(result.stack->dataset(), 2);
    EXPECT_DOUBLE_EQ(first.front(), 800.0);
    EXPECT_DOUBLE_EQ(second.back(), 400.0);
    EXPECT_EQ(result.stack->dataset()->GetRasterBand(1)->GetRasterDataType(), GDT_UInt16);
}

TEST_F(BandCompositorTest, KeepsGeoreferencing) {
    BandCompositor compositor(options_);
    auto result = compositor.compose(scene_, {"B04", "B08"});
    ASSERT_TRUE(result.ok()) << result.message;

    double gt[6];
    ASSERT_EQ(result.stack->dataset()->GetGeoTransform(gt), CE_None);
    EXPECT_DOUBLE_EQ(gt[0], 500000.0);
    EXPECT_DOUBLE_EQ(gt[5], -10.0);

    const OGRSpatialReference* srs = result.stack->dataset()->GetSpatialRef();
    ASSERT_NE(srs, nullptr);
    EXPECT_STREQ(srs->GetAuthorityCode(nullptr), "32618");
}

TEST_F(BandCompositorTest, MissingBandFailsBeforeAnyIo) {
    Scene incomplete = scene_;
    incomplete.assets.erase("B08");

    BandCompositor compositor(options_);
    auto result = compositor.compose(incomplete, {"B04", "B08"});

    EXPECT_EQ(result.status, CompositeStatus::MISSING_BAND);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.stack, nullptr);
    EXPECT_NE(result.message.find("B08"), std::string::npos);
    EXPECT_TRUE(work_is_empty());
}

TEST_F(BandCompositorTest, WorkingFileRemovedWithStack) {
    BandCompositor compositor(options_);
    auto result = compositor.compose(scene_, {"B04", "B08"});
    ASSERT_TRUE(result.ok()) << result.message;

    std::string working = result.stack->working_file();
    ASSERT_FALSE(working.empty());
    EXPECT_TRUE(std::filesystem::exists(working));
    EXPECT_EQ(std::filesystem::path(working).parent_path(), work_);

    result.stack.reset();
    EXPECT_FALSE(std::filesystem::exists(working));
    EXPECT_TRUE(work_is_empty());
}

TEST_F(BandCompositorTest, SizeMismatchIsRasterError) {
    BandCompositor compositor(options_);
    auto result = compositor.compose(scene_, {"B04", "B02"});

    EXPECT_EQ(result.status, CompositeStatus::RASTER_IO);
    EXPECT_EQ(result.stack, nullptr);
    EXPECT_TRUE(work_is_empty());
}

TEST_F(BandCompositorTest, ShiftedGeotransformIsRasterError) {
    const std::vector<double> shifted = {500020.0, 10.0, 0.0, 4500000.0, 0.0, -10.0};
    scene_.assets["B11"] = write_band(dir_->file("B11.tif"), 32, 24, shifted, 32618, 1100.0);

    BandCompositor compositor(options_);
    auto result = compositor.compose(scene_, {"B04", "B11"});

    EXPECT_EQ(result.status, CompositeStatus::RASTER_IO);
    EXPECT_EQ(result.stack, nullptr);
    EXPECT_NE(result.message.find("geotransform"), std::string::npos);
    EXPECT_TRUE(work_is_empty());
}

TEST_F(BandCompositorTest, DifferentSpatialReferenceIsRasterError) {
    const std::vector<double> gt = {500000.0, 10.0, 0.0, 4500000.0, 0.0, -10.0};
    scene_.assets["B12"] = write_band(dir_->file("B12.tif"), 32, 24, gt, 32619, 1200.0);

    BandCompositor compositor(options_);
    auto result = compositor.compose(scene_, {"B04", "B12"});

    EXPECT_EQ(result.status, CompositeStatus::RASTER_IO);
    EXPECT_EQ(result.stack, nullptr);
    EXPECT_NE(result.message.find("spatial reference"), std::string::npos);
    EXPECT_TRUE(work_is_empty());
}

TEST_F(BandCompositorTest, RoundingNoiseInGeotransformAccepted) {
    const std::vector<double> noisy = {500000.0 + 1e-9, 10.0, 0.0, 4500000.0 - 1e-9, 0.0, -10.0};
    scene_.assets["B8A"] = write_band(dir_->file("B8A.tif"), 32, 24, noisy, 32618, 850.0);

    BandCompositor compositor(options_);
    auto result = compositor.compose(scene_, {"B04", "B8A"});

    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.stack->band_count(), 2);
}

TEST_F(BandCompositorTest, UnreadableAssetIsRasterError) {
    Scene broken = scene_;
    broken.assets["B08"] = dir_->file("does_not_exist.tif");

    BandCompositor compositor(options_);
    auto result = compositor.compose(broken, {"B04", "B08"});

    EXPECT_EQ(result.status, CompositeStatus::RASTER_IO);
    EXPECT_TRUE(work_is_empty());
}

TEST_F(BandCompositorTest, InMemoryStackHasNoWorkingFile) {
    options_.in_memory = true;
    BandCompositor compositor(options_);
    auto result = compositor.compose(scene_, {"B04", "B08"});

    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_TRUE(result.stack->working_file().empty());
    EXPECT_TRUE(work_is_empty());
}

TEST_F(BandCompositorTest, ChunkedCopyMatchesSource) {
    options_.rows_per_chunk = 5;
    BandCompositor compositor(options_);

    const std::vector<double> gt = {0.0, 1.0, 0.0, 24.0, 0.0, -1.0};
    Scene gradient = make_scene("GRADIENT", 0, 0, 1, 1, 0.0);
    gradient.assets["B01"] = write_band(dir_->file("gradient.tif"), 32, 24, gt, 3857,
                                        [](int col, int row) { return row * 100 + col; });

    auto result = compositor.compose(gradient, {"B01"});
    ASSERT_TRUE(result.ok()) << result.message;

    auto values = read_band(result.stack->dataset(), 1);
    EXPECT_DOUBLE_EQ(values[0], 0.0);
    EXPECT_DOUBLE_EQ(values[32 * 23 + 31], 2331.0);
    EXPECT_DOUBLE_EQ(values[32 * 7 + 3], 703.0);
}

} // namespace aoi::test
