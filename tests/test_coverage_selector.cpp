#include "core/CoverageSelector.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

namespace aoi::test {

class CoverageSelectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        aoi_ = rectangle(0, 0, 100, 100);
    }

    OGRGeometryUniquePtr aoi_;
    CoverageSelector selector_;
};

TEST_F(CoverageSelectorTest, DefaultThresholds) {
    EXPECT_DOUBLE_EQ(selector_.options().marginal_gain_threshold, 0.05);
    EXPECT_DOUBLE_EQ(selector_.options().target_coverage, 0.98);
}

TEST_F(CoverageSelectorTest, EmptyInputGivesEmptySelection) {
    auto result = selector_.select(aoi_.get(), {});
    EXPECT_TRUE(result.empty());
    EXPECT_DOUBLE_EQ(result.coverage, 0.0);
    EXPECT_FALSE(result.complete_coverage);
}

TEST_F(CoverageSelectorTest, DisjointScenesGiveEmptySelection) {
    std::vector<Scene> scenes = {
        make_scene("far-a", 200, 200, 300, 300, 1.0),
        make_scene("far-b", -50, -50, -10, -10, 2.0)
    };
    EXPECT_TRUE(selector_.select(aoi_.get(), scenes).empty());
}

TEST_F(CoverageSelectorTest, ZeroAreaAoiGivesEmptySelection) {
    OGRPolygon empty;
    std::vector<Scene> scenes = {make_scene("any", 0, 0, 100, 100, 1.0)};
    EXPECT_TRUE(selector_.select(&empty, scenes).empty());
}

// A complete scene beats a clearer partial one
TEST_F(CoverageSelectorTest, CompleteCoverageDominates) {
    auto small_aoi = rectangle(10, 10, 20, 20);
    std::vector<Scene> scenes = {
        make_scene("partial", 10, 10, 15, 20, 1.0),
        make_scene("complete", 0, 0, 30, 30, 3.0)
    };

    auto result = selector_.select(small_aoi.get(), scenes);
    ASSERT_EQ(result.scenes.size(), 1u);
    EXPECT_EQ(result.scenes[0].id, "complete");
    EXPECT_TRUE(result.complete_coverage);
    EXPECT_DOUBLE_EQ(result.coverage, 1.0);
    ASSERT_EQ(result.marginal_gains.size(), 1u);
    EXPECT_DOUBLE_EQ(result.marginal_gains[0], 1.0);
}

TEST_F(CoverageSelectorTest, LowestCloudCompleteSceneWins) {
    std::vector<Scene> scenes = {
        make_scene("cloudy", -10, -10, 110, 110, 8.0),
        make_scene("clear", -5, -5, 105, 105, 2.0),
        make_scene("hazy", -1, -1, 101, 101, 5.0)
    };

    auto result = selector_.select(aoi_.get(), scenes);
    ASSERT_EQ(result.scenes.size(), 1u);
    EXPECT_EQ(result.scenes[0].id, "clear");
}

TEST_F(CoverageSelectorTest, CompleteTieKeepsEarliestScene) {
    std::vector<Scene> scenes = {
        make_scene("first", -10, -10, 110, 110, 4.0),
        make_scene("second", -5, -5, 105, 105, 4.0)
    };

    auto result = selector_.select(aoi_.get(), scenes);
    ASSERT_EQ(result.scenes.size(), 1u);
    EXPECT_EQ(result.scenes[0].id, "first");
}

// Strips of 40%, 35% (32% new) and 4% (2% new): the last adds too little
TEST_F(CoverageSelectorTest, GreedyUnionStopsAtMarginalGain) {
    std::vector<Scene> scenes = {
        make_scene("sliver", 70, 0, 74, 100, 1.0),
        make_scene("west", 0, 0, 40, 100, 5.0),
        make_scene("middle", 37, 0, 72, 100, 2.0)
    };

    auto result = selector_.select(aoi_.get(), scenes);
    ASSERT_EQ(result.scenes.size(), 2u);
    EXPECT_EQ(result.scenes[0].id, "west");
    EXPECT_EQ(result.scenes[1].id, "middle");
    EXPECT_FALSE(result.complete_coverage);
    EXPECT_NEAR(result.coverage, 0.72, 1e-9);

    ASSERT_EQ(result.marginal_gains.size(), 2u);
    EXPECT_NEAR(result.marginal_gains[0], 0.40, 1e-9);
    EXPECT_NEAR(result.marginal_gains[1], 0.32, 1e-9);

    ASSERT_EQ(result.skipped.size(), 1u);
    EXPECT_EQ(result.skipped[0].scene_id, "sliver");
    EXPECT_NEAR(result.skipped[0].gain, 0.02, 1e-9);
}

TEST_F(CoverageSelectorTest, CompleteSelectionSkipsNothing) {
    std::vector<Scene> scenes = {
        make_scene("partial", 0, 0, 50, 100, 1.0),
        make_scene("complete", -1, -1, 101, 101, 3.0)
    };

    auto result = selector_.select(aoi_.get(), scenes);
    EXPECT_TRUE(result.complete_coverage);
    EXPECT_TRUE(result.skipped.empty());
}

TEST_F(CoverageSelectorTest, EqualCoverageOrderedByCloud) {
    std::vector<Scene> scenes = {
        make_scene("west-cloudy", 0, 0, 50, 100, 8.0),
        make_scene("east-clear", 50, 0, 100, 100, 2.0)
    };

    auto result = selector_.select(aoi_.get(), scenes);
    ASSERT_EQ(result.scenes.size(), 2u);
    EXPECT_EQ(result.scenes[0].id, "east-clear");
    EXPECT_EQ(result.scenes[1].id, "west-cloudy");
    EXPECT_NEAR(result.coverage, 1.0, 1e-9);
    // Union of partial scenes is never reported as complete coverage
    EXPECT_FALSE(result.complete_coverage);
}

TEST_F(CoverageSelectorTest, StopsOnceTargetExceeded) {
    CoverageSelector::Options options;
    options.target_coverage = 0.5;
    CoverageSelector selector(options);

    std::vector<Scene> scenes = {
        make_scene("big", 0, 0, 60, 100, 5.0),
        make_scene("rest", 60, 0, 100, 100, 1.0)
    };

    auto result = selector.select(aoi_.get(), scenes);
    ASSERT_EQ(result.scenes.size(), 1u);
    EXPECT_EQ(result.scenes[0].id, "big");
    EXPECT_NEAR(result.coverage, 0.6, 1e-9);

    auto full = selector_.select(aoi_.get(), scenes);
    EXPECT_EQ(full.scenes.size(), 2u);
}

TEST_F(CoverageSelectorTest, CoverageGrowsWithEverySelectedScene) {
    std::vector<Scene> scenes;
    for (int i = 0; i < 8; ++i) {
        double x = i * 12.0;
        scenes.push_back(make_scene("strip" + std::to_string(i), x, 0, x + 20, 100, i));
    }

    auto result = selector_.select(aoi_.get(), scenes);
    ASSERT_FALSE(result.empty());
    ASSERT_EQ(result.marginal_gains.size(), result.scenes.size());

    double running = 0.0;
    for (size_t i = 0; i < result.marginal_gains.size(); ++i) {
        if (i > 0) {
            EXPECT_GT(result.marginal_gains[i], kMarginalGainThreshold);
        }
        running += result.marginal_gains[i];
    }
    EXPECT_NEAR(running, result.coverage, 1e-9);
    EXPECT_LE(result.coverage, 1.0 + 1e-12);
    EXPECT_LE(result.scenes.size(), scenes.size());
}

TEST_F(CoverageSelectorTest, SelectionIsSubsetOfInput) {
    std::vector<Scene> scenes = {
        make_scene("a", 0, 0, 30, 100, 3.0),
        make_scene("b", 30, 0, 60, 100, 4.0),
        make_scene("c", 60, 0, 90, 100, 5.0)
    };

    auto result = selector_.select(aoi_.get(), scenes);
    for (const auto& chosen : result.scenes) {
        bool found = false;
        for (const auto& input : scenes) {
            found = found || input.id == chosen.id;
        }
        EXPECT_TRUE(found) << chosen.id;
    }
    EXPECT_EQ(result.scenes.size(), 3u);
    EXPECT_NEAR(result.coverage, 0.9, 1e-9);
}

} // namespace aoi::test
