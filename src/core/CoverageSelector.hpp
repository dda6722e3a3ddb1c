/**
 * @file CoverageSelector.hpp
 * @brief Chooses the smallest low-cloud set of scenes covering an AOI
 */

#pragma once

#include "aoi_composite.hpp"
#include <string>
#include <vector>

namespace aoi {

// Minimum coverage a partial scene must add to be selected
constexpr double kMarginalGainThreshold = 0.05;

// Coverage ratio beyond which no further scenes are considered
constexpr double kTargetCoverage = 0.98;

// Partial scene that was considered but added too little coverage
struct SkippedScene {
    std::string scene_id;
    double gain = 0.0;
};

/**
 * @brief Outcome of one selection
 *
 * marginal_gains[i] is the AOI fraction scenes[i] added; for the first
 * scene it is its own coverage. skipped lists the partial scenes rejected
 * by the marginal gain threshold, in the order they were considered.
 * An empty result is valid.
 */
struct SelectionResult {
    std::vector<Scene> scenes;
    std::vector<double> marginal_gains;
    std::vector<SkippedScene> skipped;
    double coverage = 0.0;
    bool complete_coverage = false;

    bool empty() const { return scenes.empty(); }
};

/**
 * @brief Greedy coverage selection
 *
 * A scene whose footprint contains the AOI wins outright (lowest cloud
 * cover, catalog order on ties). Otherwise partial scenes are ranked by
 * coverage descending then cloud cover ascending, and accepted in that
 * order while each adds more than the marginal gain threshold, until the
 * accumulated coverage exceeds the target.
 */
class CoverageSelector {
public:
    struct Options {
        double marginal_gain_threshold;
        double target_coverage;

        Options()
            : marginal_gain_threshold(kMarginalGainThreshold),
              target_coverage(kTargetCoverage) {}
    };

    CoverageSelector();
    explicit CoverageSelector(const Options& options);

    SelectionResult select(const OGRGeometry* aoi, const std::vector<Scene>& scenes) const;

    const Options& options() const { return options_; }

private:
    Options options_;

    SelectionResult select_complete(const OGRGeometry* aoi, const std::vector<Scene>& scenes) const;
    SelectionResult select_partial(const OGRGeometry* aoi, const std::vector<Scene>& scenes) const;
};

} // namespace aoi
