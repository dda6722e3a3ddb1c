/**
 * @file CoverageSelector.cpp
 * @brief Implementation of the greedy coverage selection
 */

#include "CoverageSelector.hpp"
#include "GeometryUtils.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <sstream>
#include <iomanip>

namespace aoi {

namespace {

struct CoverageRecord {
    size_t scene_index;
    double coverage;
};

std::string percent(double fraction) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << fraction * 100.0 << "%";
    return out.str();
}

} // namespace

CoverageSelector::CoverageSelector() : options_() {
}

CoverageSelector::CoverageSelector(const Options& options) : options_(options) {
}

SelectionResult CoverageSelector::select(const OGRGeometry* aoi, const std::vector<Scene>& scenes) const {
    Logger logger("CoverageSelector");

    if (scenes.empty() || geometry::area(aoi) <= 0.0) {
        return SelectionResult();
    }

    SelectionResult complete = select_complete(aoi, scenes);
    if (!complete.empty()) {
        logger.debug("Scene " + complete.scenes.front().id + " covers the AOI completely");
        return complete;
    }

    return select_partial(aoi, scenes);
}

SelectionResult CoverageSelector::select_complete(const OGRGeometry* aoi, const std::vector<Scene>& scenes) const {
    const Scene* best = nullptr;
    for (const auto& scene : scenes) {
        if (!geometry::within(aoi, scene.footprint.get())) {
            continue;
        }
        // Strict comparison keeps the earliest scene on ties
        if (!best || scene.cloud_cover < best->cloud_cover) {
            best = &scene;
        }
    }

    SelectionResult result;
    if (best) {
        result.scenes.push_back(*best);
        result.marginal_gains.push_back(1.0);
        result.coverage = 1.0;
        result.complete_coverage = true;
    }
    return result;
}

SelectionResult CoverageSelector::select_partial(const OGRGeometry* aoi, const std::vector<Scene>& scenes) const {
    Logger logger("CoverageSelector");
    SelectionResult result;

    std::vector<CoverageRecord> candidates;
    for (size_t i = 0; i < scenes.size(); ++i) {
        double coverage = geometry::coverage_fraction(scenes[i].footprint.get(), aoi);
        if (coverage > 0.0) {
            candidates.push_back({i, coverage});
        }
        logger.trace("Scene " + scenes[i].id + " covers " + percent(coverage));
    }

    if (candidates.empty()) {
        return result;
    }

    std::stable_sort(candidates.begin(), candidates.end(),
        [&scenes](const CoverageRecord& a, const CoverageRecord& b) {
            if (a.coverage != b.coverage) {
                return a.coverage > b.coverage;
            }
            return scenes[a.scene_index].cloud_cover < scenes[b.scene_index].cloud_cover;
        });

    const Scene& seed = scenes[candidates.front().scene_index];
    OGRGeometryUniquePtr accumulated = geometry::intersection(seed.footprint.get(), aoi);
    result.coverage = geometry::area_ratio(accumulated.get(), aoi);
    result.scenes.push_back(seed);
    result.marginal_gains.push_back(result.coverage);

    for (size_t c = 1; c < candidates.size(); ++c) {
        if (result.coverage > options_.target_coverage) {
            break;
        }

        const Scene& candidate = scenes[candidates[c].scene_index];
        auto contribution = geometry::intersection(candidate.footprint.get(), aoi);
        auto merged = geometry::union_of(accumulated.get(), contribution.get());
        double merged_coverage = geometry::area_ratio(merged.get(), aoi);
        double gain = merged_coverage - result.coverage;

        if (gain > options_.marginal_gain_threshold) {
            result.scenes.push_back(candidate);
            result.marginal_gains.push_back(gain);
            result.coverage = merged_coverage;
            accumulated = std::move(merged);
        } else {
            logger.trace("Skipping scene " + candidate.id + " adding only " + percent(gain));
            result.skipped.push_back({candidate.id, gain});
        }
    }

    logger.debug("Selected " + std::to_string(result.scenes.size()) + " partial scenes covering " +
                 percent(result.coverage));
    return result;
}

} // namespace aoi
