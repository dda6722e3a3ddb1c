/**
 * @file YearlyOrchestrator.hpp
 * @brief Runs search, selection, compositing and clipping for one AOI over
 * every yearly observation window
 */

#pragma once

#include "aoi_composite.hpp"
#include "AoiClipper.hpp"
#include "AoiSource.hpp"
#include "AssetSigner.hpp"
#include "BandCompositor.hpp"
#include "CoverageSelector.hpp"
#include "ProcessReport.hpp"
#include "SceneCatalog.hpp"
#include "../export/GeoTIFFWriter.hpp"
#include <filesystem>
#include <string>

namespace aoi {

/**
 * @brief Per-AOI state machine
 *
 * INIT -> SEARCHING_WINDOW -> SELECTING -> FETCHING -> COMPOSITING ->
 * CLIPPING -> PERSISTED -> NEXT_WINDOW | SKIPPED_WINDOW -> TERMINAL
 *
 * The catalog and signer are borrowed for the lifetime of the orchestrator.
 * Catalog failures skip the window, per-scene failures skip the scene;
 * only setup failures end the run early.
 */
class YearlyOrchestrator {
public:
    enum class State {
        INIT,
        SEARCHING_WINDOW,
        SELECTING,
        FETCHING,
        COMPOSITING,
        CLIPPING,
        PERSISTED,
        NEXT_WINDOW,
        SKIPPED_WINDOW,
        TERMINAL
    };

    YearlyOrchestrator(const CompositeConfig& config, SceneCatalog& catalog, AssetSigner& signer);

    /**
     * @brief Process every window from the start year through the end year
     * @param job Line name and AOI feature index
     * @return Report; setup_ok is false when the AOI could not be prepared
     */
    AoiRunReport run(const AoiJob& job);

    State state() const { return state_; }

    /**
     * @brief composite_{year}_{date}_img{scene_number}.tif
     */
    static std::string output_filename(int year, const std::string& capture_date, int scene_number);

    /**
     * @brief process_log{index}.txt
     */
    static std::string process_log_filename(int index);

    static std::string to_string(State state);

private:
    const CompositeConfig& config_;
    SceneCatalog& catalog_;
    AssetSigner& signer_;
    CoverageSelector selector_;
    BandCompositor compositor_;
    AoiClipper clipper_;
    GeoTIFFWriter writer_;
    AoiSource source_;
    State state_;

    void transition(State next);

    WindowReport process_window(int year, const AreaOfInterest& area, const AoiMask& mask,
                                const std::filesystem::path& clip_folder, const Logger& log);

    SceneOutcome process_scene(int year, int scene_number, const Scene& scene, const AoiMask& mask,
                               const std::filesystem::path& clip_folder, const Logger& log);
};

} // namespace aoi
