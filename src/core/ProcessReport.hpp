/**
 * @file ProcessReport.hpp
 * @brief Records what happened to every window and scene of an AOI run
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "aoi_composite.hpp"
#include "Logger.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace aoi {

enum class SceneStatus {
    PERSISTED,
    SIGN_FAILED,
    MISSING_BAND,
    EMPTY_RESULT,
    RASTER_IO
};

enum class WindowOutcome {
    PROCESSED,       // a selection was made and its scenes attempted
    NO_SCENES,       // the catalog returned nothing
    NO_SELECTION,    // nothing intersected the AOI
    SEARCH_FAILED    // the catalog query failed; window skipped
};

std::string to_string(SceneStatus status);
std::string to_string(WindowOutcome outcome);

/**
 * @brief One selected scene and what became of it
 */
struct SceneOutcome {
    int scene_number = 0;          // 1-based position in the selection
    std::string scene_id;
    std::string capture_date;
    SceneStatus status = SceneStatus::RASTER_IO;
    std::string output_file;       // set when persisted
    size_t file_size_bytes = 0;
    std::string message;
};

/**
 * @brief One yearly observation window
 */
struct WindowReport {
    int year = 0;
    WindowOutcome outcome = WindowOutcome::NO_SCENES;
    size_t candidate_count = 0;
    double coverage = 0.0;
    bool complete_coverage = false;
    std::vector<SceneOutcome> scenes;
    std::string error_message;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;

    explicit WindowReport(int y)
        : year(y), start_time(std::chrono::system_clock::now()), end_time(start_time) {}

    void complete(WindowOutcome result) {
        outcome = result;
        end_time = std::chrono::system_clock::now();
    }

    std::chrono::milliseconds duration() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    }

    size_t persisted_count() const;
};

/**
 * @brief Everything one AOI run produced
 *
 * A run whose setup failed (missing input, bad index, no mask geometry)
 * has setup_ok false and no windows.
 */
struct AoiRunReport {
    std::string name;
    int index = 0;
    std::string line_id;
    bool setup_ok = false;
    std::string setup_error;
    std::string process_log;
    std::vector<WindowReport> windows;
    std::chrono::system_clock::time_point start_time = std::chrono::system_clock::now();
    std::chrono::system_clock::time_point end_time = start_time;

    std::vector<std::string> output_files() const;
    size_t persisted_count() const;
    size_t count(WindowOutcome outcome) const;
    size_t count(SceneStatus status) const;

    /**
     * @brief One-line summary: windows, scenes, files
     */
    std::string summary() const;
};

/**
 * @brief Collects the AOI run reports of a batch and prints them
 */
class ProcessReport {
public:
    ProcessReport();
    explicit ProcessReport(bool verbose);

    void add(AoiRunReport report);

    const std::vector<AoiRunReport>& runs() const { return runs_; }

    size_t failed_run_count() const;
    size_t persisted_count() const;
    std::vector<std::string> output_files() const;

    void printSummary() const;
    void printDetailedReport() const;

    void setVerbose(bool verbose) { verbose_ = verbose; }
    bool isVerbose() const { return verbose_; }

private:
    bool verbose_;
    std::vector<AoiRunReport> runs_;
    std::chrono::system_clock::time_point start_time_;
    mutable Logger logger_;

    static std::string formatDuration(std::chrono::milliseconds duration);
};

} // namespace aoi
