/**
 * @file ProcessReport.cpp
 * @brief Implementation of run reporting
 */

#include "ProcessReport.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace aoi {

std::string to_string(SceneStatus status) {
    switch (status) {
        case SceneStatus::PERSISTED: return "persisted";
        case SceneStatus::SIGN_FAILED: return "sign failed";
        case SceneStatus::MISSING_BAND: return "missing band";
        case SceneStatus::EMPTY_RESULT: return "empty after clipping";
        case SceneStatus::RASTER_IO: return "raster I/O error";
    }
    return "unknown";
}

std::string to_string(WindowOutcome outcome) {
    switch (outcome) {
        case WindowOutcome::PROCESSED: return "processed";
        case WindowOutcome::NO_SCENES: return "no scenes";
        case WindowOutcome::NO_SELECTION: return "no selection";
        case WindowOutcome::SEARCH_FAILED: return "search failed";
    }
    return "unknown";
}

size_t WindowReport::persisted_count() const {
    return std::count_if(scenes.begin(), scenes.end(),
                         [](const SceneOutcome& s) { return s.status == SceneStatus::PERSISTED; });
}

std::vector<std::string> AoiRunReport::output_files() const {
    std::vector<std::string> files;
    for (const auto& window : windows) {
        for (const auto& scene : window.scenes) {
            if (scene.status == SceneStatus::PERSISTED) {
                files.push_back(scene.output_file);
            }
        }
    }
    return files;
}

size_t AoiRunReport::persisted_count() const {
    size_t total = 0;
    for (const auto& window : windows) {
        total += window.persisted_count();
    }
    return total;
}

size_t AoiRunReport::count(WindowOutcome outcome) const {
    return std::count_if(windows.begin(), windows.end(),
                         [outcome](const WindowReport& w) { return w.outcome == outcome; });
}

size_t AoiRunReport::count(SceneStatus status) const {
    size_t total = 0;
    for (const auto& window : windows) {
        total += std::count_if(window.scenes.begin(), window.scenes.end(),
                               [status](const SceneOutcome& s) { return s.status == status; });
    }
    return total;
}

std::string AoiRunReport::summary() const {
    std::ostringstream oss;
    oss << name << " (index " << index << ")";
    if (!setup_ok) {
        oss << ": setup failed: " << setup_error;
        return oss.str();
    }

    size_t attempted = 0;
    for (const auto& window : windows) {
        attempted += window.scenes.size();
    }

    oss << " line " << line_id << ": "
        << windows.size() << " windows ("
        << count(WindowOutcome::PROCESSED) << " processed, "
        << count(WindowOutcome::SEARCH_FAILED) << " skipped), "
        << persisted_count() << "/" << attempted << " scenes saved";
    return oss.str();
}

// ============================================================================
// ProcessReport
// ============================================================================

ProcessReport::ProcessReport()
    : verbose_(false), start_time_(std::chrono::system_clock::now()), logger_("ProcessReport") {
}

ProcessReport::ProcessReport(bool verbose)
    : verbose_(verbose), start_time_(std::chrono::system_clock::now()), logger_("ProcessReport") {
}

void ProcessReport::add(AoiRunReport report) {
    runs_.push_back(std::move(report));
}

size_t ProcessReport::failed_run_count() const {
    return std::count_if(runs_.begin(), runs_.end(),
                         [](const AoiRunReport& r) { return !r.setup_ok; });
}

size_t ProcessReport::persisted_count() const {
    size_t total = 0;
    for (const auto& run : runs_) {
        total += run.persisted_count();
    }
    return total;
}

std::vector<std::string> ProcessReport::output_files() const {
    std::vector<std::string> files;
    for (const auto& run : runs_) {
        auto run_files = run.output_files();
        files.insert(files.end(), run_files.begin(), run_files.end());
    }
    return files;
}

void ProcessReport::printSummary() const {
    auto total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now() - start_time_);

    std::ostringstream summary;
    summary << "\n=== Composite Run Summary ===\n";
    for (const auto& run : runs_) {
        summary << "  " << run.summary() << "\n";
    }
    summary << "AOIs: " << (runs_.size() - failed_run_count()) << "/" << runs_.size()
            << " completed, " << persisted_count() << " files saved\n";
    summary << "Total time: " << formatDuration(total_time) << "\n";
    summary << "=============================";
    logger_.info(summary.str());
}

void ProcessReport::printDetailedReport() const {
    std::ostringstream report;
    report << "\n=== Detailed Run Report ===\n";

    for (const auto& run : runs_) {
        report << "\n" << run.summary() << "\n";
        if (!run.process_log.empty()) {
            report << "  log: " << run.process_log << "\n";
        }
        for (const auto& window : run.windows) {
            report << "  " << window.year << " [" << formatDuration(window.duration()) << "] "
                   << to_string(window.outcome);
            if (window.outcome == WindowOutcome::SEARCH_FAILED) {
                report << ": " << window.error_message;
            } else if (window.outcome == WindowOutcome::PROCESSED) {
                report << ", " << window.candidate_count << " candidates, coverage "
                       << std::fixed << std::setprecision(1) << window.coverage * 100.0 << "%"
                       << (window.complete_coverage ? " (complete)" : "");
            }
            report << "\n";

            for (const auto& scene : window.scenes) {
                report << "    img" << scene.scene_number << " " << scene.scene_id
                       << " " << scene.capture_date << ": " << to_string(scene.status);
                if (scene.status == SceneStatus::PERSISTED) {
                    report << " -> " << scene.output_file;
                } else if (!scene.message.empty()) {
                    report << " (" << scene.message << ")";
                }
                report << "\n";
            }
        }
    }

    report << "===========================";
    logger_.info(report.str());
}

std::string ProcessReport::formatDuration(std::chrono::milliseconds duration) {
    auto ms = duration.count();
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    }
    std::ostringstream oss;
    if (ms < 60000) {
        oss << std::fixed << std::setprecision(1) << ms / 1000.0 << "s";
    } else {
        oss << ms / 60000 << "m " << (ms % 60000) / 1000 << "s";
    }
    return oss.str();
}

} // namespace aoi
