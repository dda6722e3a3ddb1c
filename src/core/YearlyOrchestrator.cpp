/**
 * @file YearlyOrchestrator.cpp
 * @brief Implementation of the per-AOI yearly processing loop
 */

#include "YearlyOrchestrator.hpp"
#include "Logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace aoi {

int current_year() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    return tm.tm_year + 1900;
}

DateInterval observation_window(int year) {
    return DateInterval{
        std::to_string(year) + "-07-01T00:00:00Z",
        std::to_string(year + 1) + "-06-30T23:59:59Z"
    };
}

namespace {

CoverageSelector::Options selector_options(const CompositeConfig& config) {
    CoverageSelector::Options options;
    options.marginal_gain_threshold = config.marginal_gain_threshold;
    options.target_coverage = config.target_coverage;
    return options;
}

BandCompositor::Options compositor_options(const CompositeConfig& config) {
    BandCompositor::Options options;
    options.working_directory = config.working_directory;
    options.in_memory = config.composite_in_memory;
    return options;
}

AoiSource::Options source_options(const CompositeConfig& config) {
    AoiSource::Options options;
    options.aoi_file = config.aoi_file;
    options.buffer_file = config.buffer_file;
    options.line_id_attribute = config.line_id_attribute;
    options.buffer_id_attribute = config.buffer_id_attribute;
    options.nested_properties_key = config.nested_properties_key;
    options.missing_line_id = config.missing_line_id;
    options.buffer_distance_m = config.buffer_distance_m;
    return options;
}

std::string percent(double fraction) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << fraction * 100.0 << "%";
    return out.str();
}

} // namespace

YearlyOrchestrator::YearlyOrchestrator(const CompositeConfig& config, SceneCatalog& catalog,
                                       AssetSigner& signer)
    : config_(config),
      catalog_(catalog),
      signer_(signer),
      selector_(selector_options(config)),
      compositor_(compositor_options(config)),
      clipper_(),
      writer_(),
      source_(source_options(config)),
      state_(State::INIT) {
}

std::string YearlyOrchestrator::output_filename(int year, const std::string& capture_date, int scene_number) {
    return "composite_" + std::to_string(year) + "_" + capture_date + "_img" +
           std::to_string(scene_number) + ".tif";
}

std::string YearlyOrchestrator::process_log_filename(int index) {
    return "process_log" + std::to_string(index) + ".txt";
}

std::string YearlyOrchestrator::to_string(State state) {
    switch (state) {
        case State::INIT: return "INIT";
        case State::SEARCHING_WINDOW: return "SEARCHING_WINDOW";
        case State::SELECTING: return "SELECTING";
        case State::FETCHING: return "FETCHING";
        case State::COMPOSITING: return "COMPOSITING";
        case State::CLIPPING: return "CLIPPING";
        case State::PERSISTED: return "PERSISTED";
        case State::NEXT_WINDOW: return "NEXT_WINDOW";
        case State::SKIPPED_WINDOW: return "SKIPPED_WINDOW";
        case State::TERMINAL: return "TERMINAL";
    }
    return "UNKNOWN";
}

void YearlyOrchestrator::transition(State next) {
    Logger logger("YearlyOrchestrator");
    logger.trace("State " + to_string(state_) + " -> " + to_string(next));
    state_ = next;
}

AoiRunReport YearlyOrchestrator::run(const AoiJob& job) {
    Logger logger("YearlyOrchestrator");
    state_ = State::INIT;

    AoiRunReport report;
    report.name = job.name;
    report.index = job.index;

    std::filesystem::path output_dir(config_.output_directory);
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        report.setup_error = "Cannot create output directory " + output_dir.string() + ": " + ec.message();
        logger.error(report.setup_error);
        transition(State::TERMINAL);
        report.end_time = std::chrono::system_clock::now();
        return report;
    }

    // Narrative log of this AOI, started fresh on every run
    report.process_log = (output_dir / process_log_filename(job.index)).string();
    Logger log("ProcessLog", report.process_log, true);
    log.setLogLevel(LogLevel::INFO);
    log.setRepeatFolding(false);

    auto finish_setup_failure = [&](const std::string& message) {
        report.setup_error = message;
        log.error(message);
        transition(State::TERMINAL);
        report.end_time = std::chrono::system_clock::now();
        return std::move(report);
    };

    auto area = source_.load_area(job.index);
    if (!area) {
        return finish_setup_failure(source_.last_error());
    }
    report.line_id = area->line_id;
    log.info("Processing AOI with ID: " + area->line_id);

    std::filesystem::path clip_folder = output_dir / area->line_id;
    std::filesystem::create_directories(clip_folder, ec);
    if (ec) {
        return finish_setup_failure("Cannot create output folder " + clip_folder.string() + ": " + ec.message());
    }

    auto mask = source_.load_mask(area->line_id);
    if (!mask) {
        return finish_setup_failure(source_.last_error());
    }
    report.setup_ok = true;

    const int end_year = config_.end_year.value_or(current_year());
    for (int year = config_.start_year; year <= end_year; ++year) {
        report.windows.push_back(process_window(year, *area, *mask, clip_folder, log));
    }

    log.info("Download and clipping process completed.");
    transition(State::TERMINAL);
    report.end_time = std::chrono::system_clock::now();

    logger.detailed(report.summary());
    return report;
}

WindowReport YearlyOrchestrator::process_window(int year, const AreaOfInterest& area, const AoiMask& mask,
                                                const std::filesystem::path& clip_folder, const Logger& log) {
    WindowReport window(year);

    transition(State::SEARCHING_WINDOW);
    log.info("Searching images for " + std::to_string(year));

    SearchRequest request;
    request.intersects_geojson = area.geojson();
    request.interval = observation_window(year);
    request.collection = config_.collection;
    request.cloud_cover_field = config_.cloud_cover_field;
    request.max_cloud_cover = config_.max_cloud_cover;

    std::vector<Scene> scenes;
    try {
        scenes = catalog_.search(request);
    } catch (const std::exception& e) {
        // Any search failure skips this window only
        log.error("Search error for " + std::to_string(year) + ": " + e.what());
        window.error_message = e.what();
        transition(State::SKIPPED_WINDOW);
        window.complete(WindowOutcome::SEARCH_FAILED);
        return window;
    }

    window.candidate_count = scenes.size();
    if (scenes.empty()) {
        log.info("No images found for " + std::to_string(year));
        transition(State::NEXT_WINDOW);
        window.complete(WindowOutcome::NO_SCENES);
        return window;
    }
    log.info("Found " + std::to_string(scenes.size()) + " images for " + std::to_string(year));

    transition(State::SELECTING);
    SelectionResult selection = selector_.select(area.geometry.get(), scenes);
    if (selection.empty()) {
        log.info("No suitable images found for " + std::to_string(year));
        transition(State::NEXT_WINDOW);
        window.complete(WindowOutcome::NO_SELECTION);
        return window;
    }

    window.coverage = selection.coverage;
    window.complete_coverage = selection.complete_coverage;
    for (size_t i = 1; i < selection.marginal_gains.size(); ++i) {
        log.info("Added image for additional " + percent(selection.marginal_gains[i]) + " coverage");
    }
    for (const auto& skipped : selection.skipped) {
        log.info("Skipped image " + skipped.scene_id + " adding only " + percent(skipped.gain) + " coverage");
    }

    for (size_t i = 0; i < selection.scenes.size(); ++i) {
        const int scene_number = static_cast<int>(i) + 1;
        try {
            window.scenes.push_back(process_scene(year, scene_number, selection.scenes[i],
                                                  mask, clip_folder, log));
        } catch (const std::exception& e) {
            SceneOutcome failed;
            failed.scene_number = scene_number;
            failed.scene_id = selection.scenes[i].id;
            failed.capture_date = selection.scenes[i].capture_date();
            failed.status = SceneStatus::RASTER_IO;
            failed.message = e.what();
            log.error("Error processing image " + std::to_string(scene_number) + " for " +
                      std::to_string(year) + ": " + e.what());
            window.scenes.push_back(std::move(failed));
        }
    }

    transition(State::NEXT_WINDOW);
    window.complete(WindowOutcome::PROCESSED);
    return window;
}

SceneOutcome YearlyOrchestrator::process_scene(int year, int scene_number, const Scene& scene,
                                               const AoiMask& mask, const std::filesystem::path& clip_folder,
                                               const Logger& log) {
    const std::string image = std::to_string(scene_number);
    const std::string y = std::to_string(year);

    SceneOutcome outcome;
    outcome.scene_number = scene_number;
    outcome.scene_id = scene.id;
    outcome.capture_date = scene.capture_date();

    auto report_error = [&](SceneStatus status, const std::string& message) {
        outcome.status = status;
        outcome.message = message;
        log.error("Error processing image " + image + " for " + y + ": " + message);
        return outcome;
    };

    transition(State::FETCHING);
    auto signed_scene = signer_.sign(scene);
    if (!signed_scene) {
        return report_error(SceneStatus::SIGN_FAILED, "could not sign assets of " + scene.id);
    }

    transition(State::COMPOSITING);
    CompositeResult composite = compositor_.compose(*signed_scene, config_.bands);
    if (composite.status == CompositeStatus::MISSING_BAND) {
        outcome.status = SceneStatus::MISSING_BAND;
        outcome.message = composite.message;
        log.warning("Missing bands for image " + image + " in " + y);
        return outcome;
    }
    if (!composite.ok()) {
        return report_error(SceneStatus::RASTER_IO, composite.message);
    }
    log.info("Composite image created for " + y + " image " + image);

    transition(State::CLIPPING);
    ClipResult clip = clipper_.clip(*composite.stack, mask);
    if (clip.status == ClipStatus::EMPTY_RESULT) {
        outcome.status = SceneStatus::EMPTY_RESULT;
        outcome.message = clip.message;
        log.info("No data after clipping image " + image + " for " + y);
        return outcome;
    }
    if (!clip.ok()) {
        return report_error(SceneStatus::RASTER_IO, clip.message);
    }

    std::string out_name = output_filename(year, outcome.capture_date, scene_number);
    std::filesystem::path out_path = clip_folder / out_name;
    if (!writer_.write(clip.raster->dataset.get(), out_path.string())) {
        return report_error(SceneStatus::RASTER_IO, writer_.last_error());
    }

    transition(State::PERSISTED);
    outcome.status = SceneStatus::PERSISTED;
    outcome.output_file = out_path.string();
    std::error_code ec;
    auto size = std::filesystem::file_size(out_path, ec);
    outcome.file_size_bytes = ec ? 0 : static_cast<size_t>(size);

    log.info("Saved clipped image: " + out_name);
    return outcome;
}

} // namespace aoi
