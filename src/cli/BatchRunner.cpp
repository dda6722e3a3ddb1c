/**
 * @file BatchRunner.cpp
 * @brief Implementation of batch orchestration over all configured lines
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "BatchRunner.hpp"
#include "../core/InputValidator.hpp"
#include "../core/ItemFileCatalog.hpp"
#include "../core/StacCatalogClient.hpp"
#include "../core/YearlyOrchestrator.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

namespace aoi {

BatchRunner::BatchRunner(const CompositeConfig& config)
    : BatchRunner(config, &BatchRunner::make_catalog, &BatchRunner::make_signer) {
}

BatchRunner::BatchRunner(const CompositeConfig& config, CatalogFactory catalog_factory,
                         SignerFactory signer_factory)
    : config_(config)
    , catalog_factory_(std::move(catalog_factory))
    , signer_factory_(std::move(signer_factory))
    , report_(config.log_level >= 4)
    , logger_("BatchRunner")
{
    if (config_.log_file) {
        logger_.setLogFile(config_.log_file);
    }
    logger_.debug("Batch runner initialized for " + std::to_string(config_.lines.size()) + " line(s)");
}

BatchRunner::~BatchRunner() = default;

std::unique_ptr<SceneCatalog> BatchRunner::make_catalog(const CompositeConfig& config) {
    if (config.items_file) {
        return std::make_unique<ItemFileCatalog>(*config.items_file);
    }

    StacCatalogClient::Options options;
    options.api_url = config.catalog_url;
    options.page_limit = config.page_limit;
    options.max_pages = config.max_pages;
    options.timeout_seconds = config.timeout_seconds;
    return std::make_unique<StacCatalogClient>(options);
}

std::unique_ptr<AssetSigner> BatchRunner::make_signer(const CompositeConfig& config) {
    if (!config.sign_assets) {
        return std::make_unique<PassthroughSigner>();
    }

    PlanetaryComputerSigner::Options options;
    options.sas_url = config.sas_url;
    options.timeout_seconds = config.timeout_seconds;
    return std::make_unique<PlanetaryComputerSigner>(options);
}

size_t BatchRunner::worker_count(const CompositeConfig& config, size_t job_count) {
    if (!config.parallel_processing || job_count <= 1) {
        return 1;
    }

    size_t threads = config.num_threads > 0
        ? static_cast<size_t>(config.num_threads)
        : static_cast<size_t>(std::thread::hardware_concurrency());
    return std::clamp<size_t>(threads, 1, job_count);
}

bool BatchRunner::validate() const {
    InputValidator validator;
    auto validation_result = validator.validate(config_);

    if (validation_result.has_errors()) {
        logger_.error(validation_result.format_error_message());
        return false;
    }
    return true;
}

AoiRunReport BatchRunner::run_job(const AoiJob& job) const {
    try {
        auto catalog = catalog_factory_(config_);
        auto signer = signer_factory_(config_);

        YearlyOrchestrator orchestrator(config_, *catalog, *signer);
        return orchestrator.run(job);
    } catch (const std::exception& e) {
        AoiRunReport failed;
        failed.name = job.name;
        failed.index = job.index;
        failed.setup_error = std::string("Line aborted: ") + e.what();
        failed.end_time = std::chrono::system_clock::now();
        logger_.error("Line " + job.name + " (feature " + std::to_string(job.index) + "): " +
                      failed.setup_error);
        return failed;
    }
}

bool BatchRunner::run() {
    if (!validate()) {
        return false;
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    const auto& jobs = config_.lines;
    std::vector<AoiRunReport> results(jobs.size());
    size_t workers = worker_count(config_, jobs.size());

    if (workers == 1) {
        for (size_t i = 0; i < jobs.size(); ++i) {
            logger_.info("Starting line " + jobs[i].name + " (feature " + std::to_string(jobs[i].index) + ")");
            results[i] = run_job(jobs[i]);
        }
    } else {
        logger_.info("Processing " + std::to_string(jobs.size()) + " lines on " +
                     std::to_string(workers) + " threads");

        std::atomic<size_t> next_job{0};

        // run_job reports its own failures, one slot per line
        auto worker = [&]() {
            for (size_t i = next_job++; i < jobs.size(); i = next_job++) {
                results[i] = run_job(jobs[i]);
            }
        };

        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (size_t t = 0; t < workers; ++t) {
            pool.emplace_back(worker);
        }
        for (auto& thread : pool) {
            thread.join();
        }
    }

    for (auto& result : results) {
        report_.add(std::move(result));
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    size_t failed = report_.failed_run_count();
    logger_.info("Processed " + std::to_string(jobs.size()) + " line(s) in " +
                 std::to_string(duration.count()) + "ms: " +
                 std::to_string(report_.persisted_count()) + " image(s) saved" +
                 (failed > 0 ? ", " + std::to_string(failed) + " line(s) failed setup" : ""));

    return failed == 0;
}

} // namespace aoi
