/**
 * @file BatchRunner.hpp
 * @brief Runs the yearly orchestrator for every configured line
 *
 * Each line gets its own catalog client, asset signer and orchestrator;
 * only the configuration is shared between workers.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "aoi_composite.hpp"
#include "../core/AssetSigner.hpp"
#include "../core/Logger.hpp"
#include "../core/ProcessReport.hpp"
#include "../core/SceneCatalog.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace aoi {

/**
 * @brief Drives the batch of AOI runs described by a CompositeConfig
 *
 * Responsibilities:
 * - Validate the configuration before any line is touched
 * - Build per-line catalog and signer instances
 * - Run lines sequentially or on a bounded pool of worker threads
 * - Collect the run reports in configuration order
 */
class BatchRunner {
public:
    using CatalogFactory = std::function<std::unique_ptr<SceneCatalog>(const CompositeConfig&)>;
    using SignerFactory = std::function<std::unique_ptr<AssetSigner>(const CompositeConfig&)>;

    explicit BatchRunner(const CompositeConfig& config);

    /**
     * @brief Constructor with injected catalog and signer factories
     */
    BatchRunner(const CompositeConfig& config, CatalogFactory catalog_factory, SignerFactory signer_factory);

    ~BatchRunner();

    /**
     * @brief Check the configuration with InputValidator
     * @return false and logs the conflicts when the configuration is invalid
     */
    bool validate() const;

    /**
     * @brief Process every configured line
     * @return true if every line was set up successfully
     */
    bool run();

    const ProcessReport& report() const { return report_; }

    /**
     * @brief ItemFileCatalog when items_file is set, StacCatalogClient otherwise
     */
    static std::unique_ptr<SceneCatalog> make_catalog(const CompositeConfig& config);

    /**
     * @brief PlanetaryComputerSigner when sign_assets is set, PassthroughSigner otherwise
     */
    static std::unique_ptr<AssetSigner> make_signer(const CompositeConfig& config);

    /**
     * @brief Workers to start for a number of jobs (1 when sequential)
     */
    static size_t worker_count(const CompositeConfig& config, size_t job_count);

private:
    const CompositeConfig& config_;
    CatalogFactory catalog_factory_;
    SignerFactory signer_factory_;
    ProcessReport report_;
    Logger logger_;

    AoiRunReport run_job(const AoiJob& job) const;

    // Disable copy/move since we hold a reference
    BatchRunner(const BatchRunner&) = delete;
    BatchRunner& operator=(const BatchRunner&) = delete;
    BatchRunner(BatchRunner&&) = delete;
    BatchRunner& operator=(BatchRunner&&) = delete;
};

} // namespace aoi
