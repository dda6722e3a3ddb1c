/**
 * @file Logger.hpp
 * @brief Centralized logging with verbosity control and optional file sink
 *
 * Every component logs through a Logger named after itself (its facility).
 * Per-AOI process logs are Loggers whose file sink is the AOI's
 * process_log{index}.txt.
 */

#pragma once

#include <iostream>
#include <fstream>
#include <memory>
#include <string>
#include <optional>
#include <mutex>
#include <cstdlib>
#include <unordered_map>

namespace aoi {

/**
 * @brief Log levels
 *
 * Level 1: Errors (disrupts execution)
 * Level 2: Warnings (scene or window skipped)
 * Level 3: Information (selection decisions, saved files)
 * Level 4: Detailed information (codepath execution)
 * Level 5: Basic debugging (objects, methods)
 * Level 6: Detailed debugging (variable values)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

/**
 * @brief Logger with a single point of output control
 *
 * Repeated identical messages are folded into one line followed by a
 * "previous message occurred N times" summary, unless folding is turned
 * off with setRepeatFolding(false).
 */
class Logger {
public:
    Logger();

    /**
     * @brief Constructor with component name (uses default WARNING level)
     * @param component_name Facility name used for facility-specific levels
     */
    Logger(const std::string& component_name);

    /**
     * @brief Constructor with specified log level and optional file output
     * @param level Initial log level
     * @param log_file Optional path to log file (appends if exists)
     */
    Logger(LogLevel level, const std::optional<std::string>& log_file = std::nullopt);

    /**
     * @brief Constructor for a facility logger that also writes to a file
     * @param component_name Facility name
     * @param log_file Path to log file
     * @param truncate Start the file empty instead of appending
     */
    Logger(const std::string& component_name, const std::string& log_file, bool truncate);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Output a message if it meets the current verbosity level
     * @param level Level of this message
     * @param message Message to output
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) { current_level_ = level; }
    LogLevel getLogLevel() const { return current_level_; }

    /**
     * @brief Write every message, identical or not, when folding is off
     */
    void setRepeatFolding(bool enabled);
    bool repeatFolding() const { return fold_repeats_; }

    /**
     * @brief Set or change the log file
     * @param log_file Path to log file, or nullopt to disable file logging
     * @param truncate Start the file empty instead of appending
     */
    void setLogFile(const std::optional<std::string>& log_file, bool truncate = false);

    /**
     * @brief True when a file sink is open
     */
    bool hasLogFile() const;

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const {
        outputMessage(LogLevel::ERROR, message);
    }

    void warning(const std::string& message) const {
        outputMessage(LogLevel::WARNING, message);
    }

    void warn(const std::string& message) const {
        warning(message);
    }

    void info(const std::string& message) const {
        outputMessage(LogLevel::INFO, message);
    }

    void detailed(const std::string& message) const {
        outputMessage(LogLevel::DETAILED, message);
    }

    void debug(const std::string& message) const {
        outputMessage(LogLevel::DEBUG, message);
    }

    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Flush console and file output, emitting any pending repeat summary
     */
    void flush() const;

    // ========================================================================
    // Facility-based logging control
    // ========================================================================

    /**
     * @brief Set log level for a specific facility (component)
     *
     * @example
     * Logger::setFacilityLevel("StacCatalogClient", LogLevel::TRACE);
     */
    static void setFacilityLevel(const std::string& facility, LogLevel level);

    /**
     * @brief Set default log level for all facilities
     */
    static void setDefaultLevel(LogLevel level);

    /**
     * @brief Facility-specific level if set, otherwise the default level
     */
    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply log configuration from string
     *
     * Supports:
     * - Simple level: "5" sets default to DEBUG
     * - Facility-specific: "AoiClipper=6,CoverageSelector=3"
     * - Mixed: "4,StacCatalogClient=6"
     * - "default=N" sets the default level
     */
    static void parseLogConfig(const std::string& config);

    static void clearFacilityLevels();

    /**
     * @brief Facility level, then instance level, then global default
     */
    LogLevel getEffectiveLevel() const;

private:
    LogLevel current_level_;
    std::string component_name_;
    std::optional<std::string> log_file_path_;
    std::shared_ptr<std::ofstream> file_stream_;
    mutable std::mutex output_mutex_;

    // Message deduplication state
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;
    bool fold_repeats_ = true;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::mutex registry_mutex_;

    void initializeFileStream(bool truncate);

    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace aoi
