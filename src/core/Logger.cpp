/**
 * @file Logger.cpp
 * @brief Implementation of centralized logging system
 */

#include "Logger.hpp"
#include <iostream>
#include <filesystem>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <sstream>
#include <algorithm>

namespace aoi {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::mutex Logger::registry_mutex_;

namespace {

std::string trim(const std::string& value) {
    auto first = value.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    auto last = value.find_last_not_of(" \t\n\r");
    return value.substr(first, last - first + 1);
}

std::string level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARNING: return "WARN ";
        case LogLevel::INFO: return "INFO ";
        case LogLevel::DETAILED: return "DETL ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "     ";
}

} // namespace

Logger::Logger() : current_level_(LogLevel::WARNING), component_name_(""),
                   last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
}

Logger::Logger(const std::string& component_name)
    : current_level_(LogLevel::WARNING), component_name_(component_name),
      last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
}

Logger::Logger(LogLevel level, const std::optional<std::string>& log_file)
    : current_level_(level), component_name_(""), log_file_path_(log_file),
      last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
    if (log_file.has_value()) {
        initializeFileStream(false);
    }
}

Logger::Logger(const std::string& component_name, const std::string& log_file, bool truncate)
    : current_level_(LogLevel::WARNING), component_name_(component_name), log_file_path_(log_file),
      last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
    initializeFileStream(truncate);
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }

    std::cout.flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (static_cast<int>(level) <= static_cast<int>(getEffectiveLevel())) {

        if (fold_repeats_ && has_last_message_ && message == last_message_ && level == last_level_) {
            repeat_count_++;
            return;
        }

        if (has_last_message_ && repeat_count_ > 0) {
            doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        }

        doOutput(level, message);

        last_message_ = message;
        last_level_ = level;
        repeat_count_ = 0;
        has_last_message_ = true;
    }
}

void Logger::setRepeatFolding(bool enabled) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (!enabled && has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }
    fold_repeats_ = enabled;
}

void Logger::setLogFile(const std::optional<std::string>& log_file, bool truncate) {
    std::lock_guard<std::mutex> lock(output_mutex_);

    log_file_path_ = log_file;

    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }

    if (log_file.has_value()) {
        initializeFileStream(truncate);
    }
}

bool Logger::hasLogFile() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    return file_stream_ && file_stream_->is_open();
}

void Logger::initializeFileStream(bool truncate) {
    try {
        if (log_file_path_.has_value()) {
            std::filesystem::path log_path(log_file_path_.value());
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }

            file_stream_ = std::make_shared<std::ofstream>(
                log_file_path_.value(),
                truncate ? std::ios::trunc : std::ios::app
            );

            if (!file_stream_->is_open()) {
                // Not through outputMessage: the file sink is what failed
                std::cerr << "Warning: Failed to open log file: " << log_file_path_.value() << std::endl;
                file_stream_.reset();
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Warning: Exception opening log file: " << e.what() << std::endl;
        file_stream_.reset();
    }
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time_t, &tm);
    char timestamp[32];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d",
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()));

    std::cout << "[" << timestamp << "] " << level_tag(level) << " " << message << std::endl;

    // The file sink receives the bare message so process logs read as a narrative
    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << message << std::endl;
        file_stream_->flush();
    }
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }

    std::cout.flush();

    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

// ============================================================================
// Facility-based logging implementation
// ============================================================================

void Logger::setFacilityLevel(const std::string& facility, LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_[facility] = level;
}

void Logger::setDefaultLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_level_ = level;
}

LogLevel Logger::getFacilityLevel(const std::string& facility) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto it = facility_levels_.find(facility);
    if (it != facility_levels_.end()) {
        return it->second;
    }

    return default_level_;
}

void Logger::parseLogConfig(const std::string& config) {
    if (config.empty()) return;

    std::lock_guard<std::mutex> lock(registry_mutex_);

    std::stringstream ss(config);
    std::string token;

    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        size_t equals_pos = token.find('=');
        std::string facility = "default";
        std::string level_str = token;
        if (equals_pos != std::string::npos) {
            facility = trim(token.substr(0, equals_pos));
            level_str = trim(token.substr(equals_pos + 1));
        }

        try {
            int level_int = std::stoi(level_str);
            LogLevel level = static_cast<LogLevel>(std::clamp(level_int, 1, 6));

            if (facility == "default") {
                default_level_ = level;
            } else {
                facility_levels_[facility] = level;
            }
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid log level '" << level_str << "' for facility '" << facility << "'" << std::endl;
        }
    }
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

LogLevel Logger::getEffectiveLevel() const {
    if (!component_name_.empty()) {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = facility_levels_.find(component_name_);
        if (it != facility_levels_.end()) {
            return it->second;
        }
    }

    // WARNING is the constructor default, so it means "not set on this instance"
    if (current_level_ != LogLevel::WARNING) {
        return current_level_;
    }

    std::lock_guard<std::mutex> lock(registry_mutex_);
    return default_level_;
}

} // namespace aoi
