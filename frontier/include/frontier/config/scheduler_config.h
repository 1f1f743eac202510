#pragma once

#include "frontier/config/config_enums.h"
#include "frontier/utils/logger.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace frontier {

/**
 * @brief Configuration validation result
 */
struct ValidationResult {
    bool is_valid = true;                       ///< Overall validation status
    std::vector<std::string> errors;            ///< Critical errors (prevent startup)
    std::vector<std::string> warnings;          ///< Non-critical warnings

    [[nodiscard]] bool has_issues() const noexcept {
        return !errors.empty() || !warnings.empty();
    }

    /**
     * @brief Human-readable validation report
     */
    [[nodiscard]] std::string report() const;
};

/**
 * @brief Scheduler configuration, fixed at startup
 *
 * Supports programmatic configuration, TOML files and environment
 * variable overrides.
 *
 * @example
 * ```cpp
 * auto config = SchedulerConfig::from_toml_file("crawl.toml")
 *                   .with_environment_overrides();
 * config.fairness = FairnessStrategy::DOWNLOADER_AWARE;
 * Scheduler scheduler(config);
 * ```
 *
 * TOML layout:
 * ```toml
 * [scheduler]
 * fairness = "round_robin"      # or "downloader_aware"
 * order = "lifo"                # or "fifo"
 * backend = "disk"              # or "sqlite", "memory"
 * job_dir = "/var/lib/crawl/job-1"
 *
 * [logging]
 * level = "info"
 * format = "text"               # or "json"
 * console = true
 * file = "/var/log/crawl/scheduler.log"
 * log_unserializable_requests = false
 * ```
 */
struct SchedulerConfig {
    // ========================================================================
    // Core Scheduler Settings
    // ========================================================================

    FairnessStrategy fairness = FairnessStrategy::ROUND_ROBIN; ///< Slot selection policy
    QueueOrder order = QueueOrder::LIFO;                       ///< Tie-break within a priority

    /**
     * @brief Directory for resumable state
     *
     * When unset the scheduler keeps everything in memory and cannot resume.
     */
    std::optional<std::filesystem::path> job_dir;

    /**
     * @brief Storage of the durable tier; MEMORY disables it even with a job_dir
     */
    QueueBackend backend = QueueBackend::DISK;

    // ========================================================================
    // Logging Integration
    // ========================================================================

    struct Logging {
        std::string component = "frontier.scheduler";  ///< Log component name
        LogLevel level = LogLevel::INFO;                ///< Minimum level for the component
        LogFormat format = LogFormat::TEXT;             ///< Line format of every sink
        bool console = true;                            ///< Write to stderr/stdlog
        std::optional<std::filesystem::path> file;      ///< Also append to this file
        bool log_unserializable_requests = false;       ///< Log every memory fallback, not just the first
        bool log_stats_on_close = true;                 ///< Dump statistics when closing

        /**
         * @brief Configure a logger's level, formatter and sinks
         * @throws ConfigurationException if the log file cannot be opened
         */
        void apply(Logger& logger) const;
    } logging;

    // ========================================================================
    // Derived Settings
    // ========================================================================

    /**
     * @brief Whether requests survive a restart
     */
    [[nodiscard]] bool is_persistent() const noexcept {
        return job_dir.has_value() && backend != QueueBackend::MEMORY;
    }

    /**
     * @brief Root of the on-disk queues, `<job_dir>/requests.queue`
     */
    [[nodiscard]] std::filesystem::path queue_dir() const;

    /**
     * @brief Snapshot file, `<job_dir>/requests.queue/active.json`
     */
    [[nodiscard]] std::filesystem::path snapshot_path() const;

    // ========================================================================
    // Loading
    // ========================================================================

    /**
     * @brief Load configuration from a TOML file
     * @throws ConfigurationException if the file is missing or invalid
     */
    static SchedulerConfig from_toml_file(const std::filesystem::path& config_path);

    /**
     * @brief Load configuration from TOML content
     * @throws ConfigurationException on syntax errors or invalid values
     */
    static SchedulerConfig from_toml_string(const std::string& toml_content);

    /**
     * @brief Defaults with environment variable overrides applied
     *
     * Environment variables:
     * - FRONTIER_SCHEDULER_FAIRNESS
     * - FRONTIER_SCHEDULER_ORDER
     * - FRONTIER_SCHEDULER_BACKEND
     * - FRONTIER_JOB_DIR
     * - FRONTIER_LOG_LEVEL
     * - FRONTIER_LOG_FORMAT
     * - FRONTIER_LOG_FILE
     * - FRONTIER_LOG_UNSERIALIZABLE
     */
    static SchedulerConfig from_environment();

    /**
     * @brief Copy of this configuration with environment overrides applied
     * @throws ConfigurationException if a variable holds an invalid value
     */
    [[nodiscard]] SchedulerConfig with_environment_overrides() const;

    /**
     * @brief Merge with another configuration (other takes precedence)
     *
     * A job directory is only taken from other when other sets one.
     */
    [[nodiscard]] SchedulerConfig merge(const SchedulerConfig& other) const;

    // ========================================================================
    // Validation and Serialization
    // ========================================================================

    [[nodiscard]] ValidationResult validate() const;

    [[nodiscard]] std::string to_toml() const;

    [[nodiscard]] std::string summary() const;
};

} // namespace frontier
