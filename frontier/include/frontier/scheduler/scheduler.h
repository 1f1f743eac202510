#pragma once

#include "frontier/config/scheduler_config.h"
#include "frontier/http/request.h"
#include "frontier/scheduler/fairness_queue.h"
#include "frontier/scheduler/scheduler_stats.h"
#include "frontier/scheduler/snapshot.h"
#include "frontier/utils/logger.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace frontier {

/**
 * @brief Crawl scheduler holding the request frontier
 *
 * Keeps one fairness queue in memory and, when a job directory is
 * configured, a second one on disk (length-framed files or SQLite, per
 * SchedulerConfig::backend). New requests go to disk; requests the disk
 * backend cannot encode fall back to memory. next() drains the memory
 * tier first.
 *
 * Lifecycle: open() -> enqueue()/next()/hooks -> close(). A closed
 * scheduler can be opened again.
 *
 * **Thread Safety**: None, see IFairnessQueue.
 *
 * @example
 * ```cpp
 * SchedulerConfig config;
 * config.job_dir = "/var/lib/crawl/job-1";
 *
 * Scheduler scheduler(config);
 * scheduler.open();                       // resumes from active.json
 *
 * Request request("https://example.com/", 10);
 * scheduler.enqueue(request);
 *
 * while (auto next = scheduler.next()) {
 *     scheduler.on_dispatch_start(*next);
 *     // ... download ...
 *     scheduler.on_dispatch_complete(*next);
 * }
 *
 * scheduler.close("finished");
 * ```
 */
class Scheduler {
public:
    /**
     * @throws ConfigurationException if the configuration does not validate
     */
    explicit Scheduler(SchedulerConfig config);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Open, resuming from the snapshot file of the job directory
     *
     * Memory-only schedulers start empty.
     */
    void open();

    /**
     * @brief Open, resuming from an explicit snapshot
     * @param snapshot Result of an earlier close(), or std::nullopt
     * @throws MalformedSnapshotException, StorageIOException on a bad
     *         snapshot; the scheduler then stays closed and empty
     * @throws QueueStateException if already open, or if a non-empty
     *         snapshot is given to a memory-only scheduler
     */
    void open(const std::optional<PersistedSnapshot>& snapshot);

    /**
     * @brief Close both tiers and persist the disk tier
     * @param reason Free-form reason, logged
     * @return Snapshot of the disk tier (empty for memory-only schedulers)
     *
     * Requests still held by the memory tier are lost. With a job
     * directory the snapshot is also written to its snapshot file.
     */
    PersistedSnapshot close(const std::string& reason = "finished");

    [[nodiscard]] bool is_open() const noexcept { return open_; }

    // ========================================================================
    // Scheduling
    // ========================================================================

    /**
     * @brief Queue a request at its own priority
     *
     * The resolved slot is written back to the request.
     */
    void enqueue(Request& request);

    /**
     * @brief Queue the key-value form of a request
     * @throws InvalidRequestException if the document is not an object
     *         with a string "url"
     */
    void enqueue(const nlohmann::json& document);

    /**
     * @brief Next request to dispatch, or std::nullopt when idle
     */
    std::optional<Request> next();

    [[nodiscard]] bool has_pending() const { return size() > 0; }
    [[nodiscard]] size_t size() const;

    [[nodiscard]] size_t memory_size() const { return memory_queue_->size(); }
    [[nodiscard]] size_t disk_size() const { return disk_queue_ ? disk_queue_->size() : 0; }

    // ========================================================================
    // Downloader Hooks
    // ========================================================================

    void on_dispatch_start(const Request& request);
    void on_dispatch_complete(const Request& request);

    // ========================================================================
    // Introspection
    // ========================================================================

    [[nodiscard]] const SchedulerConfig& config() const noexcept { return config_; }
    [[nodiscard]] const SchedulerStats& stats() const noexcept { return stats_; }

private:
    SchedulerConfig config_;
    std::unique_ptr<IFairnessQueue> memory_queue_;
    std::unique_ptr<IFairnessQueue> disk_queue_;      ///< Null without a job directory
    SchedulerStats stats_;
    Logger* logger_;
    bool open_ = false;

    void require_open(const std::string& operation) const;
    bool push_to_disk(Request& request);
    void update_peak();
};

} // namespace frontier
