#include "frontier/scheduler/scheduler.h"
#include "frontier/core/exceptions.h"
#include "frontier/queues/disk_queue.h"
#include "frontier/queues/memory_queue.h"
#include "frontier/queues/sqlite_queue.h"

#include <algorithm>

namespace frontier {

namespace {

std::unique_ptr<IQueueFactory> make_durable_factory(const SchedulerConfig& config) {
    if (config.backend == QueueBackend::SQLITE) {
        return std::make_unique<SqliteQueueFactory>(config.queue_dir(), config.order);
    }
    return std::make_unique<DiskQueueFactory>(config.queue_dir(), config.order);
}

} // namespace

Scheduler::Scheduler(SchedulerConfig config)
    : config_(std::move(config))
    , logger_(&LoggerFactory::get_logger(config_.logging.component)) {
    auto validation = config_.validate();
    if (!validation.is_valid) {
        throw ConfigurationException(validation.report());
    }

    config_.logging.apply(*logger_);
    for (const auto& warning : validation.warnings) {
        logger_->warn(warning);
    }

    memory_queue_ = make_fairness_queue(config_.fairness,
                                        std::make_unique<MemoryQueueFactory>(config_.order));
    if (config_.is_persistent()) {
        disk_queue_ = make_fairness_queue(config_.fairness, make_durable_factory(config_));
    }
}

Scheduler::~Scheduler() {
    if (!open_) {
        return;
    }

    try {
        close("shutdown");
    } catch (const std::exception& e) {
        logger_->error(std::string("Failed to close scheduler on shutdown: ") + e.what());
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

void Scheduler::open() {
    if (!config_.is_persistent()) {
        open(std::nullopt);
        return;
    }

    open(PersistedSnapshot::load(config_.snapshot_path()));
}

void Scheduler::open(const std::optional<PersistedSnapshot>& snapshot) {
    if (open_) {
        throw QueueStateException("open scheduler", "it is already open");
    }

    stats_.reset();

    if (snapshot && !snapshot->empty()) {
        if (!disk_queue_) {
            throw QueueStateException("resume", "a snapshot was given but no job directory is configured");
        }
        disk_queue_->reopen(*snapshot);
        stats_.restored = disk_queue_->size();
        update_peak();
    }

    open_ = true;

    logger_->info("Scheduler opened (" + config_.summary() + ")");
    if (stats_.restored > 0) {
        logger_->info("Resuming crawl (" + std::to_string(stats_.restored) + " requests scheduled)");
    }
}

PersistedSnapshot Scheduler::close(const std::string& reason) {
    require_open("close scheduler");
    open_ = false;

    size_t dropped = memory_queue_->size();
    memory_queue_->close();
    if (dropped > 0) {
        logger_->warn("Dropping " + std::to_string(dropped) + " requests held in memory");
    }

    PersistedSnapshot snapshot;
    if (disk_queue_) {
        snapshot = disk_queue_->close();
        snapshot.save(config_.snapshot_path());
    }

    size_t persisted = 0;
    for (const auto& slot_state : snapshot.slots) {
        persisted += slot_state.levels.size();
    }

    logger_->with_field("reason", reason)
        .with_field("persisted_slots", snapshot.slots.size())
        .with_field("persisted_levels", persisted)
        .info("Scheduler closed");
    logger_->clear_fields();

    if (config_.logging.log_stats_on_close) {
        logger_->info("Scheduler stats: " + stats_.to_string());
    }

    return snapshot;
}

void Scheduler::require_open(const std::string& operation) const {
    if (!open_) {
        throw QueueStateException(operation, "scheduler is not open");
    }
}

// ============================================================================
// Scheduling
// ============================================================================

void Scheduler::enqueue(Request& request) {
    require_open("enqueue");

    if (!push_to_disk(request)) {
        memory_queue_->push(request, request.priority());
        ++stats_.enqueued_memory;
    }

    update_peak();
}

void Scheduler::enqueue(const nlohmann::json& document) {
    Request request = Request::from_json(document);
    enqueue(request);
}

bool Scheduler::push_to_disk(Request& request) {
    if (!disk_queue_) {
        return false;
    }

    try {
        disk_queue_->push(request, request.priority());
    } catch (const RequestSerializationException& e) {
        if (stats_.unserializable == 0 || config_.logging.log_unserializable_requests) {
            std::string message = std::string("Keeping request in memory: ") + e.what();
            if (!config_.logging.log_unserializable_requests) {
                message += " (further occurrences are counted in stats only)";
            }
            logger_->warn(message);
        }
        ++stats_.unserializable;
        return false;
    }

    ++stats_.enqueued_disk;
    return true;
}

std::optional<Request> Scheduler::next() {
    require_open("fetch next request");

    if (auto request = memory_queue_->pop()) {
        ++stats_.dequeued_memory;
        return request;
    }

    if (disk_queue_) {
        if (auto request = disk_queue_->pop()) {
            ++stats_.dequeued_disk;
            return request;
        }
    }

    return std::nullopt;
}

size_t Scheduler::size() const {
    return memory_size() + disk_size();
}

void Scheduler::update_peak() {
    stats_.peak_pending = std::max(stats_.peak_pending, size());
}

// ============================================================================
// Downloader Hooks
// ============================================================================

void Scheduler::on_dispatch_start(const Request& request) {
    memory_queue_->on_dispatch_start(request);
    if (disk_queue_) {
        disk_queue_->on_dispatch_start(request);
    }
}

void Scheduler::on_dispatch_complete(const Request& request) {
    memory_queue_->on_dispatch_complete(request);
    if (disk_queue_) {
        disk_queue_->on_dispatch_complete(request);
    }
}

} // namespace frontier
