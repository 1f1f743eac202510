#pragma once

#include "frontier/queues/request_queue.h"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace frontier {

/**
 * @brief Priority-ordered queue holding the requests of one slot
 *
 * Keeps one backend queue per distinct priority level, created through
 * the factory on first use and closed as soon as it drains. Pops always
 * come from the highest open level; order inside a level is the
 * backend's FIFO or LIFO order.
 *
 * Reattached levels that turn out empty are held open and untouched
 * until release_drained_levels(); a partition destroyed before that
 * leaves their storage as it found it.
 *
 * **Thread Safety**: None. Owned and driven by a single fairness queue.
 */
class PartitionQueue {
public:
    /**
     * @brief Create a partition, optionally reattached to persisted levels
     * @param factory Backend factory; must outlive the partition
     * @param slot_path Filesystem-safe slot name used for new levels
     * @param start_levels Levels returned by a previous close()
     * @throws MalformedSnapshotException on duplicate priority levels
     * @throws StorageIOException if a persisted level cannot be reopened
     */
    PartitionQueue(IQueueFactory& factory, std::string slot_path,
                   const PriorityState& start_levels = {});
    ~PartitionQueue();

    PartitionQueue(const PartitionQueue&) = delete;
    PartitionQueue& operator=(const PartitionQueue&) = delete;

    void push(const Request& request, int priority);
    std::optional<Request> pop();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const { return levels_.empty(); }

    /**
     * @brief Close every level and report the ones still holding entries
     * @return Open levels, highest priority first
     */
    PriorityState close();

    /**
     * @brief Close the empty levels found while reattaching
     *
     * Called once the whole snapshot has been accepted. Failures are
     * logged; the partition stays usable.
     */
    void release_drained_levels();

    [[nodiscard]] const std::string& slot_path() const noexcept { return slot_path_; }

    /**
     * @brief Priorities with outstanding entries, highest first
     */
    [[nodiscard]] std::vector<int> priorities() const;

private:
    IQueueFactory& factory_;
    std::string slot_path_;
    std::map<int, std::unique_ptr<IRequestQueue>, std::greater<int>> levels_;
    std::vector<std::unique_ptr<IRequestQueue>> drained_;    ///< Empty reattached levels
};

} // namespace frontier
