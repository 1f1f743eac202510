#pragma once

#include "frontier/config/config_enums.h"
#include "frontier/http/request.h"
#include "frontier/queues/priority_queue.h"
#include "frontier/queues/request_queue.h"
#include "frontier/scheduler/snapshot.h"
#include "frontier/utils/logger.h"

#include <nlohmann/json.hpp>

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace frontier {

// ============================================================================
// Fairness Queue Interface
// ============================================================================

/**
 * @brief Abstract interface for slot fairness policies
 *
 * A fairness queue owns one PartitionQueue per active slot and decides
 * which slot the next request comes from. Priority order inside a slot
 * is always preserved; only the choice between slots differs.
 *
 * **Thread Safety**: None. push/pop/close and the dispatch hooks must
 * not interleave; wrap the whole surface in one lock if several threads
 * drive the same instance.
 *
 * **Available Implementations**:
 * - RoundRobinQueue: one dispatch per active slot per rotation
 * - DownloaderAwareQueue: least in-flight slot first
 */
class IFairnessQueue {
public:
    virtual ~IFairnessQueue() = default;

    /**
     * @brief Queue a request under its slot
     * @param request Request; its slot is resolved and written back
     * @param priority Priority within the slot, higher first
     */
    virtual void push(Request& request, int priority) = 0;

    /**
     * @brief Remove the next request according to the policy
     * @return Request, or std::nullopt if nothing is pending
     */
    virtual std::optional<Request> pop() = 0;

    [[nodiscard]] virtual size_t size() const = 0;

    /**
     * @brief Close every partition and return what is needed to resume
     *
     * Leaves the queue empty and ready for reopen().
     */
    virtual PersistedSnapshot close() = 0;

    /**
     * @brief Rebuild partitions and rotation from a previous close()
     * @throws MalformedSnapshotException on an inconsistent snapshot
     * @throws StorageIOException if persisted levels cannot be reattached
     * @throws QueueStateException if the queue is not empty
     *
     * Either every slot is restored or the queue stays empty.
     */
    virtual void reopen(const PersistedSnapshot& snapshot) = 0;

    /**
     * @brief A popped request has started downloading
     */
    virtual void on_dispatch_start(const Request& request) = 0;

    /**
     * @brief A request reported by on_dispatch_start() has finished
     */
    virtual void on_dispatch_complete(const Request& request) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

// ============================================================================
// Fairness State
// ============================================================================

/**
 * @brief Rotation and partitions owned by one fairness queue
 *
 * Invariant: a slot is in the rotation iff its partition exists, and a
 * partition exists iff it holds at least one request.
 */
struct FairnessState {
    std::deque<std::string> rotation;                                           ///< Active slots, next turn first
    std::unordered_map<std::string, std::unique_ptr<PartitionQueue>> partitions; ///< Slot -> partition

    [[nodiscard]] bool empty() const noexcept { return rotation.empty(); }
    void clear();
};

// ============================================================================
// Round-Robin Fairness
// ============================================================================

/**
 * @brief Strict rotation across active slots
 *
 * Given N active slots, any N consecutive pops return one request from
 * each of them as long as every slot still has requests. A slot joins
 * the rotation tail when its first request arrives and leaves it when
 * its last request is popped.
 */
class RoundRobinQueue : public IFairnessQueue {
public:
    explicit RoundRobinQueue(std::unique_ptr<IQueueFactory> factory);
    ~RoundRobinQueue() override;

    RoundRobinQueue(const RoundRobinQueue&) = delete;
    RoundRobinQueue& operator=(const RoundRobinQueue&) = delete;

    void push(Request& request, int priority) override;
    std::optional<Request> pop() override;
    [[nodiscard]] size_t size() const override;
    PersistedSnapshot close() override;
    void reopen(const PersistedSnapshot& snapshot) override;

    /**
     * @brief Validate a snapshot document, then reopen from it
     * @throws MalformedSnapshotException if the document is not a mapping
     *         of slot keys to lists of priority levels
     */
    void reopen(const nlohmann::ordered_json& document);

    // Round-robin ignores downloader load
    void on_dispatch_start(const Request&) override {}
    void on_dispatch_complete(const Request&) override {}

    [[nodiscard]] std::string name() const override { return "round_robin"; }

    /**
     * @brief Active slots in rotation order
     */
    [[nodiscard]] std::vector<std::string> active_slots() const;

    /**
     * @brief Number of pending requests for one slot (0 if inactive)
     */
    [[nodiscard]] size_t slot_size(const std::string& slot) const;

protected:
    /**
     * @brief Pop from the slot at rotation index, then requeue or retire it
     */
    std::optional<Request> pop_at(size_t rotation_index);

    [[nodiscard]] const FairnessState& state() const noexcept { return state_; }
    Logger& logger() { return *logger_; }

private:
    std::unique_ptr<IQueueFactory> factory_;
    FairnessState state_;
    Logger* logger_;
};

// ============================================================================
// Downloader-Aware Fairness
// ============================================================================

/**
 * @brief Prefer the active slot with the fewest requests in flight
 *
 * In-flight counts are fed by on_dispatch_start() and
 * on_dispatch_complete(); a slot never reported counts as zero. Ties go
 * to the slot that comes first in the rotation, and the chosen slot moves
 * to the rotation tail, so equal load degrades to round-robin.
 */
class DownloaderAwareQueue : public RoundRobinQueue {
public:
    explicit DownloaderAwareQueue(std::unique_ptr<IQueueFactory> factory);

    std::optional<Request> pop() override;
    PersistedSnapshot close() override;

    void on_dispatch_start(const Request& request) override;
    void on_dispatch_complete(const Request& request) override;

    [[nodiscard]] std::string name() const override { return "downloader_aware"; }

    /**
     * @brief Requests of a slot currently in flight downstream
     */
    [[nodiscard]] size_t in_flight(const std::string& slot) const;

private:
    std::unordered_map<std::string, size_t> in_flight_;
};

// ============================================================================
// Factory
// ============================================================================

/**
 * @brief Create a fairness queue for the given strategy
 * @param strategy Fairness policy
 * @param factory Backend factory for the partitions
 */
[[nodiscard]] std::unique_ptr<IFairnessQueue> make_fairness_queue(FairnessStrategy strategy,
                                                                  std::unique_ptr<IQueueFactory> factory);

} // namespace frontier
