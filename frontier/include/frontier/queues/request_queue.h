#pragma once

#include "frontier/http/request.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace frontier {

// ============================================================================
// Queue Backend Interface
// ============================================================================

/**
 * @brief Storage for the entries of a single priority level
 *
 * Implementations decide only the order within the level (FIFO or LIFO)
 * and where entries live (memory or disk).
 *
 * **Thread Safety**: None. Callers serialize access.
 */
class IRequestQueue {
public:
    virtual ~IRequestQueue() = default;

    /**
     * @brief Append a request
     * @throws RequestSerializationException if a disk backend cannot encode it
     * @throws StorageIOException on write failure
     */
    virtual void push(const Request& request) = 0;

    /**
     * @brief Remove and return the next request
     * @return Request, or std::nullopt if the queue is empty
     * @throws StorageIOException on read failure or a corrupt record
     */
    virtual std::optional<Request> pop() = 0;

    [[nodiscard]] virtual size_t size() const = 0;

    /**
     * @brief Release resources; durable backends keep their entries
     */
    virtual void close() = 0;

    /**
     * @brief Release resources and keep the storage, even when empty
     */
    virtual void detach() { close(); }

    /**
     * @brief Where the entries are stored, relative to the backend root
     * @return Location to reopen from, or an empty string for memory queues
     */
    [[nodiscard]] virtual std::string location() const = 0;
};

// ============================================================================
// Queue Factory Interface
// ============================================================================

/**
 * @brief One open priority level of a partition, as persisted on close
 */
struct PriorityLevel {
    int priority = 0;           ///< Priority shared by all entries of the level
    std::string location;       ///< Backend location, empty for memory queues

    bool operator==(const PriorityLevel& other) const = default;
};

/**
 * @brief Open priority levels of one partition, highest priority first
 */
using PriorityState = std::vector<PriorityLevel>;

/**
 * @brief Creates the per-priority queues of a partition
 */
class IQueueFactory {
public:
    virtual ~IQueueFactory() = default;

    /**
     * @brief Create an empty queue for a new priority level
     * @param slot_path Filesystem-safe slot name (see slot_to_path)
     * @param priority Priority level the queue will hold
     */
    virtual std::unique_ptr<IRequestQueue> create(const std::string& slot_path, int priority) = 0;

    /**
     * @brief Reattach to a queue persisted by a previous run
     * @param level Level returned by a previous close()
     * @throws StorageIOException if the backing storage is missing or unreadable
     */
    virtual std::unique_ptr<IRequestQueue> open(const PriorityLevel& level) = 0;

    /**
     * @brief Whether queues survive a process restart
     */
    [[nodiscard]] virtual bool is_persistent() const = 0;
};

} // namespace frontier
