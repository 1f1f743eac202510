#pragma once

#include <cstddef>
#include <string>

namespace frontier {

/**
 * @brief Counters collected by a Scheduler over one open/close cycle
 *
 * Plain counters; the scheduler is driven by a single thread.
 */
struct SchedulerStats {
    // ========================================================================
    // Queue Traffic
    // ========================================================================

    size_t enqueued_memory = 0;     ///< Requests pushed to the memory tier
    size_t enqueued_disk = 0;       ///< Requests pushed to the disk tier
    size_t dequeued_memory = 0;     ///< Requests popped from the memory tier
    size_t dequeued_disk = 0;       ///< Requests popped from the disk tier

    // ========================================================================
    // Persistence
    // ========================================================================

    size_t unserializable = 0;      ///< Disk pushes that fell back to memory
    size_t restored = 0;            ///< Requests reattached from a snapshot on open
    size_t peak_pending = 0;        ///< Maximum pending requests observed

    [[nodiscard]] size_t total_enqueued() const noexcept { return enqueued_memory + enqueued_disk; }
    [[nodiscard]] size_t total_dequeued() const noexcept { return dequeued_memory + dequeued_disk; }

    void reset() { *this = SchedulerStats{}; }

    /**
     * @brief One-line summary for logs
     */
    [[nodiscard]] std::string to_string() const;
};

} // namespace frontier
