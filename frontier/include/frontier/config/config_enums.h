#pragma once

#include <optional>
#include <string>

namespace frontier {

// ============================================================================
// Queue Ordering
// ============================================================================

/**
 * @brief Tie-break among requests of equal priority within a slot
 *
 * Chosen once per deployment and applied identically by the memory and
 * disk backends.
 */
enum class QueueOrder : int {
    FIFO = 0,       ///< Insertion order (breadth-first crawls)
    LIFO = 1        ///< Reverse insertion order (depth-first crawls)
};

// ============================================================================
// Fairness Strategies
// ============================================================================

/**
 * @brief Policy used to choose the slot of the next dispatched request
 *
 * - ROUND_ROBIN: every active slot gets one turn per rotation
 * - DOWNLOADER_AWARE: the slot with the fewest in-flight requests wins,
 *   rotation order on ties
 */
enum class FairnessStrategy : int {
    ROUND_ROBIN = 0,        ///< Strict rotation across active slots
    DOWNLOADER_AWARE = 1    ///< Least in-flight slot first
};

// ============================================================================
// Queue Backends
// ============================================================================

/**
 * @brief Storage behind the durable tier of a scheduler with a job directory
 */
enum class QueueBackend : int {
    MEMORY = 0,     ///< Lost on process exit
    DISK = 1,       ///< One length-framed file per priority level
    SQLITE = 2      ///< One SQLite database per priority level
};

[[nodiscard]] std::string to_string(QueueOrder order);
[[nodiscard]] std::optional<QueueOrder> queue_order_from_string(const std::string& order_str);

[[nodiscard]] std::string to_string(FairnessStrategy strategy);
[[nodiscard]] std::optional<FairnessStrategy> fairness_from_string(const std::string& strategy_str);

[[nodiscard]] std::string to_string(QueueBackend backend);
[[nodiscard]] std::optional<QueueBackend> queue_backend_from_string(const std::string& backend_str);

} // namespace frontier
