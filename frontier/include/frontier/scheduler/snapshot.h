#pragma once

#include "frontier/queues/request_queue.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace frontier {

/**
 * @brief Persisted priority levels of one slot
 */
struct SlotState {
    std::string slot;           ///< Slot key
    PriorityState levels;       ///< Non-empty, highest priority first

    bool operator==(const SlotState& other) const = default;
};

/**
 * @brief State needed to rebuild a fairness queue after a restart
 *
 * Serialized as a JSON object mapping each slot to its open levels, in
 * rotation order:
 *
 * ```json
 * {"example.com": [{"priority": 5, "path": "example.com-<md5>/p5-<hex>"}]}
 * ```
 *
 * The queue contents stay in the files named by each level's path.
 */
struct PersistedSnapshot {
    std::vector<SlotState> slots;

    [[nodiscard]] bool empty() const noexcept { return slots.empty(); }

    [[nodiscard]] nlohmann::ordered_json to_json() const;

    /**
     * @brief Validate and decode a snapshot document
     * @throws MalformedSnapshotException if the document is not a mapping
     *         of slot keys to non-empty lists of priority levels. The flat
     *         priority list written by older versions is rejected here.
     */
    static PersistedSnapshot from_json(const nlohmann::ordered_json& document);

    /**
     * @brief Read a snapshot file
     * @return Snapshot, or std::nullopt if the file does not exist
     * @throws MalformedSnapshotException if the file is not a valid snapshot
     * @throws StorageIOException if the file exists but cannot be read
     */
    static std::optional<PersistedSnapshot> load(const std::filesystem::path& path);

    /**
     * @brief Atomically replace the snapshot file
     * @throws StorageIOException on write failure
     */
    void save(const std::filesystem::path& path) const;

    bool operator==(const PersistedSnapshot& other) const = default;
};

} // namespace frontier
