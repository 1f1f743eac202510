#include "frontier/scheduler/fairness_queue.h"
#include "frontier/scheduler/slot.h"
#include "frontier/core/exceptions.h"

namespace frontier {

// ============================================================================
// FairnessState
// ============================================================================

void FairnessState::clear() {
    rotation.clear();
    partitions.clear();
}

// ============================================================================
// RoundRobinQueue
// ============================================================================

RoundRobinQueue::RoundRobinQueue(std::unique_ptr<IQueueFactory> factory)
    : factory_(std::move(factory))
    , logger_(&LoggerFactory::get_logger("frontier.scheduler")) {
    if (!factory_) {
        throw QueueStateException("create fairness queue", "no queue factory given");
    }
}

RoundRobinQueue::~RoundRobinQueue() {
    // Partitions reference the factory; drop them first
    state_.clear();
}

void RoundRobinQueue::push(Request& request, int priority) {
    std::string slot = resolve_slot(request);

    auto it = state_.partitions.find(slot);
    if (it != state_.partitions.end()) {
        it->second->push(request, priority);
        return;
    }

    auto partition = std::make_unique<PartitionQueue>(*factory_, slot_to_path(slot));
    partition->push(request, priority);

    state_.partitions.emplace(slot, std::move(partition));
    state_.rotation.push_back(slot);
    logger().trace("Slot '" + slot + "' became active");
}

std::optional<Request> RoundRobinQueue::pop() {
    if (state_.rotation.empty()) {
        return std::nullopt;
    }
    return pop_at(0);
}

std::optional<Request> RoundRobinQueue::pop_at(size_t rotation_index) {
    auto position = state_.rotation.begin() + static_cast<std::ptrdiff_t>(rotation_index);
    std::string slot = std::move(*position);
    state_.rotation.erase(position);

    auto it = state_.partitions.find(slot);
    if (it == state_.partitions.end()) {
        logger().error("Slot '" + slot + "' was in the rotation without a partition");
        return std::nullopt;
    }

    std::optional<Request> request;
    try {
        request = it->second->pop();
    } catch (const FrontierException&) {
        // Keep the slot schedulable so the caller can decide what to do
        if (!it->second->empty()) {
            state_.rotation.push_back(slot);
        } else {
            state_.partitions.erase(it);
        }
        throw;
    }

    if (!it->second->empty()) {
        state_.rotation.push_back(slot);
    } else {
        state_.partitions.erase(it);
        logger().trace("Slot '" + slot + "' drained");
    }

    return request;
}

size_t RoundRobinQueue::size() const {
    size_t total = 0;
    for (const auto& [slot, partition] : state_.partitions) {
        total += partition->size();
    }
    return total;
}

PersistedSnapshot RoundRobinQueue::close() {
    PersistedSnapshot snapshot;

    for (const auto& slot : state_.rotation) {
        auto it = state_.partitions.find(slot);
        if (it == state_.partitions.end()) {
            continue;
        }

        auto levels = it->second->close();
        if (!levels.empty()) {
            snapshot.slots.push_back({slot, std::move(levels)});
        }
    }

    state_.clear();

    if (!snapshot.empty()) {
        logger().debug("Closed " + std::to_string(snapshot.slots.size()) + " active slots");
    }
    return snapshot;
}

void RoundRobinQueue::reopen(const PersistedSnapshot& snapshot) {
    if (!state_.empty()) {
        throw QueueStateException("reopen", std::to_string(size()) + " requests are still queued");
    }

    // Build aside so a failure leaves nothing half-loaded
    FairnessState restored;
    for (const auto& slot_state : snapshot.slots) {
        if (restored.partitions.count(slot_state.slot) != 0) {
            throw MalformedSnapshotException("slot '" + slot_state.slot + "' appears twice");
        }
        if (slot_state.levels.empty()) {
            throw MalformedSnapshotException("slot '" + slot_state.slot + "' has no priority levels");
        }

        auto partition = std::make_unique<PartitionQueue>(*factory_, slot_to_path(slot_state.slot),
                                                          slot_state.levels);
        if (partition->empty()) {
            throw StorageIOException(slot_state.slot, "reopen",
                                     "snapshot lists priority levels but their queue files hold no requests");
        }

        restored.rotation.push_back(slot_state.slot);
        restored.partitions.emplace(slot_state.slot, std::move(partition));
    }

    state_ = std::move(restored);
    for (auto& [slot, partition] : state_.partitions) {
        partition->release_drained_levels();
    }

    if (!state_.empty()) {
        logger().debug("Reopened " + std::to_string(state_.rotation.size()) + " slots holding " +
                       std::to_string(size()) + " requests");
    }
}

void RoundRobinQueue::reopen(const nlohmann::ordered_json& document) {
    reopen(PersistedSnapshot::from_json(document));
}

std::vector<std::string> RoundRobinQueue::active_slots() const {
    return {state_.rotation.begin(), state_.rotation.end()};
}

size_t RoundRobinQueue::slot_size(const std::string& slot) const {
    auto it = state_.partitions.find(slot);
    return it == state_.partitions.end() ? 0 : it->second->size();
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<IFairnessQueue> make_fairness_queue(FairnessStrategy strategy,
                                                    std::unique_ptr<IQueueFactory> factory) {
    switch (strategy) {
        case FairnessStrategy::ROUND_ROBIN:
            return std::make_unique<RoundRobinQueue>(std::move(factory));
        case FairnessStrategy::DOWNLOADER_AWARE:
            return std::make_unique<DownloaderAwareQueue>(std::move(factory));
    }
    throw QueueStateException("create fairness queue",
                              "unknown strategy " + std::to_string(static_cast<int>(strategy)));
}

} // namespace frontier
