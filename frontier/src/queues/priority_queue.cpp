#include "frontier/queues/priority_queue.h"
#include "frontier/core/exceptions.h"
#include "frontier/utils/logger.h"

#include <set>

namespace frontier {

namespace {

Logger& queue_logger() {
    return LoggerFactory::get_logger("frontier.queues");
}

void log_close_failure(const std::string& slot_path, int priority, const FrontierException& e) {
    queue_logger().error("Failed to close priority level " + std::to_string(priority) +
                         " of " + slot_path + ": " + e.what());
}

} // namespace

PartitionQueue::PartitionQueue(IQueueFactory& factory, std::string slot_path,
                               const PriorityState& start_levels)
    : factory_(factory)
    , slot_path_(std::move(slot_path)) {

    std::set<int> seen;
    for (const auto& level : start_levels) {
        if (!seen.insert(level.priority).second) {
            throw MalformedSnapshotException("priority level " + std::to_string(level.priority) +
                                             " listed twice for one slot");
        }

        auto queue = factory_.open(level);
        if (queue->size() == 0) {
            drained_.push_back(std::move(queue));
            continue;
        }
        levels_.emplace(level.priority, std::move(queue));
    }
}

PartitionQueue::~PartitionQueue() {
    for (auto& queue : drained_) {
        try {
            queue->detach();
        } catch (const FrontierException& e) {
            queue_logger().error("Failed to detach empty level of " + slot_path_ + ": " + e.what());
        }
    }

    for (auto& [priority, queue] : levels_) {
        try {
            queue->close();
        } catch (const FrontierException& e) {
            log_close_failure(slot_path_, priority, e);
        }
    }
}

void PartitionQueue::release_drained_levels() {
    for (auto& queue : drained_) {
        try {
            queue->close();
        } catch (const FrontierException& e) {
            queue_logger().error("Failed to remove empty level of " + slot_path_ + ": " + e.what());
        }
    }
    drained_.clear();
}

void PartitionQueue::push(const Request& request, int priority) {
    auto it = levels_.find(priority);
    if (it != levels_.end()) {
        it->second->push(request);
        return;
    }

    auto queue = factory_.create(slot_path_, priority);
    try {
        queue->push(request);
    } catch (const FrontierException&) {
        // Never keep an empty level around
        queue->close();
        throw;
    }
    levels_.emplace(priority, std::move(queue));
}

std::optional<Request> PartitionQueue::pop() {
    while (!levels_.empty()) {
        auto it = levels_.begin();
        auto request = it->second->pop();

        if (it->second->size() == 0) {
            int priority = it->first;
            auto drained = std::move(it->second);
            levels_.erase(it);

            // The request is already out of storage and must reach the caller
            try {
                drained->close();
            } catch (const FrontierException& e) {
                log_close_failure(slot_path_, priority, e);
            }
        }

        if (request) {
            return request;
        }
    }
    return std::nullopt;
}

size_t PartitionQueue::size() const {
    size_t total = 0;
    for (const auto& [priority, queue] : levels_) {
        total += queue->size();
    }
    return total;
}

PriorityState PartitionQueue::close() {
    release_drained_levels();

    PriorityState state;
    state.reserve(levels_.size());

    for (auto& [priority, queue] : levels_) {
        if (queue->size() > 0) {
            state.push_back({priority, queue->location()});
        }
        queue->close();
    }
    levels_.clear();

    return state;
}

std::vector<int> PartitionQueue::priorities() const {
    std::vector<int> result;
    result.reserve(levels_.size());
    for (const auto& [priority, queue] : levels_) {
        result.push_back(priority);
    }
    return result;
}

} // namespace frontier
