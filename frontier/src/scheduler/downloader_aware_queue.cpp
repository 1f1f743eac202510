#include "frontier/scheduler/fairness_queue.h"
#include "frontier/scheduler/slot.h"

#include <limits>

namespace frontier {

DownloaderAwareQueue::DownloaderAwareQueue(std::unique_ptr<IQueueFactory> factory)
    : RoundRobinQueue(std::move(factory)) {
}

std::optional<Request> DownloaderAwareQueue::pop() {
    const auto& rotation = state().rotation;
    if (rotation.empty()) {
        return std::nullopt;
    }

    // Strict '<' keeps the earliest slot in rotation on ties
    size_t best_index = 0;
    size_t best_load = std::numeric_limits<size_t>::max();
    for (size_t i = 0; i < rotation.size(); ++i) {
        size_t load = in_flight(rotation[i]);
        if (load < best_load) {
            best_load = load;
            best_index = i;
            if (load == 0) {
                break;
            }
        }
    }

    return pop_at(best_index);
}

PersistedSnapshot DownloaderAwareQueue::close() {
    in_flight_.clear();
    return RoundRobinQueue::close();
}

void DownloaderAwareQueue::on_dispatch_start(const Request& request) {
    ++in_flight_[slot_of(request)];
}

void DownloaderAwareQueue::on_dispatch_complete(const Request& request) {
    std::string slot = slot_of(request);

    auto it = in_flight_.find(slot);
    if (it == in_flight_.end()) {
        logger().debug("Completion reported for slot '" + slot + "' with nothing in flight");
        return;
    }

    if (--it->second == 0) {
        in_flight_.erase(it);
    }
}

size_t DownloaderAwareQueue::in_flight(const std::string& slot) const {
    auto it = in_flight_.find(slot);
    return it == in_flight_.end() ? 0 : it->second;
}

} // namespace frontier
