#include "frontier/queues/memory_queue.h"
#include "frontier/core/exceptions.h"

namespace frontier {

void MemoryQueue::push(const Request& request) {
    entries_.push_back(request);
}

std::optional<Request> MemoryQueue::pop() {
    if (entries_.empty()) {
        return std::nullopt;
    }

    if (order_ == QueueOrder::FIFO) {
        Request request = std::move(entries_.front());
        entries_.pop_front();
        return request;
    }

    Request request = std::move(entries_.back());
    entries_.pop_back();
    return request;
}

void MemoryQueue::close() {
    entries_.clear();
}

std::unique_ptr<IRequestQueue> MemoryQueueFactory::create(const std::string&, int) {
    return std::make_unique<MemoryQueue>(order_);
}

std::unique_ptr<IRequestQueue> MemoryQueueFactory::open(const PriorityLevel& level) {
    throw StorageIOException("<memory>", "reopen",
                             "memory queues do not persist; priority level " +
                             std::to_string(level.priority) + " cannot be restored");
}

} // namespace frontier
