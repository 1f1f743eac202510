#pragma once

#include "frontier/config/config_enums.h"
#include "frontier/queues/request_queue.h"

#include <deque>

namespace frontier {

/**
 * @brief In-memory queue; entries are lost when the process exits
 */
class MemoryQueue : public IRequestQueue {
public:
    explicit MemoryQueue(QueueOrder order) : order_(order) {}

    void push(const Request& request) override;
    std::optional<Request> pop() override;
    [[nodiscard]] size_t size() const override { return entries_.size(); }
    void close() override;
    [[nodiscard]] std::string location() const override { return {}; }

private:
    QueueOrder order_;
    std::deque<Request> entries_;
};

/**
 * @brief Factory for MemoryQueue levels; cannot reopen persisted levels
 */
class MemoryQueueFactory : public IQueueFactory {
public:
    explicit MemoryQueueFactory(QueueOrder order) : order_(order) {}

    std::unique_ptr<IRequestQueue> create(const std::string& slot_path, int priority) override;
    std::unique_ptr<IRequestQueue> open(const PriorityLevel& level) override;
    [[nodiscard]] bool is_persistent() const override { return false; }

private:
    QueueOrder order_;
};

} // namespace frontier
