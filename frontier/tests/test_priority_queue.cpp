#include "frontier/core/exceptions.h"
#include "frontier/queues/disk_queue.h"
#include "frontier/queues/memory_queue.h"
#include "frontier/queues/priority_queue.h"
#include "test_support.h"

#include <cassert>
#include <iostream>
#include <vector>

using namespace frontier;
using frontier::testing::TempDir;
using frontier::testing::throws;
using frontier::testing::url_of;

// Memory level whose storage refuses to be released
class StuckQueue : public IRequestQueue {
public:
    void push(const Request& request) override { inner_.push(request); }
    std::optional<Request> pop() override { return inner_.pop(); }
    [[nodiscard]] size_t size() const override { return inner_.size(); }
    void close() override { throw StorageIOException("stuck", "remove", "device busy"); }
    [[nodiscard]] std::string location() const override { return {}; }

private:
    MemoryQueue inner_{QueueOrder::FIFO};
};

class StuckQueueFactory : public IQueueFactory {
public:
    std::unique_ptr<IRequestQueue> create(const std::string&, int) override {
        return std::make_unique<StuckQueue>();
    }
    std::unique_ptr<IRequestQueue> open(const PriorityLevel&) override {
        throw StorageIOException("stuck", "reopen", "not persistent");
    }
    [[nodiscard]] bool is_persistent() const override { return false; }
};

static std::string url_for(int priority) {
    return "https://a.test/p" + std::to_string(priority);
}

static void test_highest_priority_first() {
    MemoryQueueFactory factory(QueueOrder::LIFO);
    PartitionQueue queue(factory, "a.test");

    for (int priority : {-2, 1, -1, 0, 2}) {
        queue.push(Request(url_for(priority), priority), priority);
    }
    assert(queue.size() == 5);
    assert((queue.priorities() == std::vector<int>{2, 1, 0, -1, -2}));

    std::vector<int> expected = {2, 1, 0, -1, -2};
    for (int priority : expected) {
        auto request = queue.pop();
        assert(request);
        assert(request->url() == url_for(priority));
    }

    assert(queue.empty());
    assert(queue.size() == 0);
    assert(!queue.pop());
    std::cout << "Highest priority first OK\n";
}

static void test_tie_break(QueueOrder order, const std::vector<std::string>& expected) {
    MemoryQueueFactory factory(order);
    PartitionQueue queue(factory, "a.test");

    for (const char* name : {"a", "b", "c"}) {
        queue.push(Request(std::string("https://a.test/") + name), 0);
    }

    for (const auto& name : expected) {
        assert(url_of(queue.pop()) == "https://a.test/" + name);
    }
    std::cout << "Tie-break " << to_string(order) << " OK\n";
}

static void test_drained_levels_are_dropped() {
    MemoryQueueFactory factory(QueueOrder::FIFO);
    PartitionQueue queue(factory, "a.test");

    queue.push(Request("https://a.test/1"), 5);
    queue.push(Request("https://a.test/2"), 1);
    queue.push(Request("https://a.test/3"), 1);

    assert(url_of(queue.pop()) == "https://a.test/1");
    assert((queue.priorities() == std::vector<int>{1}));
    assert(queue.size() == 2);

    // A level can come back after being drained
    queue.push(Request("https://a.test/4"), 5);
    assert((queue.priorities() == std::vector<int>{5, 1}));
    assert(url_of(queue.pop()) == "https://a.test/4");
    std::cout << "Drained levels OK\n";
}

static void test_failed_level_close_keeps_request() {
    StuckQueueFactory factory;
    PartitionQueue queue(factory, "a.test");

    queue.push(Request("https://a.test/high"), 2);
    queue.push(Request("https://a.test/low"), 1);

    assert(url_of(queue.pop()) == "https://a.test/high");
    assert((queue.priorities() == std::vector<int>{1}));
    assert(url_of(queue.pop()) == "https://a.test/low");
    assert(queue.empty());
    assert(!queue.pop());
    std::cout << "Failed level close OK\n";
}

static void test_memory_close_reports_levels() {
    MemoryQueueFactory factory(QueueOrder::FIFO);
    PartitionQueue queue(factory, "a.test");

    queue.push(Request("https://a.test/low"), 1);
    queue.push(Request("https://a.test/high"), 5);

    auto state = queue.close();
    assert(state.size() == 2);
    assert(state[0].priority == 5);
    assert(state[1].priority == 1);
    assert(queue.empty());

    // Memory levels cannot be reattached
    assert(throws<StorageIOException>([&] { PartitionQueue reopened(factory, "a.test", state); }));
    std::cout << "Memory close OK\n";
}

static void test_disk_partition_resume() {
    TempDir dir;
    PriorityState state;

    {
        DiskQueueFactory factory(dir.path(), QueueOrder::FIFO);
        PartitionQueue queue(factory, "a.test-slot");
        for (int priority : {-2, 1, -1, 0, 2}) {
            queue.push(Request(url_for(priority), priority), priority);
        }
        assert(url_of(queue.pop()) == url_for(2));
        state = queue.close();
    }

    assert(state.size() == 4);
    assert(state[0].priority == 1);
    assert(state.back().priority == -2);
    for (const auto& level : state) {
        assert(level.location.rfind("a.test-slot/p" + std::to_string(level.priority) + "-", 0) == 0);
    }

    DiskQueueFactory factory(dir.path(), QueueOrder::FIFO);
    PartitionQueue reopened(factory, "a.test-slot", state);
    assert(reopened.size() == 4);
    for (int priority : {1, 0, -1, -2}) {
        assert(url_of(reopened.pop()) == url_for(priority));
    }
    assert(reopened.empty());

    // Every drained level removed its file
    assert(frontier::testing::regular_files_under(dir.path()).empty());
    std::cout << "Disk partition resume OK\n";
}

static void test_duplicate_levels_rejected() {
    TempDir dir;
    DiskQueueFactory factory(dir.path(), QueueOrder::FIFO);

    std::string location;
    {
        auto level = factory.create("a", 3);
        level->push(Request("https://a.test/"));
        location = level->location();
        level->close();
    }

    PriorityState state = {{3, location}, {3, location}};
    assert(throws<MalformedSnapshotException>([&] { PartitionQueue queue(factory, "a", state); }));
    std::cout << "Duplicate levels OK\n";
}

int main() {
    frontier::testing::quiet_logs();

    test_highest_priority_first();
    test_tie_break(QueueOrder::FIFO, {"a", "b", "c"});
    test_tie_break(QueueOrder::LIFO, {"c", "b", "a"});
    test_drained_levels_are_dropped();
    test_failed_level_close_keeps_request();
    test_memory_close_reports_levels();
    test_disk_partition_resume();
    test_duplicate_levels_rejected();

    std::cout << "Priority queue tests PASSED\n";
    return 0;
}
