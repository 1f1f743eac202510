#include "frontier/core/exceptions.h"
#include "frontier/queues/disk_queue.h"
#include "frontier/queues/unique_path.h"
#include "test_support.h"

#include <cassert>
#include <fstream>
#include <iostream>
#include <iterator>
#include <set>

using namespace frontier;
using frontier::testing::TempDir;
using frontier::testing::throws;
using frontier::testing::url_of;

static Request numbered(int n) {
    Request request("https://disk.test/" + std::to_string(n), n);
    request.set_slot("disk.test");
    request.meta()["n"] = n;
    return request;
}

static void test_fifo_survives_reopen() {
    TempDir dir;
    auto path = dir.path() / "slot" / "p0";

    {
        DiskQueue queue(path, QueueOrder::FIFO);
        for (int n = 1; n <= 4; ++n) {
            queue.push(numbered(n));
        }
        assert(queue.size() == 4);

        auto first = queue.pop();
        assert(first);
        assert(*first == numbered(1));
    }

    DiskQueue reopened(path, QueueOrder::FIFO);
    assert(reopened.size() == 3);
    for (int n = 2; n <= 4; ++n) {
        assert(url_of(reopened.pop()) == numbered(n).url());
    }
    assert(reopened.size() == 0);
    assert(!reopened.pop());

    reopened.close();
    assert(!std::filesystem::exists(path));
    assert(!std::filesystem::exists(path.parent_path()));
    std::cout << "FIFO reopen OK\n";
}

static void test_lifo_survives_reopen() {
    TempDir dir;
    auto path = dir.path() / "p0";

    {
        DiskQueue queue(path, QueueOrder::LIFO);
        for (int n = 1; n <= 3; ++n) {
            queue.push(numbered(n));
        }
        assert(url_of(queue.pop()) == numbered(3).url());
    }

    DiskQueue reopened(path, QueueOrder::LIFO);
    assert(reopened.size() == 2);
    reopened.push(numbered(9));
    assert(url_of(reopened.pop()) == numbered(9).url());
    assert(url_of(reopened.pop()) == numbered(2).url());
    assert(url_of(reopened.pop()) == numbered(1).url());
    assert(!reopened.pop());
    std::cout << "LIFO reopen OK\n";
}

static void test_fifo_file_stays_bounded() {
    TempDir dir;
    auto path = dir.path() / "p0";

    {
        DiskQueue queue(path, QueueOrder::FIFO);
        queue.push(numbered(0));

        // One pending request while the level keeps cycling
        for (int n = 1; n <= 10000; ++n) {
            queue.push(numbered(n));
            assert(url_of(queue.pop()) == numbered(n - 1).url());
            assert(std::filesystem::file_size(path) < 2 * DiskQueue::COMPACT_THRESHOLD);
        }
        assert(queue.size() == 1);
    }

    assert(frontier::testing::regular_files_under(dir.path()).size() == 1);

    DiskQueue reopened(path, QueueOrder::FIFO);
    assert(reopened.size() == 1);
    assert(url_of(reopened.pop()) == numbered(10000).url());
    assert(!reopened.pop());
    std::cout << "FIFO compaction OK\n";
}

static void test_rejects_foreign_files() {
    TempDir dir;
    auto path = dir.path() / "p1";

    {
        DiskQueue queue(path, QueueOrder::FIFO);
        queue.push(numbered(1));
    }
    assert(throws<StorageIOException>([&] { DiskQueue queue(path, QueueOrder::LIFO); }));

    auto garbage = dir.path() / "garbage";
    {
        std::ofstream out(garbage, std::ios::binary);
        out << "definitely not a queue file";
    }
    assert(throws<StorageIOException>([&] { DiskQueue queue(garbage, QueueOrder::FIFO); }));
    std::cout << "Foreign files OK\n";
}

static void test_unserializable_request() {
    TempDir dir;
    DiskQueue queue(dir.path() / "p0", QueueOrder::FIFO);

    Request broken("https://disk.test/broken");
    broken.set_body(std::string("\xff\xfe", 2));

    assert(throws<RequestSerializationException>([&] { queue.push(broken); }));
    assert(queue.size() == 0);

    queue.push(numbered(1));
    assert(url_of(queue.pop()) == numbered(1).url());
    std::cout << "Unserializable request OK\n";
}

static void test_unique_paths() {
    TempDir dir;
    std::vector<std::filesystem::path> constructed;

    auto construct = [&](const std::filesystem::path& path) -> std::unique_ptr<IRequestQueue> {
        constructed.push_back(path);
        return std::make_unique<DiskQueue>(path, QueueOrder::FIFO, dir.path());
    };
    auto unique = unique_path_queue(construct);

    auto base = dir.path() / "slot" / "p3";
    auto first = unique(base);
    auto second = unique(base);

    assert(constructed.size() == 2);
    assert(constructed[0] != constructed[1]);
    for (const auto& path : constructed) {
        std::string name = path.filename().string();
        assert(name.rfind("p3-", 0) == 0);
        assert(name.size() == 3 + 32);
        assert(name.find_first_not_of("0123456789abcdef", 3) == std::string::npos);
    }

    assert(first->location().rfind("slot/p3-", 0) == 0);

    std::set<std::string> suffixes;
    for (int i = 0; i < 32; ++i) {
        suffixes.insert(random_path_suffix());
    }
    assert(suffixes.size() == 32);
    std::cout << "Unique paths OK\n";
}

static void test_unique_path_skips_taken_names() {
    TempDir dir;
    auto base = dir.path() / "p0";
    auto taken = dir.path() / "p0-taken";
    {
        std::ofstream out(taken, std::ios::binary);
        out << "left by an earlier run";
    }

    std::vector<std::string> suffixes = {"taken", "free"};
    size_t calls = 0;
    auto scripted = [&] { return suffixes.at(calls++); };

    std::filesystem::path constructed;
    auto construct = [&](const std::filesystem::path& path) -> std::unique_ptr<IRequestQueue> {
        constructed = path;
        return std::make_unique<DiskQueue>(path, QueueOrder::FIFO, dir.path());
    };

    auto queue = unique_path_queue(construct, scripted)(base);
    assert(calls == 2);
    assert(constructed != taken);
    assert(constructed == dir.path() / "p0-taken-free");
    assert(queue->location() == "p0-taken-free");

    std::ifstream in(taken, std::ios::binary);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    assert(contents == "left by an earlier run");
    std::cout << "Unique path collision OK\n";
}

static void test_factory() {
    TempDir dir;
    DiskQueueFactory factory(dir.path(), QueueOrder::FIFO);
    assert(factory.is_persistent());

    std::string location;
    {
        auto queue = factory.create("example.com-abc", 4);
        queue->push(numbered(4));
        location = queue->location();
        queue->close();
    }
    assert(location.rfind("example.com-abc/p4-", 0) == 0);

    auto reopened = factory.open({4, location});
    assert(reopened->size() == 1);
    assert(url_of(reopened->pop()) == numbered(4).url());

    assert(throws<StorageIOException>([&] { (void)factory.open({4, "example.com-abc/p4-missing"}); }));
    assert(throws<StorageIOException>([&] { (void)factory.open({4, ""}); }));
    std::cout << "Disk factory OK\n";
}

int main() {
    frontier::testing::quiet_logs();

    test_fifo_survives_reopen();
    test_lifo_survives_reopen();
    test_fifo_file_stays_bounded();
    test_rejects_foreign_files();
    test_unserializable_request();
    test_unique_paths();
    test_unique_path_skips_taken_names();
    test_factory();

    std::cout << "Disk queue tests PASSED\n";
    return 0;
}
