#include "frontier/core/exceptions.h"
#include "frontier/scheduler/scheduler.h"
#include "frontier/scheduler/slot.h"
#include "test_support.h"

#include <cassert>
#include <fstream>
#include <iostream>

using namespace frontier;
using frontier::testing::TempDir;
using frontier::testing::throws;
using frontier::testing::url_of;

static SchedulerConfig persistent_config(const std::filesystem::path& job_dir,
                                         FairnessStrategy fairness = FairnessStrategy::ROUND_ROBIN) {
    SchedulerConfig config;
    config.job_dir = job_dir;
    config.order = QueueOrder::FIFO;
    config.fairness = fairness;
    return config;
}

static void enqueue(Scheduler& scheduler, const std::string& url, int priority = 0) {
    Request request(url, priority);
    scheduler.enqueue(request);
}

static void test_memory_only_scheduler() {
    SchedulerConfig config;
    config.order = QueueOrder::FIFO;
    Scheduler scheduler(config);

    assert(throws<QueueStateException>([&] { enqueue(scheduler, "https://a.test/"); }));
    assert(throws<QueueStateException>([&] { (void)scheduler.next(); }));

    scheduler.open();
    assert(scheduler.is_open());
    assert(!scheduler.has_pending());
    assert(throws<QueueStateException>([&] { scheduler.open(); }));

    for (int priority : {-2, 1, -1, 0, 2}) {
        enqueue(scheduler, "https://a.test/" + std::to_string(priority), priority);
    }
    assert(scheduler.size() == 5);
    assert(scheduler.memory_size() == 5);
    assert(scheduler.disk_size() == 0);

    for (int priority : {2, 1, 0, -1, -2}) {
        assert(url_of(scheduler.next()) == "https://a.test/" + std::to_string(priority));
    }
    assert(!scheduler.next());

    enqueue(scheduler, "https://a.test/dropped");
    auto snapshot = scheduler.close("finished");
    assert(snapshot.empty());
    assert(!scheduler.is_open());
    assert(scheduler.stats().enqueued_memory == 6);
    assert(scheduler.stats().dequeued_memory == 5);
    assert(scheduler.stats().peak_pending == 5);

    PersistedSnapshot foreign;
    foreign.slots.push_back({"a.test", {{0, "a.test-x/p0-y"}}});
    assert(throws<QueueStateException>([&] { scheduler.open(foreign); }));
    assert(!scheduler.is_open());
    std::cout << "Memory-only scheduler OK\n";
}

static void test_resume_across_runs() {
    TempDir dir;
    auto config = persistent_config(dir.path() / "job");

    {
        Scheduler scheduler(config);
        scheduler.open();
        for (const char* host : {"a", "b", "c", "d"}) {
            enqueue(scheduler, std::string("https://") + host + ".test/1");
            enqueue(scheduler, std::string("https://") + host + ".test/2", 1);
        }
        assert(scheduler.disk_size() == 8);
        assert(scheduler.stats().enqueued_disk == 8);

        assert(url_of(scheduler.next()) == "https://a.test/2");

        auto snapshot = scheduler.close("paused");
        assert(snapshot.slots.size() == 4);
        assert(snapshot.slots[0].slot == "b.test");
        assert(snapshot.slots[3].slot == "a.test");
    }

    assert(std::filesystem::exists(config.snapshot_path()));

    Scheduler resumed(config);
    resumed.open();
    assert(resumed.size() == 7);
    assert(resumed.stats().restored == 7);

    std::vector<std::string> urls;
    while (auto request = resumed.next()) {
        urls.push_back(request->url());
    }
    assert((urls == std::vector<std::string>{
        "https://b.test/2", "https://c.test/2", "https://d.test/2", "https://a.test/1",
        "https://b.test/1", "https://c.test/1", "https://d.test/1"}));

    resumed.close();

    // Only the snapshot survives a drained job
    auto files = frontier::testing::regular_files_under(config.queue_dir());
    assert(files.size() == 1);
    assert(files[0].filename() == "active.json");

    Scheduler empty(config);
    empty.open();
    assert(!empty.has_pending());
    empty.close();
    std::cout << "Resume across runs OK\n";
}

static void test_resume_with_sqlite_backend() {
    TempDir dir;
    auto config = persistent_config(dir.path() / "job");
    config.backend = QueueBackend::SQLITE;
    assert(config.summary().find("backend=sqlite") != std::string::npos);

    {
        Scheduler scheduler(config);
        scheduler.open();
        enqueue(scheduler, "https://a.test/1");
        enqueue(scheduler, "https://b.test/1");
        enqueue(scheduler, "https://a.test/2", 4);
        assert(scheduler.disk_size() == 3);
        assert(url_of(scheduler.next()) == "https://a.test/2");
        scheduler.close("paused");
    }

    Scheduler resumed(config);
    resumed.open();
    assert(resumed.size() == 2);
    assert(url_of(resumed.next()) == "https://b.test/1");
    assert(url_of(resumed.next()) == "https://a.test/1");
    resumed.close();

    auto files = frontier::testing::regular_files_under(config.queue_dir());
    assert(files.size() == 1);
    assert(files[0].filename() == "active.json");

    // A memory backend ignores the job directory
    config.backend = QueueBackend::MEMORY;
    Scheduler volatile_scheduler(config);
    volatile_scheduler.open();
    enqueue(volatile_scheduler, "https://c.test/1");
    assert(volatile_scheduler.memory_size() == 1);
    assert(volatile_scheduler.disk_size() == 0);
    volatile_scheduler.close();
    std::cout << "SQLite backend resume OK\n";
}

static void test_unserializable_requests_stay_in_memory() {
    TempDir dir;
    Scheduler scheduler(persistent_config(dir.path()));
    scheduler.open();

    enqueue(scheduler, "https://a.test/disk", 100);

    Request broken("https://a.test/broken", -5);
    broken.set_body(std::string("\xff", 1));
    scheduler.enqueue(broken);
    scheduler.enqueue(broken);

    assert(scheduler.memory_size() == 2);
    assert(scheduler.disk_size() == 1);
    assert(scheduler.stats().unserializable == 2);

    // Memory drains first regardless of priority
    assert(url_of(scheduler.next()) == "https://a.test/broken");
    assert(url_of(scheduler.next()) == "https://a.test/broken");
    assert(url_of(scheduler.next()) == "https://a.test/disk");
    assert(scheduler.stats().dequeued_memory == 2);
    assert(scheduler.stats().dequeued_disk == 1);
    scheduler.close();
    std::cout << "Unserializable fallback OK\n";
}

static void test_enqueue_documents() {
    SchedulerConfig config;
    Scheduler scheduler(config);
    scheduler.open();

    scheduler.enqueue(nlohmann::json{{"url", "https://doc.test/a"}, {"priority", 3}});
    scheduler.enqueue(nlohmann::json{{"url", "https://doc.test/b"},
                                     {"meta", {{SLOT_META_KEY, "custom"}}}});

    assert(throws<InvalidRequestException>([&] { scheduler.enqueue(nlohmann::json::array({"https://x.test/"})); }));
    assert(throws<InvalidRequestException>([&] { scheduler.enqueue(nlohmann::json{{"priority", 1}}); }));
    assert(scheduler.size() == 2);

    auto first = scheduler.next();
    assert(url_of(first) == "https://doc.test/a");
    assert(first->priority() == 3);
    assert(first->slot() == std::optional<std::string>("doc.test"));

    auto second = scheduler.next();
    assert(second->slot() == std::optional<std::string>("custom"));
    scheduler.close();
    std::cout << "Document requests OK\n";
}

static void test_legacy_snapshot_is_rejected() {
    TempDir dir;
    auto config = persistent_config(dir.path());

    std::filesystem::create_directories(config.queue_dir());
    {
        std::ofstream out(config.snapshot_path());
        out << "[0, -1, 5]\n";
    }

    Scheduler scheduler(config);
    assert(throws<MalformedSnapshotException>([&] { scheduler.open(); }));
    assert(!scheduler.is_open());
    assert(scheduler.size() == 0);

    {
        std::ofstream out(config.snapshot_path(), std::ios::trunc);
        out << "{not json";
    }
    assert(throws<MalformedSnapshotException>([&] { scheduler.open(); }));
    std::cout << "Legacy snapshot OK\n";
}

static void test_downloader_hooks_flow_through() {
    TempDir dir;
    Scheduler scheduler(persistent_config(dir.path(), FairnessStrategy::DOWNLOADER_AWARE));
    scheduler.open();

    enqueue(scheduler, "https://busy.test/1");
    enqueue(scheduler, "https://busy.test/2");
    enqueue(scheduler, "https://idle.test/1");
    enqueue(scheduler, "https://idle.test/2");

    auto first = scheduler.next();
    assert(url_of(first) == "https://busy.test/1");
    scheduler.on_dispatch_start(*first);

    // busy.test keeps its turn skipped while its download is running
    assert(url_of(scheduler.next()) == "https://idle.test/1");
    assert(url_of(scheduler.next()) == "https://idle.test/2");

    scheduler.on_dispatch_complete(*first);
    assert(url_of(scheduler.next()) == "https://busy.test/2");
    scheduler.close();
    std::cout << "Downloader hooks OK\n";
}

static void test_invalid_configuration() {
    TempDir dir;
    auto file = dir.path() / "not-a-dir";
    {
        std::ofstream out(file);
        out << "x";
    }

    SchedulerConfig config;
    config.job_dir = file;
    assert(throws<ConfigurationException>([&] { Scheduler scheduler(config); }));
    std::cout << "Invalid configuration OK\n";
}

int main() {
    frontier::testing::quiet_logs();

    test_memory_only_scheduler();
    test_resume_across_runs();
    test_resume_with_sqlite_backend();
    test_unserializable_requests_stay_in_memory();
    test_enqueue_documents();
    test_legacy_snapshot_is_rejected();
    test_downloader_hooks_flow_through();
    test_invalid_configuration();

    std::cout << "Scheduler tests PASSED\n";
    return 0;
}
