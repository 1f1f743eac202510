#pragma once

#include "frontier/config/config_enums.h"
#include "frontier/queues/disk_queue.h"
#include "frontier/queues/request_queue.h"

#include <filesystem>

struct sqlite3;

namespace frontier {

/**
 * @brief SQLite database holding one priority level
 *
 * Requests are JSON rows in `queue(id INTEGER PRIMARY KEY AUTOINCREMENT,
 * item BLOB)`; FIFO pops the lowest id, LIFO the highest. The tie-break
 * is recorded in `frontier_meta` and checked on reopen. Every statement
 * commits on its own, so a crash loses at most the operation in
 * progress. A database whose rows are all consumed is deleted on close().
 */
class SqliteQueue : public IRequestQueue {
public:
    /**
     * @brief Open the database at path, creating it when missing
     * @throws StorageIOException if it cannot be opened, is not a queue
     *         database, or was written with the other order
     */
    SqliteQueue(std::filesystem::path path, QueueOrder order, std::filesystem::path root = {});
    ~SqliteQueue() override;

    SqliteQueue(const SqliteQueue&) = delete;
    SqliteQueue& operator=(const SqliteQueue&) = delete;

    void push(const Request& request) override;
    std::optional<Request> pop() override;
    [[nodiscard]] size_t size() const override { return count_; }
    void close() override;
    void detach() override;
    [[nodiscard]] std::string location() const override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::filesystem::path root_;
    QueueOrder order_;
    sqlite3* db_ = nullptr;
    size_t count_ = 0;

    void prepare_schema();
};

/**
 * @brief Factory placing one SqliteQueue database per slot and priority level
 *
 * Paths follow DiskQueueFactory: `<root>/<slot_path>/p<priority>-<suffix>`.
 */
class SqliteQueueFactory : public IQueueFactory {
public:
    SqliteQueueFactory(std::filesystem::path root, QueueOrder order);

    std::unique_ptr<IRequestQueue> create(const std::string& slot_path, int priority) override;
    std::unique_ptr<IRequestQueue> open(const PriorityLevel& level) override;
    [[nodiscard]] bool is_persistent() const override { return true; }

private:
    std::filesystem::path root_;
    DiskQueueConstructor construct_;
    DiskQueueConstructor construct_unique_;
};

} // namespace frontier
