#pragma once

#include "frontier/config/config_enums.h"
#include "frontier/queues/request_queue.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>

namespace frontier {

/**
 * @brief File-backed queue holding one priority level
 *
 * File layout (little endian):
 * - header: magic "FRQ1", u32 order, u64 head offset, u64 entry count
 * - FIFO records: u32 length, JSON-encoded request
 * - LIFO records: JSON-encoded request, u32 length
 *
 * FIFO pops advance the head offset and the consumed prefix is dropped
 * once it outgrows both COMPACT_THRESHOLD and the live records; LIFO
 * pops truncate the file. The header is rewritten after every
 * operation, so a crash loses at most the operation in progress. A file
 * whose entries are all consumed is deleted on close().
 */
class DiskQueue : public IRequestQueue {
public:
    static constexpr uint64_t HEADER_SIZE = 24;
    static constexpr uint64_t COMPACT_THRESHOLD = 64 * 1024;   ///< Consumed FIFO bytes kept before compaction

    /**
     * @brief Open the queue at path, creating it when missing
     * @param path Queue file
     * @param order Tie-break; must match the order the file was created with
     * @param root Directory that location() is reported relative to
     * @throws StorageIOException if the file cannot be created or read
     */
    DiskQueue(std::filesystem::path path, QueueOrder order, std::filesystem::path root = {});
    ~DiskQueue() override;

    DiskQueue(const DiskQueue&) = delete;
    DiskQueue& operator=(const DiskQueue&) = delete;

    void push(const Request& request) override;
    std::optional<Request> pop() override;
    [[nodiscard]] size_t size() const override { return static_cast<size_t>(count_); }
    void close() override;
    void detach() override;
    [[nodiscard]] std::string location() const override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::filesystem::path root_;
    QueueOrder order_;
    std::fstream file_;

    uint64_t head_ = HEADER_SIZE;   ///< Offset of the oldest FIFO record
    uint64_t end_ = HEADER_SIZE;    ///< Offset one past the last record
    uint64_t count_ = 0;

    void create_file();
    void read_header();
    void write_header();
    void truncate_to(uint64_t new_end);
    [[nodiscard]] bool needs_compaction() const;
    void compact();
    std::string read_bytes(uint64_t offset, uint64_t length);
    void check_stream(const std::string& operation);
    Request decode(const std::string& payload) const;
};

/**
 * @brief Delete a drained queue file, then its slot directory if that is now empty
 * @param path Queue file
 * @param root Backend root, never removed
 * @throws StorageIOException if the file cannot be removed
 */
void remove_queue_storage(const std::filesystem::path& path, const std::filesystem::path& root);

/**
 * @brief Constructor of a disk-backed queue at a given path
 */
using DiskQueueConstructor = std::function<std::unique_ptr<IRequestQueue>(const std::filesystem::path&)>;

/**
 * @brief Factory placing one DiskQueue file per slot and priority level
 *
 * New levels are created at `<root>/<slot_path>/p<priority>-<suffix>`
 * through unique_path_queue(), so a file left behind by an earlier run
 * is never reused by accident.
 */
class DiskQueueFactory : public IQueueFactory {
public:
    DiskQueueFactory(std::filesystem::path root, QueueOrder order);

    std::unique_ptr<IRequestQueue> create(const std::string& slot_path, int priority) override;
    std::unique_ptr<IRequestQueue> open(const PriorityLevel& level) override;
    [[nodiscard]] bool is_persistent() const override { return true; }

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
    QueueOrder order_;
    DiskQueueConstructor construct_;
    DiskQueueConstructor construct_unique_;
};

} // namespace frontier
