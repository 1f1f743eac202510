#include "frontier/queues/disk_queue.h"
#include "frontier/queues/unique_path.h"
#include "frontier/core/exceptions.h"
#include "frontier/utils/logger.h"

#include <algorithm>
#include <array>
#include <limits>

namespace frontier {

namespace {

constexpr char MAGIC[4] = {'F', 'R', 'Q', '1'};

void put_u32(char* out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out[i] = static_cast<char>((value >> (8 * i)) & 0xFF);
    }
}

void put_u64(char* out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<char>((value >> (8 * i)) & 0xFF);
    }
}

uint32_t get_u32(const char* in) {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(static_cast<unsigned char>(in[i])) << (8 * i);
    }
    return value;
}

uint64_t get_u64(const char* in) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(static_cast<unsigned char>(in[i])) << (8 * i);
    }
    return value;
}

std::array<char, DiskQueue::HEADER_SIZE> encode_header(QueueOrder order, uint64_t head, uint64_t count) {
    std::array<char, DiskQueue::HEADER_SIZE> header{};
    std::copy(std::begin(MAGIC), std::end(MAGIC), header.begin());
    put_u32(header.data() + 4, static_cast<uint32_t>(order));
    put_u64(header.data() + 8, head);
    put_u64(header.data() + 16, count);
    return header;
}

Logger& queue_logger() {
    return LoggerFactory::get_logger("frontier.queues");
}

} // namespace

// ============================================================================
// DiskQueue
// ============================================================================

DiskQueue::DiskQueue(std::filesystem::path path, QueueOrder order, std::filesystem::path root)
    : path_(std::move(path))
    , root_(std::move(root))
    , order_(order) {

    std::error_code ec;
    auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw StorageIOException(parent.string(), "create directory", ec.message());
        }
    }

    if (!std::filesystem::exists(path_)) {
        create_file();
    }

    file_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
    if (!file_.is_open()) {
        throw StorageIOException(path_.string(), "open", "cannot open queue file");
    }

    read_header();
}

DiskQueue::~DiskQueue() {
    if (!file_.is_open()) {
        return;
    }

    try {
        close();
    } catch (const FrontierException& e) {
        queue_logger().error(std::string("Failed to close queue on destruction: ") + e.what());
    }
}

std::string DiskQueue::location() const {
    if (root_.empty()) {
        return path_.string();
    }
    return path_.lexically_relative(root_).generic_string();
}

void DiskQueue::create_file() {
    std::ofstream out(path_, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw StorageIOException(path_.string(), "create", "cannot create queue file");
    }

    auto header = encode_header(order_, HEADER_SIZE, 0);
    out.write(header.data(), header.size());
    out.flush();
    if (!out) {
        throw StorageIOException(path_.string(), "create", "cannot write queue header");
    }
}

void DiskQueue::read_header() {
    std::array<char, HEADER_SIZE> header{};
    file_.seekg(0, std::ios::beg);
    file_.read(header.data(), header.size());
    if (!file_) {
        throw StorageIOException(path_.string(), "read", "truncated queue header");
    }

    if (!std::equal(std::begin(MAGIC), std::end(MAGIC), header.begin())) {
        throw StorageIOException(path_.string(), "read", "not a frontier queue file");
    }

    auto stored_order = static_cast<QueueOrder>(get_u32(header.data() + 4));
    if (stored_order != order_) {
        throw StorageIOException(path_.string(), "read",
                                 "queue was written as " + to_string(stored_order) +
                                 " but is opened as " + to_string(order_));
    }

    head_ = get_u64(header.data() + 8);
    count_ = get_u64(header.data() + 16);

    std::error_code ec;
    end_ = std::filesystem::file_size(path_, ec);
    if (ec) {
        throw StorageIOException(path_.string(), "stat", ec.message());
    }

    // Emptied queues always shrink back to the bare header
    if (head_ < HEADER_SIZE || head_ > end_ || (count_ == 0) != (head_ == end_)) {
        throw StorageIOException(path_.string(), "read", "inconsistent queue header");
    }
}

void DiskQueue::write_header() {
    std::array<char, 16> fields{};
    put_u64(fields.data(), head_);
    put_u64(fields.data() + 8, count_);

    file_.seekp(8, std::ios::beg);
    file_.write(fields.data(), fields.size());
    file_.flush();
    check_stream("write header");
}

void DiskQueue::truncate_to(uint64_t new_end) {
    file_.flush();
    std::error_code ec;
    std::filesystem::resize_file(path_, new_end, ec);
    if (ec) {
        throw StorageIOException(path_.string(), "truncate", ec.message());
    }
    end_ = new_end;
}

bool DiskQueue::needs_compaction() const {
    uint64_t consumed = head_ - HEADER_SIZE;
    return consumed >= COMPACT_THRESHOLD && consumed >= end_ - head_;
}

void DiskQueue::compact() {
    std::string live = read_bytes(head_, end_ - head_);

    // Rewrite aside and rename over the queue, so a crash keeps one intact copy
    auto temp_path = path_;
    temp_path += ".compact";
    {
        std::ofstream out(temp_path, std::ios::out | std::ios::binary | std::ios::trunc);
        auto header = encode_header(order_, HEADER_SIZE, count_);
        out.write(header.data(), header.size());
        out.write(live.data(), static_cast<std::streamsize>(live.size()));
        out.flush();
        if (!out) {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            throw StorageIOException(temp_path.string(), "compact", "cannot write compacted queue");
        }
    }

    file_.close();
    std::error_code ec;
    std::filesystem::rename(temp_path, path_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        file_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
        throw StorageIOException(path_.string(), "compact", ec.message());
    }

    queue_logger().trace("Compacted " + path_.string() + ": dropped " +
                         std::to_string(head_ - HEADER_SIZE) + " consumed bytes");
    head_ = HEADER_SIZE;
    end_ = HEADER_SIZE + live.size();

    file_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
    if (!file_.is_open()) {
        throw StorageIOException(path_.string(), "compact", "cannot reopen compacted queue");
    }
}

std::string DiskQueue::read_bytes(uint64_t offset, uint64_t length) {
    if (offset + length > end_) {
        throw StorageIOException(path_.string(), "read", "record extends past end of file");
    }

    std::string buffer(static_cast<size_t>(length), '\0');
    file_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    file_.read(buffer.data(), static_cast<std::streamsize>(length));
    check_stream("read");
    return buffer;
}

void DiskQueue::check_stream(const std::string& operation) {
    if (!file_) {
        file_.clear();
        throw StorageIOException(path_.string(), operation, "I/O error");
    }
}

Request DiskQueue::decode(const std::string& payload) const {
    try {
        return Request::from_json(nlohmann::json::parse(payload));
    } catch (const nlohmann::json::parse_error& e) {
        throw StorageIOException(path_.string(), "decode", std::string("corrupt record: ") + e.what());
    } catch (const InvalidRequestException& e) {
        throw StorageIOException(path_.string(), "decode", e.what());
    }
}

void DiskQueue::push(const Request& request) {
    if (!file_.is_open()) {
        throw StorageIOException(path_.string(), "push", "queue is closed");
    }

    std::string payload;
    try {
        payload = request.to_json().dump();
    } catch (const nlohmann::json::type_error& e) {
        throw RequestSerializationException(request.url(), e.what());
    }

    if (payload.size() > std::numeric_limits<uint32_t>::max()) {
        throw RequestSerializationException(request.url(), "encoded request exceeds 4 GiB");
    }

    char length[4];
    put_u32(length, static_cast<uint32_t>(payload.size()));

    file_.seekp(static_cast<std::streamoff>(end_), std::ios::beg);
    if (order_ == QueueOrder::FIFO) {
        file_.write(length, sizeof(length));
        file_.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    } else {
        file_.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        file_.write(length, sizeof(length));
    }
    check_stream("append");

    end_ += sizeof(length) + payload.size();
    ++count_;
    write_header();
}

std::optional<Request> DiskQueue::pop() {
    if (!file_.is_open()) {
        throw StorageIOException(path_.string(), "pop", "queue is closed");
    }

    if (count_ == 0) {
        return std::nullopt;
    }

    std::string payload;
    if (order_ == QueueOrder::FIFO) {
        uint32_t length = get_u32(read_bytes(head_, 4).data());
        payload = read_bytes(head_ + 4, length);
        head_ += 4 + static_cast<uint64_t>(length);
        --count_;

        if (count_ == 0) {
            head_ = HEADER_SIZE;
            truncate_to(HEADER_SIZE);
        }
    } else {
        if (end_ < HEADER_SIZE + 4) {
            throw StorageIOException(path_.string(), "read", "missing record length");
        }
        uint32_t length = get_u32(read_bytes(end_ - 4, 4).data());
        if (end_ - 4 < HEADER_SIZE + length) {
            throw StorageIOException(path_.string(), "read", "record length out of range");
        }
        uint64_t start = end_ - 4 - length;
        payload = read_bytes(start, length);
        --count_;
        truncate_to(start);
    }

    write_header();

    if (order_ == QueueOrder::FIFO && needs_compaction()) {
        try {
            compact();
        } catch (const StorageIOException& e) {
            // The popped record is already committed; retry on a later pop
            queue_logger().warn(e.what());
        }
    }

    return decode(payload);
}

void DiskQueue::detach() {
    if (!file_.is_open()) {
        return;
    }

    write_header();
    file_.close();
}

void DiskQueue::close() {
    if (!file_.is_open()) {
        return;
    }

    detach();
    if (count_ == 0) {
        remove_queue_storage(path_, root_);
    }
}

void remove_queue_storage(const std::filesystem::path& path, const std::filesystem::path& root) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        throw StorageIOException(path.string(), "remove", ec.message());
    }

    auto parent = path.parent_path();
    if (!parent.empty() && parent != root && std::filesystem::is_empty(parent, ec) && !ec) {
        std::filesystem::remove(parent, ec);
        if (ec) {
            queue_logger().debug("Could not remove empty slot directory " + parent.string() + ": " + ec.message());
        }
    }
}

// ============================================================================
// DiskQueueFactory
// ============================================================================

DiskQueueFactory::DiskQueueFactory(std::filesystem::path root, QueueOrder order)
    : root_(std::move(root))
    , order_(order) {
    construct_ = [root = root_, order](const std::filesystem::path& path) -> std::unique_ptr<IRequestQueue> {
        return std::make_unique<DiskQueue>(path, order, root);
    };
    construct_unique_ = unique_path_queue(construct_);
}

std::unique_ptr<IRequestQueue> DiskQueueFactory::create(const std::string& slot_path, int priority) {
    return construct_unique_(root_ / slot_path / ("p" + std::to_string(priority)));
}

std::unique_ptr<IRequestQueue> DiskQueueFactory::open(const PriorityLevel& level) {
    if (level.location.empty()) {
        throw StorageIOException(root_.string(), "reopen",
                                 "priority level " + std::to_string(level.priority) + " has no location");
    }

    auto path = root_ / level.location;
    if (!std::filesystem::is_regular_file(path)) {
        throw StorageIOException(path.string(), "reopen", "queue file is missing");
    }
    return construct_(path);
}

} // namespace frontier
