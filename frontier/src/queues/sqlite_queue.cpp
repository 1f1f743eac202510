#include "frontier/queues/sqlite_queue.h"
#include "frontier/queues/unique_path.h"
#include "frontier/core/exceptions.h"
#include "frontier/utils/logger.h"

#include <sqlite3.h>

namespace frontier {

namespace {

StorageIOException sqlite_error(sqlite3* db, const std::filesystem::path& path, const std::string& operation) {
    return StorageIOException(path.string(), operation, db ? sqlite3_errmsg(db) : "out of memory");
}

/**
 * @brief Prepared statement finalized on scope exit
 */
class Statement {
public:
    Statement(sqlite3* db, const std::filesystem::path& path, const char* sql)
        : db_(db)
        , path_(path) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw sqlite_error(db_, path_, "prepare");
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @return true while a row is available, false once done
     */
    bool step(const std::string& operation) {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc != SQLITE_DONE) {
            throw sqlite_error(db_, path_, operation);
        }
        return false;
    }

    sqlite3_stmt* get() const noexcept { return stmt_; }

private:
    sqlite3* db_;
    const std::filesystem::path& path_;
    sqlite3_stmt* stmt_ = nullptr;
};

void execute(sqlite3* db, const std::filesystem::path& path, const char* sql, const std::string& operation) {
    char* message = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &message) != SQLITE_OK) {
        std::string reason = message ? message : sqlite3_errmsg(db);
        sqlite3_free(message);
        throw StorageIOException(path.string(), operation, reason);
    }
}

} // namespace

// ============================================================================
// SqliteQueue
// ============================================================================

SqliteQueue::SqliteQueue(std::filesystem::path path, QueueOrder order, std::filesystem::path root)
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

    if (sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK) {
        auto failure = sqlite_error(db_, path_, "open");
        sqlite3_close(db_);
        db_ = nullptr;
        throw failure;
    }

    try {
        prepare_schema();
    } catch (const StorageIOException&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteQueue::~SqliteQueue() {
    if (!db_) {
        return;
    }

    try {
        close();
    } catch (const FrontierException& e) {
        LoggerFactory::get_logger("frontier.queues")
            .error(std::string("Failed to close queue on destruction: ") + e.what());
    }
}

void SqliteQueue::prepare_schema() {
    execute(db_, path_,
            "CREATE TABLE IF NOT EXISTS queue (id INTEGER PRIMARY KEY AUTOINCREMENT, item BLOB NOT NULL);"
            "CREATE TABLE IF NOT EXISTS frontier_meta (key TEXT PRIMARY KEY, value TEXT NOT NULL);",
            "create schema");

    {
        Statement insert(db_, path_, "INSERT OR IGNORE INTO frontier_meta (key, value) VALUES ('order', ?)");
        std::string order = to_string(order_);
        sqlite3_bind_text(insert.get(), 1, order.c_str(), -1, SQLITE_TRANSIENT);
        insert.step("record order");
    }

    Statement select(db_, path_, "SELECT value FROM frontier_meta WHERE key = 'order'");
    if (!select.step("read order")) {
        throw StorageIOException(path_.string(), "read", "queue order is not recorded");
    }
    auto stored = reinterpret_cast<const char*>(sqlite3_column_text(select.get(), 0));
    std::string stored_order = stored ? stored : "";
    if (stored_order != to_string(order_)) {
        throw StorageIOException(path_.string(), "read",
                                 "queue was written as " + stored_order + " but is opened as " + to_string(order_));
    }

    Statement count(db_, path_, "SELECT COUNT(*) FROM queue");
    count.step("count");
    count_ = static_cast<size_t>(sqlite3_column_int64(count.get(), 0));
}

std::string SqliteQueue::location() const {
    if (root_.empty()) {
        return path_.string();
    }
    return path_.lexically_relative(root_).generic_string();
}

void SqliteQueue::push(const Request& request) {
    if (!db_) {
        throw StorageIOException(path_.string(), "push", "queue is closed");
    }

    std::string payload;
    try {
        payload = request.to_json().dump();
    } catch (const nlohmann::json::type_error& e) {
        throw RequestSerializationException(request.url(), e.what());
    }

    Statement insert(db_, path_, "INSERT INTO queue (item) VALUES (?)");
    sqlite3_bind_blob64(insert.get(), 1, payload.data(), payload.size(), SQLITE_TRANSIENT);
    insert.step("insert");
    ++count_;
}

std::optional<Request> SqliteQueue::pop() {
    if (!db_) {
        throw StorageIOException(path_.string(), "pop", "queue is closed");
    }

    if (count_ == 0) {
        return std::nullopt;
    }

    const char* sql = order_ == QueueOrder::FIFO
        ? "SELECT id, item FROM queue ORDER BY id ASC LIMIT 1"
        : "SELECT id, item FROM queue ORDER BY id DESC LIMIT 1";

    sqlite3_int64 id = 0;
    std::string payload;
    {
        Statement select(db_, path_, sql);
        if (!select.step("select")) {
            throw StorageIOException(path_.string(), "pop",
                                     "expected " + std::to_string(count_) + " rows, found none");
        }
        id = sqlite3_column_int64(select.get(), 0);
        auto data = static_cast<const char*>(sqlite3_column_blob(select.get(), 1));
        auto length = sqlite3_column_bytes(select.get(), 1);
        payload.assign(data ? data : "", static_cast<size_t>(length));
    }

    Statement remove(db_, path_, "DELETE FROM queue WHERE id = ?");
    sqlite3_bind_int64(remove.get(), 1, id);
    remove.step("delete");
    --count_;

    try {
        return Request::from_json(nlohmann::json::parse(payload));
    } catch (const nlohmann::json::parse_error& e) {
        throw StorageIOException(path_.string(), "decode", std::string("corrupt record: ") + e.what());
    } catch (const InvalidRequestException& e) {
        throw StorageIOException(path_.string(), "decode", e.what());
    }
}

void SqliteQueue::detach() {
    if (!db_) {
        return;
    }

    int rc = sqlite3_close(db_);
    if (rc != SQLITE_OK) {
        throw sqlite_error(db_, path_, "close");
    }
    db_ = nullptr;
}

void SqliteQueue::close() {
    if (!db_) {
        return;
    }

    detach();
    if (count_ == 0) {
        remove_queue_storage(path_, root_);
    }
}

// ============================================================================
// SqliteQueueFactory
// ============================================================================

SqliteQueueFactory::SqliteQueueFactory(std::filesystem::path root, QueueOrder order)
    : root_(std::move(root)) {
    construct_ = [root = root_, order](const std::filesystem::path& path) -> std::unique_ptr<IRequestQueue> {
        return std::make_unique<SqliteQueue>(path, order, root);
    };
    construct_unique_ = unique_path_queue(construct_);
}

std::unique_ptr<IRequestQueue> SqliteQueueFactory::create(const std::string& slot_path, int priority) {
    return construct_unique_(root_ / slot_path / ("p" + std::to_string(priority)));
}

std::unique_ptr<IRequestQueue> SqliteQueueFactory::open(const PriorityLevel& level) {
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
