/**
 * @file snapshot_store.cpp
 * @brief Implementation of SQLite snapshot persistence
 * @author RegBridge Team
 * @date 2025-09-05
 */

#include "snapshot_store.hpp"
#include "logger.hpp"
#include <chrono>

namespace regBridge {

namespace {

enum ValueTag {
    VALUE_NULL = 0,
    VALUE_BOOL = 1,
    VALUE_INT = 2,
    VALUE_REAL = 3,
    VALUE_TEXT = 4
};

// Finalizes a prepared statement on scope exit
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            std::string error = sqlite3_errmsg(db);
            sqlite3_finalize(stmt_);
            throw StorageException("Failed to prepare statement: " + error);
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

int64_t toMillis(const TimePoint& time_point) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch()).count();
}

TimePoint fromMillis(int64_t millis) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(Duration(millis)));
}

void bindOptionalText(sqlite3_stmt* stmt, int index, const std::optional<std::string>& text) {
    if (text) {
        sqlite3_bind_text(stmt, index, text->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

void bindValue(sqlite3_stmt* stmt, int tag_index, const ParameterValue& value) {
    // Columns: tag, int_value, real_value, text_value
    sqlite3_bind_null(stmt, tag_index + 1);
    sqlite3_bind_null(stmt, tag_index + 2);
    sqlite3_bind_null(stmt, tag_index + 3);

    if (std::holds_alternative<bool>(value)) {
        sqlite3_bind_int(stmt, tag_index, VALUE_BOOL);
        sqlite3_bind_int64(stmt, tag_index + 1, std::get<bool>(value) ? 1 : 0);
    } else if (std::holds_alternative<int64_t>(value)) {
        sqlite3_bind_int(stmt, tag_index, VALUE_INT);
        sqlite3_bind_int64(stmt, tag_index + 1, std::get<int64_t>(value));
    } else if (std::holds_alternative<double>(value)) {
        sqlite3_bind_int(stmt, tag_index, VALUE_REAL);
        sqlite3_bind_double(stmt, tag_index + 2, std::get<double>(value));
    } else if (std::holds_alternative<std::string>(value)) {
        sqlite3_bind_int(stmt, tag_index, VALUE_TEXT);
        sqlite3_bind_text(stmt, tag_index + 3, std::get<std::string>(value).c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_int(stmt, tag_index, VALUE_NULL);
    }
}

ParameterValue columnValue(sqlite3_stmt* stmt, int tag_column) {
    switch (sqlite3_column_int(stmt, tag_column)) {
        case VALUE_BOOL:
            return sqlite3_column_int64(stmt, tag_column + 1) != 0;
        case VALUE_INT:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, tag_column + 1));
        case VALUE_REAL:
            return sqlite3_column_double(stmt, tag_column + 2);
        case VALUE_TEXT: {
            const unsigned char* text = sqlite3_column_text(stmt, tag_column + 3);
            return std::string(text ? reinterpret_cast<const char*>(text) : "");
        }
        default:
            return std::monostate{};
    }
}

std::optional<std::string> columnOptionalText(sqlite3_stmt* stmt, int column) {
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return std::string(reinterpret_cast<const char*>(sqlite3_column_text(stmt, column)));
}

} // namespace

SnapshotStore::SnapshotStore(const std::string& db_path)
    : db_path_(db_path), db_(nullptr) {

    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = "Failed to open database " + db_path_ + ": " + std::string(sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageException(error);
    }

    initializeDatabase();
    LOG_INFO("Snapshot store initialized with database: {}", db_path_);
}

SnapshotStore::~SnapshotStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SnapshotStore::initializeDatabase() {
    const char* create_table_sql = R"(
        CREATE TABLE IF NOT EXISTS snapshots (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            device_id TEXT NOT NULL,
            timestamp INTEGER NOT NULL,
            error_count INTEGER NOT NULL DEFAULT 0
        );

        CREATE INDEX IF NOT EXISTS idx_snapshots_device_timestamp
        ON snapshots(device_id, timestamp);

        CREATE TABLE IF NOT EXISTS readings (
            snapshot_id INTEGER NOT NULL REFERENCES snapshots(id) ON DELETE CASCADE,
            position INTEGER NOT NULL,
            name TEXT NOT NULL,
            value_tag INTEGER NOT NULL,
            int_value INTEGER,
            real_value REAL,
            text_value TEXT,
            unit TEXT,
            data_type TEXT NOT NULL,
            decimals INTEGER,
            error TEXT,
            error_kind INTEGER NOT NULL DEFAULT 0,
            PRIMARY KEY (snapshot_id, position)
        );

        CREATE INDEX IF NOT EXISTS idx_readings_name
        ON readings(name, snapshot_id);
    )";

    executeSQL("PRAGMA foreign_keys = ON;");
    executeSQL(create_table_sql);
}

void SnapshotStore::executeSQL(const std::string& sql) const {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        std::string error = "SQL error: " + std::string(error_msg ? error_msg : sqlite3_errmsg(db_));
        sqlite3_free(error_msg);
        throw StorageException(error);
    }
}

void SnapshotStore::storeSnapshot(const ReadingSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);

    executeSQL("BEGIN TRANSACTION;");
    try {
        {
            Statement insert_snapshot(db_, R"(
                INSERT INTO snapshots (device_id, timestamp, error_count)
                VALUES (?, ?, ?)
            )");
            sqlite3_bind_text(insert_snapshot.get(), 1, snapshot.device_id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(insert_snapshot.get(), 2, toMillis(snapshot.timestamp));
            sqlite3_bind_int64(insert_snapshot.get(), 3, static_cast<int64_t>(snapshot.errorCount()));

            if (sqlite3_step(insert_snapshot.get()) != SQLITE_DONE) {
                throw StorageException("Failed to insert snapshot: " + std::string(sqlite3_errmsg(db_)));
            }
        }

        int64_t snapshot_id = sqlite3_last_insert_rowid(db_);

        Statement insert_reading(db_, R"(
            INSERT INTO readings (snapshot_id, position, name, value_tag, int_value, real_value,
                                  text_value, unit, data_type, decimals, error, error_kind)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        )");

        int position = 0;
        for (const auto& reading : snapshot.readings) {
            sqlite3_stmt* stmt = insert_reading.get();
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);

            sqlite3_bind_int64(stmt, 1, snapshot_id);
            sqlite3_bind_int(stmt, 2, position++);
            sqlite3_bind_text(stmt, 3, reading.name.c_str(), -1, SQLITE_TRANSIENT);
            bindValue(stmt, 4, reading.value);
            sqlite3_bind_text(stmt, 8, reading.unit.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 9, to_string(reading.data_type).c_str(), -1, SQLITE_TRANSIENT);
            if (reading.decimals) {
                sqlite3_bind_int(stmt, 10, *reading.decimals);
            } else {
                sqlite3_bind_null(stmt, 10);
            }
            bindOptionalText(stmt, 11, reading.error);
            sqlite3_bind_int(stmt, 12, static_cast<int>(reading.error_kind));

            if (sqlite3_step(stmt) != SQLITE_DONE) {
                throw StorageException("Failed to insert reading '" + reading.name + "': " +
                                       std::string(sqlite3_errmsg(db_)));
            }
        }

        executeSQL("COMMIT;");
    } catch (const StorageException&) {
        char* error_msg = nullptr;
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &error_msg);
        sqlite3_free(error_msg);
        throw;
    }

    LOG_TRACE("Stored snapshot of '{}' with {} readings", snapshot.device_id, snapshot.readings.size());
}

SnapshotPtr SnapshotStore::getLatestSnapshot(const DeviceId& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    int64_t snapshot_id = 0;
    auto snapshot = std::make_shared<ReadingSnapshot>();
    snapshot->device_id = device_id;

    {
        Statement select_snapshot(db_, R"(
            SELECT id, timestamp FROM snapshots
            WHERE device_id = ?
            ORDER BY timestamp DESC, id DESC
            LIMIT 1
        )");
        sqlite3_bind_text(select_snapshot.get(), 1, device_id.c_str(), -1, SQLITE_TRANSIENT);

        if (sqlite3_step(select_snapshot.get()) != SQLITE_ROW) {
            return nullptr;
        }
        snapshot_id = sqlite3_column_int64(select_snapshot.get(), 0);
        snapshot->timestamp = fromMillis(sqlite3_column_int64(select_snapshot.get(), 1));
    }

    Statement select_readings(db_, R"(
        SELECT name, value_tag, int_value, real_value, text_value, unit, data_type, decimals,
               error, error_kind
        FROM readings
        WHERE snapshot_id = ?
        ORDER BY position
    )");
    sqlite3_bind_int64(select_readings.get(), 1, snapshot_id);

    sqlite3_stmt* stmt = select_readings.get();
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ParameterReading reading;
        reading.name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        reading.value = columnValue(stmt, 1);
        reading.unit = columnOptionalText(stmt, 5).value_or("");
        reading.data_type = data_type_from_string(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 6)));
        if (sqlite3_column_type(stmt, 7) != SQLITE_NULL) {
            reading.decimals = sqlite3_column_int(stmt, 7);
        }
        reading.error = columnOptionalText(stmt, 8);
        reading.error_kind = static_cast<ErrorKind>(sqlite3_column_int(stmt, 9));
        snapshot->readings.push_back(std::move(reading));
    }

    return snapshot;
}

std::vector<HistoryPoint> SnapshotStore::getHistory(const DeviceId& device_id,
                                                    const std::string& parameter,
                                                    const TimePoint& start_time,
                                                    const TimePoint& end_time) const {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement select_history(db_, R"(
        SELECT s.timestamp, r.value_tag, r.int_value, r.real_value, r.text_value, r.error
        FROM readings r
        JOIN snapshots s ON s.id = r.snapshot_id
        WHERE s.device_id = ? AND r.name = ? AND s.timestamp BETWEEN ? AND ?
        ORDER BY s.timestamp ASC, s.id ASC
    )");

    sqlite3_stmt* stmt = select_history.get();
    sqlite3_bind_text(stmt, 1, device_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, parameter.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, toMillis(start_time));
    sqlite3_bind_int64(stmt, 4, toMillis(end_time));

    std::vector<HistoryPoint> history;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        HistoryPoint point;
        point.timestamp = fromMillis(sqlite3_column_int64(stmt, 0));
        point.value = columnValue(stmt, 1);
        point.error = columnOptionalText(stmt, 5);
        history.push_back(std::move(point));
    }

    return history;
}

size_t SnapshotStore::cleanupOldData(uint32_t retention_days) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto cutoff_time = std::chrono::system_clock::now() - std::chrono::hours(24 * retention_days);

    Statement delete_snapshots(db_, "DELETE FROM snapshots WHERE timestamp < ?");
    sqlite3_bind_int64(delete_snapshots.get(), 1, toMillis(cutoff_time));

    if (sqlite3_step(delete_snapshots.get()) != SQLITE_DONE) {
        throw StorageException("Failed to cleanup old data: " + std::string(sqlite3_errmsg(db_)));
    }

    auto removed = static_cast<size_t>(sqlite3_changes(db_));
    if (removed > 0) {
        LOG_INFO("Removed {} snapshots older than {} days", removed, retention_days);
    }
    return removed;
}

StorageStatistics SnapshotStore::getStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    StorageStatistics stats;

    {
        Statement count_snapshots(db_, "SELECT COUNT(*) FROM snapshots");
        if (sqlite3_step(count_snapshots.get()) == SQLITE_ROW) {
            stats.total_snapshots = static_cast<uint64_t>(sqlite3_column_int64(count_snapshots.get(), 0));
        }
    }

    {
        Statement count_readings(db_, "SELECT COUNT(*) FROM readings");
        if (sqlite3_step(count_readings.get()) == SQLITE_ROW) {
            stats.total_readings = static_cast<uint64_t>(sqlite3_column_int64(count_readings.get(), 0));
        }
    }

    {
        Statement by_device(db_, "SELECT device_id, COUNT(*) FROM snapshots GROUP BY device_id");
        while (sqlite3_step(by_device.get()) == SQLITE_ROW) {
            DeviceId device_id = reinterpret_cast<const char*>(sqlite3_column_text(by_device.get(), 0));
            stats.snapshots_by_device[device_id] = static_cast<uint64_t>(sqlite3_column_int64(by_device.get(), 1));
        }
    }

    {
        Statement time_range(db_, "SELECT MIN(timestamp), MAX(timestamp) FROM snapshots");
        if (sqlite3_step(time_range.get()) == SQLITE_ROW &&
            sqlite3_column_type(time_range.get(), 0) != SQLITE_NULL) {
            stats.oldest_snapshot_time = fromMillis(sqlite3_column_int64(time_range.get(), 0));
            stats.newest_snapshot_time = fromMillis(sqlite3_column_int64(time_range.get(), 1));
        }
    }

    return stats;
}

} // namespace regBridge
