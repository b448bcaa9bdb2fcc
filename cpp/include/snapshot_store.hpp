/**
 * @file snapshot_store.hpp
 * @brief SQLite persistence of reading snapshots
 * @author RegBridge Team
 * @date 2025-09-05
 */

#pragma once

#include "types.hpp"
#include "exceptions.hpp"
#include <sqlite3.h>
#include <mutex>
#include <string>
#include <vector>

namespace regBridge {

/**
 * @brief One stored value of a parameter
 */
struct HistoryPoint {
    TimePoint timestamp;
    ParameterValue value;
    std::optional<std::string> error;
};

/**
 * @brief Stores every snapshot with its readings; the newest one per device
 * is the device's latest known state
 */
class SnapshotStore {
public:
    /**
     * @brief Constructor
     * @param db_path Database file path (":memory:" for an in-memory database)
     * @throws StorageException if the database cannot be opened
     */
    explicit SnapshotStore(const std::string& db_path);

    /**
     * @brief Destructor
     */
    ~SnapshotStore();

    SnapshotStore(const SnapshotStore&) = delete;
    SnapshotStore& operator=(const SnapshotStore&) = delete;

    /**
     * @brief Store a snapshot and its readings in one transaction
     */
    void storeSnapshot(const ReadingSnapshot& snapshot);

    /**
     * @brief Most recent stored snapshot of a device
     * @return nullptr if the device has none
     */
    SnapshotPtr getLatestSnapshot(const DeviceId& device_id) const;

    /**
     * @brief Values of one parameter between two times, oldest first
     */
    std::vector<HistoryPoint> getHistory(const DeviceId& device_id,
                                         const std::string& parameter,
                                         const TimePoint& start_time,
                                         const TimePoint& end_time) const;

    /**
     * @brief Delete snapshots older than the retention period
     * @return Number of snapshots removed
     */
    size_t cleanupOldData(uint32_t retention_days);

    /**
     * @brief Get storage statistics
     */
    StorageStatistics getStatistics() const;

private:
    void initializeDatabase();
    void executeSQL(const std::string& sql) const;

    std::string db_path_;
    sqlite3* db_;
    mutable std::mutex mutex_;
};

} // namespace regBridge
