/**
 * @file device_monitor.hpp
 * @brief Per-device polling, snapshot cache and change detection
 * @author RegBridge Team
 * @date 2025-09-04
 */

#pragma once

#include "types.hpp"
#include "exceptions.hpp"
#include "connection_manager.hpp"
#include "register_operations.hpp"
#include "device_config_source.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace regBridge {

enum class PollStatus {
    COMPLETED,
    SKIPPED,    // another poll of the device was in flight
    FAILED,
    DISCARDED   // device was unscheduled while the poll was in flight
};

std::string to_string(PollStatus status);

/**
 * @brief Outcome of a poll or cache lookup
 *
 * `snapshot` may be set on a FAILED or SKIPPED result: it is then the last
 * good (stale) snapshot of the device.
 */
struct PollResult {
    PollStatus status = PollStatus::FAILED;
    SnapshotPtr snapshot;
    std::string error;
    ErrorKind error_kind = ErrorKind::NONE;
    bool stale = false;

    bool ok() const { return status == PollStatus::COMPLETED; }
};

/**
 * @brief Monitors many devices in parallel
 *
 * Each device has its own state record in the monitor's registry. A device
 * is polled by at most one poll at a time (a busy device is skipped, never
 * queued) and polls and writes on the same device never overlap. Scheduled
 * devices each run on their own timer thread.
 */
class DeviceMonitor {
public:
    // Callback types
    using SnapshotCallback = std::function<void(const SnapshotPtr&)>;
    using ChangeCallback = std::function<void(const DeviceId&, const std::vector<std::string>&,
                                              const SnapshotPtr&)>;
    using HealthCallback = std::function<void(const DeviceId&, const DeviceHealth&)>;
    using ExclusiveOperation = std::function<void(ConnectionHandle&, const DeviceRecord&)>;

    /**
     * @brief Constructor
     * @param source Device configuration source, consulted on every poll
     * @param config Monitor settings
     * @param factory Transport factory for connections (defaults to libmodbus)
     */
    DeviceMonitor(SharedPtr<DeviceConfigSource> source,
                  const MonitorConfig& config,
                  TransportFactory factory = nullptr);

    /**
     * @brief Destructor; stops every timer and waits for in-flight polls
     */
    ~DeviceMonitor();

    DeviceMonitor(const DeviceMonitor&) = delete;
    DeviceMonitor& operator=(const DeviceMonitor&) = delete;

    /**
     * @brief Poll a device now
     *
     * Returns SKIPPED at once if a poll of the device is already in flight.
     * A failed poll keeps the previous snapshot and marks the device unhealthy.
     * An id unknown to the configuration source fails with NOT_FOUND and
     * leaves the registry untouched.
     */
    PollResult poll(const DeviceId& device_id);

    /**
     * @brief Return the cached snapshot if fresh, otherwise poll
     *
     * When the refresh fails or is skipped the stale snapshot is returned
     * (flagged stale) if there is one.
     */
    PollResult getCached(const DeviceId& device_id, Duration max_age);
    PollResult getCached(const DeviceId& device_id);

    /**
     * @brief Current snapshot of a device, nullptr if never polled successfully
     */
    SnapshotPtr lastSnapshot(const DeviceId& device_id) const;

    /**
     * @brief Names of parameters that differ between two snapshots
     *
     * Numbers are compared with an epsilon of 0.5 * 10^-decimals when the
     * reading declares decimals, 0.01 otherwise. A reading gaining or losing
     * an error and added or removed parameters count as changes. Without a
     * previous snapshot every parameter is reported.
     */
    static std::vector<std::string> detectChanges(const ReadingSnapshot* previous,
                                                  const ReadingSnapshot& current);

    /**
     * @brief Poll a device periodically on its own timer thread
     * @param interval Base interval; failures back it off up to max_backoff
     * @throws ValidationException for a non-positive interval
     * @throws RegBridgeException (NOT_FOUND) for an unknown device
     */
    void schedule(const DeviceId& device_id, Duration interval);

    /**
     * @brief Stop future polls; an in-flight poll finishes and its result is discarded
     */
    void unschedule(const DeviceId& device_id);

    void unscheduleAll();
    bool isScheduled(const DeviceId& device_id) const;

    /**
     * @brief Interval the timer currently waits between polls
     */
    Duration currentInterval(const DeviceId& device_id) const;

    /**
     * @brief Number of devices with a state record
     */
    size_t trackedDevices() const;

    /**
     * @brief Stopped timer threads not joined yet
     */
    size_t retiredTimerCount() const;

    /**
     * @brief Expire the cached snapshot so the next getCached polls
     */
    void invalidate(const DeviceId& device_id);

    /**
     * @brief Run an operation on a connected handle under the device's I/O lock
     * @throws RegBridgeException (NOT_FOUND) for an unknown device
     * @throws ValidationException for a disabled device
     */
    void runExclusive(const DeviceId& device_id, const ExclusiveOperation& operation);

    DeviceHealth getHealth(const DeviceId& device_id) const;
    PollStatistics getStatistics(const DeviceId& device_id) const;

    void addSnapshotCallback(SnapshotCallback callback);
    void addChangeCallback(ChangeCallback callback);
    void addHealthCallback(HealthCallback callback);

    RegisterOperations& operations() { return operations_; }
    const MonitorConfig& getConfig() const { return config_; }

private:
    struct DeviceState {
        explicit DeviceState(const DeviceId& device_id) : id(device_id) {}

        const DeviceId id;
        std::atomic<bool> in_flight{false};
        std::mutex io_mutex;

        // Guarded by data_mutex
        mutable std::mutex data_mutex;
        SnapshotPtr last_snapshot;
        std::optional<SteadyTimePoint> last_poll_time;
        bool expired = false;
        DeviceHealth health;
        PollStatistics stats;

        // Schedule, guarded by data_mutex
        bool scheduled = false;
        uint64_t generation = 0;
        Duration base_interval = Duration(0);
        Duration current_interval = Duration(0);
        std::thread timer;
        std::shared_ptr<std::atomic<bool>> timer_done;
        std::condition_variable wakeup;
    };

    struct RetiredTimer {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    DeviceState& stateFor(const DeviceId& device_id);

    /**
     * @brief State of a device the source knows; nullptr otherwise
     */
    DeviceState* knownState(const DeviceId& device_id);
    const DeviceState* findState(const DeviceId& device_id) const;

    /**
     * @brief Poll body; a set generation ties the result to a schedule
     */
    PollResult pollDevice(DeviceState& state, std::optional<uint64_t> generation);

    SnapshotPtr readDevice(const DeviceRecord& record);

    void scheduleLoop(DeviceState* state, uint64_t generation,
                      std::shared_ptr<std::atomic<bool>> done);
    void retireTimer(DeviceState& state);

    /**
     * @brief Join retired timers whose loop has returned; never the calling thread
     */
    void reapRetiredTimers();
    void adjustInterval(DeviceState& state, PollStatus status);

    void recordSuccess(DeviceState& state, const SnapshotPtr& snapshot);
    void recordFailure(DeviceState& state, const std::string& error, ErrorKind kind);

    void notifySnapshot(const SnapshotPtr& snapshot);
    void notifyChange(const DeviceId& device_id, const std::vector<std::string>& changes,
                      const SnapshotPtr& snapshot);
    void notifyHealth(const DeviceId& device_id, const DeviceHealth& health);

    // Dependencies
    SharedPtr<DeviceConfigSource> source_;
    MonitorConfig config_;
    TransportFactory factory_;
    RegisterOperations operations_;

    // Registry
    std::map<DeviceId, std::unique_ptr<DeviceState>> devices_;
    mutable std::mutex registry_mutex_;

    // Timers stopped while their last poll may still run
    std::vector<RetiredTimer> retired_timers_;
    mutable std::mutex retired_mutex_;

    // Callbacks
    std::vector<SnapshotCallback> snapshot_callbacks_;
    std::vector<ChangeCallback> change_callbacks_;
    std::vector<HealthCallback> health_callbacks_;
    mutable std::mutex callbacks_mutex_;
};

} // namespace regBridge
