/**
 * @file device_service.hpp
 * @brief Device access facade for collaborators (UI, scheduling, notifications)
 * @author RegBridge Team
 * @date 2025-09-05
 */

#pragma once

#include "types.hpp"
#include "exceptions.hpp"
#include "config_manager.hpp"
#include "device_config_source.hpp"
#include "device_monitor.hpp"
#include "snapshot_store.hpp"
#include <memory>
#include <string>
#include <vector>

namespace regBridge {

/**
 * @brief Result of a write or other action
 */
struct OperationResult {
    bool success = false;
    std::string message;
    ErrorKind error_kind = ErrorKind::NONE;
};

/**
 * @brief Result of a one-shot connection probe
 */
struct ConnectionTestResult {
    bool success = false;
    std::string message;
    std::optional<Duration> latency;
    ErrorKind error_kind = ErrorKind::NONE;
};

/**
 * @brief Result of readNow/getCached
 *
 * A stale result carries the last good snapshot together with the error
 * that prevented a refresh.
 */
struct ReadResult {
    bool success = false;
    SnapshotPtr snapshot;
    bool stale = false;
    std::string message;
    ErrorKind error_kind = ErrorKind::NONE;
};

/**
 * @brief Result of a batch coil write
 */
struct BatchCoilWriteResult {
    bool success = false;       // at least one coil applied
    bool all_success = false;   // every coil applied
    std::string message;
    ErrorKind error_kind = ErrorKind::NONE;
    std::vector<CoilWriteResult> results;
};

/**
 * @brief Entry point for everything outside the communication core
 *
 * Converts every failure into a structured result; no RegBridge exception
 * escapes the public operations.
 */
class DeviceService {
public:
    /**
     * @brief Constructor from loaded configuration
     * @param config Configuration manager
     * @param factory Transport factory (defaults to libmodbus)
     */
    explicit DeviceService(const ConfigManager& config, TransportFactory factory = nullptr);

    /**
     * @brief Constructor from components
     * @param source Device configuration source
     * @param monitor_config Monitor settings
     * @param store Optional snapshot persistence
     * @param factory Transport factory (defaults to libmodbus)
     */
    DeviceService(SharedPtr<DeviceConfigSource> source,
                  const MonitorConfig& monitor_config,
                  SharedPtr<SnapshotStore> store = nullptr,
                  TransportFactory factory = nullptr);

    /**
     * @brief Destructor
     */
    ~DeviceService();

    /**
     * @brief Connect once and disconnect, measuring the connect latency
     */
    ConnectionTestResult testConnection(const ConnectionConfig& config) const;

    /**
     * @brief Poll a device now, bypassing the cache
     */
    ReadResult readNow(const DeviceId& device_id);

    /**
     * @brief Cached snapshot no older than max_age, polling when needed
     */
    ReadResult getCached(const DeviceId& device_id, Duration max_age);

    /**
     * @brief Encode and write a writable parameter by name
     */
    OperationResult writeSetpoint(const DeviceId& device_id,
                                  const std::string& parameter_name,
                                  const ParameterValue& value);

    /**
     * @brief Write a single coil
     */
    OperationResult writeCoil(const DeviceId& device_id, RegisterAddress address,
                              bool value, CoilType coil_type);

    /**
     * @brief Write consecutive coils with one request
     */
    BatchCoilWriteResult writeCoils(const DeviceId& device_id, RegisterAddress address,
                                    const std::vector<bool>& values, CoilType coil_type);

    /**
     * @brief Subscribe to change events (best effort, at most once per poll)
     */
    void onChange(DeviceMonitor::ChangeCallback callback);

    DeviceHealth deviceHealth(const DeviceId& device_id) const;

    /**
     * @brief Schedule every enabled device at its configured interval
     * @return Number of devices scheduled
     */
    size_t scheduleAll();

    /**
     * @brief Stop every schedule
     */
    void stop();

    DeviceMonitor& monitor() { return *monitor_; }
    SharedPtr<SnapshotStore> store() const { return store_; }

private:
    /**
     * @brief Wire snapshot persistence into the monitor
     */
    void setupCallbacks();

    std::optional<DeviceRecord> enabledDevice(const DeviceId& device_id, OperationResult& failure) const;

    static ReadResult toReadResult(const PollResult& result);

    SharedPtr<DeviceConfigSource> source_;
    MonitorConfig monitor_config_;
    SharedPtr<SnapshotStore> store_;
    TransportFactory factory_;
    UniquePtr<DeviceMonitor> monitor_;
};

} // namespace regBridge
