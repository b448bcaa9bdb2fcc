/**
 * @file device_service.cpp
 * @brief Implementation of the device access facade
 * @author RegBridge Team
 * @date 2025-09-05
 */

#include "device_service.hpp"
#include "logger.hpp"
#include <chrono>

namespace regBridge {

namespace {

SharedPtr<SnapshotStore> createStore(const StorageConfig& config) {
    if (!config.enable_persistent_storage) {
        return nullptr;
    }
    auto store = std::make_shared<SnapshotStore>(config.database_path);
    store->cleanupOldData(config.data_retention_days);
    return store;
}

std::string endpoint(const ConnectionConfig& config) {
    if (config.kind == TransportKind::TCP) {
        return config.host + ":" + std::to_string(config.port);
    }
    return config.serial_port;
}

std::pair<const RegisterRange*, const Parameter*> locateParameter(const DeviceRecord& device,
                                                                  const std::string& name) {
    for (const auto& range : device.ranges) {
        for (const auto& parameter : range.parameters) {
            if (parameter.name == name) {
                return {&range, &parameter};
            }
        }
    }
    throw RegBridgeException(ErrorKind::NOT_FOUND,
                             "Parameter '" + name + "' not found on device '" + device.id + "'");
}

} // namespace

DeviceService::DeviceService(const ConfigManager& config, TransportFactory factory)
    : DeviceService(std::make_shared<StaticDeviceConfigSource>(config.getDevices()),
                    config.getMonitorConfig(),
                    createStore(config.getStorageConfig()),
                    std::move(factory)) {
}

DeviceService::DeviceService(SharedPtr<DeviceConfigSource> source,
                             const MonitorConfig& monitor_config,
                             SharedPtr<SnapshotStore> store,
                             TransportFactory factory)
    : source_(std::move(source)),
      monitor_config_(monitor_config),
      store_(std::move(store)),
      factory_(std::move(factory)) {
    monitor_ = std::make_unique<DeviceMonitor>(source_, monitor_config_, factory_);
    setupCallbacks();

    LOG_INFO("Device service initialized (persistent storage {})", store_ ? "enabled" : "disabled");
}

DeviceService::~DeviceService() {
    stop();
    monitor_.reset();
}

void DeviceService::setupCallbacks() {
    if (store_) {
        monitor_->addSnapshotCallback([store = store_](const SnapshotPtr& snapshot) {
            store->storeSnapshot(*snapshot);
        });
    }

    monitor_->addHealthCallback([](const DeviceId& device_id, const DeviceHealth& health) {
        if (health.healthy) {
            LOG_INFO("Device '{}' is {}", device_id, to_string(health.status));
        } else {
            LOG_WARN("Device '{}' is {} ({} consecutive failures): {}", device_id,
                     to_string(health.status), health.consecutive_failures, health.last_error);
        }
    });
}

// ============================================================================
// Reads
// ============================================================================

ConnectionTestResult DeviceService::testConnection(const ConnectionConfig& config) const {
    ConnectionTestResult result;

    try {
        ConnectionManager manager(config, factory_);
        auto start_time = std::chrono::steady_clock::now();
        ConnectionHandle handle = manager.connect();
        auto latency = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start_time);

        if (!manager.isHealthy(handle)) {
            throw ConnectionException("Session to " + endpoint(config) + " closed right after connecting");
        }
        handle.release();

        result.success = true;
        result.latency = latency;
        result.message = "Successfully connected to " + endpoint(config);
        LOG_INFO("Connection test to {} succeeded in {}ms", endpoint(config), latency.count());

    } catch (const RegBridgeException& e) {
        result.success = false;
        result.error_kind = e.kind();
        result.message = "Connection failed: " + std::string(e.what());
        LOG_WARN("Connection test to {} failed: {}", endpoint(config), e.what());
    }

    return result;
}

ReadResult DeviceService::readNow(const DeviceId& device_id) {
    return toReadResult(monitor_->poll(device_id));
}

ReadResult DeviceService::getCached(const DeviceId& device_id, Duration max_age) {
    return toReadResult(monitor_->getCached(device_id, max_age));
}

ReadResult DeviceService::toReadResult(const PollResult& poll_result) {
    ReadResult result;
    result.snapshot = poll_result.snapshot;
    result.stale = poll_result.stale;
    result.error_kind = poll_result.error_kind;

    if (poll_result.ok()) {
        result.success = true;
        result.message = "Read completed";
    } else if (poll_result.stale && poll_result.snapshot) {
        result.success = true;
        result.message = "Serving stale data: " + poll_result.error;
    } else {
        result.success = false;
        result.snapshot.reset();
        result.message = poll_result.error;
    }
    return result;
}

// ============================================================================
// Writes
// ============================================================================

std::optional<DeviceRecord> DeviceService::enabledDevice(const DeviceId& device_id,
                                                         OperationResult& failure) const {
    std::optional<DeviceRecord> record = source_->fetchDevice(device_id);
    if (!record) {
        failure.error_kind = ErrorKind::NOT_FOUND;
        failure.message = "Device '" + device_id + "' not found";
        return std::nullopt;
    }
    if (!record->enabled) {
        failure.error_kind = ErrorKind::VALIDATION;
        failure.message = "Device '" + device_id + "' is disabled";
        return std::nullopt;
    }
    return record;
}

OperationResult DeviceService::writeSetpoint(const DeviceId& device_id,
                                             const std::string& parameter_name,
                                             const ParameterValue& value) {
    OperationResult result;
    if (!enabledDevice(device_id, result)) {
        return result;
    }

    try {
        monitor_->runExclusive(device_id, [&](ConnectionHandle& handle, const DeviceRecord& device) {
            auto [range, parameter] = locateParameter(device, parameter_name);
            if (!parameter->writable) {
                throw ValidationException("Parameter '" + parameter_name + "' is read-only");
            }
            monitor_->operations().writeParameter(handle, *range, *parameter, value);
        });

        monitor_->invalidate(device_id);
        result.success = true;
        result.message = "Successfully wrote " + to_string(value) + " to '" + parameter_name +
                         "' on device '" + device_id + "'";
        LOG_INFO("{}", result.message);

    } catch (const RegBridgeException& e) {
        result.success = false;
        result.error_kind = e.kind();
        result.message = "Failed to write '" + parameter_name + "': " + e.what();
        LOG_ERROR("{}", result.message);
    }

    return result;
}

OperationResult DeviceService::writeCoil(const DeviceId& device_id, RegisterAddress address,
                                         bool value, CoilType coil_type) {
    OperationResult result;
    if (!enabledDevice(device_id, result)) {
        return result;
    }

    try {
        monitor_->runExclusive(device_id, [&](ConnectionHandle& handle, const DeviceRecord&) {
            monitor_->operations().writeCoil(handle, address, value);
        });

        monitor_->invalidate(device_id);
        result.success = true;
        result.message = "Successfully set " + to_string(coil_type) + " coil at address " +
                         std::to_string(address) + " to " + (value ? "ON" : "OFF");
        LOG_INFO("{} on device '{}'", result.message, device_id);

    } catch (const RegBridgeException& e) {
        result.success = false;
        result.error_kind = e.kind();
        result.message = "Failed to set " + to_string(coil_type) + " coil at address " +
                         std::to_string(address) + ": " + e.what();
        LOG_ERROR("{} on device '{}'", result.message, device_id);
    }

    return result;
}

BatchCoilWriteResult DeviceService::writeCoils(const DeviceId& device_id, RegisterAddress address,
                                               const std::vector<bool>& values, CoilType coil_type) {
    BatchCoilWriteResult batch;

    OperationResult failure;
    if (!enabledDevice(device_id, failure)) {
        batch.error_kind = failure.error_kind;
        batch.message = failure.message;
        return batch;
    }

    try {
        monitor_->runExclusive(device_id, [&](ConnectionHandle& handle, const DeviceRecord&) {
            batch.results = monitor_->operations().writeCoils(handle, address, values);
        });
    } catch (const ValidationException& e) {
        batch.error_kind = e.kind();
        batch.message = "Invalid " + to_string(coil_type) + " coil batch: " + e.what();
        LOG_ERROR("{}", batch.message);
        return batch;
    } catch (const RegBridgeException& e) {
        // Never reached the device: nothing was applied
        batch.results.clear();
        for (size_t i = 0; i < values.size(); ++i) {
            CoilWriteResult coil;
            coil.address = static_cast<RegisterAddress>(address + i);
            coil.value = values[i];
            coil.error_kind = e.kind();
            coil.message = e.what();
            batch.results.push_back(coil);
        }
    }

    size_t applied = 0;
    for (const auto& coil : batch.results) {
        if (coil.success) {
            ++applied;
        } else if (batch.error_kind == ErrorKind::NONE) {
            batch.error_kind = coil.error_kind;
        }
    }

    batch.success = applied > 0;
    batch.all_success = !batch.results.empty() && applied == batch.results.size();

    if (batch.all_success) {
        batch.message = "Successfully set " + std::to_string(applied) + " " + to_string(coil_type) +
                        " coils starting at address " + std::to_string(address);
        LOG_INFO("{} on device '{}'", batch.message, device_id);
    } else if (applied == 0) {
        batch.message = "Failed to set " + to_string(coil_type) + " coils at address " +
                        std::to_string(address) + ": " +
                        (batch.results.empty() ? std::string("no result") : batch.results.front().message);
        LOG_ERROR("{} on device '{}'", batch.message, device_id);
    } else {
        batch.message = "Set " + std::to_string(applied) + " of " + std::to_string(batch.results.size()) +
                        " " + to_string(coil_type) + " coils starting at address " + std::to_string(address);
        LOG_WARN("{} on device '{}'", batch.message, device_id);
    }

    if (applied > 0) {
        monitor_->invalidate(device_id);
    }
    return batch;
}

// ============================================================================
// Events and scheduling
// ============================================================================

void DeviceService::onChange(DeviceMonitor::ChangeCallback callback) {
    monitor_->addChangeCallback(std::move(callback));
}

DeviceHealth DeviceService::deviceHealth(const DeviceId& device_id) const {
    return monitor_->getHealth(device_id);
}

size_t DeviceService::scheduleAll() {
    size_t scheduled = 0;
    for (const auto& device_id : source_->listDevices()) {
        std::optional<DeviceRecord> record = source_->fetchDevice(device_id);
        if (!record || !record->enabled) {
            LOG_DEBUG("Not scheduling disabled device '{}'", device_id);
            continue;
        }
        monitor_->schedule(device_id, record->poll_interval.value_or(monitor_config_.default_poll_interval));
        ++scheduled;
    }
    LOG_INFO("Scheduled {} devices", scheduled);
    return scheduled;
}

void DeviceService::stop() {
    if (monitor_) {
        monitor_->unscheduleAll();
    }
}

} // namespace regBridge
