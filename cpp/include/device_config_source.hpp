/**
 * @file device_config_source.hpp
 * @brief Source of device configuration records
 * @author RegBridge Team
 * @date 2025-09-04
 */

#pragma once

#include "types.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace regBridge {

/**
 * @brief Supplies read-only device records, fetched at poll time
 */
class DeviceConfigSource {
public:
    virtual ~DeviceConfigSource() = default;

    virtual std::optional<DeviceRecord> fetchDevice(const DeviceId& device_id) const = 0;
    virtual std::vector<DeviceId> listDevices() const = 0;
};

/**
 * @brief In-memory records, typically loaded from the JSON configuration
 */
class StaticDeviceConfigSource : public DeviceConfigSource {
public:
    StaticDeviceConfigSource() = default;
    explicit StaticDeviceConfigSource(const std::vector<DeviceRecord>& devices) {
        for (const auto& device : devices) {
            devices_[device.id] = device;
        }
    }

    std::optional<DeviceRecord> fetchDevice(const DeviceId& device_id) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(device_id);
        if (it == devices_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<DeviceId> listDevices() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<DeviceId> ids;
        ids.reserve(devices_.size());
        for (const auto& [id, device] : devices_) {
            ids.push_back(id);
        }
        return ids;
    }

    /**
     * @brief Add or replace a record; picked up by the next poll
     */
    void upsert(const DeviceRecord& device) {
        std::lock_guard<std::mutex> lock(mutex_);
        devices_[device.id] = device;
    }

    bool remove(const DeviceId& device_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return devices_.erase(device_id) > 0;
    }

private:
    mutable std::mutex mutex_;
    std::map<DeviceId, DeviceRecord> devices_;
};

} // namespace regBridge
