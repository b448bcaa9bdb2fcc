/**
 * @file config_manager.hpp
 * @brief Configuration management for RegBridge
 * @author RegBridge Team
 * @date 2025-09-05
 */

#pragma once

#include "types.hpp"
#include "exceptions.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace regBridge {

/**
 * @brief Manages application configuration from environment variables and JSON files
 *
 * Environment values (from the .env file) override the JSON sections they
 * correspond to. Connection defaults apply to every device that does not set
 * the value itself.
 */
class ConfigManager {
public:
    /**
     * @brief Constructor - loads configuration from files
     * @param config_file Path to JSON configuration file
     * @param env_file Path to environment file (.env)
     * @throws ConfigException on unreadable or invalid configuration
     */
    ConfigManager(const std::string& config_file = "config.json",
                  const std::string& env_file = ".env");

    /**
     * @brief Constructor from an already parsed document
     * @param json Configuration document
     * @param env_vars Environment overrides
     */
    ConfigManager(const nlohmann::json& json, const std::map<std::string, std::string>& env_vars);

    const MonitorConfig& getMonitorConfig() const { return monitor_config_; }
    const StorageConfig& getStorageConfig() const { return storage_config_; }
    const LoggingConfig& getLoggingConfig() const { return logging_config_; }
    const ConnectionConfig& getConnectionDefaults() const { return connection_defaults_; }

    const std::vector<DeviceRecord>& getDevices() const { return devices_; }

    /**
     * @brief Get device by id
     * @throws ConfigException if the device is not configured
     */
    const DeviceRecord& getDevice(const DeviceId& device_id) const;

    bool hasDevice(const DeviceId& device_id) const;

    /**
     * @brief Get application information
     */
    const std::string& getAppName() const { return app_name_; }
    const std::string& getAppVersion() const { return app_version_; }

    /**
     * @brief Validate configuration consistency
     * @throws ConfigException if configuration is invalid
     */
    void validateConfiguration() const;

    /**
     * @brief Parse a connection object on top of defaults
     */
    static ConnectionConfig parseConnection(const nlohmann::json& json, const ConnectionConfig& defaults);

    /**
     * @brief Parse one parameter definition
     */
    static Parameter parseParameter(const nlohmann::json& json);

private:
    void loadEnvironmentVariables(const std::string& env_file);
    void loadJsonConfiguration(const nlohmann::json& json);
    void parseDevices(const nlohmann::json& json);
    DeviceRecord parseDevice(const nlohmann::json& json) const;

    std::optional<std::string> env(const std::string& key) const;
    int envInt(const std::string& key, int fallback) const;

    // Configuration sections
    MonitorConfig monitor_config_;
    StorageConfig storage_config_;
    LoggingConfig logging_config_;
    ConnectionConfig connection_defaults_;

    std::vector<DeviceRecord> devices_;

    // Application information
    std::string app_name_ = "RegBridge";
    std::string app_version_ = "1.0.0";

    // Environment variables
    std::map<std::string, std::string> env_vars_;
};

} // namespace regBridge
