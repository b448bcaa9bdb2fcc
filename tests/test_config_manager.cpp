/**
 * @file test_config_manager.cpp
 * @brief Tests for configuration loading, defaults and validation
 * @author RegBridge Test Team
 * @date 2025-09-07
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../cpp/include/config_manager.hpp"
#include "../cpp/include/exceptions.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace regBridge;
using namespace testing;
using json = nlohmann::json;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = json::parse(R"({
            "application": {"name": "RegBridge", "version": "1.2.0"},
            "logging": {"console_level": "warn", "log_file": ""},
            "monitor": {
                "default_poll_interval_ms": 2000,
                "cache_max_age_ms": 5000,
                "offline_after_failures": 4,
                "max_backoff_ms": 30000
            },
            "connection_defaults": {"timeout_ms": 1500, "retries": 2, "retry_delay_ms": 250},
            "storage": {"enable_persistent_storage": true, "database_path": "snapshots.db", "data_retention_days": 7},
            "devices": [
                {
                    "id": "inverter-1",
                    "name": "Rooftop inverter",
                    "poll_interval_ms": 1000,
                    "connection": {"type": "tcp", "host": "10.0.0.5", "port": 502, "unit_id": 3},
                    "ranges": [
                        {
                            "start_address": 0,
                            "count": 6,
                            "function_code": 3,
                            "parameters": [
                                {"name": "voltage", "data_type": "UINT16", "scale": 0.1, "decimals": 1, "unit": "V"},
                                {"name": "power", "data_type": "FLOAT32", "register_offset": 1, "byte_order": "CDAB"},
                                {"name": "limit", "data_type": "INT16", "register_offset": 3, "writable": true},
                                {"name": "serial", "data_type": "STRING", "register_offset": 4, "string_length": 4}
                            ]
                        }
                    ]
                },
                {
                    "id": "meter-2",
                    "enabled": false,
                    "connection": {"type": "rtu", "serial_port": "/dev/ttyUSB0", "baud_rate": 19200, "parity": "even"},
                    "ranges": [
                        {"start_address": 100, "count": 2, "function_code": 4,
                         "parameters": [{"name": "energy", "data_type": "UINT32"}]}
                    ]
                }
            ]
        })");
    }

    json config_;
    std::map<std::string, std::string> env_;
};

// ============================================================================
// Loading Tests
// ============================================================================

TEST_F(ConfigManagerTest, Load_ParsesSections) {
    ConfigManager manager(config_, env_);

    EXPECT_EQ(manager.getAppVersion(), "1.2.0");
    EXPECT_EQ(manager.getLoggingConfig().console_level, LogLevel::WARN);
    EXPECT_EQ(manager.getMonitorConfig().default_poll_interval, Duration(2000));
    EXPECT_EQ(manager.getMonitorConfig().offline_after_failures, 4u);
    EXPECT_EQ(manager.getMonitorConfig().max_backoff, Duration(30000));
    EXPECT_TRUE(manager.getStorageConfig().enable_persistent_storage);
    EXPECT_EQ(manager.getStorageConfig().data_retention_days, 7u);
    EXPECT_EQ(manager.getDevices().size(), 2u);
}

TEST_F(ConfigManagerTest, Load_DeviceInheritsConnectionDefaults) {
    ConfigManager manager(config_, env_);
    const DeviceRecord& inverter = manager.getDevice("inverter-1");

    EXPECT_EQ(inverter.connection.host, "10.0.0.5");
    EXPECT_EQ(inverter.connection.unit_id, 3);
    EXPECT_EQ(inverter.connection.timeout, Duration(1500));
    EXPECT_EQ(inverter.connection.retries, 2u);
    EXPECT_EQ(inverter.connection.retry_delay, Duration(250));
    EXPECT_EQ(inverter.poll_interval, Duration(1000));
}

TEST_F(ConfigManagerTest, Load_ParsesParameters) {
    ConfigManager manager(config_, env_);
    const auto& parameters = manager.getDevice("inverter-1").ranges.at(0).parameters;

    ASSERT_EQ(parameters.size(), 4u);
    EXPECT_EQ(parameters[0].byte_order, ByteOrder::AB);
    EXPECT_EQ(parameters[0].scale, 0.1);
    EXPECT_EQ(parameters[1].data_type, DataType::FLOAT32);
    EXPECT_EQ(parameters[1].byte_order, ByteOrder::CDAB);
    EXPECT_EQ(parameters[1].word_count, 2);
    EXPECT_TRUE(parameters[2].writable);
    EXPECT_EQ(parameters[3].word_count, 2);
}

TEST_F(ConfigManagerTest, Load_RtuDevice) {
    ConfigManager manager(config_, env_);
    const DeviceRecord& meter = manager.getDevice("meter-2");

    EXPECT_FALSE(meter.enabled);
    EXPECT_EQ(meter.connection.kind, TransportKind::RTU);
    EXPECT_EQ(meter.connection.baud_rate, 19200u);
    EXPECT_EQ(meter.connection.parity, Parity::EVEN);
    EXPECT_EQ(meter.ranges.at(0).function, ModbusFunction::READ_INPUT_REGISTERS);
}

TEST_F(ConfigManagerTest, GetDevice_Unknown_ThrowsConfigException) {
    ConfigManager manager(config_, env_);
    EXPECT_FALSE(manager.hasDevice("nope"));
    EXPECT_THROW(manager.getDevice("nope"), ConfigException);
}

TEST_F(ConfigManagerTest, EnvironmentOverrides_ApplyToDefaultsAndDevices) {
    env_["DEFAULT_TIMEOUT_MS"] = "800";
    env_["DEFAULT_RETRIES"] = "0";
    env_["LOG_LEVEL"] = "debug";
    env_["DATABASE_PATH"] = "/tmp/other.db";

    ConfigManager manager(config_, env_);

    EXPECT_EQ(manager.getConnectionDefaults().timeout, Duration(800));
    EXPECT_EQ(manager.getDevice("inverter-1").connection.timeout, Duration(800));
    EXPECT_EQ(manager.getDevice("inverter-1").connection.retries, 0u);
    EXPECT_EQ(manager.getLoggingConfig().console_level, LogLevel::DEBUG);
    EXPECT_EQ(manager.getStorageConfig().database_path, "/tmp/other.db");
}

TEST_F(ConfigManagerTest, EnvironmentOverride_NotANumber_ThrowsConfigException) {
    env_["DEFAULT_RETRIES"] = "many";
    EXPECT_THROW(ConfigManager(config_, env_), ConfigException);
}

TEST_F(ConfigManagerTest, LoadFromFiles_ReadsJsonAndEnvFile) {
    const std::string config_path = "test_regbridge_config.json";
    const std::string env_path = "test_regbridge.env";
    {
        std::ofstream config_file(config_path);
        config_file << config_.dump(2);
        std::ofstream env_file(env_path);
        env_file << "# overrides\nPOLL_INTERVAL_MS = 3000\n";
    }

    ConfigManager manager(config_path, env_path);
    EXPECT_EQ(manager.getMonitorConfig().default_poll_interval, Duration(3000));

    std::filesystem::remove(config_path);
    std::filesystem::remove(env_path);
}

TEST_F(ConfigManagerTest, LoadFromFiles_MissingConfig_ThrowsConfigException) {
    EXPECT_THROW(ConfigManager("does-not-exist.json", "does-not-exist.env"), ConfigException);
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST_F(ConfigManagerTest, Validate_DuplicateDeviceIds_Throws) {
    config_["devices"][1]["id"] = "inverter-1";
    EXPECT_THROW(ConfigManager(config_, env_), ConfigException);
}

TEST_F(ConfigManagerTest, Validate_DuplicateParameterNames_Throws) {
    config_["devices"][0]["ranges"][0]["parameters"][1]["name"] = "voltage";
    EXPECT_THROW(ConfigManager(config_, env_), ConfigException);
}

TEST_F(ConfigManagerTest, Validate_ParameterOutsideRange_Throws) {
    config_["devices"][0]["ranges"][0]["count"] = 4;
    EXPECT_THROW(ConfigManager(config_, env_), ConfigException);
}

TEST_F(ConfigManagerTest, Validate_ByteOrderNotFittingType_Throws) {
    config_["devices"][0]["ranges"][0]["parameters"][0]["byte_order"] = "ABCD";
    EXPECT_THROW(ConfigManager(config_, env_), ConfigException);
}

TEST_F(ConfigManagerTest, Validate_WordCountMismatch_Throws) {
    config_["devices"][0]["ranges"][0]["parameters"][1]["word_count"] = 3;
    EXPECT_THROW(ConfigManager(config_, env_), ConfigException);
}

TEST_F(ConfigManagerTest, Validate_RangeTooLarge_Throws) {
    config_["devices"][0]["ranges"][0]["count"] = 126;
    EXPECT_THROW(ConfigManager(config_, env_), ConfigException);
}

TEST_F(ConfigManagerTest, Validate_UnsupportedFunctionCode_Throws) {
    config_["devices"][0]["ranges"][0]["function_code"] = 16;
    EXPECT_THROW(ConfigManager(config_, env_), ConfigException);
}

TEST_F(ConfigManagerTest, Validate_EnabledTcpDeviceWithoutHost_Throws) {
    config_["devices"][0]["connection"].erase("host");
    EXPECT_THROW(ConfigManager(config_, env_), ConfigException);
}

TEST_F(ConfigManagerTest, Validate_DisabledDeviceConnectionNotChecked) {
    config_["devices"][1]["connection"].erase("serial_port");
    EXPECT_NO_THROW(ConfigManager(config_, env_));
}

TEST_F(ConfigManagerTest, Validate_PollIntervalTooShort_Throws) {
    config_["monitor"]["default_poll_interval_ms"] = 50;
    EXPECT_THROW(ConfigManager(config_, env_), ConfigException);
}
