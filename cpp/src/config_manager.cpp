/**
 * @file config_manager.cpp
 * @brief Implementation of configuration management
 * @author RegBridge Team
 * @date 2025-09-05
 */

#include "config_manager.hpp"
#include "connection_manager.hpp"
#include "register_codec.hpp"
#include "register_operations.hpp"
#include "logger.hpp"
#include <fstream>
#include <set>

namespace regBridge {

namespace {

constexpr int64_t MIN_POLL_INTERVAL_MS = 100;
constexpr int64_t MIN_TIMEOUT_MS = 100;

} // namespace

ConfigManager::ConfigManager(const std::string& config_file, const std::string& env_file) {
    // Load environment variables first (they override config file values)
    loadEnvironmentVariables(env_file);

    std::ifstream file(config_file);
    if (!file.is_open()) {
        throw ConfigException("Cannot open configuration file: " + config_file);
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigException("Invalid JSON in configuration file: " + std::string(e.what()));
    }

    loadJsonConfiguration(json);
    validateConfiguration();

    LOG_INFO("Configuration loaded successfully ({} devices)", devices_.size());
}

ConfigManager::ConfigManager(const nlohmann::json& json, const std::map<std::string, std::string>& env_vars)
    : env_vars_(env_vars) {
    loadJsonConfiguration(json);
    validateConfiguration();
}

void ConfigManager::loadEnvironmentVariables(const std::string& env_file) {
    std::ifstream file(env_file);
    if (!file.is_open()) {
        LOG_WARN("Environment file '{}' not found, using defaults", env_file);
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Parse KEY=VALUE format
        size_t equals_pos = line.find('=');
        if (equals_pos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, equals_pos);
        std::string value = line.substr(equals_pos + 1);

        // Trim whitespace
        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t\r\n") + 1);
        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        env_vars_[key] = value;
    }

    LOG_DEBUG("Loaded {} environment variables from '{}'", env_vars_.size(), env_file);
}

void ConfigManager::loadJsonConfiguration(const nlohmann::json& json) {
    try {
        // Application info
        if (json.contains("application")) {
            const auto& app = json["application"];
            app_name_ = app.value("name", app_name_);
            app_version_ = app.value("version", app_version_);
        }

        // Logging configuration
        if (json.contains("logging")) {
            const auto& logging = json["logging"];
            logging_config_.console_level = log_level_from_string(logging.value("console_level", "INFO"));
            logging_config_.file_level = log_level_from_string(logging.value("file_level", "DEBUG"));
            logging_config_.log_file = logging.value("log_file", logging_config_.log_file);
            logging_config_.max_file_size_mb = logging.value("max_file_size_mb", 10);
            logging_config_.max_files = logging.value("max_files", 5);
            logging_config_.format = logging.value("format", logging_config_.format);
        }

        // Monitor configuration
        if (json.contains("monitor")) {
            const auto& monitor = json["monitor"];
            monitor_config_.default_poll_interval = Duration(monitor.value("default_poll_interval_ms", 10000));
            monitor_config_.cache_max_age = Duration(monitor.value("cache_max_age_ms", 5000));
            monitor_config_.offline_after_failures = monitor.value("offline_after_failures", 3u);
            monitor_config_.max_backoff = Duration(monitor.value("max_backoff_ms", 60000));
        }

        // Connection defaults
        if (json.contains("connection_defaults")) {
            const auto& defaults = json["connection_defaults"];
            connection_defaults_.timeout = Duration(defaults.value("timeout_ms", 5000));
            connection_defaults_.retries = defaults.value("retries", 1u);
            connection_defaults_.retry_delay = Duration(defaults.value("retry_delay_ms", 500));
        }

        // Storage configuration
        if (json.contains("storage")) {
            const auto& storage = json["storage"];
            storage_config_.enable_persistent_storage = storage.value("enable_persistent_storage", false);
            storage_config_.database_path = storage.value("database_path", storage_config_.database_path);
            storage_config_.data_retention_days = storage.value("data_retention_days", 30u);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigException("Invalid configuration value: " + std::string(e.what()));
    } catch (const ValidationException& e) {
        throw ConfigException(e.what());
    }

    // Override with environment variables
    if (auto level = env("LOG_LEVEL")) {
        logging_config_.console_level = log_level_from_string(*level);
    }
    if (auto log_file = env("LOG_FILE")) {
        logging_config_.log_file = *log_file;
    }
    if (auto db_path = env("DATABASE_PATH")) {
        storage_config_.database_path = *db_path;
    }
    connection_defaults_.timeout = Duration(envInt("DEFAULT_TIMEOUT_MS",
                                                   static_cast<int>(connection_defaults_.timeout.count())));
    connection_defaults_.retries = static_cast<uint32_t>(envInt("DEFAULT_RETRIES",
                                                                static_cast<int>(connection_defaults_.retries)));
    connection_defaults_.retry_delay = Duration(envInt("DEFAULT_RETRY_DELAY_MS",
                                                       static_cast<int>(connection_defaults_.retry_delay.count())));
    monitor_config_.default_poll_interval = Duration(envInt("POLL_INTERVAL_MS",
                                                            static_cast<int>(monitor_config_.default_poll_interval.count())));

    // Devices last, so they inherit the final connection defaults
    parseDevices(json);
}

void ConfigManager::parseDevices(const nlohmann::json& json) {
    if (!json.contains("devices")) {
        LOG_WARN("No devices found in configuration");
        return;
    }
    if (!json["devices"].is_array()) {
        throw ConfigException("'devices' must be an array");
    }

    for (const auto& device_json : json["devices"]) {
        devices_.push_back(parseDevice(device_json));
    }

    LOG_DEBUG("Loaded {} device configurations", devices_.size());
}

DeviceRecord ConfigManager::parseDevice(const nlohmann::json& json) const {
    DeviceRecord device;
    device.id = json.value("id", "");
    if (device.id.empty()) {
        throw ConfigException("Device without an id");
    }

    try {
        device.name = json.value("name", device.id);
        device.enabled = json.value("enabled", true);
        if (json.contains("poll_interval_ms")) {
            device.poll_interval = Duration(json["poll_interval_ms"].get<int64_t>());
        }

        device.connection = json.contains("connection")
            ? parseConnection(json["connection"], connection_defaults_)
            : connection_defaults_;

        if (json.contains("ranges")) {
            for (const auto& range_json : json["ranges"]) {
                RegisterRange range;
                range.start_address = range_json.at("start_address").get<RegisterAddress>();
                range.count = range_json.at("count").get<uint16_t>();
                range.function = function_from_code(range_json.value("function_code", 3));

                if (range_json.contains("parameters")) {
                    for (const auto& parameter_json : range_json["parameters"]) {
                        range.parameters.push_back(parseParameter(parameter_json));
                    }
                }
                device.ranges.push_back(std::move(range));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigException("Device '" + device.id + "': " + e.what());
    } catch (const ValidationException& e) {
        throw ConfigException("Device '" + device.id + "': " + e.what());
    }

    return device;
}

ConnectionConfig ConfigManager::parseConnection(const nlohmann::json& json, const ConnectionConfig& defaults) {
    ConnectionConfig config = defaults;

    config.kind = transport_kind_from_string(json.value("type", to_string(defaults.kind)));
    config.host = json.value("host", defaults.host);
    config.port = json.value("port", defaults.port);
    config.serial_port = json.value("serial_port", defaults.serial_port);
    config.baud_rate = json.value("baud_rate", defaults.baud_rate);
    config.data_bits = json.value("data_bits", defaults.data_bits);
    config.stop_bits = json.value("stop_bits", defaults.stop_bits);
    config.parity = parity_from_string(json.value("parity", to_string(defaults.parity)));
    config.unit_id = json.value("unit_id", defaults.unit_id);
    config.timeout = Duration(json.value("timeout_ms", static_cast<int64_t>(defaults.timeout.count())));
    config.retries = json.value("retries", defaults.retries);
    config.retry_delay = Duration(json.value("retry_delay_ms", static_cast<int64_t>(defaults.retry_delay.count())));

    return config;
}

Parameter ConfigManager::parseParameter(const nlohmann::json& json) {
    Parameter parameter;
    parameter.name = json.at("name").get<std::string>();
    parameter.data_type = data_type_from_string(json.value("data_type", "UINT16"));
    parameter.byte_order = json.contains("byte_order")
        ? byte_order_from_string(json["byte_order"].get<std::string>())
        : default_byte_order(parameter.data_type);
    parameter.register_offset = json.value("register_offset", static_cast<uint16_t>(0));
    parameter.unit = json.value("unit", "");
    parameter.writable = json.value("writable", false);

    if (json.contains("scale")) {
        parameter.scale = json["scale"].get<double>();
    }
    if (json.contains("decimals")) {
        parameter.decimals = json["decimals"].get<int>();
    }
    if (json.contains("signed")) {
        parameter.is_signed = json["signed"].get<bool>();
    }
    if (json.contains("string_length")) {
        parameter.string_length = json["string_length"].get<uint16_t>();
    }

    uint16_t natural_width = word_width(parameter.data_type);
    if (parameter.data_type == DataType::STRING) {
        natural_width = parameter.string_length
            ? static_cast<uint16_t>((*parameter.string_length + 1) / 2)
            : 1;
    }
    parameter.word_count = json.value("word_count", natural_width);

    if (parameter.data_type != DataType::STRING && parameter.word_count != natural_width) {
        throw ValidationException("Parameter '" + parameter.name + "' of type " +
                                  to_string(parameter.data_type) + " occupies " +
                                  std::to_string(natural_width) + " words, not " +
                                  std::to_string(parameter.word_count));
    }

    return parameter;
}

const DeviceRecord& ConfigManager::getDevice(const DeviceId& device_id) const {
    for (const auto& device : devices_) {
        if (device.id == device_id) {
            return device;
        }
    }
    throw ConfigException("Device '" + device_id + "' not configured");
}

bool ConfigManager::hasDevice(const DeviceId& device_id) const {
    for (const auto& device : devices_) {
        if (device.id == device_id) {
            return true;
        }
    }
    return false;
}

void ConfigManager::validateConfiguration() const {
    if (monitor_config_.default_poll_interval.count() < MIN_POLL_INTERVAL_MS) {
        throw ConfigException("Poll interval must be at least " + std::to_string(MIN_POLL_INTERVAL_MS) + "ms");
    }
    if (monitor_config_.offline_after_failures == 0) {
        throw ConfigException("offline_after_failures must be at least 1");
    }
    if (connection_defaults_.timeout.count() < MIN_TIMEOUT_MS) {
        throw ConfigException("Timeout must be at least " + std::to_string(MIN_TIMEOUT_MS) + "ms");
    }

    std::set<DeviceId> device_ids;
    for (const auto& device : devices_) {
        if (!device_ids.insert(device.id).second) {
            throw ConfigException("Duplicate device id '" + device.id + "'");
        }

        if (device.poll_interval && device.poll_interval->count() < MIN_POLL_INTERVAL_MS) {
            throw ConfigException("Device '" + device.id + "': poll interval must be at least " +
                                  std::to_string(MIN_POLL_INTERVAL_MS) + "ms");
        }

        if (device.enabled) {
            try {
                ConnectionManager::validateConfig(device.connection);
            } catch (const ValidationException& e) {
                throw ConfigException("Device '" + device.id + "': " + e.what());
            }
        }

        std::set<std::string> parameter_names;
        for (const auto& range : device.ranges) {
            try {
                RegisterOperations::validateReadRequest(range.function, range.start_address, range.count);
                for (const auto& parameter : range.parameters) {
                    if (!parameter_names.insert(parameter.name).second) {
                        throw ConfigException("Device '" + device.id + "': duplicate parameter '" +
                                              parameter.name + "'");
                    }
                    RegisterOperations::validateParameterLayout(range, parameter);
                }
            } catch (const ValidationException& e) {
                throw ConfigException("Device '" + device.id + "': " + e.what());
            }
        }
    }

    LOG_DEBUG("Configuration validation passed");
}

std::optional<std::string> ConfigManager::env(const std::string& key) const {
    auto it = env_vars_.find(key);
    if (it == env_vars_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

int ConfigManager::envInt(const std::string& key, int fallback) const {
    auto value = env(key);
    if (!value) {
        return fallback;
    }
    try {
        return std::stoi(*value);
    } catch (const std::exception&) {
        throw ConfigException("Invalid integer for " + key + ": '" + *value + "'");
    }
}

} // namespace regBridge
