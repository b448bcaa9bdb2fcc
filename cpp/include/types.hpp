/**
 * @file types.hpp
 * @brief Common type definitions for RegBridge
 * @author RegBridge Team
 * @date 2025-09-02
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include <memory>
#include <map>
#include <optional>
#include <variant>

namespace regBridge {

// Type aliases for clarity
using RegisterAddress = uint16_t;
using RegisterValue = uint16_t;
using UnitId = uint8_t;
using DeviceId = std::string;
using TimePoint = std::chrono::system_clock::time_point;
using SteadyTimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

// Modbus function codes
enum class ModbusFunction : uint8_t {
    READ_COILS = 0x01,
    READ_DISCRETE_INPUTS = 0x02,
    READ_HOLDING_REGISTERS = 0x03,
    READ_INPUT_REGISTERS = 0x04,
    WRITE_SINGLE_COIL = 0x05,
    WRITE_SINGLE_REGISTER = 0x06,
    WRITE_MULTIPLE_COILS = 0x0F,
    WRITE_MULTIPLE_REGISTERS = 0x10
};

enum class TransportKind {
    TCP,
    RTU
};

enum class Parity {
    NONE,
    EVEN,
    ODD
};

enum class DataType {
    BOOL,
    INT16,
    UINT16,
    INT32,
    UINT32,
    FLOAT32,
    FLOAT64,
    STRING
};

// AB/BA apply to 16-bit types, the four-letter orders to 32/64-bit types
enum class ByteOrder {
    AB,
    BA,
    ABCD,
    CDAB,
    BADC,
    DCBA
};

enum class CoilType {
    CONTROL,
    SCHEDULE,
    STATUS
};

// Log levels
#ifdef ERROR
#undef ERROR  // Undefine Windows ERROR macro if present
#endif
enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Decoded engineering value of one parameter
 *
 * std::monostate marks "no value" (decode error or missing reading).
 */
using ParameterValue = std::variant<std::monostate, bool, int64_t, double, std::string>;

// Connection settings for one device
struct ConnectionConfig {
    TransportKind kind = TransportKind::TCP;

    // TCP
    std::string host;
    uint16_t port = 502;

    // RTU
    std::string serial_port;
    uint32_t baud_rate = 9600;
    uint8_t data_bits = 8;
    uint8_t stop_bits = 1;
    Parity parity = Parity::NONE;

    UnitId unit_id = 1;

    // Retry policy shared by connect and every wire operation
    Duration timeout = Duration(5000);
    uint32_t retries = 1;
    Duration retry_delay = Duration(500);
};

struct Parameter {
    std::string name;
    DataType data_type = DataType::UINT16;
    ByteOrder byte_order = ByteOrder::AB;
    uint16_t register_offset = 0;
    uint16_t word_count = 1;
    std::optional<double> scale;
    std::optional<int> decimals;
    std::optional<bool> is_signed;
    std::optional<uint16_t> string_length;  // bytes, STRING only
    std::string unit;
    bool writable = false;
};

struct RegisterRange {
    RegisterAddress start_address = 0;
    uint16_t count = 0;
    ModbusFunction function = ModbusFunction::READ_HOLDING_REGISTERS;
    std::vector<Parameter> parameters;
};

struct DeviceRecord {
    DeviceId id;
    std::string name;
    bool enabled = true;
    ConnectionConfig connection;
    std::vector<RegisterRange> ranges;
    std::optional<Duration> poll_interval;
};

// Error classification shared by exceptions and structured results
enum class ErrorKind {
    NONE,
    VALIDATION,
    INVALID_BYTE_ORDER,
    VALUE_OUT_OF_RANGE,
    CONNECTION,
    TIMEOUT,
    PROTOCOL,
    PARTIAL_DECODE,
    BUSY,
    NOT_FOUND,
    CONFIG,
    STORAGE,
    INTERNAL
};

struct ParameterReading {
    std::string name;
    ParameterValue value;
    std::string unit;
    DataType data_type = DataType::UINT16;
    std::optional<int> decimals;
    std::optional<std::string> error;
    ErrorKind error_kind = ErrorKind::NONE;

    bool hasValue() const { return !std::holds_alternative<std::monostate>(value); }
};

// Raw words of one range, kept with a snapshot for diagnostics
struct RangeWords {
    RegisterAddress start_address = 0;
    ModbusFunction function = ModbusFunction::READ_HOLDING_REGISTERS;
    std::vector<RegisterValue> words;
    std::optional<std::string> error;
};

struct ReadingSnapshot {
    DeviceId device_id;
    TimePoint timestamp;
    std::vector<ParameterReading> readings;
    std::vector<RangeWords> raw;

    const ParameterReading* find(const std::string& name) const {
        for (const auto& reading : readings) {
            if (reading.name == name) {
                return &reading;
            }
        }
        return nullptr;
    }

    size_t errorCount() const {
        size_t errors = 0;
        for (const auto& reading : readings) {
            if (reading.error) {
                ++errors;
            }
        }
        return errors;
    }
};

using SnapshotPtr = std::shared_ptr<const ReadingSnapshot>;

enum class HealthStatus {
    UNKNOWN,
    ONLINE,
    DEGRADED,
    OFFLINE
};

struct DeviceHealth {
    bool healthy = true;
    bool stale = false;
    HealthStatus status = HealthStatus::UNKNOWN;
    uint32_t consecutive_failures = 0;
    std::string last_error;
    ErrorKind last_error_kind = ErrorKind::NONE;
    TimePoint last_success;
    TimePoint last_attempt;
};

// Statistics structures
struct PollStatistics {
    uint64_t total_polls = 0;
    uint64_t successful_polls = 0;
    uint64_t failed_polls = 0;
    uint64_t skipped_polls = 0;
    TimePoint last_poll_time;
    std::string last_error;

    double success_rate() const {
        return total_polls > 0 ? static_cast<double>(successful_polls) / total_polls : 0.0;
    }
};

struct StorageStatistics {
    uint64_t total_snapshots = 0;
    uint64_t total_readings = 0;
    std::map<DeviceId, uint64_t> snapshots_by_device;
    TimePoint oldest_snapshot_time;
    TimePoint newest_snapshot_time;
};

// Configuration structures
struct MonitorConfig {
    Duration default_poll_interval = Duration(10000);
    Duration cache_max_age = Duration(5000);
    uint32_t offline_after_failures = 3;
    Duration max_backoff = Duration(60000);
};

struct StorageConfig {
    bool enable_persistent_storage = false;
    std::string database_path = "regbridge.db";
    uint32_t data_retention_days = 30;
};

struct LoggingConfig {
    LogLevel console_level = LogLevel::INFO;
    LogLevel file_level = LogLevel::DEBUG;
    std::string log_file = "regbridge.log";
    uint32_t max_file_size_mb = 10;
    uint32_t max_files = 5;
    std::string format = "[%Y-%m-%d %H:%M:%S] [%l] %v";
};

// Smart pointer aliases
template<typename T>
using UniquePtr = std::unique_ptr<T>;

template<typename T>
using SharedPtr = std::shared_ptr<T>;

// Helper functions
std::string to_string(TransportKind kind);
std::string to_string(Parity parity);
std::string to_string(DataType type);
std::string to_string(ByteOrder order);
std::string to_string(ModbusFunction function);
std::string to_string(CoilType type);
std::string to_string(LogLevel level);
std::string to_string(ErrorKind kind);
std::string to_string(HealthStatus status);
std::string to_string(const ParameterValue& value);

TransportKind transport_kind_from_string(const std::string& str);
Parity parity_from_string(const std::string& str);
DataType data_type_from_string(const std::string& str);
ByteOrder byte_order_from_string(const std::string& str);
ModbusFunction function_from_code(int code);
CoilType coil_type_from_string(const std::string& str);
LogLevel log_level_from_string(const std::string& str);

/**
 * @brief Number of 16-bit words a fixed-width data type occupies
 * @return 0 for STRING, whose width comes from the parameter
 */
uint16_t word_width(DataType type);

bool is_bit_function(ModbusFunction function);

/**
 * @brief Default byte order for a data type (AB for 16-bit, ABCD otherwise)
 */
ByteOrder default_byte_order(DataType type);

} // namespace regBridge
