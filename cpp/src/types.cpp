/**
 * @file types.cpp
 * @brief String conversions for RegBridge enumerations
 * @author RegBridge Team
 * @date 2025-09-02
 */

#include "types.hpp"
#include "exceptions.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace regBridge {

namespace {

std::string upper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

} // namespace

std::string to_string(TransportKind kind) {
    switch (kind) {
        case TransportKind::TCP: return "tcp";
        case TransportKind::RTU: return "rtu";
        default: return "unknown";
    }
}

std::string to_string(Parity parity) {
    switch (parity) {
        case Parity::NONE: return "none";
        case Parity::EVEN: return "even";
        case Parity::ODD: return "odd";
        default: return "unknown";
    }
}

std::string to_string(DataType type) {
    switch (type) {
        case DataType::BOOL: return "BOOL";
        case DataType::INT16: return "INT16";
        case DataType::UINT16: return "UINT16";
        case DataType::INT32: return "INT32";
        case DataType::UINT32: return "UINT32";
        case DataType::FLOAT32: return "FLOAT32";
        case DataType::FLOAT64: return "FLOAT64";
        case DataType::STRING: return "STRING";
        default: return "UNKNOWN";
    }
}

std::string to_string(ByteOrder order) {
    switch (order) {
        case ByteOrder::AB: return "AB";
        case ByteOrder::BA: return "BA";
        case ByteOrder::ABCD: return "ABCD";
        case ByteOrder::CDAB: return "CDAB";
        case ByteOrder::BADC: return "BADC";
        case ByteOrder::DCBA: return "DCBA";
        default: return "UNKNOWN";
    }
}

std::string to_string(ModbusFunction function) {
    switch (function) {
        case ModbusFunction::READ_COILS: return "read coils";
        case ModbusFunction::READ_DISCRETE_INPUTS: return "read discrete inputs";
        case ModbusFunction::READ_HOLDING_REGISTERS: return "read holding registers";
        case ModbusFunction::READ_INPUT_REGISTERS: return "read input registers";
        case ModbusFunction::WRITE_SINGLE_COIL: return "write single coil";
        case ModbusFunction::WRITE_SINGLE_REGISTER: return "write single register";
        case ModbusFunction::WRITE_MULTIPLE_COILS: return "write multiple coils";
        case ModbusFunction::WRITE_MULTIPLE_REGISTERS: return "write multiple registers";
        default: return "unknown";
    }
}

std::string to_string(CoilType type) {
    switch (type) {
        case CoilType::CONTROL: return "control";
        case CoilType::SCHEDULE: return "schedule";
        case CoilType::STATUS: return "status";
        default: return "unknown";
    }
}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "None";
        case ErrorKind::VALIDATION: return "ValidationError";
        case ErrorKind::INVALID_BYTE_ORDER: return "InvalidByteOrder";
        case ErrorKind::VALUE_OUT_OF_RANGE: return "ValueOutOfRange";
        case ErrorKind::CONNECTION: return "ConnectionError";
        case ErrorKind::TIMEOUT: return "TimeoutError";
        case ErrorKind::PROTOCOL: return "ProtocolError";
        case ErrorKind::PARTIAL_DECODE: return "PartialDecodeError";
        case ErrorKind::BUSY: return "Busy";
        case ErrorKind::NOT_FOUND: return "NotFound";
        case ErrorKind::CONFIG: return "ConfigError";
        case ErrorKind::STORAGE: return "StorageError";
        case ErrorKind::INTERNAL: return "InternalError";
        default: return "Unknown";
    }
}

std::string to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::UNKNOWN: return "unknown";
        case HealthStatus::ONLINE: return "online";
        case HealthStatus::DEGRADED: return "degraded";
        case HealthStatus::OFFLINE: return "offline";
        default: return "unknown";
    }
}

std::string to_string(const ParameterValue& value) {
    if (std::holds_alternative<bool>(value)) {
        return std::get<bool>(value) ? "true" : "false";
    }
    if (std::holds_alternative<int64_t>(value)) {
        return std::to_string(std::get<int64_t>(value));
    }
    if (std::holds_alternative<double>(value)) {
        std::ostringstream oss;
        oss << std::get<double>(value);
        return oss.str();
    }
    if (std::holds_alternative<std::string>(value)) {
        return std::get<std::string>(value);
    }
    return "null";
}

TransportKind transport_kind_from_string(const std::string& str) {
    std::string value = upper(str);
    if (value == "TCP" || value == "STREAM") return TransportKind::TCP;
    if (value == "RTU" || value == "SERIAL") return TransportKind::RTU;
    throw ValidationException("Unknown transport kind '" + str + "'");
}

Parity parity_from_string(const std::string& str) {
    std::string value = upper(str);
    if (value == "NONE" || value == "N") return Parity::NONE;
    if (value == "EVEN" || value == "E") return Parity::EVEN;
    if (value == "ODD" || value == "O") return Parity::ODD;
    throw ValidationException("Unknown parity '" + str + "'");
}

DataType data_type_from_string(const std::string& str) {
    std::string value = upper(str);
    if (value == "BOOL" || value == "BOOLEAN") return DataType::BOOL;
    if (value == "INT16") return DataType::INT16;
    if (value == "UINT16") return DataType::UINT16;
    if (value == "INT32") return DataType::INT32;
    if (value == "UINT32") return DataType::UINT32;
    if (value == "FLOAT32" || value == "FLOAT") return DataType::FLOAT32;
    if (value == "FLOAT64" || value == "DOUBLE") return DataType::FLOAT64;
    if (value == "STRING") return DataType::STRING;
    throw ValidationException("Unknown data type '" + str + "'");
}

ByteOrder byte_order_from_string(const std::string& str) {
    std::string value = upper(str);
    if (value == "AB") return ByteOrder::AB;
    if (value == "BA") return ByteOrder::BA;
    if (value == "ABCD") return ByteOrder::ABCD;
    if (value == "CDAB") return ByteOrder::CDAB;
    if (value == "BADC") return ByteOrder::BADC;
    if (value == "DCBA") return ByteOrder::DCBA;
    throw ValidationException("Unknown byte order '" + str + "'");
}

ModbusFunction function_from_code(int code) {
    switch (code) {
        case 1: return ModbusFunction::READ_COILS;
        case 2: return ModbusFunction::READ_DISCRETE_INPUTS;
        case 3: return ModbusFunction::READ_HOLDING_REGISTERS;
        case 4: return ModbusFunction::READ_INPUT_REGISTERS;
        default:
            throw ValidationException("Unsupported read function code " + std::to_string(code));
    }
}

CoilType coil_type_from_string(const std::string& str) {
    std::string value = upper(str);
    if (value == "CONTROL") return CoilType::CONTROL;
    if (value == "SCHEDULE") return CoilType::SCHEDULE;
    if (value == "STATUS") return CoilType::STATUS;
    throw ValidationException("Unknown coil type '" + str + "'");
}

LogLevel log_level_from_string(const std::string& str) {
    std::string value = upper(str);
    if (value == "TRACE") return LogLevel::TRACE;
    if (value == "DEBUG") return LogLevel::DEBUG;
    if (value == "INFO") return LogLevel::INFO;
    if (value == "WARN" || value == "WARNING") return LogLevel::WARN;
    if (value == "ERROR") return LogLevel::ERROR;
    if (value == "CRITICAL") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

uint16_t word_width(DataType type) {
    switch (type) {
        case DataType::BOOL:
        case DataType::INT16:
        case DataType::UINT16:
            return 1;
        case DataType::INT32:
        case DataType::UINT32:
        case DataType::FLOAT32:
            return 2;
        case DataType::FLOAT64:
            return 4;
        case DataType::STRING:
        default:
            return 0;
    }
}

bool is_bit_function(ModbusFunction function) {
    return function == ModbusFunction::READ_COILS ||
           function == ModbusFunction::READ_DISCRETE_INPUTS;
}

ByteOrder default_byte_order(DataType type) {
    return word_width(type) > 1 ? ByteOrder::ABCD : ByteOrder::AB;
}

} // namespace regBridge
