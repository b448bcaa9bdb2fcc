/**
 * @file exceptions.hpp
 * @brief Custom exception classes for RegBridge
 * @author RegBridge Team
 * @date 2025-09-02
 */

#pragma once

#include "types.hpp"
#include <stdexcept>
#include <string>

namespace regBridge {

/**
 * @brief Base exception class for RegBridge
 */
class RegBridgeException : public std::runtime_error {
public:
    RegBridgeException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

    /**
     * @brief Whether the retry policy applies to this failure
     */
    bool retryable() const noexcept {
        return kind_ == ErrorKind::CONNECTION || kind_ == ErrorKind::TIMEOUT;
    }

private:
    ErrorKind kind_;
};

/**
 * @brief Exception for invalid addresses, ranges and type combinations
 *
 * Raised before any transport call; never retried.
 */
class ValidationException : public RegBridgeException {
public:
    explicit ValidationException(const std::string& message)
        : RegBridgeException(ErrorKind::VALIDATION, "Validation Error: " + message) {}

protected:
    ValidationException(ErrorKind kind, const std::string& message)
        : RegBridgeException(kind, message) {}
};

/**
 * @brief Exception for a byte order that does not fit the data type width
 */
class InvalidByteOrderException : public ValidationException {
public:
    InvalidByteOrderException(ByteOrder order, DataType type)
        : ValidationException(ErrorKind::INVALID_BYTE_ORDER,
                              "Invalid Byte Order: " + to_string(order) +
                              " is not valid for " + to_string(type)) {}
};

/**
 * @brief Exception for values that cannot be represented in the target width
 */
class ValueOutOfRangeException : public ValidationException {
public:
    explicit ValueOutOfRangeException(const std::string& message)
        : ValidationException(ErrorKind::VALUE_OUT_OF_RANGE, "Value Out Of Range: " + message) {}
};

/**
 * @brief Exception for transport-level connect failures (refused, reset, port busy)
 */
class ConnectionException : public RegBridgeException {
public:
    explicit ConnectionException(const std::string& message)
        : RegBridgeException(ErrorKind::CONNECTION, "Connection Error: " + message) {}
};

/**
 * @brief Exception for timeout errors
 */
class TimeoutException : public RegBridgeException {
public:
    explicit TimeoutException(const std::string& message)
        : RegBridgeException(ErrorKind::TIMEOUT, "Timeout Error: " + message) {}
};

/**
 * @brief Exception for Modbus protocol errors (exception responses, malformed replies)
 */
class ProtocolException : public RegBridgeException {
public:
    explicit ProtocolException(const std::string& message)
        : RegBridgeException(ErrorKind::PROTOCOL, "Modbus Error: " + message) {}

    ProtocolException(uint8_t exception_code, const std::string& description)
        : RegBridgeException(ErrorKind::PROTOCOL,
                             "Modbus Error (0x" + hex(exception_code) + "): " + description) {}

private:
    static std::string hex(uint8_t code) {
        const char* digits = "0123456789ABCDEF";
        return {digits[code >> 4], digits[code & 0x0F]};
    }
};

/**
 * @brief Exception for configuration errors
 */
class ConfigException : public RegBridgeException {
public:
    explicit ConfigException(const std::string& message)
        : RegBridgeException(ErrorKind::CONFIG, "Configuration Error: " + message) {}
};

/**
 * @brief Exception for reading persistence errors
 */
class StorageException : public RegBridgeException {
public:
    explicit StorageException(const std::string& message)
        : RegBridgeException(ErrorKind::STORAGE, "Storage Error: " + message) {}
};

} // namespace regBridge
