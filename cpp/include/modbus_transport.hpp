/**
 * @file modbus_transport.hpp
 * @brief Primitive Modbus transport interface
 * @author RegBridge Team
 * @date 2025-09-03
 */

#pragma once

#include "types.hpp"
#include <functional>
#include <memory>
#include <vector>

namespace regBridge {

/**
 * @brief Primitive Modbus layer (connect, read/write coils and registers)
 *
 * Implementations report failures with the RegBridge exception hierarchy:
 * ConnectionException, TimeoutException, ProtocolException or
 * ValidationException. One instance serves one logical session and is not
 * shared between threads.
 */
class ModbusTransport {
public:
    virtual ~ModbusTransport() = default;

    /**
     * @brief Open the session (socket connect or serial open)
     * @throws ConnectionException or TimeoutException
     */
    virtual void connect() = 0;

    /**
     * @brief Close the session; safe on an already closed transport
     */
    virtual void close() = 0;

    /**
     * @brief Liveness of the underlying socket or file descriptor, no wire traffic
     */
    virtual bool isOpen() const = 0;

    virtual void setSlave(UnitId unit_id) = 0;
    virtual void setResponseTimeout(Duration timeout) = 0;

    virtual std::vector<bool> readCoils(RegisterAddress address, uint16_t count) = 0;
    virtual std::vector<bool> readDiscreteInputs(RegisterAddress address, uint16_t count) = 0;
    virtual std::vector<RegisterValue> readHoldingRegisters(RegisterAddress address, uint16_t count) = 0;
    virtual std::vector<RegisterValue> readInputRegisters(RegisterAddress address, uint16_t count) = 0;

    virtual void writeCoil(RegisterAddress address, bool value) = 0;
    virtual void writeCoils(RegisterAddress address, const std::vector<bool>& values) = 0;
    virtual void writeRegister(RegisterAddress address, RegisterValue value) = 0;
    virtual void writeRegisters(RegisterAddress address, const std::vector<RegisterValue>& values) = 0;
};

/**
 * @brief Creates a transport for a connection configuration
 */
using TransportFactory = std::function<std::unique_ptr<ModbusTransport>(const ConnectionConfig&)>;

} // namespace regBridge
