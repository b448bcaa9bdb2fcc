/**
 * @file libmodbus_transport.hpp
 * @brief ModbusTransport implementation over libmodbus (TCP and RTU)
 * @author RegBridge Team
 * @date 2025-09-03
 */

#pragma once

#include "modbus_transport.hpp"
#include "exceptions.hpp"
#include <modbus.h>
#include <string>

namespace regBridge {

/**
 * @brief libmodbus backed transport
 *
 * The response timeout is applied to the context before connecting, so it
 * bounds the TCP connect as well as every request. For RTU the serial port
 * is probed with an exclusive advisory lock before it is opened and the lock
 * is held for the lifetime of the session.
 */
class LibmodbusTransport : public ModbusTransport {
public:
    explicit LibmodbusTransport(const ConnectionConfig& config);
    ~LibmodbusTransport() override;

    LibmodbusTransport(const LibmodbusTransport&) = delete;
    LibmodbusTransport& operator=(const LibmodbusTransport&) = delete;

    void connect() override;
    void close() override;
    bool isOpen() const override;

    void setSlave(UnitId unit_id) override;
    void setResponseTimeout(Duration timeout) override;

    std::vector<bool> readCoils(RegisterAddress address, uint16_t count) override;
    std::vector<bool> readDiscreteInputs(RegisterAddress address, uint16_t count) override;
    std::vector<RegisterValue> readHoldingRegisters(RegisterAddress address, uint16_t count) override;
    std::vector<RegisterValue> readInputRegisters(RegisterAddress address, uint16_t count) override;

    void writeCoil(RegisterAddress address, bool value) override;
    void writeCoils(RegisterAddress address, const std::vector<bool>& values) override;
    void writeRegister(RegisterAddress address, RegisterValue value) override;
    void writeRegisters(RegisterAddress address, const std::vector<RegisterValue>& values) override;

    /**
     * @brief Factory suitable for ConnectionManager
     */
    static std::unique_ptr<ModbusTransport> create(const ConnectionConfig& config);

private:
    void createContext();
    void ensurePortFree() const;
    void requireOpen(const char* operation) const;

    /**
     * @brief Map errno after a failed libmodbus call to the exception hierarchy
     */
    [[noreturn]] void raiseError(const std::string& operation, int error) const;

    std::string describe() const;

    ConnectionConfig config_;
    modbus_t* ctx_ = nullptr;
    bool connected_ = false;
};

} // namespace regBridge
