/**
 * @file register_operations.hpp
 * @brief Validated coil and register reads/writes over a live connection
 * @author RegBridge Team
 * @date 2025-09-03
 */

#pragma once

#include "types.hpp"
#include "exceptions.hpp"
#include "connection_manager.hpp"
#include "register_codec.hpp"
#include <functional>
#include <mutex>
#include <vector>

namespace regBridge {

// Protocol limits per request
constexpr uint16_t MAX_READ_REGISTERS = 125;
constexpr uint16_t MAX_WRITE_REGISTERS = 123;
constexpr uint16_t MAX_READ_BITS = 2000;
constexpr uint16_t MAX_WRITE_COILS = 1968;

/**
 * @brief Outcome of one element of a batch coil write
 */
struct CoilWriteResult {
    RegisterAddress address = 0;
    bool value = false;
    bool success = false;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string message;
};

/**
 * @brief Reads and writes over a ConnectionHandle
 *
 * Every request is validated before the transport is touched. Timeouts and
 * connection errors are retried per the handle's ConnectionConfig, re-opening
 * the session after a connection error; protocol errors surface immediately.
 */
class RegisterOperations {
public:
    RegisterOperations() = default;

    /**
     * @brief Read the raw words of a range
     * @param handle Live connection
     * @param range Range to read
     * @return One word per register, or one 0/1 word per bit for coil and discrete ranges
     * @throws ValidationException, ConnectionException, TimeoutException, ProtocolException
     */
    std::vector<RegisterValue> readRange(ConnectionHandle& handle, const RegisterRange& range);

    /**
     * @brief Read a range and decode its parameters
     *
     * A parameter that fails to decode is reported in its reading with
     * ErrorKind::PARTIAL_DECODE; the other readings are unaffected.
     * @param raw Optional output for the words that were read
     */
    std::vector<ParameterReading> readParameters(ConnectionHandle& handle,
                                                 const RegisterRange& range,
                                                 const std::vector<Parameter>& parameters,
                                                 std::vector<RegisterValue>* raw = nullptr);

    /**
     * @brief Write a single coil (FC5)
     */
    void writeCoil(ConnectionHandle& handle, RegisterAddress address, bool value);

    /**
     * @brief Write consecutive coils with one FC15 request
     *
     * Validation errors throw. A rejected request is reported by marking every
     * element failed with the same error.
     */
    std::vector<CoilWriteResult> writeCoils(ConnectionHandle& handle,
                                            RegisterAddress address,
                                            const std::vector<bool>& values);

    /**
     * @brief Write a single holding register (FC6)
     */
    void writeRegister(ConnectionHandle& handle, RegisterAddress address, RegisterValue value);

    /**
     * @brief Write consecutive holding registers (FC16)
     */
    void writeRegisters(ConnectionHandle& handle, RegisterAddress address,
                        const std::vector<RegisterValue>& values);

    /**
     * @brief Encode a value and write it at the parameter's address
     *
     * Holding ranges use FC6 for one word and FC16 otherwise; BOOL
     * parameters of coil ranges use FC5. Input and discrete ranges are
     * read-only.
     */
    void writeParameter(ConnectionHandle& handle, const RegisterRange& range,
                        const Parameter& parameter, const ParameterValue& value);

    /**
     * @brief Check a parameter lies inside its range and its byte order fits its type
     * @throws ValidationException
     */
    static void validateParameterLayout(const RegisterRange& range, const Parameter& parameter);

    /**
     * @brief Check a read request against protocol limits
     * @throws ValidationException
     */
    static void validateReadRequest(ModbusFunction function, RegisterAddress address, uint16_t count);

    /**
     * @brief Communication statistics
     */
    struct CommunicationStats {
        uint64_t total_requests = 0;
        uint64_t successful_requests = 0;
        uint64_t failed_requests = 0;
        uint64_t retry_attempts = 0;
        Duration average_response_time = Duration(0);

        double success_rate() const {
            return total_requests > 0 ?
                static_cast<double>(successful_requests) / total_requests : 0.0;
        }
    };

    CommunicationStats getStatistics() const;
    void resetStatistics();

private:
    static void validateAddressSpan(RegisterAddress address, size_t count);
    static void validateWriteRegisters(RegisterAddress address, size_t count);
    static void validateWriteCoils(RegisterAddress address, size_t count);

    /**
     * @brief Run one wire request under the handle's retry policy
     */
    void execute(ConnectionHandle& handle, const std::string& description,
                 const std::function<void(ModbusTransport&)>& request);

    void updateStats(bool success, Duration response_time, bool was_retry = false);

    mutable std::mutex stats_mutex_;
    CommunicationStats stats_;
};

} // namespace regBridge
