/**
 * @file register_operations.cpp
 * @brief Implementation of validated register operations
 * @author RegBridge Team
 * @date 2025-09-03
 */

#include "register_operations.hpp"
#include "logger.hpp"
#include <chrono>
#include <thread>

namespace regBridge {

std::vector<RegisterValue> RegisterOperations::readRange(ConnectionHandle& handle,
                                                         const RegisterRange& range) {
    validateReadRequest(range.function, range.start_address, range.count);

    LOG_DEBUG("Reading {} units ({}) starting from address {}",
              range.count, to_string(range.function), range.start_address);

    std::vector<RegisterValue> words;
    std::string description = to_string(range.function) + " " +
                              std::to_string(range.start_address) + "+" + std::to_string(range.count);

    execute(handle, description, [&](ModbusTransport& transport) {
        switch (range.function) {
            case ModbusFunction::READ_COILS:
            case ModbusFunction::READ_DISCRETE_INPUTS: {
                std::vector<bool> bits = range.function == ModbusFunction::READ_COILS
                    ? transport.readCoils(range.start_address, range.count)
                    : transport.readDiscreteInputs(range.start_address, range.count);
                words.assign(bits.begin(), bits.end());
                break;
            }
            case ModbusFunction::READ_HOLDING_REGISTERS:
                words = transport.readHoldingRegisters(range.start_address, range.count);
                break;
            case ModbusFunction::READ_INPUT_REGISTERS:
                words = transport.readInputRegisters(range.start_address, range.count);
                break;
            default:
                throw ValidationException(to_string(range.function) + " is not a read function");
        }
    });

    if (words.size() != range.count) {
        throw ProtocolException("Unit count mismatch: expected " + std::to_string(range.count) +
                                ", got " + std::to_string(words.size()));
    }

    return words;
}

std::vector<ParameterReading> RegisterOperations::readParameters(ConnectionHandle& handle,
                                                                 const RegisterRange& range,
                                                                 const std::vector<Parameter>& parameters,
                                                                 std::vector<RegisterValue>* raw) {
    std::vector<RegisterValue> words = readRange(handle, range);

    std::vector<ParameterReading> readings;
    readings.reserve(parameters.size());

    for (const auto& parameter : parameters) {
        ParameterReading reading;
        reading.name = parameter.name;
        reading.unit = parameter.unit;
        reading.data_type = parameter.data_type;
        reading.decimals = parameter.decimals;

        try {
            validateParameterLayout(range, parameter);
            reading.value = RegisterCodec::decodeParameter(words, parameter);
        } catch (const RegBridgeException& e) {
            LOG_WARN("Failed to decode parameter '{}': {}", parameter.name, e.what());
            reading.error = e.what();
            reading.error_kind = ErrorKind::PARTIAL_DECODE;
        }

        readings.push_back(std::move(reading));
    }

    if (raw) {
        *raw = std::move(words);
    }
    return readings;
}

void RegisterOperations::writeCoil(ConnectionHandle& handle, RegisterAddress address, bool value) {
    validateAddressSpan(address, 1);

    LOG_DEBUG("Writing coil {} = {}", address, value);
    execute(handle, "write coil " + std::to_string(address), [&](ModbusTransport& transport) {
        transport.writeCoil(address, value);
    });
}

std::vector<CoilWriteResult> RegisterOperations::writeCoils(ConnectionHandle& handle,
                                                            RegisterAddress address,
                                                            const std::vector<bool>& values) {
    validateWriteCoils(address, values.size());

    std::vector<CoilWriteResult> results;
    results.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        CoilWriteResult result;
        result.address = static_cast<RegisterAddress>(address + i);
        result.value = values[i];
        results.push_back(result);
    }

    LOG_DEBUG("Writing {} coils starting from address {}", values.size(), address);

    try {
        execute(handle, "write coils " + std::to_string(address) + "+" + std::to_string(values.size()),
                [&](ModbusTransport& transport) { transport.writeCoils(address, values); });
    } catch (const RegBridgeException& e) {
        LOG_ERROR("Batch coil write at {} rejected: {}", address, e.what());
        for (auto& result : results) {
            result.success = false;
            result.error_kind = e.kind();
            result.message = e.what();
        }
        return results;
    }

    for (auto& result : results) {
        result.success = true;
        result.message = "Coil " + std::to_string(result.address) + " set to " +
                         (result.value ? "ON" : "OFF");
    }
    return results;
}

void RegisterOperations::writeRegister(ConnectionHandle& handle, RegisterAddress address,
                                       RegisterValue value) {
    validateAddressSpan(address, 1);

    LOG_DEBUG("Writing value {} to register {}", value, address);
    execute(handle, "write register " + std::to_string(address), [&](ModbusTransport& transport) {
        transport.writeRegister(address, value);
    });
}

void RegisterOperations::writeRegisters(ConnectionHandle& handle, RegisterAddress address,
                                        const std::vector<RegisterValue>& values) {
    validateWriteRegisters(address, values.size());

    LOG_DEBUG("Writing {} registers starting from address {}", values.size(), address);
    execute(handle, "write registers " + std::to_string(address) + "+" + std::to_string(values.size()),
            [&](ModbusTransport& transport) { transport.writeRegisters(address, values); });
}

void RegisterOperations::writeParameter(ConnectionHandle& handle, const RegisterRange& range,
                                        const Parameter& parameter, const ParameterValue& value) {
    validateParameterLayout(range, parameter);

    size_t target = static_cast<size_t>(range.start_address) + parameter.register_offset;
    validateAddressSpan(static_cast<RegisterAddress>(target), RegisterCodec::parameterWidth(parameter));
    auto address = static_cast<RegisterAddress>(target);

    switch (range.function) {
        case ModbusFunction::READ_HOLDING_REGISTERS: {
            std::vector<RegisterValue> words = RegisterCodec::encodeParameter(value, parameter);
            if (words.size() == 1) {
                writeRegister(handle, address, words.front());
            } else {
                writeRegisters(handle, address, words);
            }
            break;
        }

        case ModbusFunction::READ_COILS: {
            if (parameter.data_type != DataType::BOOL) {
                throw ValidationException("Parameter '" + parameter.name + "' of type " +
                                          to_string(parameter.data_type) +
                                          " cannot be written to a coil range");
            }
            std::vector<RegisterValue> words = RegisterCodec::encodeParameter(value, parameter);
            writeCoil(handle, address, words.front() != 0);
            break;
        }

        default:
            throw ValidationException("Parameter '" + parameter.name + "' belongs to a read-only " +
                                      to_string(range.function) + " range");
    }
}

void RegisterOperations::validateParameterLayout(const RegisterRange& range, const Parameter& parameter) {
    uint16_t width = RegisterCodec::parameterWidth(parameter);
    if (width == 0) {
        throw ValidationException("Parameter '" + parameter.name + "' occupies no registers");
    }
    if (static_cast<size_t>(parameter.register_offset) + width > range.count) {
        throw ValidationException("Parameter '" + parameter.name + "' at offset " +
                                  std::to_string(parameter.register_offset) + " with " +
                                  std::to_string(width) + " words exceeds range of " +
                                  std::to_string(range.count));
    }
    RegisterCodec::validateByteOrder(parameter.data_type, parameter.byte_order);
}

void RegisterOperations::validateReadRequest(ModbusFunction function, RegisterAddress address,
                                             uint16_t count) {
    uint16_t limit = 0;
    switch (function) {
        case ModbusFunction::READ_COILS:
        case ModbusFunction::READ_DISCRETE_INPUTS:
            limit = MAX_READ_BITS;
            break;
        case ModbusFunction::READ_HOLDING_REGISTERS:
        case ModbusFunction::READ_INPUT_REGISTERS:
            limit = MAX_READ_REGISTERS;
            break;
        default:
            throw ValidationException(to_string(function) + " is not a read function");
    }

    if (count == 0 || count > limit) {
        throw ValidationException("Invalid count " + std::to_string(count) + " for " +
                                  to_string(function) + " (1.." + std::to_string(limit) + ")");
    }
    validateAddressSpan(address, count);
}

void RegisterOperations::validateAddressSpan(RegisterAddress address, size_t count) {
    if (static_cast<size_t>(address) + count > 65536) {
        throw ValidationException("Address range " + std::to_string(address) + "+" +
                                  std::to_string(count) + " exceeds the 16-bit address space");
    }
}

void RegisterOperations::validateWriteRegisters(RegisterAddress address, size_t count) {
    if (count == 0 || count > MAX_WRITE_REGISTERS) {
        throw ValidationException("Invalid register count " + std::to_string(count) +
                                  " for write (1.." + std::to_string(MAX_WRITE_REGISTERS) + ")");
    }
    validateAddressSpan(address, count);
}

void RegisterOperations::validateWriteCoils(RegisterAddress address, size_t count) {
    if (count == 0 || count > MAX_WRITE_COILS) {
        throw ValidationException("Invalid coil count " + std::to_string(count) +
                                  " for write (1.." + std::to_string(MAX_WRITE_COILS) + ")");
    }
    validateAddressSpan(address, count);
}

void RegisterOperations::execute(ConnectionHandle& handle, const std::string& description,
                                 const std::function<void(ModbusTransport&)>& request) {
    const ConnectionConfig& config = handle.config();
    uint32_t attempt = 0;

    while (true) {
        auto start_time = std::chrono::steady_clock::now();
        try {
            request(handle.transport());
            auto duration = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start_time);
            updateStats(true, duration, attempt > 0);
            LOG_TRACE("{} completed in {}ms", description, duration.count());
            return;

        } catch (const RegBridgeException& e) {
            auto duration = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start_time);
            updateStats(false, duration, attempt > 0);

            if (!e.retryable() || attempt >= config.retries) {
                if (e.retryable()) {
                    LOG_WARN("{} failed after {} attempts: {}", description, attempt + 1, e.what());
                }
                throw;
            }

            LOG_WARN("{} attempt {} failed: {}", description, attempt + 1, e.what());
        }

        ++attempt;
        LOG_DEBUG("Retrying in {}ms...", config.retry_delay.count());
        std::this_thread::sleep_for(config.retry_delay);

        // A timed out or reset session may hold stale data; start clean
        try {
            handle.reopen();
        } catch (const RegBridgeException& e) {
            if (!e.retryable()) {
                throw;
            }
            LOG_WARN("Re-opening session for {} failed: {}", description, e.what());
        }
    }
}

void RegisterOperations::updateStats(bool success, Duration response_time, bool was_retry) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.total_requests++;

    if (success) {
        stats_.successful_requests++;
    } else {
        stats_.failed_requests++;
    }

    if (was_retry) {
        stats_.retry_attempts++;
    }

    // Running average of response time
    if (stats_.total_requests > 1) {
        auto total_time = stats_.average_response_time.count() * (stats_.total_requests - 1) +
                          response_time.count();
        stats_.average_response_time = Duration(total_time / stats_.total_requests);
    } else {
        stats_.average_response_time = response_time;
    }
}

RegisterOperations::CommunicationStats RegisterOperations::getStatistics() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void RegisterOperations::resetStatistics() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_ = CommunicationStats{};
    LOG_DEBUG("Communication statistics reset");
}

} // namespace regBridge
