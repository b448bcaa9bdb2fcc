/**
 * @file libmodbus_transport.cpp
 * @brief Implementation of the libmodbus transport
 * @author RegBridge Team
 * @date 2025-09-03
 */

#include "libmodbus_transport.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/file.h>
#include <sys/socket.h>
#include <unistd.h>

namespace regBridge {

namespace {

char parityChar(Parity parity) {
    switch (parity) {
        case Parity::EVEN: return 'E';
        case Parity::ODD: return 'O';
        case Parity::NONE:
        default: return 'N';
    }
}

std::string exceptionDescription(int code) {
    switch (code) {
        case 1: return "Illegal function";
        case 2: return "Illegal data address";
        case 3: return "Illegal data value";
        case 4: return "Slave device failure";
        case 5: return "Acknowledge";
        case 6: return "Slave device busy";
        case 7: return "Negative acknowledge";
        case 8: return "Memory parity error";
        case 10: return "Gateway path unavailable";
        case 11: return "Gateway target device failed to respond";
        default: return "Unknown exception";
    }
}

} // namespace

LibmodbusTransport::LibmodbusTransport(const ConnectionConfig& config)
    : config_(config) {
    createContext();
}

LibmodbusTransport::~LibmodbusTransport() {
    close();
    if (ctx_) {
        modbus_free(ctx_);
        ctx_ = nullptr;
    }
}

std::unique_ptr<ModbusTransport> LibmodbusTransport::create(const ConnectionConfig& config) {
    return std::make_unique<LibmodbusTransport>(config);
}

void LibmodbusTransport::createContext() {
    if (config_.kind == TransportKind::TCP) {
        ctx_ = modbus_new_tcp(config_.host.c_str(), config_.port);
    } else {
        ctx_ = modbus_new_rtu(config_.serial_port.c_str(),
                              static_cast<int>(config_.baud_rate),
                              parityChar(config_.parity),
                              config_.data_bits,
                              config_.stop_bits);
    }

    if (!ctx_) {
        throw ValidationException("Cannot create Modbus context for " + describe() +
                                  ": " + modbus_strerror(errno));
    }

    // The destructor does not run when the constructor throws
    try {
        setSlave(config_.unit_id);
        setResponseTimeout(config_.timeout);
    } catch (const RegBridgeException&) {
        modbus_free(ctx_);
        ctx_ = nullptr;
        throw;
    }
}

void LibmodbusTransport::connect() {
    if (connected_) {
        return;
    }

    if (config_.kind == TransportKind::RTU) {
        ensurePortFree();
    }

    LOG_DEBUG("Opening Modbus session to {}", describe());

    if (modbus_connect(ctx_) == -1) {
        raiseError("connect", errno);
    }
    connected_ = true;

    if (config_.kind == TransportKind::RTU) {
        int fd = modbus_get_socket(ctx_);
        if (fd < 0 || flock(fd, LOCK_EX | LOCK_NB) == -1) {
            int error = errno;
            close();
            throw ConnectionException("Serial port " + config_.serial_port + " is busy: " +
                                      std::strerror(error));
        }
    }
}

void LibmodbusTransport::close() {
    if (ctx_ && connected_) {
        LOG_TRACE("Closing Modbus session to {}", describe());
        // Closing the descriptor drops the advisory lock with it
        modbus_close(ctx_);
    }
    connected_ = false;
}

bool LibmodbusTransport::isOpen() const {
    if (!ctx_ || !connected_) {
        return false;
    }

    int fd = modbus_get_socket(ctx_);
    if (fd < 0) {
        return false;
    }

    if (config_.kind == TransportKind::RTU) {
        return fcntl(fd, F_GETFD) != -1;
    }

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, 0);
    if (rc < 0) {
        return false;
    }
    if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) {
        return false;
    }
    if (pfd.revents & POLLIN) {
        // Readable with nothing pending means the peer closed the connection
        char byte;
        ssize_t peeked = ::recv(fd, &byte, 1, MSG_PEEK | MSG_DONTWAIT);
        return peeked > 0;
    }
    return true;
}

void LibmodbusTransport::setSlave(UnitId unit_id) {
    if (modbus_set_slave(ctx_, unit_id) == -1) {
        throw ValidationException("Invalid unit id " + std::to_string(unit_id) + " for " + describe());
    }
}

void LibmodbusTransport::setResponseTimeout(Duration timeout) {
    auto ms = timeout.count();
    modbus_set_response_timeout(ctx_,
                                static_cast<uint32_t>(ms / 1000),
                                static_cast<uint32_t>((ms % 1000) * 1000));
}

std::vector<bool> LibmodbusTransport::readCoils(RegisterAddress address, uint16_t count) {
    requireOpen("read coils");
    std::vector<uint8_t> bits(count);
    if (modbus_read_bits(ctx_, address, count, bits.data()) == -1) {
        raiseError("read coils", errno);
    }
    return std::vector<bool>(bits.begin(), bits.end());
}

std::vector<bool> LibmodbusTransport::readDiscreteInputs(RegisterAddress address, uint16_t count) {
    requireOpen("read discrete inputs");
    std::vector<uint8_t> bits(count);
    if (modbus_read_input_bits(ctx_, address, count, bits.data()) == -1) {
        raiseError("read discrete inputs", errno);
    }
    return std::vector<bool>(bits.begin(), bits.end());
}

std::vector<RegisterValue> LibmodbusTransport::readHoldingRegisters(RegisterAddress address,
                                                                   uint16_t count) {
    requireOpen("read holding registers");
    std::vector<RegisterValue> words(count);
    if (modbus_read_registers(ctx_, address, count, words.data()) == -1) {
        raiseError("read holding registers", errno);
    }
    return words;
}

std::vector<RegisterValue> LibmodbusTransport::readInputRegisters(RegisterAddress address,
                                                                 uint16_t count) {
    requireOpen("read input registers");
    std::vector<RegisterValue> words(count);
    if (modbus_read_input_registers(ctx_, address, count, words.data()) == -1) {
        raiseError("read input registers", errno);
    }
    return words;
}

void LibmodbusTransport::writeCoil(RegisterAddress address, bool value) {
    requireOpen("write coil");
    if (modbus_write_bit(ctx_, address, value ? 1 : 0) == -1) {
        raiseError("write coil", errno);
    }
}

void LibmodbusTransport::writeCoils(RegisterAddress address, const std::vector<bool>& values) {
    requireOpen("write coils");
    std::vector<uint8_t> bits(values.begin(), values.end());
    if (modbus_write_bits(ctx_, address, static_cast<int>(bits.size()), bits.data()) == -1) {
        raiseError("write coils", errno);
    }
}

void LibmodbusTransport::writeRegister(RegisterAddress address, RegisterValue value) {
    requireOpen("write register");
    if (modbus_write_register(ctx_, address, value) == -1) {
        raiseError("write register", errno);
    }
}

void LibmodbusTransport::writeRegisters(RegisterAddress address,
                                        const std::vector<RegisterValue>& values) {
    requireOpen("write registers");
    if (modbus_write_registers(ctx_, address, static_cast<int>(values.size()), values.data()) == -1) {
        raiseError("write registers", errno);
    }
}

void LibmodbusTransport::ensurePortFree() const {
    int fd = ::open(config_.serial_port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd == -1) {
        int error = errno;
        if (error == EBUSY || error == EACCES) {
            throw ConnectionException("Serial port " + config_.serial_port + " is busy: " +
                                      std::strerror(error));
        }
        throw ConnectionException("Cannot open serial port " + config_.serial_port + ": " +
                                  std::strerror(error));
    }

    bool locked = flock(fd, LOCK_EX | LOCK_NB) == 0;
    int error = errno;
    if (locked) {
        flock(fd, LOCK_UN);
    }
    ::close(fd);

    if (!locked) {
        throw ConnectionException("Serial port " + config_.serial_port +
                                  " is in use by another process: " + std::strerror(error));
    }
}

void LibmodbusTransport::requireOpen(const char* operation) const {
    if (!connected_) {
        throw ConnectionException(std::string("Cannot ") + operation + ": session to " +
                                  describe() + " is not open");
    }
}

void LibmodbusTransport::raiseError(const std::string& operation, int error) const {
    std::string message = operation + " on " + describe() + " failed: " + modbus_strerror(error);

    if (error > MODBUS_ENOBASE && error <= MODBUS_ENOBASE + 11) {
        int code = error - MODBUS_ENOBASE;
        throw ProtocolException(static_cast<uint8_t>(code),
                                exceptionDescription(code) + " (" + operation + " on " + describe() + ")");
    }

    switch (error) {
        case ETIMEDOUT:
            throw TimeoutException(message);

        case EMBBADCRC:
        case EMBBADDATA:
        case EMBBADEXC:
        case EMBUNKEXC:
        case EMBBADSLAVE:
            throw ProtocolException(message);

        case EMBMDATA:
        case EINVAL:
            throw ValidationException(message);

        default:
            // ECONNRESET, ECONNREFUSED, EPIPE, EHOSTUNREACH, EBADF, EIO, EBUSY...
            throw ConnectionException(message);
    }
}

std::string LibmodbusTransport::describe() const {
    if (config_.kind == TransportKind::TCP) {
        return config_.host + ":" + std::to_string(config_.port) +
               " (unit " + std::to_string(config_.unit_id) + ")";
    }
    return config_.serial_port + "@" + std::to_string(config_.baud_rate) +
           " (unit " + std::to_string(config_.unit_id) + ")";
}

} // namespace regBridge
