/**
 * @file connection_manager.cpp
 * @brief Implementation of connection life cycle management
 * @author RegBridge Team
 * @date 2025-09-03
 */

#include "connection_manager.hpp"
#include "libmodbus_transport.hpp"
#include "logger.hpp"
#include <exception>
#include <thread>

namespace regBridge {

std::string to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::IDLE: return "idle";
        case ConnectionState::CONNECTING: return "connecting";
        case ConnectionState::CONNECTED: return "connected";
        case ConnectionState::CLOSING: return "closing";
        case ConnectionState::FAILED: return "failed";
        default: return "unknown";
    }
}

// ============================================================================
// ConnectionHandle
// ============================================================================

ConnectionHandle::~ConnectionHandle() {
    release();
}

ConnectionHandle::ConnectionHandle(ConnectionHandle&& other) noexcept
    : manager_(other.manager_) {
    other.manager_ = nullptr;
}

ConnectionHandle& ConnectionHandle::operator=(ConnectionHandle&& other) noexcept {
    if (this != &other) {
        release();
        manager_ = other.manager_;
        other.manager_ = nullptr;
    }
    return *this;
}

ModbusTransport& ConnectionHandle::transport() const {
    if (!manager_ || !manager_->transport_) {
        throw ConnectionException("Connection handle has no live session");
    }
    return *manager_->transport_;
}

const ConnectionConfig& ConnectionHandle::config() const {
    if (!manager_) {
        throw ConnectionException("Connection handle was released");
    }
    return manager_->config_;
}

void ConnectionHandle::reopen() {
    if (!manager_) {
        throw ConnectionException("Connection handle was released");
    }
    manager_->reopen(*this);
}

void ConnectionHandle::release() noexcept {
    if (manager_) {
        manager_->disconnect();
        manager_ = nullptr;
    }
}

// ============================================================================
// ConnectionManager
// ============================================================================

ConnectionManager::ConnectionManager(const ConnectionConfig& config, TransportFactory factory)
    : config_(config),
      factory_(factory ? std::move(factory) : TransportFactory(&LibmodbusTransport::create)) {
}

ConnectionManager::~ConnectionManager() {
    disconnect();
}

void ConnectionManager::validateConfig(const ConnectionConfig& config) {
    if (config.kind == TransportKind::TCP) {
        if (config.host.empty()) {
            throw ValidationException("TCP connection requires a host");
        }
        if (config.port == 0) {
            throw ValidationException("TCP connection requires a port");
        }
    } else {
        if (config.serial_port.empty()) {
            throw ValidationException("RTU connection requires a serial port path");
        }
        if (config.baud_rate == 0) {
            throw ValidationException("Invalid baud rate 0 for " + config.serial_port);
        }
        if (config.data_bits < 5 || config.data_bits > 8) {
            throw ValidationException("Invalid data bits " + std::to_string(config.data_bits) +
                                      " for " + config.serial_port);
        }
        if (config.stop_bits < 1 || config.stop_bits > 2) {
            throw ValidationException("Invalid stop bits " + std::to_string(config.stop_bits) +
                                      " for " + config.serial_port);
        }
        if (config.unit_id < 1 || config.unit_id > 247) {
            throw ValidationException("Unit id " + std::to_string(config.unit_id) +
                                      " is outside 1..247");
        }
    }

    if (config.timeout.count() <= 0) {
        throw ValidationException("Timeout must be positive");
    }
}

ConnectionHandle ConnectionManager::connect() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (transport_ && state_ == ConnectionState::CONNECTED) {
        throw RegBridgeException(ErrorKind::INTERNAL,
                                 "Connection manager already has a live session");
    }

    validateConfig(config_);

    state_ = ConnectionState::CONNECTING;
    try {
        openTransport();
    } catch (const RegBridgeException& e) {
        state_ = ConnectionState::FAILED;
        LOG_WARN("Connect failed ({}): {}", to_string(e.kind()), e.what());
        releaseTransport();
        state_ = ConnectionState::IDLE;
        throw;
    } catch (const std::exception& e) {
        state_ = ConnectionState::FAILED;
        LOG_WARN("Connect failed: {}", e.what());
        releaseTransport();
        state_ = ConnectionState::IDLE;
        throw ConnectionException(e.what());
    }

    state_ = ConnectionState::CONNECTED;
    return ConnectionHandle(this);
}

ConnectionHandle ConnectionManager::connectWithRetries(uint32_t retries, Duration retry_delay) {
    std::exception_ptr last_error;

    for (uint32_t attempt = 0; attempt <= retries; ++attempt) {
        try {
            return connect();
        } catch (const RegBridgeException& e) {
            if (!e.retryable()) {
                throw;
            }
            last_error = std::current_exception();
            LOG_DEBUG("Connect attempt {}/{} failed: {}", attempt + 1, retries + 1, e.what());
        }

        if (attempt < retries) {
            std::this_thread::sleep_for(retry_delay);
        }
    }

    LOG_WARN("Connect failed after {} attempts", retries + 1);
    std::rethrow_exception(last_error);
}

ConnectionHandle ConnectionManager::connectWithRetries() {
    return connectWithRetries(config_.retries, config_.retry_delay);
}

void ConnectionManager::disconnect() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!transport_) {
        state_ = ConnectionState::IDLE;
        return;
    }
    state_ = ConnectionState::CLOSING;
    releaseTransport();
    state_ = ConnectionState::IDLE;
}

bool ConnectionManager::isHealthy(const ConnectionHandle& handle) const {
    if (handle.manager_ != this || state_ != ConnectionState::CONNECTED || !transport_) {
        return false;
    }
    try {
        return transport_->isOpen();
    } catch (const std::exception& e) {
        LOG_DEBUG("Liveness check failed: {}", e.what());
        return false;
    }
}

void ConnectionManager::reopen(ConnectionHandle& handle) {
    if (handle.manager_ != this) {
        throw ConnectionException("Handle does not belong to this connection manager");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    LOG_DEBUG("Re-opening session");

    releaseTransport();
    state_ = ConnectionState::CONNECTING;
    try {
        openTransport();
    } catch (const std::exception& e) {
        state_ = ConnectionState::FAILED;
        LOG_WARN("Re-open failed: {}", e.what());
        releaseTransport();
        state_ = ConnectionState::IDLE;
        throw;
    }
    state_ = ConnectionState::CONNECTED;
}

void ConnectionManager::openTransport() {
    transport_ = factory_(config_);
    if (!transport_) {
        throw ConnectionException("Transport factory returned no transport");
    }
    transport_->setSlave(config_.unit_id);
    transport_->setResponseTimeout(config_.timeout);
    transport_->connect();
}

void ConnectionManager::releaseTransport() noexcept {
    if (!transport_) {
        return;
    }
    try {
        transport_->close();
    } catch (const std::exception& e) {
        // Already reset connections fail to close; nothing left to release
        LOG_DEBUG("Ignoring transport close error: {}", e.what());
    }
    transport_.reset();
}

} // namespace regBridge
