/**
 * @file connection_manager.hpp
 * @brief Life cycle of one logical Modbus connection
 * @author RegBridge Team
 * @date 2025-09-03
 */

#pragma once

#include "types.hpp"
#include "exceptions.hpp"
#include "modbus_transport.hpp"
#include <atomic>
#include <memory>
#include <mutex>

namespace regBridge {

enum class ConnectionState {
    IDLE,
    CONNECTING,
    CONNECTED,
    CLOSING,
    FAILED
};

std::string to_string(ConnectionState state);

class ConnectionManager;

/**
 * @brief Scoped handle on a live transport session
 *
 * Move-only. Destroying a handle disconnects its manager, so a session
 * never outlives the operation that acquired it.
 */
class ConnectionHandle {
public:
    ConnectionHandle() = default;
    ~ConnectionHandle();

    ConnectionHandle(ConnectionHandle&& other) noexcept;
    ConnectionHandle& operator=(ConnectionHandle&& other) noexcept;

    ConnectionHandle(const ConnectionHandle&) = delete;
    ConnectionHandle& operator=(const ConnectionHandle&) = delete;

    bool valid() const { return manager_ != nullptr; }

    /**
     * @brief Transport of the live session
     * @throws ConnectionException if the handle was released
     */
    ModbusTransport& transport() const;

    const ConnectionConfig& config() const;

    /**
     * @brief Re-establish the session after a transport failure
     * @throws ConnectionException or TimeoutException
     */
    void reopen();

    /**
     * @brief Disconnect now instead of at destruction
     */
    void release() noexcept;

private:
    friend class ConnectionManager;
    explicit ConnectionHandle(ConnectionManager* manager) : manager_(manager) {}

    ConnectionManager* manager_ = nullptr;
};

/**
 * @brief Manages connect, retry and guaranteed release for one device
 *
 * State machine: IDLE -> CONNECTING -> CONNECTED -> CLOSING -> IDLE, with
 * FAILED entered on a connect error and left again once the transport has
 * been released. Only one handle may be live per manager; callers serialize
 * operations on the same device.
 */
class ConnectionManager {
public:
    /**
     * @brief Constructor
     * @param config Connection settings, fixed for the manager's lifetime
     * @param factory Transport factory (defaults to libmodbus)
     */
    explicit ConnectionManager(const ConnectionConfig& config, TransportFactory factory = nullptr);

    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Open the transport
     * @return Handle owning the live session
     * @throws ValidationException for an invalid configuration (never retried)
     * @throws ConnectionException or TimeoutException on transport failure
     */
    ConnectionHandle connect();

    /**
     * @brief connect() with a fixed delay between attempts
     * @param retries Re-attempts after the first failure
     * @param retry_delay Delay between attempts
     * @return Handle of the first successful attempt
     * @throws the last error once every attempt failed
     */
    ConnectionHandle connectWithRetries(uint32_t retries, Duration retry_delay);

    /**
     * @brief connectWithRetries() using the configured policy
     */
    ConnectionHandle connectWithRetries();

    /**
     * @brief Release the transport; idempotent and never throws
     */
    void disconnect() noexcept;

    /**
     * @brief Cheap liveness check of the handle's session, no wire traffic
     */
    bool isHealthy(const ConnectionHandle& handle) const;

    /**
     * @brief Close and re-open the session behind a live handle
     * @throws ConnectionException or TimeoutException
     */
    void reopen(ConnectionHandle& handle);

    ConnectionState state() const { return state_.load(); }
    const ConnectionConfig& config() const { return config_; }

    /**
     * @brief Check a configuration without connecting
     * @throws ValidationException
     */
    static void validateConfig(const ConnectionConfig& config);

private:
    friend class ConnectionHandle;

    void openTransport();
    void releaseTransport() noexcept;

    const ConnectionConfig config_;
    TransportFactory factory_;
    std::unique_ptr<ModbusTransport> transport_;
    std::atomic<ConnectionState> state_{ConnectionState::IDLE};
    std::mutex mutex_;
};

} // namespace regBridge
