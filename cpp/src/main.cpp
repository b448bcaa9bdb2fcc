/**
 * @file main.cpp
 * @brief Main application entry point for the RegBridge monitor
 * @author RegBridge Team
 * @date 2025-09-06
 */

#include "config_manager.hpp"
#include "logger.hpp"
#include "device_service.hpp"
#include "exceptions.hpp"
#include <iostream>
#include <iomanip>
#include <csignal>
#include <thread>
#include <chrono>
#include <atomic>
#include <memory>

// Set from the signal handler, polled by the main loop
static std::atomic<bool> g_running{true};

/**
 * @brief Signal handler for graceful shutdown
 */
void signalHandler(int) {
    g_running = false;
}

namespace regBridge {

/**
 * @brief Print application banner
 */
void printBanner(const ConfigManager& config) {
    std::cout << "\n";
    std::cout << "+==============================================================+\n";
    std::cout << "|                          RegBridge                           |\n";
    std::cout << "|           Industrial register monitor (Modbus TCP/RTU)       |\n";
    std::cout << "|                                                              |\n";
    std::cout << "|  Version: " << std::left << std::setw(50) << config.getAppVersion() << " |\n";
    std::cout << "|  Devices: " << std::left << std::setw(50) << config.getDevices().size() << " |\n";
    std::cout << "+==============================================================+\n";
    std::cout << "\n";
}

/**
 * @brief Print the latest snapshot of one device
 */
void printSnapshot(const DeviceId& device_id, const ReadResult& result) {
    std::string header = "+- " + device_id + (result.stale ? " (stale) " : " ");
    if (header.size() < 63) {
        header.append(63 - header.size(), '-');
    }
    std::cout << "\n" << header << "+\n";

    if (!result.snapshot) {
        std::cout << "| " << std::left << std::setw(61) << ("No data: " + result.message) << "|\n";
        std::cout << "+--------------------------------------------------------------+\n";
        return;
    }

    for (const auto& reading : result.snapshot->readings) {
        std::string line = "| " + reading.name + ": ";
        if (reading.error) {
            line += "<" + to_string(reading.error_kind) + "> " + *reading.error;
        } else {
            line += to_string(reading.value);
            if (!reading.unit.empty()) {
                line += " " + reading.unit;
            }
        }
        std::cout << std::left << std::setw(63) << line << "|\n";
    }
    std::cout << "+--------------------------------------------------------------+\n";
}

/**
 * @brief Print health and poll statistics for every device
 */
void printSystemStatus(DeviceService& service, const ConfigManager& config) {
    std::cout << "\n+- System Status ----------------------------------------------+\n";
    for (const auto& device : config.getDevices()) {
        if (!device.enabled) {
            continue;
        }
        DeviceHealth health = service.deviceHealth(device.id);
        PollStatistics stats = service.monitor().getStatistics(device.id);

        std::string line = "| " + device.id + ": " + to_string(health.status) +
                           ", polls " + std::to_string(stats.total_polls) +
                           ", success " + std::to_string(static_cast<int>(stats.success_rate() * 100)) + "%";
        std::cout << std::left << std::setw(63) << line << "|\n";
    }
    std::cout << "+--------------------------------------------------------------+\n";

    if (auto store = service.store()) {
        try {
            StorageStatistics storage = store->getStatistics();
            std::cout << "  Stored snapshots: " << storage.total_snapshots
                      << ", readings: " << storage.total_readings << "\n";
        } catch (const StorageException& e) {
            LOG_ERROR("Failed to read storage statistics: {}", e.what());
        }
    }
}

/**
 * @brief Probe one configured device
 * @return Process exit code
 */
int runConnectionTest(DeviceService& service, const ConfigManager& config, const DeviceId& device_id) {
    const DeviceRecord& device = config.getDevice(device_id);

    std::cout << "[*] Testing connection to device '" << device_id << "'...\n";
    ConnectionTestResult result = service.testConnection(device.connection);
    if (!result.success) {
        std::cerr << "[!] " << result.message << std::endl;
        return 1;
    }
    std::cout << "[+] " << result.message << " (" << result.latency->count() << " ms)\n";
    return 0;
}

/**
 * @brief Read every enabled device once and print the results
 * @return Process exit code
 */
int runSinglePoll(DeviceService& service, const ConfigManager& config) {
    int failures = 0;
    for (const auto& device : config.getDevices()) {
        if (!device.enabled) {
            continue;
        }
        ReadResult result = service.readNow(device.id);
        printSnapshot(device.id, result);
        if (!result.success) {
            ++failures;
        }
    }
    return failures == 0 ? 0 : 1;
}

} // namespace regBridge

/**
 * @brief Main application entry point
 */
int main(int argc, char* argv[]) {
    using namespace regBridge;

    try {
        // Parse command line arguments
        std::string config_file = "config.json";
        std::string env_file = ".env";
        std::string test_device;
        bool single_poll = false;

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_file = argv[++i];
            } else if (arg == "--env" && i + 1 < argc) {
                env_file = argv[++i];
            } else if (arg == "--test-connection" && i + 1 < argc) {
                test_device = argv[++i];
            } else if (arg == "--once") {
                single_poll = true;
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [options]\n";
                std::cout << "Options:\n";
                std::cout << "  --config <file>           Configuration file (default: config.json)\n";
                std::cout << "  --env <file>              Environment file (default: .env)\n";
                std::cout << "  --test-connection <id>    Connect to one device and exit\n";
                std::cout << "  --once                    Read every enabled device once and exit\n";
                std::cout << "  --help, -h                Show this help message\n";
                return 0;
            } else {
                std::cerr << "[!] Unknown option: " << arg << std::endl;
                return 2;
            }
        }

        // Load configuration
        ConfigManager config(config_file, env_file);

        // Initialize logging
        Logger::initialize(config.getLoggingConfig());

        printBanner(config);

        LOG_INFO("Starting {} v{}", config.getAppName(), config.getAppVersion());
        LOG_INFO("Configuration loaded from: {}", config_file);

        DeviceService service(config);

        if (!test_device.empty()) {
            int code = runConnectionTest(service, config, test_device);
            Logger::shutdown();
            return code;
        }

        if (single_poll) {
            int code = runSinglePoll(service, config);
            Logger::shutdown();
            return code;
        }

        service.onChange([](const DeviceId& device_id, const std::vector<std::string>& changed,
                            const SnapshotPtr&) {
            LOG_INFO("Device '{}': {} parameter(s) changed", device_id, changed.size());
        });

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        size_t scheduled = service.scheduleAll();
        std::cout << "[+] Monitoring " << scheduled << " device(s)\n";
        std::cout << "   Press Ctrl+C to stop\n\n";

        // Main loop - print status periodically
        const auto status_interval = std::chrono::seconds(30);
        auto last_status_time = std::chrono::steady_clock::now();
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            auto now = std::chrono::steady_clock::now();
            if (now - last_status_time >= status_interval) {
                printSystemStatus(service, config);
                last_status_time = now;
            }
        }

        LOG_INFO("Shutdown requested, stopping monitor...");
        service.stop();
        printSystemStatus(service, config);
        Logger::shutdown();

    } catch (const RegBridgeException& e) {
        std::cerr << "[!] " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[!] Unexpected Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
