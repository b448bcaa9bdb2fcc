/**
 * @file logger.hpp
 * @brief Logging system for RegBridge
 * @author RegBridge Team
 * @date 2025-09-02
 */

#pragma once

// Prevent Windows macro conflicts
#ifdef ERROR
#undef ERROR
#endif

#include "types.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <mutex>
#include <string>

namespace regBridge {

/**
 * @brief Centralized logging system using spdlog
 *
 * Poll threads log concurrently, so initialization and named logger lookup
 * are serialized internally; the sinks themselves are the thread-safe `_mt`
 * variants.
 */
class Logger {
public:
    /**
     * @brief Initialize (or reconfigure) the logging system
     * @param config Logging configuration; an empty log_file disables the file sink
     */
    static void initialize(const LoggingConfig& config);

    /**
     * @brief Get the logger instance
     * @param name Component name; the root logger is returned for "regBridge" or ""
     */
    static std::shared_ptr<spdlog::logger> get(const std::string& name = "regBridge");

    /**
     * @brief Set log level for all loggers
     */
    static void setLevel(LogLevel level);

    /**
     * @brief Flush all loggers
     */
    static void flush();

    /**
     * @brief Shutdown the logging system
     */
    static void shutdown();

private:
    static void initializeLocked(const LoggingConfig& config);

    static std::shared_ptr<spdlog::logger> logger_;
    static bool initialized_;
    static std::recursive_mutex mutex_;

    static spdlog::level::level_enum convertLogLevel(LogLevel level);
};

// Convenience macros for logging
#define LOG_TRACE(...) regBridge::Logger::get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) regBridge::Logger::get()->debug(__VA_ARGS__)
#define LOG_INFO(...) regBridge::Logger::get()->info(__VA_ARGS__)
#define LOG_WARN(...) regBridge::Logger::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) regBridge::Logger::get()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) regBridge::Logger::get()->critical(__VA_ARGS__)

} // namespace regBridge
