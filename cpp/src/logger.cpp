/**
 * @file logger.cpp
 * @brief Implementation of logging system
 * @author RegBridge Team
 * @date 2025-09-02
 */

#include "logger.hpp"
#include <iostream>

namespace regBridge {

std::shared_ptr<spdlog::logger> Logger::logger_;
bool Logger::initialized_ = false;
std::recursive_mutex Logger::mutex_;

void Logger::initialize(const LoggingConfig& config) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (initialized_) {
        // Replace the console-only default installed by an early get()
        spdlog::drop_all();
        logger_.reset();
        initialized_ = false;
    }
    initializeLocked(config);
}

void Logger::initializeLocked(const LoggingConfig& config) {
    if (initialized_) {
        return;
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(convertLogLevel(config.console_level));
        sinks.push_back(console_sink);

        if (!config.log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.log_file,
                config.max_file_size_mb * 1024 * 1024,
                config.max_files
            );
            file_sink->set_level(convertLogLevel(config.file_level));
            sinks.push_back(file_sink);
        }

        logger_ = std::make_shared<spdlog::logger>("regBridge", sinks.begin(), sinks.end());
        logger_->set_level(spdlog::level::trace); // Let sinks filter
        logger_->flush_on(spdlog::level::warn);
        logger_->set_pattern(config.format);

        spdlog::set_default_logger(logger_);

        initialized_ = true;

        logger_->info("Logging system initialized");
        logger_->info("Console level: {}, File level: {}, File: {}",
                      to_string(config.console_level),
                      to_string(config.file_level),
                      config.log_file.empty() ? "<disabled>" : config.log_file);

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        throw;
    }
}

std::shared_ptr<spdlog::logger> Logger::get(const std::string& name) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (!initialized_) {
        // Console-only default until the application loads its configuration
        LoggingConfig default_config;
        default_config.log_file.clear();
        initializeLocked(default_config);
    }

    if (name == "regBridge" || name.empty()) {
        return logger_;
    }

    auto named_logger = spdlog::get(name);
    if (!named_logger) {
        named_logger = logger_->clone(name);
        spdlog::register_logger(named_logger);
    }

    return named_logger;
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (logger_) {
        logger_->set_level(convertLogLevel(level));
    }
}

void Logger::flush() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (logger_) {
        logger_->flush();
    }
}

void Logger::shutdown() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (initialized_) {
        logger_->info("Shutting down logging system");
        logger_->flush();
        spdlog::shutdown();
        logger_.reset();
        initialized_ = false;
    }
}

spdlog::level::level_enum Logger::convertLogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        default: return spdlog::level::info;
    }
}

} // namespace regBridge
