#pragma once

/**
 * @file logger.hpp
 * @brief Logging utilities for suffixsort
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <string>

#include "common/config.hpp"

namespace suffixsort {

/**
 * @brief Logger wrapper for suffixsort
 *
 * Logs go to stderr; stdout carries the sorted lines.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     *
     * Only the first call has an effect; later calls, including the
     * implicit one made by get(), keep the existing logger.
     *
     * @param name Logger name
     * @param level Log level (trace, debug, info, warn, error, critical)
     */
    static void init(const std::string& name = config::kLoggerName,
                     spdlog::level::level_enum level = spdlog::level::warn);

    /**
     * @brief Get the logger instance, initializing it with defaults if needed
     *
     * Safe to call concurrently from worker threads.
     */
    static std::shared_ptr<spdlog::logger>& get();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

// Convenience macros for logging
#define LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(suffixsort::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(suffixsort::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)     SPDLOG_LOGGER_INFO(suffixsort::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)     SPDLOG_LOGGER_WARN(suffixsort::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(suffixsort::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(suffixsort::Logger::get(), __VA_ARGS__)

}  // namespace suffixsort
