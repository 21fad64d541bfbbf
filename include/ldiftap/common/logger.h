/**
 * @file logger.h
 * @brief Logging setup for ldif-tap
 *
 * Wraps spdlog with the project's sink and pattern configuration.
 * Console output goes to stderr because stdout carries the records.
 */

#pragma once

#include <spdlog/spdlog.h>
#include <string>

namespace ldiftap {
namespace common {

/**
 * @brief Logger initialization and configuration
 */
class Logger {
public:
    /**
     * @brief Initialize the default logger
     * @param name Logger name (e.g., "ldif-tap")
     * @param logLevel Log level (trace, debug, info, warn, error, critical)
     * @param logToFile Enable file logging
     * @param logFile Log file path
     */
    static void initialize(
        const std::string& name,
        const std::string& logLevel = "info",
        bool logToFile = false,
        const std::string& logFile = ""
    );

    /**
     * @brief Map a level name to spdlog's level, info when unknown
     */
    static spdlog::level::level_enum parseLevel(const std::string& level);

    /**
     * @brief Flush the default logger
     */
    static void flush();
};

} // namespace common
} // namespace ldiftap
