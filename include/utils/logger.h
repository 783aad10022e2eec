#pragma once
/**
 * @file logger.h
 * @brief Logging utilities
 */

#include <string>

namespace overlay_ocr {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

/**
 * @brief Set minimum log level
 */
void setLogLevel(LogLevel level);

/**
 * @brief Parse a level name ("debug", "info", "warning"/"warn", "error")
 * @return true if the name was recognized
 */
bool parseLogLevel(const std::string& name, LogLevel& level);

/**
 * @brief Log a message
 */
void log(LogLevel level, const std::string& message);

/**
 * @brief Convenience logging functions
 */
void logDebug(const std::string& message);
void logInfo(const std::string& message);
void logWarning(const std::string& message);
void logError(const std::string& message);

/**
 * @brief Log an error only the first time a given key is seen
 *
 * Used for conditions that would otherwise repeat every frame.
 */
void logErrorOnce(const std::string& key, const std::string& message);

} // namespace overlay_ocr
