#pragma once
#ifndef CALLCLIENT_LOGGING_H
#define CALLCLIENT_LOGGING_H

#include <string>
#include <iostream>
#include <atomic>
#include <mutex>
#include <chrono>

/**
 * @brief Lightweight logging facility with compile-time and runtime level control
 *
 * Supports:
 * - Runtime configurable levels via CALL_LOG_LEVEL environment variable
 *   or the "logging.level" entry of config.json
 * - Thread-safe logging, callable from the real-time audio threads
 * - Release builds default to WARN/ERROR only
 *
 * Usage:
 *   LOG_ERROR("[Transport] Something went wrong");
 *   LOG_INFO("[Capture] Recording started");
 */

namespace Logging {

// Log levels in order of increasing verbosity
enum Level {
    LEVEL_NONE = 0,       //!< No logging
    LEVEL_ERROR_LOG = 1,  //!< Critical errors only
    LEVEL_WARN_LOG = 2,   //!< Warnings and errors
    LEVEL_INFO_LOG = 3,   //!< General information
    LEVEL_DEBUG_LOG = 4,  //!< Debug information
    LEVEL_TRACE_LOG = 5   //!< Detailed trace information
};

// Convert string to log level
Level stringToLevel(const std::string& level);

// Convert log level to string
std::string levelToString(Level level);

// Get current log level (runtime configurable)
Level getCurrentLevel();

// Set log level at runtime
void setLevel(Level level);

// Initialize logging system (call once at startup).
// configLevel is used when CALL_LOG_LEVEL is not set; empty means build default.
void initialize(const std::string& configLevel = "");

// True when a message at this level would be printed
bool isEnabled(Level level);

// Core logging function
void log(Level level, const std::string& message);

} // namespace Logging

#define LOG_ERROR(message) Logging::log(Logging::LEVEL_ERROR_LOG, message)
#define LOG_WARN(message)  Logging::log(Logging::LEVEL_WARN_LOG, message)
#define LOG_INFO(message)  Logging::log(Logging::LEVEL_INFO_LOG, message)
#define LOG_DEBUG(message) Logging::log(Logging::LEVEL_DEBUG_LOG, message)
#define LOG_TRACE(message) Logging::log(Logging::LEVEL_TRACE_LOG, message)

#endif // CALLCLIENT_LOGGING_H
