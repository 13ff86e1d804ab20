#pragma once
#include <string>
#include <system_error>

/**
 * @brief Centralized error reporting utilities for consistent error handling
 *
 * Every failure in the call client falls into one of the categories below and
 * is reported through logError(), which routes the formatted message into the
 * Logging facility at the matching level. Nothing reported here terminates
 * the process; FATAL is kept for start-up failures in main().
 */
namespace ErrorUtils {

/**
 * @brief Error severity levels for consistent categorization
 */
enum class ErrorSeverity {
    INFO,       // Informational messages
    WARNING,    // Non-critical issues
    ERROR,      // Errors requiring attention
    FATAL       // Start-up errors that abort the program
};

/**
 * @brief Error categories, one per failure domain of the client
 */
enum class ErrorCategory {
    DEVICE,         // Microphone/speaker acquisition and streaming
    TRANSPORT,      // Connection open/close/send failures
    PROTOCOL,       // Malformed or unexpected inbound payloads
    DECODE,         // Compressed audio chunk decoding
    CONFIG,         // Configuration file and validation errors
    GENERIC         // General/other errors
};

/**
 * @brief Format a std::error_code into a consistent error message
 *
 * Used for websocketpp and asio error codes.
 *
 * @param ec The error code to format
 * @param context Optional context information about where the error occurred
 * @return Formatted error message string
 */
std::string formatErrorCode(const std::error_code& ec, const std::string& context = "");

/**
 * @brief Format an FFmpeg return code (negative AVERROR value)
 */
std::string formatAvError(int errnum, const std::string& context = "");

/**
 * @brief Format a PortAudio PaError code
 */
std::string formatPaError(int paError, const std::string& context = "");

/**
 * @brief Create a standardized error message with category and severity
 *
 * @param severity Error severity level
 * @param category Error category
 * @param message Primary error message
 * @param details Optional detailed information
 * @return Formatted error message with consistent prefix
 */
std::string createErrorMessage(ErrorSeverity severity, ErrorCategory category,
                               const std::string& message, const std::string& details = "");

/**
 * @brief Log an error message with consistent formatting
 *
 * @param severity Error severity level
 * @param category Error category
 * @param message Primary error message
 * @param details Optional detailed information
 */
void logError(ErrorSeverity severity, ErrorCategory category,
              const std::string& message, const std::string& details = "");

/**
 * @brief Convert ErrorSeverity enum to string
 */
std::string severityToString(ErrorSeverity severity);

/**
 * @brief Convert ErrorCategory enum to string
 */
std::string categoryToString(ErrorCategory category);

// Convenience macros for the error taxonomy of the client

#define LOG_DEVICE_ERROR(message, details) \
    ErrorUtils::logError(ErrorUtils::ErrorSeverity::ERROR, ErrorUtils::ErrorCategory::DEVICE, \
                         message, details)

#define LOG_TRANSPORT_WARNING(message, details) \
    ErrorUtils::logError(ErrorUtils::ErrorSeverity::WARNING, ErrorUtils::ErrorCategory::TRANSPORT, \
                         message, details)

#define LOG_PROTOCOL_WARNING(message, details) \
    ErrorUtils::logError(ErrorUtils::ErrorSeverity::WARNING, ErrorUtils::ErrorCategory::PROTOCOL, \
                         message, details)

#define LOG_DECODE_ERROR(message, details) \
    ErrorUtils::logError(ErrorUtils::ErrorSeverity::ERROR, ErrorUtils::ErrorCategory::DECODE, \
                         message, details)

#define LOG_CONFIG_ERROR(message, details) \
    ErrorUtils::logError(ErrorUtils::ErrorSeverity::ERROR, ErrorUtils::ErrorCategory::CONFIG, \
                         message, details)

} // namespace ErrorUtils
