#include "ErrorUtils.h"
#include "Logging.h"
#include <sstream>

extern "C" {
#include <libavutil/error.h>
}
#include <portaudio.h>

namespace ErrorUtils {

std::string formatErrorCode(const std::error_code& ec, const std::string& context) {
    std::stringstream ss;
    ss << "Error code " << ec.value() << " (" << ec.category().name() << ")";
    if (!ec.message().empty()) {
        ss << ": " << ec.message();
    }
    if (!context.empty()) {
        ss << " [Context: " << context << "]";
    }
    return ss.str();
}

std::string formatAvError(int errnum, const std::string& context) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(errnum, buf, sizeof(buf));

    std::stringstream ss;
    ss << "AVERROR " << errnum << ": " << buf;
    if (!context.empty()) {
        ss << " [Context: " << context << "]";
    }
    return ss.str();
}

std::string formatPaError(int paError, const std::string& context) {
    std::stringstream ss;
    ss << "PaError " << paError << ": " << Pa_GetErrorText(static_cast<PaError>(paError));
    if (!context.empty()) {
        ss << " [Context: " << context << "]";
    }
    return ss.str();
}

std::string createErrorMessage(ErrorSeverity severity, ErrorCategory category,
                               const std::string& message, const std::string& details) {
    std::stringstream ss;
    ss << "[" << severityToString(severity) << "/" << categoryToString(category) << "] ";
    ss << message;
    if (!details.empty()) {
        ss << " - " << details;
    }
    return ss.str();
}

void logError(ErrorSeverity severity, ErrorCategory category,
              const std::string& message, const std::string& details) {
    std::string fullMessage = createErrorMessage(severity, category, message, details);

    switch (severity) {
        case ErrorSeverity::FATAL:
        case ErrorSeverity::ERROR:
            LOG_ERROR(fullMessage);
            break;
        case ErrorSeverity::WARNING:
            LOG_WARN(fullMessage);
            break;
        default:
            LOG_INFO(fullMessage);
            break;
    }
}

std::string severityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARN";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

std::string categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::DEVICE: return "DEVICE";
        case ErrorCategory::TRANSPORT: return "TRANSPORT";
        case ErrorCategory::PROTOCOL: return "PROTOCOL";
        case ErrorCategory::DECODE: return "DECODE";
        case ErrorCategory::CONFIG: return "CONFIG";
        case ErrorCategory::GENERIC: return "GENERIC";
        default: return "UNKNOWN";
    }
}

} // namespace ErrorUtils
