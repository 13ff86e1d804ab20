#include "Logging.h"
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <sstream>
#include <iomanip>
#include <unistd.h>

namespace Logging {

namespace {
std::atomic<Level> g_currentLevel{LEVEL_WARN_LOG};
std::mutex g_logMutex;
std::atomic<bool> g_initialized{false};
bool g_useColor = false;

#define LOG_COLOR_RED    "\033[31m"
#define LOG_COLOR_YELLOW "\033[33m"
#define LOG_COLOR_BLUE   "\033[34m"
#define LOG_COLOR_RESET  "\033[0m"

std::string getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time_t, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

std::string colored(const char* color, const char* text) {
    if (!g_useColor) {
        return text;
    }
    return std::string(color) + text + LOG_COLOR_RESET;
}

std::string getLevelPrefix(Level level) {
    switch (level) {
        case LEVEL_ERROR_LOG: return colored(LOG_COLOR_RED, "[ERROR]");
        case LEVEL_WARN_LOG:  return colored(LOG_COLOR_YELLOW, "[WARN] ");
        case LEVEL_INFO_LOG:  return colored(LOG_COLOR_BLUE, "[INFO] ");
        case LEVEL_DEBUG_LOG: return "[DEBUG]";
        case LEVEL_TRACE_LOG: return "[TRACE]";
        default:              return "[UNKNOWN]";
    }
}

} // anonymous namespace

Level stringToLevel(const std::string& level) {
    std::string upperLevel = level;
    for (char& c : upperLevel) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    if (upperLevel == "NONE") return LEVEL_NONE;
    if (upperLevel == "ERROR") return LEVEL_ERROR_LOG;
    if (upperLevel == "WARN") return LEVEL_WARN_LOG;
    if (upperLevel == "INFO") return LEVEL_INFO_LOG;
    if (upperLevel == "DEBUG") return LEVEL_DEBUG_LOG;
    if (upperLevel == "TRACE") return LEVEL_TRACE_LOG;

    // Default to WARN for invalid levels
    return LEVEL_WARN_LOG;
}

std::string levelToString(Level level) {
    switch (level) {
        case LEVEL_NONE: return "NONE";
        case LEVEL_ERROR_LOG: return "ERROR";
        case LEVEL_WARN_LOG: return "WARN";
        case LEVEL_INFO_LOG: return "INFO";
        case LEVEL_DEBUG_LOG: return "DEBUG";
        case LEVEL_TRACE_LOG: return "TRACE";
        default: return "UNKNOWN";
    }
}

Level getCurrentLevel() {
    return g_currentLevel.load();
}

void setLevel(Level level) {
    g_currentLevel.store(level);
}

void initialize(const std::string& configLevel) {
    bool expected = false;
    if (!g_initialized.compare_exchange_strong(expected, true)) {
        return;
    }

    g_useColor = ::isatty(STDOUT_FILENO) != 0;

    const char* envLevel = std::getenv("CALL_LOG_LEVEL");
    if (envLevel) {
        setLevel(stringToLevel(envLevel));
    } else if (!configLevel.empty()) {
        setLevel(stringToLevel(configLevel));
    } else {
#ifndef NDEBUG
        setLevel(LEVEL_DEBUG_LOG);
#else
        setLevel(LEVEL_WARN_LOG);
#endif
    }
}

bool isEnabled(Level level) {
    return level != LEVEL_NONE && level <= getCurrentLevel();
}

void log(Level level, const std::string& message) {
    if (!isEnabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(g_logMutex);

    // Format: [TIMESTAMP] [LEVEL] message
    std::ostream& out = (level <= LEVEL_WARN_LOG) ? std::cerr : std::cout;
    out << "[" << getTimestamp() << "] " << getLevelPrefix(level) << " " << message << std::endl;
}

} // namespace Logging
