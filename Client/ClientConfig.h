#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace ClientConfig {

/**
 * @brief Remote endpoint settings
 */
struct ServerConfig {
    std::string baseUrl = "ws://localhost:8000";
    std::string voicePath = "/ws/voice";        // Voice mode endpoint (STT/TTS)
    std::string textPath = "/ws";               // Text mode endpoint (JSON only)
    size_t maxMessageBytes = 1024 * 1024;       // Inbound payload hard cap
};

/**
 * @brief Reconnection backoff schedule, one entry per consecutive failure
 */
struct ReconnectConfig {
    std::vector<std::chrono::milliseconds> delays = {
        std::chrono::milliseconds(3000),
        std::chrono::milliseconds(6000),
        std::chrono::milliseconds(12000)
    };
};

/**
 * @brief Microphone capture settings
 */
struct CaptureConfig {
    int sampleRate = 16000;          // Target rate of outbound PCM frames
    int channels = 1;                // Outbound frames are always mono
    size_t frameSamples = 4096;      // ~256 ms at 16 kHz
    size_t queueDepth = 32;          // Frames buffered between capture thread and control loop
    bool echoCancellation = true;
    bool noiseSuppression = true;
    bool autoGainControl = true;
    std::string deviceName;          // Empty selects the default input device
};

/**
 * @brief Agent speech playback settings
 */
struct PlaybackConfig {
    int sampleRate = 48000;          // Output stream rate; decoded chunks are resampled to it
    int channels = 1;
    float volume = 1.0f;             // Initial gain, [0, 1]
    std::string codec = "mp3";       // FFmpeg decoder name for inbound chunks
    std::string deviceName;          // Empty selects the default output device
};

struct LoggingConfig {
    std::string level;               // Empty keeps the build default
};

/**
 * @brief Complete client configuration
 */
struct Configuration {
    ServerConfig server;
    ReconnectConfig reconnect;
    CaptureConfig capture;
    PlaybackConfig playback;
    LoggingConfig logging;
};

/**
 * @brief Load configuration from JSON, keeping defaults for absent keys
 * @param jsonConfig JSON object (root of config.json)
 * @param outConfig Configuration to fill
 * @return true if loaded successfully, false on a type error
 */
bool loadFromJson(const nlohmann::json& jsonConfig, Configuration& outConfig);

/**
 * @brief Apply CALL_* environment variable overrides
 */
void applyEnvironmentOverrides(Configuration& config);

/**
 * @brief Save configuration to JSON
 */
nlohmann::json saveToJson(const Configuration& config);

/**
 * @brief Validate configuration for consistency
 * @param error Receives the first problem found
 * @return true if configuration is valid, false otherwise
 */
bool validateConfiguration(const Configuration& config, std::string& error);

/**
 * @brief Human-readable configuration summary
 */
std::string getConfigurationSummary(const Configuration& config);

} // namespace ClientConfig
