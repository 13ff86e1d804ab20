#include "ClientConfig.h"
#include "Config.h"
#include "ErrorUtils.h"
#include "Logging.h"
#include <sstream>

namespace ClientConfig {

namespace {

// Counts are read signed so that a negative value is rejected instead of wrapping
bool readCount(const nlohmann::json& j, const char* key, size_t& value) {
    if (!j.contains(key)) return true;
    long long count = j.at(key).get<long long>();
    if (count <= 0) {
        LOG_CONFIG_ERROR(std::string(key) + " must be positive", std::to_string(count));
        return false;
    }
    value = static_cast<size_t>(count);
    return true;
}

bool loadServer(const nlohmann::json& j, ServerConfig& server) {
    server.baseUrl = j.value("baseUrl", server.baseUrl);
    server.voicePath = j.value("voicePath", server.voicePath);
    server.textPath = j.value("textPath", server.textPath);
    return readCount(j, "maxMessageBytes", server.maxMessageBytes);
}

void loadReconnect(const nlohmann::json& j, ReconnectConfig& reconnect) {
    if (!j.contains("delaysMs")) return;
    reconnect.delays.clear();
    for (const auto& d : j.at("delaysMs")) {
        reconnect.delays.emplace_back(d.get<long long>());
    }
}

bool loadCapture(const nlohmann::json& j, CaptureConfig& capture) {
    capture.sampleRate = j.value("sampleRate", capture.sampleRate);
    capture.channels = j.value("channels", capture.channels);
    capture.echoCancellation = j.value("echoCancellation", capture.echoCancellation);
    capture.noiseSuppression = j.value("noiseSuppression", capture.noiseSuppression);
    capture.autoGainControl = j.value("autoGainControl", capture.autoGainControl);
    capture.deviceName = j.value("deviceName", capture.deviceName);
    return readCount(j, "frameSamples", capture.frameSamples) && readCount(j, "queueDepth", capture.queueDepth);
}

void loadPlayback(const nlohmann::json& j, PlaybackConfig& playback) {
    playback.sampleRate = j.value("sampleRate", playback.sampleRate);
    playback.channels = j.value("channels", playback.channels);
    playback.volume = j.value("volume", playback.volume);
    playback.codec = j.value("codec", playback.codec);
    playback.deviceName = j.value("deviceName", playback.deviceName);
}

} // namespace

bool loadFromJson(const nlohmann::json& jsonConfig, Configuration& outConfig) {
    try {
        if (!jsonConfig.is_object()) {
            LOG_CONFIG_ERROR("Configuration root must be a JSON object", jsonConfig.type_name());
            return false;
        }
        if (jsonConfig.contains("server") && !loadServer(jsonConfig.at("server"), outConfig.server)) {
            return false;
        }
        if (jsonConfig.contains("reconnect")) {
            loadReconnect(jsonConfig.at("reconnect"), outConfig.reconnect);
        }
        if (jsonConfig.contains("capture") && !loadCapture(jsonConfig.at("capture"), outConfig.capture)) {
            return false;
        }
        if (jsonConfig.contains("playback")) {
            loadPlayback(jsonConfig.at("playback"), outConfig.playback);
        }
        if (jsonConfig.contains("logging")) {
            outConfig.logging.level = jsonConfig.at("logging").value("level", outConfig.logging.level);
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_ERROR("Invalid value in configuration", e.what());
        return false;
    }
}

void applyEnvironmentOverrides(Configuration& config) {
    if (EnvConfig::hasEnv("CALL_WS_URL")) {
        config.server.baseUrl = EnvConfig::getEnv("CALL_WS_URL", config.server.baseUrl);
    }
    if (EnvConfig::hasEnv("CALL_LOG_LEVEL")) {
        config.logging.level = EnvConfig::getEnv("CALL_LOG_LEVEL", config.logging.level);
    }
    if (EnvConfig::hasEnv("CALL_CAPTURE_DEVICE")) {
        config.capture.deviceName = EnvConfig::getEnv("CALL_CAPTURE_DEVICE", config.capture.deviceName);
    }
    if (EnvConfig::hasEnv("CALL_PLAYBACK_DEVICE")) {
        config.playback.deviceName = EnvConfig::getEnv("CALL_PLAYBACK_DEVICE", config.playback.deviceName);
    }
}

nlohmann::json saveToJson(const Configuration& config) {
    nlohmann::json j;

    j["server"]["baseUrl"] = config.server.baseUrl;
    j["server"]["voicePath"] = config.server.voicePath;
    j["server"]["textPath"] = config.server.textPath;
    j["server"]["maxMessageBytes"] = config.server.maxMessageBytes;

    nlohmann::json delays = nlohmann::json::array();
    for (const auto& d : config.reconnect.delays) {
        delays.push_back(d.count());
    }
    j["reconnect"]["delaysMs"] = delays;

    j["capture"]["sampleRate"] = config.capture.sampleRate;
    j["capture"]["channels"] = config.capture.channels;
    j["capture"]["frameSamples"] = config.capture.frameSamples;
    j["capture"]["queueDepth"] = config.capture.queueDepth;
    j["capture"]["echoCancellation"] = config.capture.echoCancellation;
    j["capture"]["noiseSuppression"] = config.capture.noiseSuppression;
    j["capture"]["autoGainControl"] = config.capture.autoGainControl;
    j["capture"]["deviceName"] = config.capture.deviceName;

    j["playback"]["sampleRate"] = config.playback.sampleRate;
    j["playback"]["channels"] = config.playback.channels;
    j["playback"]["volume"] = config.playback.volume;
    j["playback"]["codec"] = config.playback.codec;
    j["playback"]["deviceName"] = config.playback.deviceName;

    j["logging"]["level"] = config.logging.level;
    return j;
}

bool validateConfiguration(const Configuration& config, std::string& error) {
    if (config.server.baseUrl.rfind("ws://", 0) != 0) {
        error = "server.baseUrl must start with ws://";
        return false;
    }
    if (config.server.maxMessageBytes == 0) {
        error = "server.maxMessageBytes must be positive";
        return false;
    }
    if (config.reconnect.delays.empty()) {
        error = "reconnect.delaysMs must contain at least one delay";
        return false;
    }
    for (const auto& d : config.reconnect.delays) {
        if (d.count() < 0) {
            error = "reconnect.delaysMs entries must not be negative";
            return false;
        }
    }
    if (config.capture.sampleRate <= 0 || config.playback.sampleRate <= 0) {
        error = "sample rates must be positive";
        return false;
    }
    if (config.capture.channels != 1) {
        error = "capture.channels must be 1 (mono)";
        return false;
    }
    if (config.playback.channels < 1 || config.playback.channels > 2) {
        error = "playback.channels must be 1 or 2";
        return false;
    }
    if (config.capture.frameSamples == 0) {
        error = "capture.frameSamples must be positive";
        return false;
    }
    if (config.capture.queueDepth == 0) {
        error = "capture.queueDepth must be positive";
        return false;
    }
    if (config.playback.volume < 0.0f || config.playback.volume > 1.0f) {
        error = "playback.volume must be within [0, 1]";
        return false;
    }
    if (config.playback.codec.empty()) {
        error = "playback.codec must name an FFmpeg decoder";
        return false;
    }
    return true;
}

std::string getConfigurationSummary(const Configuration& config) {
    std::ostringstream ss;
    ss << "server=" << config.server.baseUrl
       << " voice=" << config.server.voicePath
       << " text=" << config.server.textPath
       << " backoff=[";
    for (size_t i = 0; i < config.reconnect.delays.size(); ++i) {
        if (i) ss << ",";
        ss << config.reconnect.delays[i].count();
    }
    ss << "]ms capture=" << config.capture.sampleRate << "Hz/" << config.capture.frameSamples
       << " playback=" << config.playback.sampleRate << "Hz/" << config.playback.channels << "ch"
       << " codec=" << config.playback.codec
       << " volume=" << config.playback.volume;
    return ss.str();
}

} // namespace ClientConfig
