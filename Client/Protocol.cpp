#include "Protocol.h"

#include <cctype>
#include <websocketpp/base64/base64.hpp>

namespace Protocol {

using json = nlohmann::json;

MessageType messageTypeFromString(const std::string& type) {
    if (type == "session") return MessageType::SESSION;
    if (type == "transcript") return MessageType::TRANSCRIPT;
    if (type == "status") return MessageType::STATUS;
    if (type == "state_update") return MessageType::STATE_UPDATE;
    if (type == "audio") return MessageType::AUDIO;
    if (type == "audio_end") return MessageType::AUDIO_END;
    if (type == "error") return MessageType::ERROR;
    return MessageType::UNKNOWN;
}

bool parseInbound(const std::string& payload, InboundMessage& out, std::string& error) {
    json message = json::parse(payload, nullptr, false);
    if (message.is_discarded()) {
        error = "invalid JSON";
        return false;
    }
    if (!message.is_object()) {
        error = "payload is not a JSON object";
        return false;
    }
    auto it = message.find("type");
    if (it == message.end() || !it->is_string()) {
        error = "missing or non-string 'type' field";
        return false;
    }
    out.typeName = it->get<std::string>();
    out.type = messageTypeFromString(out.typeName);
    out.payload = std::move(message);
    return true;
}

bool parseSession(const json& message, std::string& sessionId, std::string& error) {
    auto it = message.find("session_id");
    if (it == message.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        error = "session message without a string session_id";
        return false;
    }
    sessionId = it->get<std::string>();
    return true;
}

bool parseTranscript(const json& message, TranscriptEvent& out, std::string& error) {
    auto speaker = message.find("speaker");
    if (speaker == message.end() || !speaker->is_string() ||
        !Session::parseSpeaker(speaker->get<std::string>(), out.speaker)) {
        error = "transcript without a valid speaker";
        return false;
    }
    auto text = message.find("text");
    if (text == message.end() || !text->is_string()) {
        error = "transcript without string text";
        return false;
    }
    out.text = text->get<std::string>();

    out.isFinal = true;
    auto isFinal = message.find("is_final");
    if (isFinal != message.end() && !isFinal->is_null()) {
        if (!isFinal->is_boolean()) {
            error = "transcript is_final must be a boolean";
            return false;
        }
        out.isFinal = isFinal->get<bool>();
    }

    out.timestamp.clear();
    auto timestamp = message.find("timestamp");
    if (timestamp != message.end() && timestamp->is_string()) {
        out.timestamp = timestamp->get<std::string>();
    }
    return true;
}

bool parseStatus(const json& message, Session::AgentStatus& out, std::string& error) {
    auto status = message.find("status");
    if (status == message.end() || !status->is_string()) {
        error = "status message without a string status";
        return false;
    }
    if (!Session::parseAgentStatus(status->get<std::string>(), out)) {
        error = "unknown agent status '" + status->get<std::string>() + "'";
        return false;
    }
    return true;
}

namespace {

bool readNullableString(const json& message, const char* key,
                        std::optional<std::optional<std::string>>& out, std::string& error) {
    auto it = message.find(key);
    if (it == message.end()) {
        return true;
    }
    if (it->is_null()) {
        out = std::optional<std::string>();
        return true;
    }
    if (!it->is_string()) {
        error = std::string(key) + " must be a string or null";
        return false;
    }
    out = std::optional<std::string>(it->get<std::string>());
    return true;
}

bool readBool(const json& message, const char* key, std::optional<bool>& out, std::string& error) {
    auto it = message.find(key);
    if (it == message.end() || it->is_null()) {
        return true;
    }
    if (!it->is_boolean()) {
        error = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // namespace

bool parseStateUpdate(const json& message, Session::ConversationStateUpdate& out, std::string& error) {
    out = Session::ConversationStateUpdate{};
    return readNullableString(message, "intent", out.intent, error) &&
           readBool(message, "authenticated", out.authenticated, error) &&
           readNullableString(message, "flow_stage", out.flowStage, error) &&
           readBool(message, "escalation_requested", out.escalationRequested, error);
}

bool parseAudio(const json& message, std::string& base64Data, std::string& error) {
    auto data = message.find("data");
    if (data == message.end() || !data->is_string() || data->get_ref<const std::string&>().empty()) {
        error = "audio message without base64 data";
        return false;
    }
    base64Data = data->get<std::string>();
    return true;
}

std::string parseErrorText(const json& message) {
    auto text = message.find("message");
    if (text != message.end() && text->is_string()) {
        return text->get<std::string>();
    }
    return "unspecified server error";
}

bool decodeBase64(const std::string& encoded, std::vector<uint8_t>& out) {
    std::string compact;
    compact.reserve(encoded.size());
    size_t padding = 0;
    for (char c : encoded) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) {
            continue;
        }
        if (c == '=') {
            padding++;
        } else if (padding > 0 || !(std::isalnum(uc) || c == '+' || c == '/')) {
            // Data after padding or a character outside the alphabet
            return false;
        }
        compact.push_back(c);
    }
    if (padding > 2 || (padding > 0 && compact.size() % 4 != 0) || compact.size() % 4 == 1) {
        return false;
    }

    std::string decoded = websocketpp::base64_decode(compact);
    out.assign(decoded.begin(), decoded.end());
    return true;
}

std::string makeTextMessage(const std::string& content) {
    json message;
    message["type"] = "text";
    message["content"] = content;
    // Typed input may not be UTF-8; invalid bytes become U+FFFD
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string makeStopMessage() {
    json message;
    message["type"] = "stop";
    return message.dump();
}

std::string encodePcmFrame(const std::vector<int16_t>& samples) {
    std::string bytes;
    bytes.resize(samples.size() * 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        uint16_t v = static_cast<uint16_t>(samples[i]);
        bytes[2 * i] = static_cast<char>(v & 0xFF);
        bytes[2 * i + 1] = static_cast<char>((v >> 8) & 0xFF);
    }
    return bytes;
}

} // namespace Protocol
