#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "SessionTypes.h"

// Wire protocol spoken with the agent server.
//
// Inbound frames are JSON text with a string "type":
//   session       {session_id}
//   transcript    {speaker, text, is_final?, timestamp?}
//   status        {status}
//   state_update  {intent, authenticated, flow_stage, escalation_requested}
//   audio         {data: base64 compressed audio}
//   audio_end     {}
//   error         {message}
// Outbound: {"type":"text","content":...}, {"type":"stop"} and binary
// little-endian 16-bit mono PCM frames.
namespace Protocol {

enum class MessageType {
    SESSION,
    TRANSCRIPT,
    STATUS,
    STATE_UPDATE,
    AUDIO,
    AUDIO_END,
    ERROR,
    UNKNOWN
};

MessageType messageTypeFromString(const std::string& type);

struct InboundMessage {
    MessageType type = MessageType::UNKNOWN;
    std::string typeName;
    nlohmann::json payload;
};

struct TranscriptEvent {
    Session::Speaker speaker = Session::Speaker::USER;
    std::string text;
    bool isFinal = true;            // Absent is_final means final
    std::string timestamp;          // Empty when the server sent none
};

// Parses a text frame into a JSON object with a string "type".
// Returns false (with a reason) for invalid JSON or a missing/non-string type.
bool parseInbound(const std::string& payload, InboundMessage& out, std::string& error);

bool parseSession(const nlohmann::json& message, std::string& sessionId, std::string& error);
bool parseTranscript(const nlohmann::json& message, TranscriptEvent& out, std::string& error);
bool parseStatus(const nlohmann::json& message, Session::AgentStatus& out, std::string& error);
bool parseStateUpdate(const nlohmann::json& message, Session::ConversationStateUpdate& out, std::string& error);
bool parseAudio(const nlohmann::json& message, std::string& base64Data, std::string& error);
std::string parseErrorText(const nlohmann::json& message);

// Strict base64 decoding (standard alphabet, optional padding, ASCII
// whitespace ignored). Returns false on any other character.
bool decodeBase64(const std::string& encoded, std::vector<uint8_t>& out);

std::string makeTextMessage(const std::string& content);
std::string makeStopMessage();

// Serializes samples as little-endian int16 regardless of host byte order
std::string encodePcmFrame(const std::vector<int16_t>& samples);

} // namespace Protocol
