#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Session {

enum class CallStatus {
    IDLE,
    CONNECTING,
    ACTIVE,
    ENDED
};

// Remote agent turn-taking state
enum class AgentStatus {
    IDLE,
    LISTENING,
    THINKING,
    SPEAKING,
    ERROR
};

enum class Speaker {
    USER,
    AGENT
};

enum class CallMode {
    VOICE,
    TEXT
};

struct TranscriptMessage {
    std::string id;
    Speaker speaker = Speaker::USER;
    std::string text;
    bool isFinal = true;
    std::string timestamp;      // ISO-8601, as received or locally generated
};

// Facts asserted by the remote agent about the conversation
struct ConversationState {
    std::optional<std::string> intent;
    bool authenticated = false;
    std::optional<std::string> flowStage;
    bool escalationRequested = false;
};

// Partial update of ConversationState. An absent field keeps its value; for
// intent/flowStage a present-but-empty inner optional clears the field.
struct ConversationStateUpdate {
    std::optional<std::optional<std::string>> intent;
    std::optional<bool> authenticated;
    std::optional<std::optional<std::string>> flowStage;
    std::optional<bool> escalationRequested;

    bool empty() const {
        return !intent && !authenticated && !flowStage && !escalationRequested;
    }
};

// Consistent copy of the whole store, handed to presentation layers
struct SessionSnapshot {
    CallStatus callStatus = CallStatus::IDLE;
    std::optional<std::string> sessionId;
    AgentStatus agentStatus = AgentStatus::IDLE;
    std::vector<TranscriptMessage> messages;
    ConversationState conversation;
    bool isMuted = false;
    float volume = 1.0f;
    uint64_t revision = 0;      // Incremented by every mutation
};

const char* toString(CallStatus status);
const char* toString(AgentStatus status);
const char* toString(Speaker speaker);
const char* toString(CallMode mode);

bool parseAgentStatus(const std::string& text, AgentStatus& out);
bool parseSpeaker(const std::string& text, Speaker& out);
bool parseCallMode(const std::string& text, CallMode& out);

} // namespace Session
