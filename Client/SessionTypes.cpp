#include "SessionTypes.h"

namespace Session {

const char* toString(CallStatus status) {
    switch (status) {
        case CallStatus::IDLE: return "idle";
        case CallStatus::CONNECTING: return "connecting";
        case CallStatus::ACTIVE: return "active";
        case CallStatus::ENDED: return "ended";
        default: return "unknown";
    }
}

const char* toString(AgentStatus status) {
    switch (status) {
        case AgentStatus::IDLE: return "idle";
        case AgentStatus::LISTENING: return "listening";
        case AgentStatus::THINKING: return "thinking";
        case AgentStatus::SPEAKING: return "speaking";
        case AgentStatus::ERROR: return "error";
        default: return "unknown";
    }
}

const char* toString(Speaker speaker) {
    return speaker == Speaker::AGENT ? "agent" : "user";
}

const char* toString(CallMode mode) {
    return mode == CallMode::VOICE ? "voice" : "text";
}

bool parseAgentStatus(const std::string& text, AgentStatus& out) {
    if (text == "idle") { out = AgentStatus::IDLE; return true; }
    if (text == "listening") { out = AgentStatus::LISTENING; return true; }
    if (text == "thinking") { out = AgentStatus::THINKING; return true; }
    if (text == "speaking") { out = AgentStatus::SPEAKING; return true; }
    if (text == "error") { out = AgentStatus::ERROR; return true; }
    return false;
}

bool parseSpeaker(const std::string& text, Speaker& out) {
    if (text == "user") { out = Speaker::USER; return true; }
    if (text == "agent") { out = Speaker::AGENT; return true; }
    return false;
}

bool parseCallMode(const std::string& text, CallMode& out) {
    if (text == "voice") { out = CallMode::VOICE; return true; }
    if (text == "text") { out = CallMode::TEXT; return true; }
    return false;
}

} // namespace Session
