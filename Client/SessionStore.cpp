#include "SessionStore.h"
#include "IdGenerator.h"
#include "Logging.h"

#include <algorithm>

namespace Session {

template <typename Mutator>
void SessionStore::mutate(ChangeKind kind, Mutator&& mutator) {
    std::vector<std::pair<int, Listener>> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listenerMutex);
        listeners = m_listeners;
    }

    // The transcript is only copied when someone is listening
    SessionSnapshot copy;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        mutator(m_state);
        m_state.revision++;
        if (listeners.empty()) {
            return;
        }
        copy = m_state;
    }

    for (auto& entry : listeners) {
        if (entry.second) {
            entry.second(kind, copy);
        }
    }
}

void SessionStore::SetCallStatus(CallStatus status) {
    LOG_DEBUG(std::string("[Store] callStatus -> ") + toString(status));
    mutate(ChangeKind::CALL_STATUS, [status](SessionSnapshot& s) {
        s.callStatus = status;
    });
}

void SessionStore::SetSessionId(const std::string& sessionId) {
    LOG_DEBUG("[Store] sessionId -> " + sessionId);
    mutate(ChangeKind::SESSION_ID, [&sessionId](SessionSnapshot& s) {
        s.sessionId = sessionId;
    });
}

void SessionStore::SetAgentStatus(AgentStatus status) {
    mutate(ChangeKind::AGENT_STATUS, [status](SessionSnapshot& s) {
        s.agentStatus = status;
    });
}

void SessionStore::AddMessage(TranscriptMessage message) {
    if (message.id.empty()) {
        message.id = generateUuid();
    }
    if (message.timestamp.empty()) {
        message.timestamp = currentIsoTimestamp();
    }
    mutate(ChangeKind::TRANSCRIPT, [&message](SessionSnapshot& s) {
        s.messages.push_back(std::move(message));
    });
}

int SessionStore::findOpenUserInterim() const {
    for (int i = static_cast<int>(m_state.messages.size()) - 1; i >= 0; --i) {
        const auto& msg = m_state.messages[static_cast<size_t>(i)];
        if (msg.speaker == Speaker::USER && !msg.isFinal) {
            return i;
        }
    }
    return -1;
}

void SessionStore::UpdateLastInterim(const std::string& text) {
    std::string id = generateUuid();
    std::string timestamp = currentIsoTimestamp();
    mutate(ChangeKind::TRANSCRIPT, [&](SessionSnapshot& s) {
        int idx = findOpenUserInterim();
        if (idx >= 0) {
            s.messages[static_cast<size_t>(idx)].text = text;
            return;
        }
        TranscriptMessage msg;
        msg.id = std::move(id);
        msg.speaker = Speaker::USER;
        msg.text = text;
        msg.isFinal = false;
        msg.timestamp = std::move(timestamp);
        s.messages.push_back(std::move(msg));
    });
}

void SessionStore::FinalizeUserTranscript(const std::string& text, const std::string& timestamp) {
    std::string id = generateUuid();
    std::string ts = timestamp.empty() ? currentIsoTimestamp() : timestamp;
    mutate(ChangeKind::TRANSCRIPT, [&](SessionSnapshot& s) {
        int idx = findOpenUserInterim();
        if (idx >= 0) {
            auto& msg = s.messages[static_cast<size_t>(idx)];
            msg.text = text;
            msg.isFinal = true;
            return;
        }
        TranscriptMessage msg;
        msg.id = std::move(id);
        msg.speaker = Speaker::USER;
        msg.text = text;
        msg.isFinal = true;
        msg.timestamp = std::move(ts);
        s.messages.push_back(std::move(msg));
    });
}

void SessionStore::MergeConversationState(const ConversationStateUpdate& update) {
    if (update.empty()) {
        return;
    }
    mutate(ChangeKind::CONVERSATION_STATE, [&update](SessionSnapshot& s) {
        if (update.intent) s.conversation.intent = *update.intent;
        if (update.authenticated) s.conversation.authenticated = *update.authenticated;
        if (update.flowStage) s.conversation.flowStage = *update.flowStage;
        if (update.escalationRequested) s.conversation.escalationRequested = *update.escalationRequested;
    });
}

void SessionStore::SetMuted(bool muted) {
    mutate(ChangeKind::AUDIO_PREFERENCES, [muted](SessionSnapshot& s) {
        s.isMuted = muted;
    });
}

void SessionStore::ToggleMute() {
    mutate(ChangeKind::AUDIO_PREFERENCES, [](SessionSnapshot& s) {
        s.isMuted = !s.isMuted;
    });
}

void SessionStore::SetVolume(float volume) {
    float clamped = std::clamp(volume, 0.0f, 1.0f);
    mutate(ChangeKind::AUDIO_PREFERENCES, [clamped](SessionSnapshot& s) {
        s.volume = clamped;
    });
}

void SessionStore::Reset() {
    LOG_DEBUG("[Store] Reset");
    mutate(ChangeKind::RESET, [](SessionSnapshot& s) {
        uint64_t revision = s.revision;
        s = SessionSnapshot{};
        s.revision = revision;
    });
}

SessionSnapshot SessionStore::Snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

CallStatus SessionStore::GetCallStatus() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.callStatus;
}

bool SessionStore::IsMuted() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.isMuted;
}

int SessionStore::Subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    int id = m_nextListenerId++;
    m_listeners.emplace_back(id, std::move(listener));
    return id;
}

void SessionStore::Unsubscribe(int id) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    m_listeners.erase(std::remove_if(m_listeners.begin(), m_listeners.end(),
                                     [id](const std::pair<int, Listener>& e) { return e.first == id; }),
                      m_listeners.end());
}

} // namespace Session
