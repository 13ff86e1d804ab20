#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "SessionTypes.h"

namespace Session {

/**
 * @brief Mutation surface the transport is allowed to drive
 *
 * Inbound protocol events are the only writers of agent status and
 * conversation state, so the transport receives this interface rather than
 * the full store.
 */
class SessionEvents {
public:
    virtual ~SessionEvents() = default;

    virtual void SetCallStatus(CallStatus status) = 0;
    virtual void SetSessionId(const std::string& sessionId) = 0;
    virtual void SetAgentStatus(AgentStatus status) = 0;

    // Appends a message; an empty id or timestamp is filled in locally
    virtual void AddMessage(TranscriptMessage message) = 0;

    // Replaces the text of the most recent non-final user message, or
    // appends a new non-final user message when there is none
    virtual void UpdateLastInterim(const std::string& text) = 0;

    // Finalizes the open user interim in place with the final text, or
    // appends a final user message when no interim is open
    virtual void FinalizeUserTranscript(const std::string& text, const std::string& timestamp) = 0;

    virtual void MergeConversationState(const ConversationStateUpdate& update) = 0;
};

enum class ChangeKind {
    CALL_STATUS,
    SESSION_ID,
    AGENT_STATUS,
    TRANSCRIPT,
    CONVERSATION_STATE,
    AUDIO_PREFERENCES,
    RESET
};

/**
 * @brief Single-writer session state shared by transport, audio and presentation
 *
 * Owned by the application and injected into the components that write it.
 * Every mutation happens atomically under one lock and bumps the snapshot
 * revision; listeners run after the lock is released, in mutation order.
 * Presentation code may take Snapshot() from any thread.
 */
class SessionStore : public SessionEvents {
public:
    using Listener = std::function<void(ChangeKind, const SessionSnapshot&)>;

    SessionStore() = default;
    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    // SessionEvents
    void SetCallStatus(CallStatus status) override;
    void SetSessionId(const std::string& sessionId) override;
    void SetAgentStatus(AgentStatus status) override;
    void AddMessage(TranscriptMessage message) override;
    void UpdateLastInterim(const std::string& text) override;
    void FinalizeUserTranscript(const std::string& text, const std::string& timestamp) override;
    void MergeConversationState(const ConversationStateUpdate& update) override;

    // Audio preferences
    void SetMuted(bool muted);
    void ToggleMute();
    void SetVolume(float volume);   // Clamped to [0, 1]

    // Restores every field to its initial value
    void Reset();

    SessionSnapshot Snapshot() const;
    CallStatus GetCallStatus() const;
    bool IsMuted() const;

    // Returns an id usable with Unsubscribe
    int Subscribe(Listener listener);
    void Unsubscribe(int id);

private:
    template <typename Mutator>
    void mutate(ChangeKind kind, Mutator&& mutator);

    int findOpenUserInterim() const;

    mutable std::mutex m_mutex;
    SessionSnapshot m_state;

    std::mutex m_listenerMutex;
    std::vector<std::pair<int, Listener>> m_listeners;
    int m_nextListenerId = 1;
};

} // namespace Session
