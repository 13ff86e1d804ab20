#include "Runtime.h"

namespace Runtime {

void PrintBanner(std::ostream& out, Session::CallMode mode, const std::string& serverUrl)
{
    out << "\n----------------------------------------\n";
    out << "  Voice Agent Call Client\n";
    out << "  Mode:   " << Session::toString(mode) << "\n";
    out << "  Server: " << serverUrl << "\n";
    if (mode == Session::CallMode::TEXT) {
        out << "  Type a message and press Enter to send.\n";
    } else {
        out << "  Speak into the microphone.\n";
    }
    out << "  Commands: /mute, /volume <0-1>, /quit\n";
    out << "----------------------------------------\n\n";
    out.flush();
}

void ConsolePrinter::Attach(Session::SessionStore& store)
{
    Detach();
    m_store = &store;
    m_subscription = store.Subscribe([this](Session::ChangeKind kind, const Session::SessionSnapshot& snapshot) {
        OnChange(kind, snapshot);
    });
}

void ConsolePrinter::Detach()
{
    if (m_store) {
        m_store->Unsubscribe(m_subscription);
        m_store = nullptr;
    }
}

void ConsolePrinter::OnChange(Session::ChangeKind kind, const Session::SessionSnapshot& snapshot)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    switch (kind) {
        case Session::ChangeKind::CALL_STATUS:
            m_out << "[call] " << Session::toString(snapshot.callStatus) << std::endl;
            break;
        case Session::ChangeKind::SESSION_ID:
            if (snapshot.sessionId) {
                m_out << "[call] session " << *snapshot.sessionId << std::endl;
            }
            break;
        case Session::ChangeKind::AGENT_STATUS:
            m_out << "[agent] (" << Session::toString(snapshot.agentStatus) << ")" << std::endl;
            break;
        case Session::ChangeKind::TRANSCRIPT:
            PrintTranscript(snapshot);
            break;
        case Session::ChangeKind::CONVERSATION_STATE: {
            const auto& c = snapshot.conversation;
            m_out << "[state] intent=" << c.intent.value_or("-")
                  << " authenticated=" << (c.authenticated ? "yes" : "no")
                  << " stage=" << c.flowStage.value_or("-")
                  << (c.escalationRequested ? " escalation requested" : "") << std::endl;
            break;
        }
        case Session::ChangeKind::AUDIO_PREFERENCES:
            m_out << "[audio] " << (snapshot.isMuted ? "muted" : "unmuted")
                  << ", volume " << snapshot.volume << std::endl;
            break;
        case Session::ChangeKind::RESET:
            m_printed.clear();
            break;
    }
}

void ConsolePrinter::PrintTranscript(const Session::SessionSnapshot& snapshot)
{
    for (const auto& msg : snapshot.messages) {
        auto it = m_printed.find(msg.id);
        if (it != m_printed.end() && it->second.first == msg.text && it->second.second == msg.isFinal) {
            continue;
        }
        m_printed[msg.id] = std::make_pair(msg.text, msg.isFinal);
        m_out << (msg.speaker == Session::Speaker::AGENT ? "Agent: " : "You:   ") << msg.text
              << (msg.isFinal ? "" : " ...") << std::endl;
    }
}

}
