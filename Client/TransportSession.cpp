#include "TransportSession.h"
#include "ErrorUtils.h"
#include "IdGenerator.h"
#include "Logging.h"
#include "Metrics.h"

using json = nlohmann::json;

const char* toString(TransportSession::State state) {
    switch (state) {
        case TransportSession::State::IDLE: return "idle";
        case TransportSession::State::CONNECTING: return "connecting";
        case TransportSession::State::CONNECTED: return "connected";
        case TransportSession::State::DISCONNECTED_CLEAN: return "disconnected-clean";
        case TransportSession::State::DISCONNECTED_ABNORMAL: return "disconnected-abnormal";
        case TransportSession::State::RECONNECTING: return "reconnecting";
        case TransportSession::State::EXHAUSTED: return "exhausted";
        default: return "unknown";
    }
}

TransportSession::TransportSession(boost::asio::io_context& io,
                                   Session::SessionEvents& events,
                                   ChannelFactory channelFactory,
                                   const ClientConfig::ServerConfig& server,
                                   const ClientConfig::ReconnectConfig& reconnect)
    : m_io(io),
      m_events(events),
      m_channelFactory(std::move(channelFactory)),
      m_server(server),
      m_policy(reconnect.delays),
      m_reconnectTimer(io) {}

TransportSession::~TransportSession() {
    cancelReconnect();
    releaseChannel();
}

std::string TransportSession::endpointUri() const {
    std::string base = m_server.baseUrl;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + (m_mode == Session::CallMode::VOICE ? m_server.voicePath : m_server.textPath);
}

void TransportSession::Connect(Session::CallMode mode) {
    cancelReconnect();
    releaseChannel();

    m_mode = mode;
    m_policy.Reset();
    m_state = State::CONNECTING;
    m_events.SetCallStatus(Session::CallStatus::CONNECTING);
    openChannel();
}

void TransportSession::openChannel() {
    std::shared_ptr<MessageChannel> channel(m_channelFactory());
    if (!channel) {
        LOG_ERROR("[Transport] Channel factory returned no channel");
        handleClose(m_channelGeneration, kCloseAbnormal, "no channel");
        return;
    }
    m_channel = channel;
    uint64_t generation = ++m_channelGeneration;

    MessageChannel::Callbacks callbacks;
    callbacks.onOpen = [this, generation]() { handleOpen(generation); };
    callbacks.onText = [this, generation](const std::string& payload) { handleText(generation, payload); };
    callbacks.onClose = [this, generation](uint16_t code, const std::string& reason) {
        handleClose(generation, code, reason);
    };

    std::string uri = endpointUri();
    LOG_INFO(std::string("[Transport] Opening ") + Session::toString(m_mode) + " session at " + uri);
    channel->Open(uri, std::move(callbacks));
}

void TransportSession::releaseChannel() {
    // Bumping the generation detaches callbacks still in flight
    ++m_channelGeneration;
    if (!m_channel) {
        return;
    }
    std::shared_ptr<MessageChannel> channel = std::move(m_channel);
    m_channel.reset();
    channel->Close(kCloseNormal, "Session replaced");
    // The channel may be the caller of this function; destroy it later
    boost::asio::post(m_io, [channel]() {});
}

void TransportSession::cancelReconnect() {
    ++m_timerGeneration;
    if (m_reconnectPending) {
        LOG_DEBUG("[Transport] Reconnect cancelled");
    }
    m_reconnectPending = false;
    m_reconnectTimer.cancel();
}

void TransportSession::Disconnect() {
    cancelReconnect();
    if (m_channel) {
        if (m_channel->IsOpen()) {
            m_channel->SendText(Protocol::makeStopMessage());
        }
        std::shared_ptr<MessageChannel> channel = std::move(m_channel);
        m_channel.reset();
        ++m_channelGeneration;
        channel->Close(kCloseNormal, "User disconnected");
        boost::asio::post(m_io, [channel]() {});
        LOG_INFO("[Transport] Disconnected by user");
    }
    if (m_state != State::IDLE) {
        m_state = State::DISCONNECTED_CLEAN;
    }
    m_events.SetCallStatus(Session::CallStatus::ENDED);
}

bool TransportSession::IsOpen() const {
    return m_channel && m_channel->IsOpen();
}

bool TransportSession::SendText(const std::string& content) {
    if (!IsOpen()) {
        LOG_DEBUG("[Transport] Dropping text message, channel not open");
        return false;
    }
    std::string payload;
    try {
        payload = Protocol::makeTextMessage(content);
    } catch (const json::exception& e) {
        LOG_PROTOCOL_WARNING("Unable to serialise text message", e.what());
        return false;
    }
    return m_channel->SendText(payload);
}

void TransportSession::SendAudio(const std::vector<int16_t>& frame) {
    if (!IsOpen()) {
        CallMetrics::inc(CallMetrics::framesDropped());
        return;
    }
    if (m_channel->SendBinary(Protocol::encodePcmFrame(frame))) {
        CallMetrics::inc(CallMetrics::framesSent());
    } else {
        CallMetrics::inc(CallMetrics::framesDropped());
    }
}

void TransportSession::On(const std::string& type, MessageHandler handler) {
    if (!handler) {
        m_handlers.erase(type);
        return;
    }
    m_handlers[type] = std::move(handler);
}

void TransportSession::handleOpen(uint64_t generation) {
    if (generation != m_channelGeneration) {
        return;
    }
    LOG_INFO("[Transport] Connected");
    m_policy.Reset();
    m_state = State::CONNECTED;

    // Text sessions have no server handshake
    if (m_mode == Session::CallMode::TEXT) {
        m_events.SetCallStatus(Session::CallStatus::ACTIVE);
        m_events.SetSessionId(generateUuid());
    }
}

void TransportSession::handleText(uint64_t generation, const std::string& payload) {
    if (generation != m_channelGeneration) {
        return;
    }
    CallMetrics::inc(CallMetrics::messagesReceived());

    if (payload.size() > m_server.maxMessageBytes) {
        CallMetrics::inc(CallMetrics::malformedMessages());
        LOG_PROTOCOL_WARNING("Dropping oversized message", std::to_string(payload.size()) + " bytes");
        return;
    }

    Protocol::InboundMessage message;
    std::string error;
    if (!Protocol::parseInbound(payload, message, error)) {
        CallMetrics::inc(CallMetrics::malformedMessages());
        LOG_PROTOCOL_WARNING("Failed to parse message", error);
        return;
    }
    LOG_TRACE("[Transport] Received message type: " + message.typeName);

    dispatch(message.payload, message.type, message.typeName);

    auto it = m_handlers.find(message.typeName);
    if (it != m_handlers.end() && it->second) {
        try {
            it->second(message.payload);
        } catch (const std::exception& e) {
            LOG_ERROR("[Transport] Handler for '" + message.typeName + "' threw: " + e.what());
        }
    }
}

void TransportSession::dispatch(const json& message, Protocol::MessageType type, const std::string& typeName) {
    std::string error;
    switch (type) {
        case Protocol::MessageType::SESSION: {
            std::string sessionId;
            if (!Protocol::parseSession(message, sessionId, error)) break;
            LOG_INFO("[Transport] Session started: " + sessionId);
            m_events.SetSessionId(sessionId);
            m_events.SetCallStatus(Session::CallStatus::ACTIVE);
            return;
        }
        case Protocol::MessageType::TRANSCRIPT: {
            Protocol::TranscriptEvent transcript;
            if (!Protocol::parseTranscript(message, transcript, error)) break;
            if (transcript.speaker == Session::Speaker::USER && !transcript.isFinal) {
                m_events.UpdateLastInterim(transcript.text);
            } else if (transcript.speaker == Session::Speaker::USER) {
                m_events.FinalizeUserTranscript(transcript.text, transcript.timestamp);
            } else {
                Session::TranscriptMessage msg;
                msg.speaker = transcript.speaker;
                msg.text = transcript.text;
                msg.isFinal = transcript.isFinal;
                msg.timestamp = transcript.timestamp;
                m_events.AddMessage(std::move(msg));
            }
            return;
        }
        case Protocol::MessageType::STATUS: {
            Session::AgentStatus status;
            if (!Protocol::parseStatus(message, status, error)) break;
            m_events.SetAgentStatus(status);
            return;
        }
        case Protocol::MessageType::STATE_UPDATE: {
            Session::ConversationStateUpdate update;
            if (!Protocol::parseStateUpdate(message, update, error)) break;
            m_events.MergeConversationState(update);
            return;
        }
        case Protocol::MessageType::AUDIO:
            // Consumed by the registered "audio" handler
            if (m_handlers.find(typeName) == m_handlers.end()) {
                LOG_DEBUG("[Transport] Audio chunk received with no playback attached");
            }
            return;
        case Protocol::MessageType::AUDIO_END:
            LOG_DEBUG("[Transport] Agent audio finished");
            return;
        case Protocol::MessageType::ERROR:
            LOG_WARN("[Transport] Server error: " + Protocol::parseErrorText(message));
            m_events.SetAgentStatus(Session::AgentStatus::ERROR);
            return;
        case Protocol::MessageType::UNKNOWN:
        default:
            CallMetrics::inc(CallMetrics::unknownMessages());
            LOG_DEBUG("[Transport] Ignoring unknown message type: " + typeName);
            return;
    }

    CallMetrics::inc(CallMetrics::malformedMessages());
    LOG_PROTOCOL_WARNING("Invalid '" + typeName + "' message", error);
}

void TransportSession::handleClose(uint64_t generation, uint16_t code, const std::string& reason) {
    if (generation != m_channelGeneration) {
        return;
    }
    LOG_INFO("[Transport] Disconnected: code=" + std::to_string(code) +
             (reason.empty() ? std::string() : " reason=" + reason) + " (was " + toString(m_state) + ")");

    releaseChannel();

    if (code == kCloseNormal) {
        m_state = State::DISCONNECTED_CLEAN;
        m_events.SetCallStatus(Session::CallStatus::ENDED);
        return;
    }

    m_state = State::DISCONNECTED_ABNORMAL;
    scheduleReconnect();
}

void TransportSession::scheduleReconnect() {
    std::chrono::milliseconds delay(0);
    if (!m_policy.NextDelay(delay)) {
        LOG_TRANSPORT_WARNING("Reconnect attempts exhausted",
                              std::to_string(m_policy.ScheduleLength()) + " attempts failed");
        m_state = State::EXHAUSTED;
        m_reconnectPending = false;
        m_events.SetCallStatus(Session::CallStatus::ENDED);
        return;
    }

    size_t attempt = m_policy.ConsecutiveFailures();
    LOG_INFO("[Transport] Reconnecting in " + std::to_string(delay.count()) +
             "ms (attempt " + std::to_string(attempt) + ")");
    CallMetrics::inc(CallMetrics::reconnectAttempts());

    m_state = State::RECONNECTING;
    m_reconnectPending = true;
    uint64_t timerGeneration = ++m_timerGeneration;
    m_reconnectTimer.expires_after(delay);
    m_reconnectTimer.async_wait([this, timerGeneration](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        if (timerGeneration != m_timerGeneration) {
            return;
        }
        m_reconnectPending = false;
        m_state = State::CONNECTING;
        m_events.SetCallStatus(Session::CallStatus::CONNECTING);
        openChannel();
    });

    if (m_reconnectObserver) {
        m_reconnectObserver(attempt, delay);
    }
}
