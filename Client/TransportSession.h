#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "ClientConfig.h"
#include "MessageChannel.h"
#include "Protocol.h"
#include "ReconnectPolicy.h"
#include "SessionStore.h"

/**
 * @brief Owns the single connection to the agent server
 *
 * Opens the voice or text endpoint, dispatches inbound protocol messages into
 * the session (and then to handlers registered with On()), and reconnects
 * after abnormal closes following the configured backoff schedule.
 *
 * Every method must be called on the control loop (the io_context given to
 * the constructor); channel callbacks and the reconnect timer run there too.
 */
class TransportSession {
public:
    enum class State {
        IDLE,
        CONNECTING,
        CONNECTED,
        DISCONNECTED_CLEAN,
        DISCONNECTED_ABNORMAL,
        RECONNECTING,
        EXHAUSTED
    };

    using MessageHandler = std::function<void(const nlohmann::json&)>;
    // Called whenever a reconnect attempt is scheduled (attempt numbers start at 1)
    using ReconnectObserver = std::function<void(size_t attempt, std::chrono::milliseconds delay)>;

    TransportSession(boost::asio::io_context& io,
                     Session::SessionEvents& events,
                     ChannelFactory channelFactory,
                     const ClientConfig::ServerConfig& server,
                     const ClientConfig::ReconnectConfig& reconnect);
    ~TransportSession();

    TransportSession(const TransportSession&) = delete;
    TransportSession& operator=(const TransportSession&) = delete;

    // Tears down any previous connection and opens a new one
    void Connect(Session::CallMode mode);

    // Graceful hangup: {"type":"stop"} then close 1000. Safe in any state.
    void Disconnect();

    // Sends {"type":"text","content":...}; no-op returning false when not open
    bool SendText(const std::string& content);

    // Fire-and-forget PCM frame; dropped while the channel is not open
    void SendAudio(const std::vector<int16_t>& frame);

    // Registers the handler for one message type, replacing any previous one.
    // Handlers run after the built-in dispatch with the parsed payload.
    // An empty handler unregisters the type.
    void On(const std::string& type, MessageHandler handler);

    void SetReconnectObserver(ReconnectObserver observer) { m_reconnectObserver = std::move(observer); }

    State GetState() const { return m_state; }
    bool IsOpen() const;
    bool ReconnectPending() const { return m_reconnectPending; }
    Session::CallMode GetMode() const { return m_mode; }

private:
    void openChannel();
    void releaseChannel();
    void cancelReconnect();
    void scheduleReconnect();

    void handleOpen(uint64_t generation);
    void handleText(uint64_t generation, const std::string& payload);
    void handleClose(uint64_t generation, uint16_t code, const std::string& reason);

    void dispatch(const nlohmann::json& message, Protocol::MessageType type, const std::string& typeName);

    std::string endpointUri() const;

    boost::asio::io_context& m_io;
    Session::SessionEvents& m_events;
    ChannelFactory m_channelFactory;
    ClientConfig::ServerConfig m_server;
    ReconnectPolicy m_policy;

    std::shared_ptr<MessageChannel> m_channel;
    uint64_t m_channelGeneration = 0;     // Callbacks from older channels are ignored

    boost::asio::steady_timer m_reconnectTimer;
    uint64_t m_timerGeneration = 0;
    bool m_reconnectPending = false;

    State m_state = State::IDLE;
    Session::CallMode m_mode = Session::CallMode::VOICE;

    std::map<std::string, MessageHandler> m_handlers;
    ReconnectObserver m_reconnectObserver;
};

const char* toString(TransportSession::State state);
