#include "WebsocketChannel.h"
#include "ErrorUtils.h"
#include "Logging.h"

WebsocketEndpoint::WebsocketEndpoint(boost::asio::io_context& io) {
    m_client.clear_access_channels(websocketpp::log::alevel::all);
    m_client.clear_error_channels(websocketpp::log::elevel::all);
    m_client.set_error_channels(websocketpp::log::elevel::rerror | websocketpp::log::elevel::fatal);
    m_client.set_user_agent("call-client");
    m_client.set_close_handshake_timeout(2000);
    m_client.init_asio(&io);
}

WebsocketChannel::WebsocketChannel(WebsocketEndpoint& endpoint)
    : m_client(endpoint.Client()) {}

WebsocketChannel::~WebsocketChannel() {
    m_callbacks.reset();
    if (m_connection) {
        Close(kCloseNormal, "Channel released");
    }
}

void WebsocketChannel::Open(const std::string& uri, Callbacks callbacks) {
    m_callbacks = std::make_shared<Callbacks>(std::move(callbacks));
    std::weak_ptr<Callbacks> weak = m_callbacks;

    websocketpp::lib::error_code ec;
    m_connection = m_client.get_connection(uri, ec);
    if (ec) {
        LOG_TRANSPORT_WARNING("Error getting connection for " + uri, ErrorUtils::formatErrorCode(ec));
        m_connection.reset();
        // Report asynchronously so callers never re-enter from Open()
        std::string reason = ec.message();
        boost::asio::post(m_client.get_io_service(), [weak, reason]() {
            if (auto cb = weak.lock()) {
                if (cb->onClose) cb->onClose(kCloseAbnormal, reason);
            }
        });
        return;
    }

    m_connection->set_open_handler([weak](websocketpp::connection_hdl) {
        if (auto cb = weak.lock()) {
            if (cb->onOpen) cb->onOpen();
        }
    });

    m_connection->set_message_handler([weak](websocketpp::connection_hdl, WsClient::message_ptr msg) {
        auto cb = weak.lock();
        if (!cb) return;
        if (msg->get_opcode() != websocketpp::frame::opcode::text) {
            LOG_DEBUG("[WebSocket] Ignoring binary frame of " + std::to_string(msg->get_payload().size()) + " bytes");
            return;
        }
        if (cb->onText) cb->onText(msg->get_payload());
    });

    WsClient* client = &m_client;
    m_connection->set_close_handler([weak, client](websocketpp::connection_hdl hdl) {
        auto cb = weak.lock();
        if (!cb) return;
        websocketpp::lib::error_code conEc;
        WsClient::connection_ptr con = client->get_con_from_hdl(hdl, conEc);
        uint16_t code = kCloseAbnormal;
        std::string reason;
        if (!conEc && con) {
            code = con->get_remote_close_code();
            reason = con->get_remote_close_reason();
        }
        LOG_INFO("[WebSocket] Connection closed: code=" + std::to_string(code));
        if (cb->onClose) cb->onClose(code, reason);
    });

    m_connection->set_fail_handler([weak, client](websocketpp::connection_hdl hdl) {
        auto cb = weak.lock();
        if (!cb) return;
        websocketpp::lib::error_code conEc;
        WsClient::connection_ptr con = client->get_con_from_hdl(hdl, conEc);
        std::string reason = (!conEc && con) ? con->get_ec().message() : "connection failed";
        LOG_TRANSPORT_WARNING("Connection failed", reason);
        if (cb->onClose) cb->onClose(kCloseAbnormal, reason);
    });

    LOG_INFO("[WebSocket] Connecting to " + uri);
    m_client.connect(m_connection);
}

bool WebsocketChannel::IsOpen() const {
    return m_connection && m_connection->get_state() == websocketpp::session::state::open;
}

bool WebsocketChannel::send(const std::string& payload, websocketpp::frame::opcode::value opcode) {
    if (!IsOpen()) {
        return false;
    }
    websocketpp::lib::error_code ec;
    m_connection->send(payload, opcode, ec);
    if (ec) {
        LOG_TRANSPORT_WARNING("Error sending message", ErrorUtils::formatErrorCode(ec));
        return false;
    }
    return true;
}

bool WebsocketChannel::SendText(const std::string& payload) {
    return send(payload, websocketpp::frame::opcode::text);
}

bool WebsocketChannel::SendBinary(const std::string& payload) {
    return send(payload, websocketpp::frame::opcode::binary);
}

void WebsocketChannel::Close(uint16_t code, const std::string& reason) {
    if (!m_connection) {
        return;
    }
    websocketpp::lib::error_code ec;
    auto state = m_connection->get_state();
    if (state == websocketpp::session::state::open) {
        m_connection->close(code, reason, ec);
    } else if (state == websocketpp::session::state::connecting) {
        m_connection->terminate(websocketpp::error::make_error_code(websocketpp::error::operation_canceled));
    }
    if (ec) {
        LOG_TRANSPORT_WARNING("Error closing connection", ErrorUtils::formatErrorCode(ec));
    }
    m_connection.reset();
}
