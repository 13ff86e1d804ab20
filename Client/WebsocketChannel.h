#pragma once
#define _WEBSOCKETPP_CPP11_STL_

#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

#include "MessageChannel.h"

typedef websocketpp::client<websocketpp::config::asio_client> WsClient;

// websocketpp client endpoint running on the application's io_context.
// Owned by main() and shared by every channel; must outlive them.
class WebsocketEndpoint {
public:
    explicit WebsocketEndpoint(boost::asio::io_context& io);

    WebsocketEndpoint(const WebsocketEndpoint&) = delete;
    WebsocketEndpoint& operator=(const WebsocketEndpoint&) = delete;

    WsClient& Client() { return m_client; }

private:
    WsClient m_client;
};

// MessageChannel over one websocketpp client connection (ws:// only)
class WebsocketChannel : public MessageChannel {
public:
    explicit WebsocketChannel(WebsocketEndpoint& endpoint);
    ~WebsocketChannel() override;

    void Open(const std::string& uri, Callbacks callbacks) override;
    bool IsOpen() const override;
    bool SendText(const std::string& payload) override;
    bool SendBinary(const std::string& payload) override;
    void Close(uint16_t code, const std::string& reason) override;

private:
    bool send(const std::string& payload, websocketpp::frame::opcode::value opcode);

    WsClient& m_client;
    WsClient::connection_ptr m_connection;
    // Connection handlers hold weak references; resetting detaches them
    std::shared_ptr<Callbacks> m_callbacks;
};
