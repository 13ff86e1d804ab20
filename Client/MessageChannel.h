#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

// Normal closure; any other code is an abnormal close
constexpr uint16_t kCloseNormal = 1000;
// Reported for connections that drop or fail without a close frame
constexpr uint16_t kCloseAbnormal = 1006;

/**
 * @brief One persistent bidirectional message connection
 *
 * Callbacks are invoked on the control loop. After Close() the channel still
 * reports the final onClose; destroying the channel detaches every callback.
 */
class MessageChannel {
public:
    struct Callbacks {
        std::function<void()> onOpen;
        std::function<void(const std::string&)> onText;
        std::function<void(uint16_t code, const std::string& reason)> onClose;
    };

    virtual ~MessageChannel() = default;

    // Starts the opening handshake; failures are reported through onClose
    virtual void Open(const std::string& uri, Callbacks callbacks) = 0;

    virtual bool IsOpen() const = 0;

    // Both return false when the channel is not open or the send failed
    virtual bool SendText(const std::string& payload) = 0;
    virtual bool SendBinary(const std::string& payload) = 0;

    virtual void Close(uint16_t code, const std::string& reason) = 0;
};

using ChannelFactory = std::function<std::unique_ptr<MessageChannel>()>;
