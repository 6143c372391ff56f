#ifndef TRANSFERD_NOTIFY_CHANNEL_TRANSPORT_H
#define TRANSFERD_NOTIFY_CHANNEL_TRANSPORT_H

#include "transferd/net/connection.h"
#include "transferd/net/websocket.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace transferd {

enum class TransportEventType {
    Message,   // one complete text message
    Timeout,   // nothing arrived within the wait
    Closed,    // close handshake from the peer
    Error      // connection dropped or protocol violation
};

struct TransportEvent {
    TransportEventType type = TransportEventType::Timeout;
    std::string text;
    uint16_t close_code = 0;
    std::string reason;
};

// Message-oriented duplex link used by the notification channel.
// receive() is called from one thread; send_text() may be called from any.
class ChannelTransport {
public:
    virtual ~ChannelTransport() = default;

    virtual bool connect(const std::string& url, std::chrono::milliseconds timeout) = 0;
    virtual bool send_text(const std::string& text) = 0;
    virtual TransportEvent receive(std::chrono::milliseconds timeout) = 0;
    virtual void close(uint16_t code, const std::string& reason) = 0;
    virtual std::string last_error() const = 0;
};

using TransportFactory = std::function<std::unique_ptr<ChannelTransport>()>;

// RFC 6455 client over Connection (ws:// and wss://)
class WebSocketTransport : public ChannelTransport {
public:
    WebSocketTransport();
    ~WebSocketTransport() override;

    bool connect(const std::string& url, std::chrono::milliseconds timeout) override;
    bool send_text(const std::string& text) override;
    TransportEvent receive(std::chrono::milliseconds timeout) override;
    void close(uint16_t code, const std::string& reason) override;
    std::string last_error() const override;

    static TransportFactory factory();

private:
    bool send_frame(WsOpcode opcode, const std::string& payload);
    void set_error(const std::string& error);
    // Close the socket without a close frame; serialized with senders
    void drop_connection();

    Connection conn_;
    WsFrameParser parser_;
    std::string fragments_;
    bool in_fragment_ = false;
    bool close_sent_ = false;
    std::mutex send_mutex_;
    mutable std::mutex error_mutex_;
    std::string error_;
};

} // namespace transferd

#endif // TRANSFERD_NOTIFY_CHANNEL_TRANSPORT_H
