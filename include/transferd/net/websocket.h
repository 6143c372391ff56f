#ifndef TRANSFERD_NET_WEBSOCKET_H
#define TRANSFERD_NET_WEBSOCKET_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace transferd {

// RFC 6455 opcodes
enum class WsOpcode : uint8_t {
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA
};

// Close codes used by the channel
static constexpr uint16_t WS_CLOSE_NORMAL = 1000;
static constexpr uint16_t WS_CLOSE_GOING_AWAY = 1001;
static constexpr uint16_t WS_CLOSE_PROTOCOL_ERROR = 1002;
static constexpr uint16_t WS_CLOSE_ABNORMAL = 1006;

struct WsFrame {
    bool fin = true;
    WsOpcode opcode = WsOpcode::Text;
    std::string payload;
};

// Encode one frame. Client frames must be masked.
std::string encode_ws_frame(WsOpcode opcode, const std::string& payload, bool fin = true,
                            const std::optional<std::array<uint8_t, 4>>& mask = std::nullopt);

// Close frame payload: 2-byte code followed by the reason
std::string encode_close_payload(uint16_t code, const std::string& reason);

// Code from a close frame payload; 1005 (no status) when empty
uint16_t parse_close_code(const std::string& payload);

// Incremental frame parser for a byte stream
class WsFrameParser {
public:
    explicit WsFrameParser(uint64_t max_payload = 16 * 1024 * 1024);

    void feed(const char* data, size_t len);

    // Next complete frame, unmasked; empty when more bytes are needed
    std::optional<WsFrame> next();

    bool failed() const { return failed_; }
    const std::string& error() const { return error_; }

private:
    std::string buffer_;
    uint64_t max_payload_;
    bool failed_ = false;
    std::string error_;
};

// Random base64-encoded 16-byte Sec-WebSocket-Key
std::string generate_websocket_key();

// base64(SHA-1(key + GUID)) for Sec-WebSocket-Accept
std::string compute_websocket_accept(const std::string& key);

// Client opening handshake (RFC 6455 section 4.1)
std::string build_upgrade_request(const std::string& host_header, const std::string& target,
                                  const std::string& key);

} // namespace transferd

#endif // TRANSFERD_NET_WEBSOCKET_H
