#include "transferd/net/websocket.h"
#include <random>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace transferd {

namespace {

constexpr const char* kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

std::string base64_encode(const unsigned char* data, size_t len) {
    std::string out(4 * ((len + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data,
                                  static_cast<int>(len));
    out.resize(written < 0 ? 0 : static_cast<size_t>(written));
    return out;
}

} // anonymous namespace

std::string encode_ws_frame(WsOpcode opcode, const std::string& payload, bool fin,
                            const std::optional<std::array<uint8_t, 4>>& mask) {
    std::string frame;
    frame.reserve(payload.size() + 14);

    frame += static_cast<char>((fin ? 0x80 : 0x00) | static_cast<uint8_t>(opcode));

    uint8_t mask_bit = mask ? 0x80 : 0x00;
    uint64_t len = payload.size();
    if (len < 126) {
        frame += static_cast<char>(mask_bit | static_cast<uint8_t>(len));
    } else if (len <= 0xFFFF) {
        frame += static_cast<char>(mask_bit | 126);
        frame += static_cast<char>((len >> 8) & 0xFF);
        frame += static_cast<char>(len & 0xFF);
    } else {
        frame += static_cast<char>(mask_bit | 127);
        for (int shift = 56; shift >= 0; shift -= 8) {
            frame += static_cast<char>((len >> shift) & 0xFF);
        }
    }

    if (!mask) {
        frame += payload;
        return frame;
    }

    for (uint8_t b : *mask) {
        frame += static_cast<char>(b);
    }
    for (size_t i = 0; i < payload.size(); ++i) {
        frame += static_cast<char>(static_cast<uint8_t>(payload[i]) ^ (*mask)[i % 4]);
    }
    return frame;
}

std::string encode_close_payload(uint16_t code, const std::string& reason) {
    std::string payload;
    payload += static_cast<char>((code >> 8) & 0xFF);
    payload += static_cast<char>(code & 0xFF);
    // Control frame payloads are limited to 125 bytes
    payload += reason.substr(0, 123);
    return payload;
}

uint16_t parse_close_code(const std::string& payload) {
    if (payload.size() < 2) {
        return 1005;
    }
    return static_cast<uint16_t>((static_cast<uint8_t>(payload[0]) << 8) |
                                 static_cast<uint8_t>(payload[1]));
}

WsFrameParser::WsFrameParser(uint64_t max_payload) : max_payload_(max_payload) {}

void WsFrameParser::feed(const char* data, size_t len) {
    buffer_.append(data, len);
}

std::optional<WsFrame> WsFrameParser::next() {
    if (failed_ || buffer_.size() < 2) {
        return std::nullopt;
    }

    auto byte = [this](size_t i) { return static_cast<uint8_t>(buffer_[i]); };

    uint8_t b0 = byte(0);
    uint8_t b1 = byte(1);
    if (b0 & 0x70) {
        failed_ = true;
        error_ = "reserved bits set";
        return std::nullopt;
    }

    size_t pos = 2;
    uint64_t len = b1 & 0x7F;
    if (len == 126) {
        if (buffer_.size() < 4) return std::nullopt;
        len = (static_cast<uint64_t>(byte(2)) << 8) | byte(3);
        pos = 4;
    } else if (len == 127) {
        if (buffer_.size() < 10) return std::nullopt;
        len = 0;
        for (size_t i = 2; i < 10; ++i) {
            len = (len << 8) | byte(i);
        }
        pos = 10;
    }

    if (len > max_payload_) {
        failed_ = true;
        error_ = "frame too large";
        return std::nullopt;
    }

    bool masked = (b1 & 0x80) != 0;
    std::array<uint8_t, 4> mask{};
    if (masked) {
        if (buffer_.size() < pos + 4) return std::nullopt;
        for (size_t i = 0; i < 4; ++i) {
            mask[i] = byte(pos + i);
        }
        pos += 4;
    }

    if (buffer_.size() < pos + len) {
        return std::nullopt;
    }

    WsFrame frame;
    frame.fin = (b0 & 0x80) != 0;
    frame.opcode = static_cast<WsOpcode>(b0 & 0x0F);
    frame.payload = buffer_.substr(pos, static_cast<size_t>(len));
    if (masked) {
        for (size_t i = 0; i < frame.payload.size(); ++i) {
            frame.payload[i] = static_cast<char>(static_cast<uint8_t>(frame.payload[i]) ^ mask[i % 4]);
        }
    }

    buffer_.erase(0, pos + static_cast<size_t>(len));
    return frame;
}

std::string generate_websocket_key() {
    unsigned char nonce[16];
    if (RAND_bytes(nonce, sizeof(nonce)) != 1) {
        std::random_device rd;
        for (auto& b : nonce) {
            b = static_cast<unsigned char>(rd());
        }
    }
    return base64_encode(nonce, sizeof(nonce));
}

std::string compute_websocket_accept(const std::string& key) {
    std::string input = key + kWebSocketGuid;
    unsigned char digest[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(input.data()), input.size(), digest);
    return base64_encode(digest, sizeof(digest));
}

std::string build_upgrade_request(const std::string& host_header, const std::string& target,
                                  const std::string& key) {
    return "GET " + target + " HTTP/1.1\r\n"
           "Host: " + host_header + "\r\n"
           "Upgrade: websocket\r\n"
           "Connection: Upgrade\r\n"
           "Sec-WebSocket-Key: " + key + "\r\n"
           "Sec-WebSocket-Version: 13\r\n"
           "\r\n";
}

} // namespace transferd
