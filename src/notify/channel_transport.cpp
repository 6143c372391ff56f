#include "transferd/notify/channel_transport.h"
#include "transferd/base/logger.h"
#include "transferd/net/http.h"
#include "transferd/net/url.h"
#include <optional>
#include <random>

namespace transferd {

namespace {

std::array<uint8_t, 4> random_mask() {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 255);
    return {static_cast<uint8_t>(dist(rng)), static_cast<uint8_t>(dist(rng)),
            static_cast<uint8_t>(dist(rng)), static_cast<uint8_t>(dist(rng))};
}

constexpr size_t kMaxHandshakeSize = 16 * 1024;

// Read the server's handshake response up to the blank line. Frame bytes that
// arrived with it are left in `leftover`.
std::optional<HttpResponseHead> read_handshake_response(Connection& conn, std::chrono::milliseconds timeout,
                                                        std::string& leftover, std::string& error) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string buffer;
    char chunk[4096];

    while (true) {
        auto end = buffer.find("\r\n\r\n");
        if (end != std::string::npos) {
            leftover = buffer.substr(end + 4);
            auto head = parse_response_head(buffer.substr(0, end));
            if (!head) {
                error = "malformed response head";
            }
            return head;
        }
        if (buffer.size() > kMaxHandshakeSize) {
            error = "response head too large";
            return std::nullopt;
        }

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        size_t n = 0;
        IoStatus status = left.count() > 0 ? conn.receive(chunk, sizeof(chunk), n, left)
                                           : IoStatus::TimedOut;
        if (status == IoStatus::Ok) {
            buffer.append(chunk, n);
            continue;
        }
        error = status == IoStatus::Closed ? "connection closed before response"
              : status == IoStatus::TimedOut ? "timed out waiting for response"
              : conn.last_error();
        return std::nullopt;
    }
}

TransportEvent make_event(TransportEventType type, std::string reason = {}, uint16_t code = 0) {
    TransportEvent event;
    event.type = type;
    event.reason = std::move(reason);
    event.close_code = code;
    return event;
}

} // anonymous namespace

WebSocketTransport::WebSocketTransport() = default;

WebSocketTransport::~WebSocketTransport() {
    drop_connection();
}

void WebSocketTransport::drop_connection() {
    std::lock_guard<std::mutex> lock(send_mutex_);
    conn_.close();
}

void WebSocketTransport::set_error(const std::string& error) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    error_ = error;
}

std::string WebSocketTransport::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return error_;
}

bool WebSocketTransport::connect(const std::string& url, std::chrono::milliseconds timeout) {
    auto parsed = parse_url(url);
    if (!parsed || (parsed->scheme != "ws" && parsed->scheme != "wss")) {
        set_error("Unsupported channel URL: " + url);
        return false;
    }

    if (!conn_.connect(parsed->host, parsed->port, parsed->is_tls(), timeout)) {
        set_error(conn_.last_error());
        return false;
    }

    std::string key = generate_websocket_key();
    if (!conn_.send_all(build_upgrade_request(parsed->host_header(), parsed->target, key))) {
        set_error(conn_.last_error());
        conn_.close();
        return false;
    }

    std::string leftover;
    std::string error;
    auto head = read_handshake_response(conn_, timeout, leftover, error);
    if (!head) {
        set_error("WebSocket handshake failed: " + error);
        conn_.close();
        return false;
    }
    if (head->status_code != 101) {
        set_error("WebSocket handshake rejected with HTTP " + std::to_string(head->status_code));
        conn_.close();
        return false;
    }
    if (head->get_header("sec-websocket-accept") != compute_websocket_accept(key)) {
        set_error("WebSocket handshake returned a bad accept key");
        conn_.close();
        return false;
    }

    parser_ = WsFrameParser();
    parser_.feed(leftover.data(), leftover.size());
    fragments_.clear();
    in_fragment_ = false;
    close_sent_ = false;
    Logger::instance().debug("WebSocket connected to {}", parsed->to_string());
    return true;
}

bool WebSocketTransport::send_frame(WsOpcode opcode, const std::string& payload) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (close_sent_) {
        set_error("WebSocket is closing");
        return false;
    }
    if (opcode == WsOpcode::Close) {
        close_sent_ = true;
    }
    if (!conn_.send_all(encode_ws_frame(opcode, payload, true, random_mask()))) {
        set_error(conn_.last_error());
        return false;
    }
    return true;
}

bool WebSocketTransport::send_text(const std::string& text) {
    return send_frame(WsOpcode::Text, text);
}

TransportEvent WebSocketTransport::receive(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buffer[8192];

    while (true) {
        while (auto frame = parser_.next()) {
            switch (frame->opcode) {
                case WsOpcode::Text:
                case WsOpcode::Binary:
                    if (!frame->fin) {
                        fragments_ = std::move(frame->payload);
                        in_fragment_ = true;
                        break;
                    }
                    {
                        TransportEvent event = make_event(TransportEventType::Message);
                        event.text = std::move(frame->payload);
                        return event;
                    }

                case WsOpcode::Continuation:
                    if (!in_fragment_) {
                        set_error("Unexpected continuation frame");
                        close(WS_CLOSE_PROTOCOL_ERROR, "unexpected continuation");
                        return make_event(TransportEventType::Error, last_error(), WS_CLOSE_PROTOCOL_ERROR);
                    }
                    fragments_ += frame->payload;
                    if (frame->fin) {
                        in_fragment_ = false;
                        TransportEvent event = make_event(TransportEventType::Message);
                        event.text = std::move(fragments_);
                        fragments_.clear();
                        return event;
                    }
                    break;

                case WsOpcode::Ping:
                    if (!send_frame(WsOpcode::Pong, frame->payload)) {
                        Logger::instance().debug("Failed to answer WebSocket ping: {}", last_error());
                    }
                    break;

                case WsOpcode::Pong:
                    break;

                case WsOpcode::Close: {
                    uint16_t code = parse_close_code(frame->payload);
                    std::string reason = frame->payload.size() > 2 ? frame->payload.substr(2) : "";
                    close(code == 1005 ? WS_CLOSE_NORMAL : code, "");
                    return make_event(TransportEventType::Closed, reason, code);
                }

                default:
                    set_error("Unknown WebSocket opcode");
                    close(WS_CLOSE_PROTOCOL_ERROR, "unknown opcode");
                    return make_event(TransportEventType::Error, last_error(), WS_CLOSE_PROTOCOL_ERROR);
            }
        }

        if (parser_.failed()) {
            set_error("WebSocket protocol error: " + parser_.error());
            close(WS_CLOSE_PROTOCOL_ERROR, parser_.error());
            return make_event(TransportEventType::Error, last_error(), WS_CLOSE_PROTOCOL_ERROR);
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return make_event(TransportEventType::Timeout);
        }

        size_t received = 0;
        auto status = conn_.receive(buffer, sizeof(buffer), received,
                                    std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
        if (status == IoStatus::TimedOut) {
            return make_event(TransportEventType::Timeout);
        }
        if (status == IoStatus::Closed) {
            set_error("Connection dropped");
            drop_connection();
            return make_event(TransportEventType::Error, last_error(), WS_CLOSE_ABNORMAL);
        }
        if (status != IoStatus::Ok) {
            set_error(conn_.last_error());
            drop_connection();
            return make_event(TransportEventType::Error, last_error(), WS_CLOSE_ABNORMAL);
        }
        parser_.feed(buffer, received);
    }
}

void WebSocketTransport::close(uint16_t code, const std::string& reason) {
    if (conn_.is_open()) {
        bool already_sent;
        {
            std::lock_guard<std::mutex> lock(send_mutex_);
            already_sent = close_sent_;
        }
        if (!already_sent && !send_frame(WsOpcode::Close, encode_close_payload(code, reason))) {
            Logger::instance().debug("Failed to send WebSocket close: {}", last_error());
        }
    }
    drop_connection();
}

TransportFactory WebSocketTransport::factory() {
    return [] { return std::make_unique<WebSocketTransport>(); };
}

} // namespace transferd
