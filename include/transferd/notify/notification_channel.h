#ifndef TRANSFERD_NOTIFY_NOTIFICATION_CHANNEL_H
#define TRANSFERD_NOTIFY_NOTIFICATION_CHANNEL_H

#include "transferd/base/config.h"
#include "transferd/core/event_bus.h"
#include "transferd/core/retry_policy.h"
#include "transferd/notify/channel_transport.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace transferd {

enum class ChannelState {
    Idle,
    Connecting,
    Open,
    Authenticating,
    Authenticated,
    Closed,
    Error,
    Reconnecting,
    Lost
};

std::string to_string(ChannelState state);

using MessageHandler = std::function<void(const nlohmann::json& message)>;
using HandlerId = uint64_t;

// Reports every state change; `detail` carries the failure text if any
using ChannelStatusCallback = std::function<void(ChannelState state, const std::string& detail)>;

// Authenticated, heartbeating WebSocket client that reconnects with backoff
// and replays its subscriptions. All network I/O runs on one thread.
class NotificationChannel {
public:
    struct Options {
        std::string url;
        std::string auth_token;
        std::string user_id = "transferd";
        std::chrono::milliseconds connect_timeout{10000};
        std::chrono::milliseconds auth_timeout{10000};
        std::chrono::milliseconds heartbeat_interval{30000};
        std::chrono::milliseconds pong_timeout{10000};
        // Upper bound on how long the I/O thread sleeps between checks
        std::chrono::milliseconds poll_interval{100};
        uint32_t max_reconnect_attempts = 5;
        RetryPolicy::Options reconnect{std::chrono::milliseconds(5000), 2.0,
                                       std::chrono::milliseconds(300000), 0.0};
        std::vector<std::string> subscriptions;

        static Options from_config(const ChannelConfig& config);
    };

    NotificationChannel(Options options, TransportFactory factory);
    ~NotificationChannel();

    NotificationChannel(const NotificationChannel&) = delete;
    NotificationChannel& operator=(const NotificationChannel&) = delete;

    // Start the I/O thread; no-op while it is already running
    void connect();

    // Close normally, stop the I/O thread and drop every subscription
    void disconnect();

    // Rejected (false) unless the channel is authenticated
    bool send(const nlohmann::json& message);

    // Retained across reconnects; sent at once when authenticated
    void subscribe(const std::string& channel);
    void unsubscribe(const std::string& channel);
    std::vector<std::string> subscriptions() const;

    // An empty event matches every event of the type
    HandlerId on(const std::string& type, const std::string& event, MessageHandler handler);
    void off(HandlerId id);

    void set_status_callback(ChannelStatusCallback callback);

    // Re-send the auth message; only valid while authenticated
    bool request_reauthentication();

    // Forward every bus event to the hub while authenticated
    void attach(EventBus& bus);
    void detach();

    ChannelState state() const;
    bool is_authenticated() const { return state() == ChannelState::Authenticated; }

    // Consecutive failed connection attempts since the last authentication
    uint32_t reconnect_attempts() const;

    // Delay before reconnect attempt n (1-based)
    std::chrono::milliseconds reconnect_delay(uint32_t attempt) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace transferd

#endif // TRANSFERD_NOTIFY_NOTIFICATION_CHANNEL_H
