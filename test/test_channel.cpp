#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "transferd/notify/notification_channel.h"
#include "test_support.h"

using namespace transferd;
using namespace transferd::test;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

// In-process stand-in for the notification hub. Each accepted connection is
// a Link; the newest one is "current".
class FakeHub {
public:
    struct Link {
        std::deque<TransportEvent> inbox;
        std::vector<json> received;
        bool dropped = false;
        uint16_t client_close_code = 0;
    };

    std::atomic<bool> accept_connections{true};
    std::atomic<bool> auto_auth{true};
    std::atomic<bool> reject_auth{false};
    std::atomic<bool> answer_pings{true};

    TransportFactory factory();

    void push(const json& message) {
        deliver(TransportEvent{TransportEventType::Message, message.dump(), 0, {}});
    }

    void drop() {
        deliver(TransportEvent{TransportEventType::Error, {}, WS_CLOSE_ABNORMAL, "connection reset"});
    }

    void close(uint16_t code) {
        deliver(TransportEvent{TransportEventType::Closed, {}, code, "server closing"});
    }

    size_t connect_attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return urls_.size();
    }

    size_t link_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return links_.size();
    }

    std::string last_url() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return urls_.empty() ? std::string() : urls_.back();
    }

    // Messages the client sent on link `index`
    std::vector<json> received(size_t index) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index < links_.size() ? links_[index]->received : std::vector<json>{};
    }

    size_t count_received(size_t index, const std::string& type) const {
        size_t n = 0;
        for (const auto& message : received(index)) {
            if (message.value("type", std::string()) == type) {
                ++n;
            }
        }
        return n;
    }

    uint16_t client_close_code(size_t index) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index < links_.size() ? links_[index]->client_close_code : 0;
    }

private:
    friend class FakeTransport;

    void deliver(TransportEvent event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (links_.empty()) {
                return;
            }
            links_.back()->inbox.push_back(std::move(event));
        }
        cv_.notify_all();
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> urls_;
    std::vector<std::shared_ptr<Link>> links_;
};

class FakeTransport : public ChannelTransport {
public:
    explicit FakeTransport(FakeHub& hub) : hub_(hub) {}

    bool connect(const std::string& url, std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(hub_.mutex_);
        hub_.urls_.push_back(url);
        if (!hub_.accept_connections) {
            error_ = "connection refused";
            return false;
        }
        link_ = std::make_shared<FakeHub::Link>();
        hub_.links_.push_back(link_);
        return true;
    }

    bool send_text(const std::string& text) override {
        {
            std::lock_guard<std::mutex> lock(hub_.mutex_);
            if (!link_ || link_->dropped) {
                error_ = "not connected";
                return false;
            }
            json message = json::parse(text);
            link_->received.push_back(message);

            std::string type = message.value("type", std::string());
            if (type == "auth" && hub_.reject_auth) {
                link_->inbox.push_back({TransportEventType::Message,
                                        json{{"type", "auth"}, {"event", "error"}}.dump(), 0, {}});
            } else if (type == "auth" && hub_.auto_auth) {
                link_->inbox.push_back({TransportEventType::Message,
                                        json{{"type", "auth"}, {"event", "authenticated"}}.dump(), 0, {}});
            } else if (type == "ping" && hub_.answer_pings) {
                link_->inbox.push_back({TransportEventType::Message, json{{"type", "pong"}}.dump(), 0, {}});
            }
        }
        hub_.cv_.notify_all();
        return true;
    }

    TransportEvent receive(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(hub_.mutex_);
        if (!link_) {
            return {TransportEventType::Error, {}, WS_CLOSE_ABNORMAL, "not connected"};
        }
        hub_.cv_.wait_for(lock, timeout, [this]() { return !link_->inbox.empty(); });
        if (link_->inbox.empty()) {
            return {};
        }
        TransportEvent event = std::move(link_->inbox.front());
        link_->inbox.pop_front();
        if (event.type == TransportEventType::Error || event.type == TransportEventType::Closed) {
            link_->dropped = true;
        }
        return event;
    }

    void close(uint16_t code, const std::string&) override {
        std::lock_guard<std::mutex> lock(hub_.mutex_);
        if (link_) {
            link_->client_close_code = code;
            link_->dropped = true;
        }
    }

    std::string last_error() const override { return error_; }

private:
    FakeHub& hub_;
    std::shared_ptr<FakeHub::Link> link_;
    std::string error_;
};

TransportFactory FakeHub::factory() {
    return [this]() { return std::make_unique<FakeTransport>(*this); };
}

NotificationChannel::Options fast_options() {
    NotificationChannel::Options options;
    options.url = "ws://hub.local/ws";
    options.auth_token = "secret";
    options.user_id = "user-1";
    options.auth_timeout = 2000ms;
    options.heartbeat_interval = 60000ms;
    options.pong_timeout = 1000ms;
    options.poll_interval = 10ms;
    options.max_reconnect_attempts = 3;
    options.reconnect = RetryPolicy::Options{10ms, 2.0, 40ms, 0.0};
    options.subscriptions = {"downloads"};
    return options;
}

bool has_message(const std::vector<json>& messages, const std::string& type, const std::string& channel) {
    for (const auto& message : messages) {
        if (message.value("type", std::string()) == type &&
            message.contains("data") && message["data"].value("channel", std::string()) == channel) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

TEST_CASE("Channel Authenticates And Subscribes", "[channel][auth]") {
    FakeHub hub;
    NotificationChannel channel(fast_options(), hub.factory());

    REQUIRE(channel.state() == ChannelState::Idle);
    channel.connect();
    REQUIRE(wait_until([&]() { return channel.is_authenticated(); }));
    REQUIRE(wait_until([&]() { return hub.count_received(0, "subscribe") == 1; }));

    REQUIRE(hub.last_url() == "ws://hub.local/ws?token=secret");
    auto messages = hub.received(0);
    REQUIRE(messages[0]["type"] == "auth");
    REQUIRE(messages[0]["data"]["token"] == "secret");
    REQUIRE(messages[0]["data"]["userId"] == "user-1");
    REQUIRE(has_message(messages, "subscribe", "downloads"));
    REQUIRE(channel.reconnect_attempts() == 0);

    channel.disconnect();
    REQUIRE(channel.state() == ChannelState::Idle);
    REQUIRE(hub.client_close_code(0) == WS_CLOSE_NORMAL);
    REQUIRE(channel.subscriptions().empty());
}

TEST_CASE("Channel Dispatches Messages By Type And Event", "[channel][dispatch]") {
    FakeHub hub;
    std::atomic<int> progress{0};
    std::atomic<int> any_download{0};
    NotificationChannel channel(fast_options(), hub.factory());

    channel.on("download", "progress", [&](const json& message) {
        if (message["data"]["id"] == "dl_1") {
            ++progress;
        }
    });
    auto wildcard = channel.on("download", "", [&](const json&) { ++any_download; });
    channel.on("download", "completed", [](const json&) { throw std::runtime_error("handler failure"); });

    channel.connect();
    REQUIRE(wait_until([&]() { return channel.is_authenticated(); }));

    hub.push({{"type", "download"}, {"event", "progress"}, {"data", {{"id", "dl_1"}}}});
    hub.push({{"type", "mystery"}, {"event", "whatever"}});
    hub.push({{"type", 42}});
    hub.push({{"type", "download"}, {"event", "completed"}, {"data", json::object()}});
    REQUIRE(wait_until([&]() { return any_download == 2; }));
    REQUIRE(progress == 1);

    channel.off(wildcard);
    hub.push({{"type", "download"}, {"event", "progress"}, {"data", {{"id", "dl_1"}}}});
    REQUIRE(wait_until([&]() { return progress == 2; }));
    REQUIRE(any_download == 2);
    REQUIRE(channel.is_authenticated());
}

TEST_CASE("Channel Rejects Sends Until Authenticated", "[channel][auth]") {
    FakeHub hub;
    hub.auto_auth = false;
    NotificationChannel channel(fast_options(), hub.factory());

    REQUIRE_FALSE(channel.send({{"type", "command"}}));

    channel.connect();
    REQUIRE(wait_until([&]() { return channel.state() == ChannelState::Authenticating; }));
    REQUIRE_FALSE(channel.send({{"type", "command"}}));
    REQUIRE_FALSE(channel.request_reauthentication());

    // Subscriptions made now are only sent after authentication
    channel.subscribe("media");
    REQUIRE(hub.count_received(0, "subscribe") == 0);

    hub.push({{"type", "auth"}, {"event", "authenticated"}});
    REQUIRE(wait_until([&]() { return channel.is_authenticated(); }));
    REQUIRE(channel.send({{"type", "command"}, {"event", "ping"}}));
    REQUIRE(wait_until([&]() { return hub.count_received(0, "subscribe") == 2; }));
    REQUIRE(hub.count_received(0, "command") == 1);
}

TEST_CASE("Channel Reconnects And Replays Subscriptions", "[channel][reconnect]") {
    FakeHub hub;
    std::atomic<int> media_events{0};
    NotificationChannel channel(fast_options(), hub.factory());

    channel.on("media", "", [&](const json&) { ++media_events; });

    channel.connect();
    REQUIRE(wait_until([&]() { return channel.is_authenticated(); }));
    channel.subscribe("media");
    REQUIRE(wait_until([&]() { return hub.count_received(0, "subscribe") == 2; }));

    hub.drop();
    REQUIRE(wait_until([&]() { return hub.link_count() == 2 && channel.is_authenticated(); }));
    REQUIRE(wait_until([&]() { return hub.count_received(1, "subscribe") == 2; }));

    auto replayed = hub.received(1);
    REQUIRE(replayed[0]["type"] == "auth");
    REQUIRE(has_message(replayed, "subscribe", "downloads"));
    REQUIRE(has_message(replayed, "subscribe", "media"));
    REQUIRE(channel.reconnect_attempts() == 0);

    hub.push({{"type", "media"}, {"event", "added"}, {"data", {{"channel", "media"}}}});
    REQUIRE(wait_until([&]() { return media_events == 1; }));

    channel.unsubscribe("media");
    REQUIRE(wait_until([&]() { return hub.count_received(1, "unsubscribe") == 1; }));
    REQUIRE(channel.subscriptions() == std::vector<std::string>{"downloads"});
}

TEST_CASE("Channel Gives Up After Repeated Failures", "[channel][reconnect]") {
    FakeHub hub;
    hub.accept_connections = false;

    std::mutex mutex;
    std::vector<ChannelState> states;
    std::atomic<int> lost{0};
    std::atomic<int> lost_code{0};
    NotificationChannel channel(fast_options(), hub.factory());

    channel.set_status_callback([&](ChannelState state, const std::string&) {
        std::lock_guard<std::mutex> lock(mutex);
        states.push_back(state);
    });

    channel.on("system", "connection_lost", [&](const json& message) {
        lost_code = message["data"]["code"].get<int>();
        ++lost;
    });

    channel.connect();
    REQUIRE(wait_until([&]() { return channel.state() == ChannelState::Lost; }));
    REQUIRE(wait_until([&]() { return lost == 1; }));
    REQUIRE(lost_code == static_cast<int>(ErrorCode::ConnectionLost));

    // The first attempt plus three reconnects
    REQUIRE(hub.connect_attempts() == 4);

    std::lock_guard<std::mutex> lock(mutex);
    size_t reconnecting = 0;
    for (auto state : states) {
        if (state == ChannelState::Reconnecting) {
            ++reconnecting;
        }
    }
    REQUIRE(reconnecting == 3);
    REQUIRE(states.back() == ChannelState::Lost);
}

TEST_CASE("Channel Can Reconnect After Being Lost", "[channel][reconnect]") {
    FakeHub hub;
    hub.accept_connections = false;
    NotificationChannel channel(fast_options(), hub.factory());

    channel.connect();
    REQUIRE(wait_until([&]() { return channel.state() == ChannelState::Lost; }));

    hub.accept_connections = true;
    channel.connect();
    REQUIRE(wait_until([&]() { return channel.is_authenticated(); }));
    REQUIRE(channel.reconnect_attempts() == 0);
}

TEST_CASE("Channel Stays Closed After A Normal Close", "[channel][reconnect]") {
    FakeHub hub;
    NotificationChannel channel(fast_options(), hub.factory());

    channel.connect();
    REQUIRE(wait_until([&]() { return channel.is_authenticated(); }));

    hub.close(WS_CLOSE_NORMAL);
    REQUIRE(wait_until([&]() { return channel.state() == ChannelState::Closed; }));
    std::this_thread::sleep_for(100ms);
    REQUIRE(hub.connect_attempts() == 1);
    REQUIRE(channel.state() == ChannelState::Closed);
}

TEST_CASE("Channel Reconnects After An Abnormal Close", "[channel][reconnect]") {
    FakeHub hub;
    NotificationChannel channel(fast_options(), hub.factory());

    channel.connect();
    REQUIRE(wait_until([&]() { return channel.is_authenticated(); }));

    hub.close(WS_CLOSE_GOING_AWAY);
    REQUIRE(wait_until([&]() { return hub.link_count() == 2 && channel.is_authenticated(); }));
}

TEST_CASE("Channel Times Out Missing Heartbeats", "[channel][heartbeat]") {
    FakeHub hub;
    hub.answer_pings = false;
    auto options = fast_options();
    options.heartbeat_interval = 30ms;
    options.pong_timeout = 50ms;
    NotificationChannel channel(options, hub.factory());

    channel.connect();
    REQUIRE(wait_until([&]() { return hub.link_count() >= 2; }));
    REQUIRE(hub.count_received(0, "ping") >= 1);
    REQUIRE(hub.client_close_code(0) == WS_CLOSE_GOING_AWAY);
}

TEST_CASE("Channel Keeps A Healthy Heartbeat", "[channel][heartbeat]") {
    FakeHub hub;
    auto options = fast_options();
    options.heartbeat_interval = 20ms;
    options.pong_timeout = 200ms;
    NotificationChannel channel(options, hub.factory());

    channel.connect();
    REQUIRE(wait_until([&]() { return hub.count_received(0, "ping") >= 3; }));
    REQUIRE(hub.link_count() == 1);
    REQUIRE(channel.is_authenticated());
}

TEST_CASE("Channel Times Out Authentication", "[channel][auth]") {
    FakeHub hub;
    hub.auto_auth = false;
    auto options = fast_options();
    options.auth_timeout = 50ms;
    NotificationChannel channel(options, hub.factory());

    channel.connect();
    REQUIRE(wait_until([&]() { return hub.count_received(1, "auth") == 1; }));
}

TEST_CASE("Channel Treats Rejected Authentication As A Failure", "[channel][auth]") {
    FakeHub hub;
    hub.reject_auth = true;
    std::atomic<int> rejections{0};
    NotificationChannel channel(fast_options(), hub.factory());

    channel.on("auth", "error", [&](const json&) { ++rejections; });

    channel.connect();
    REQUIRE(wait_until([&]() { return channel.state() == ChannelState::Lost; }));
    REQUIRE(rejections == 4);
    REQUIRE(hub.link_count() == 4);
}

TEST_CASE("Channel Re-Authenticates On Request", "[channel][auth]") {
    FakeHub hub;
    NotificationChannel channel(fast_options(), hub.factory());

    channel.connect();
    REQUIRE(wait_until([&]() { return channel.is_authenticated(); }));
    REQUIRE(channel.request_reauthentication());
    REQUIRE(wait_until([&]() { return hub.count_received(0, "auth") == 2; }));
    REQUIRE(wait_until([&]() { return channel.is_authenticated(); }));
    REQUIRE(hub.link_count() == 1);
}

TEST_CASE("Channel Forwards Bus Events While Authenticated", "[channel][bus]") {
    FakeHub hub;
    EventBus bus;
    NotificationChannel channel(fast_options(), hub.factory());
    channel.attach(bus);

    TransferEvent dropped;
    dropped.kind = TransferEventKind::Added;
    dropped.transfer.id = "dl_offline";
    bus.publish(dropped);
    bus.drain();

    channel.connect();
    REQUIRE(wait_until([&]() { return channel.is_authenticated(); }));

    TransferEvent added;
    added.kind = TransferEventKind::Added;
    added.transfer.id = "dl_online";
    bus.publish(added);
    bus.drain();

    auto messages = hub.received(0);
    size_t downloads = 0;
    for (const auto& message : messages) {
        if (message.value("type", std::string()) == "download") {
            REQUIRE(message["event"] == "added");
            REQUIRE(message["data"]["id"] == "dl_online");
            ++downloads;
        }
    }
    REQUIRE(downloads == 1);

    channel.detach();
    REQUIRE(bus.subscriber_count() == 0);
}

TEST_CASE("Channel Reconnect Delays Grow To The Cap", "[channel][reconnect]") {
    FakeHub hub;
    NotificationChannel::Options options;
    options.url = "ws://hub.local/ws";
    NotificationChannel channel(options, hub.factory());

    REQUIRE(channel.reconnect_delay(1) == 5000ms);
    REQUIRE(channel.reconnect_delay(2) == 10000ms);
    REQUIRE(channel.reconnect_delay(3) == 20000ms);
    REQUIRE(channel.reconnect_delay(50) == 300000ms);

    auto previous = channel.reconnect_delay(1);
    for (uint32_t attempt = 2; attempt < 40; ++attempt) {
        REQUIRE(channel.reconnect_delay(attempt) >= previous);
        previous = channel.reconnect_delay(attempt);
    }
}

TEST_CASE("Channel State Names", "[channel]") {
    REQUIRE(to_string(ChannelState::Authenticated) == "AUTHENTICATED");
    REQUIRE(to_string(ChannelState::Reconnecting) == "RECONNECTING");
    REQUIRE(to_string(ChannelState::Lost) == "LOST");
}
