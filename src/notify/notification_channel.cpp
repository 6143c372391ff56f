#include "transferd/notify/notification_channel.h"
#include "transferd/base/logger.h"
#include "transferd/net/url.h"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <nlohmann/json.hpp>

namespace transferd {

using json = nlohmann::json;
using SteadyClock = std::chrono::steady_clock;

namespace {

// String member of a message object, empty when absent or not a string
std::string string_field(const json& message, const char* key) {
    if (!message.is_object()) {
        return {};
    }
    auto it = message.find(key);
    if (it == message.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

} // anonymous namespace

std::string to_string(ChannelState state) {
    switch (state) {
        case ChannelState::Idle: return "IDLE";
        case ChannelState::Connecting: return "CONNECTING";
        case ChannelState::Open: return "OPEN";
        case ChannelState::Authenticating: return "AUTHENTICATING";
        case ChannelState::Authenticated: return "AUTHENTICATED";
        case ChannelState::Closed: return "CLOSED";
        case ChannelState::Error: return "ERROR";
        case ChannelState::Reconnecting: return "RECONNECTING";
        case ChannelState::Lost: return "LOST";
    }
    return "UNKNOWN";
}

NotificationChannel::Options NotificationChannel::Options::from_config(const ChannelConfig& config) {
    Options options;
    options.url = config.url;
    options.auth_token = config.auth_token;
    options.user_id = config.user_id;
    options.auth_timeout = std::chrono::seconds(config.auth_timeout_sec);
    options.heartbeat_interval = std::chrono::seconds(config.heartbeat_interval_sec);
    options.pong_timeout = std::chrono::seconds(config.pong_timeout_sec);
    options.max_reconnect_attempts = config.max_reconnect_attempts;
    options.reconnect.base_delay = std::chrono::milliseconds(config.reconnect_base_ms);
    options.reconnect.factor = 2.0;
    options.reconnect.max_delay = std::chrono::milliseconds(config.reconnect_max_delay_ms);
    options.reconnect.jitter_ratio = 0.0;
    options.subscriptions = config.subscriptions;
    return options;
}

struct NotificationChannel::Impl {
    struct HandlerEntry {
        std::string type;
        std::string event;
        MessageHandler handler;
    };

    // How a connected session ended
    enum class SessionEnd { Stopped, NormalClose, Failed };

    Options options;
    TransportFactory factory;
    RetryPolicy reconnect_policy;

    mutable std::mutex mutex;
    std::condition_variable wake_cv;
    std::atomic<ChannelState> state{ChannelState::Idle};
    std::atomic<bool> stop_requested{false};
    std::atomic<bool> reauth_requested{false};
    std::atomic<bool> running{false};
    std::atomic<uint32_t> attempts{0};

    std::shared_ptr<ChannelTransport> transport;
    std::vector<std::string> subscriptions;
    std::map<HandlerId, HandlerEntry> handlers;
    HandlerId next_handler_id = 1;
    ChannelStatusCallback status_callback;
    EventBus* bus = nullptr;
    SubscriptionId bus_subscription = 0;
    std::thread io_thread;

    Impl(Options opts, TransportFactory f)
        : options(std::move(opts)), factory(std::move(f)), reconnect_policy(options.reconnect) {
        for (const auto& channel : options.subscriptions) {
            if (std::find(subscriptions.begin(), subscriptions.end(), channel) == subscriptions.end()) {
                subscriptions.push_back(channel);
            }
        }
    }

    void set_state(ChannelState next, const std::string& detail = {}) {
        ChannelState previous = state.exchange(next);
        if (previous == next && detail.empty()) {
            return;
        }
        if (detail.empty()) {
            Logger::instance().debug("Channel state {} -> {}", to_string(previous), to_string(next));
        } else {
            Logger::instance().info("Channel state {} -> {}: {}", to_string(previous), to_string(next), detail);
        }

        ChannelStatusCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex);
            callback = status_callback;
        }
        if (callback) {
            try {
                callback(next, detail);
            } catch (const std::exception& e) {
                Logger::instance().error("Channel status callback failed: {}", e.what());
            }
        }
    }

    std::string connect_url() const {
        if (options.auth_token.empty()) {
            return options.url;
        }
        return append_query_parameter(options.url, "token", options.auth_token);
    }

    json auth_message() const {
        return {{"type", "auth"},
                {"data", {{"token", options.auth_token}, {"userId", options.user_id}}}};
    }

    static json subscription_message(const std::string& type, const std::string& channel) {
        return {{"type", type}, {"data", {{"channel", channel}}}};
    }

    bool send_raw(ChannelTransport& link, const json& message) {
        if (!link.send_text(message.dump())) {
            Logger::instance().warning("Channel send failed: {}", link.last_error());
            return false;
        }
        return true;
    }

    void dispatch(const json& message) {
        std::string type = string_field(message, "type");
        std::string event = string_field(message, "event");

        std::vector<MessageHandler> matched;
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (const auto& [id, entry] : handlers) {
                if (entry.type == type && (entry.event.empty() || entry.event == event)) {
                    matched.push_back(entry.handler);
                }
            }
        }

        if (matched.empty()) {
            Logger::instance().debug("No handler for channel message {}/{}", type, event);
            return;
        }
        for (const auto& handler : matched) {
            try {
                handler(message);
            } catch (const std::exception& e) {
                Logger::instance().error("Channel handler for {}/{} failed: {}", type, event, e.what());
            }
        }
    }

    void replay_subscriptions(ChannelTransport& link) {
        std::vector<std::string> channels;
        {
            std::lock_guard<std::mutex> lock(mutex);
            channels = subscriptions;
        }
        for (const auto& channel : channels) {
            send_raw(link, subscription_message("subscribe", channel));
        }
        if (!channels.empty()) {
            Logger::instance().debug("Replayed {} channel subscriptions", channels.size());
        }
    }

    // Sleep before reconnecting; false when asked to stop
    bool wait_before_reconnect(std::chrono::milliseconds delay) {
        std::unique_lock<std::mutex> lock(mutex);
        return !wake_cv.wait_for(lock, delay, [this]() { return stop_requested.load(); });
    }

    SessionEnd run_session(const std::shared_ptr<ChannelTransport>& link, std::string& detail) {
        auto now = SteadyClock::now();
        auto auth_deadline = now + options.auth_timeout;
        auto next_ping = now;
        auto pong_deadline = now;
        bool awaiting_pong = false;

        if (!send_raw(*link, auth_message())) {
            detail = "failed to send auth message";
            return SessionEnd::Failed;
        }
        set_state(ChannelState::Authenticating);

        while (true) {
            if (stop_requested) {
                link->close(WS_CLOSE_NORMAL, "client disconnect");
                return SessionEnd::Stopped;
            }

            now = SteadyClock::now();
            ChannelState current = state.load();

            if (current == ChannelState::Authenticated && reauth_requested.exchange(false)) {
                if (!send_raw(*link, auth_message())) {
                    detail = "failed to send auth message";
                    return SessionEnd::Failed;
                }
                auth_deadline = now + options.auth_timeout;
                set_state(ChannelState::Authenticating, "re-authentication requested");
                current = ChannelState::Authenticating;
            }

            if (current == ChannelState::Authenticating && now >= auth_deadline) {
                link->close(WS_CLOSE_NORMAL, "auth timeout");
                detail = "authentication timed out";
                return SessionEnd::Failed;
            }

            if (current == ChannelState::Authenticated) {
                if (awaiting_pong && now >= pong_deadline) {
                    link->close(WS_CLOSE_GOING_AWAY, "pong timeout");
                    detail = "heartbeat timed out";
                    return SessionEnd::Failed;
                }
                if (!awaiting_pong && now >= next_ping) {
                    if (!send_raw(*link, json{{"type", "ping"}})) {
                        detail = "failed to send heartbeat";
                        return SessionEnd::Failed;
                    }
                    awaiting_pong = true;
                    pong_deadline = now + options.pong_timeout;
                    next_ping = now + options.heartbeat_interval;
                }
            }

            TransportEvent incoming = link->receive(options.poll_interval);
            switch (incoming.type) {
                case TransportEventType::Timeout:
                    continue;
                case TransportEventType::Closed:
                    if (incoming.close_code == WS_CLOSE_NORMAL) {
                        detail = "closed by server";
                        return SessionEnd::NormalClose;
                    }
                    detail = "closed with code " + std::to_string(incoming.close_code) +
                             (incoming.reason.empty() ? "" : ": " + incoming.reason);
                    return SessionEnd::Failed;
                case TransportEventType::Error:
                    detail = incoming.reason.empty() ? "connection error" : incoming.reason;
                    return SessionEnd::Failed;
                case TransportEventType::Message:
                    break;
            }

            json message;
            try {
                message = json::parse(incoming.text);
            } catch (const json::parse_error& e) {
                Logger::instance().warning("Dropping malformed channel message: {}", e.what());
                continue;
            }
            if (!message.is_object()) {
                Logger::instance().warning("Dropping non-object channel message");
                continue;
            }

            std::string type = string_field(message, "type");
            std::string event = string_field(message, "event");

            if (type == "auth" && event == "authenticated") {
                attempts = 0;
                set_state(ChannelState::Authenticated);
                replay_subscriptions(*link);
                awaiting_pong = false;
                next_ping = SteadyClock::now() + options.heartbeat_interval;
            } else if (type == "auth" && (event == "error" || event == "failed")) {
                link->close(WS_CLOSE_NORMAL, "auth rejected");
                detail = "authentication rejected";
                dispatch(message);
                return SessionEnd::Failed;
            } else if (type == "pong" || (type == "system" && event == "pong")) {
                awaiting_pong = false;
            }

            dispatch(message);
        }
    }

    void run() {
        while (!stop_requested) {
            set_state(ChannelState::Connecting);

            std::shared_ptr<ChannelTransport> link = factory();
            std::string detail;
            SessionEnd end = SessionEnd::Failed;

            if (!link->connect(connect_url(), options.connect_timeout)) {
                detail = link->last_error();
            } else {
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    transport = link;
                }
                set_state(ChannelState::Open);
                end = run_session(link, detail);
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    transport.reset();
                }
            }

            if (end == SessionEnd::Stopped || stop_requested) {
                break;
            }
            if (end == SessionEnd::NormalClose) {
                set_state(ChannelState::Closed, detail);
                running = false;
                return;
            }

            set_state(ChannelState::Error, detail);

            uint32_t failures = ++attempts;
            if (failures > options.max_reconnect_attempts) {
                set_state(ChannelState::Lost, "gave up after " +
                          std::to_string(options.max_reconnect_attempts) + " reconnect attempts");
                dispatch(json{{"type", "system"},
                              {"event", "connection_lost"},
                              {"data", {{"code", static_cast<int>(ErrorCode::ConnectionLost)},
                                        {"kind", kind_name(ErrorCode::ConnectionLost)},
                                        {"attempts", options.max_reconnect_attempts}}}});
                running = false;
                return;
            }

            auto delay = reconnect_policy.delay(failures - 1);
            set_state(ChannelState::Reconnecting,
                      "attempt " + std::to_string(failures) + "/" +
                      std::to_string(options.max_reconnect_attempts) + " in " +
                      std::to_string(delay.count()) + "ms");
            if (!wait_before_reconnect(delay)) {
                break;
            }
        }
        running = false;
    }
};

NotificationChannel::NotificationChannel(Options options, TransportFactory factory)
    : impl_(std::make_unique<Impl>(std::move(options), std::move(factory))) {}

NotificationChannel::~NotificationChannel() {
    detach();
    disconnect();
}

void NotificationChannel::connect() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->running) {
        return;
    }
    if (impl_->io_thread.joinable()) {
        // Previous run ended in CLOSED or LOST
        impl_->io_thread.join();
    }
    impl_->stop_requested = false;
    impl_->reauth_requested = false;
    impl_->attempts = 0;
    impl_->running = true;
    impl_->io_thread = std::thread([this]() { impl_->run(); });
    Logger::instance().info("Notification channel connecting to {}", impl_->options.url);
}

void NotificationChannel::disconnect() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->stop_requested = true;
        if (impl_->io_thread.joinable() && impl_->io_thread.get_id() != std::this_thread::get_id()) {
            worker = std::move(impl_->io_thread);
        }
    }
    impl_->wake_cv.notify_all();
    if (worker.joinable()) {
        worker.join();
    }

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->subscriptions.clear();
    }
    impl_->running = false;
    if (impl_->state.load() != ChannelState::Idle) {
        impl_->set_state(ChannelState::Idle, "disconnected");
    }
}

bool NotificationChannel::send(const nlohmann::json& message) {
    std::shared_ptr<ChannelTransport> link;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->state.load() != ChannelState::Authenticated || !impl_->transport) {
            Logger::instance().debug("Channel not authenticated, rejecting {} message",
                                     string_field(message, "type"));
            return false;
        }
        link = impl_->transport;
    }
    return impl_->send_raw(*link, message);
}

void NotificationChannel::subscribe(const std::string& channel) {
    std::shared_ptr<ChannelTransport> link;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto& subs = impl_->subscriptions;
        if (std::find(subs.begin(), subs.end(), channel) != subs.end()) {
            return;
        }
        subs.push_back(channel);
        if (impl_->state.load() == ChannelState::Authenticated) {
            link = impl_->transport;
        }
    }
    if (link) {
        impl_->send_raw(*link, Impl::subscription_message("subscribe", channel));
    }
}

void NotificationChannel::unsubscribe(const std::string& channel) {
    std::shared_ptr<ChannelTransport> link;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto& subs = impl_->subscriptions;
        auto it = std::find(subs.begin(), subs.end(), channel);
        if (it == subs.end()) {
            return;
        }
        subs.erase(it);
        if (impl_->state.load() == ChannelState::Authenticated) {
            link = impl_->transport;
        }
    }
    if (link) {
        impl_->send_raw(*link, Impl::subscription_message("unsubscribe", channel));
    }
}

std::vector<std::string> NotificationChannel::subscriptions() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->subscriptions;
}

HandlerId NotificationChannel::on(const std::string& type, const std::string& event, MessageHandler handler) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    HandlerId id = impl_->next_handler_id++;
    impl_->handlers.emplace(id, Impl::HandlerEntry{type, event, std::move(handler)});
    return id;
}

void NotificationChannel::off(HandlerId id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->handlers.erase(id);
}

void NotificationChannel::set_status_callback(ChannelStatusCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->status_callback = std::move(callback);
}

bool NotificationChannel::request_reauthentication() {
    if (impl_->state.load() != ChannelState::Authenticated) {
        Logger::instance().debug("Re-authentication requested while {}", to_string(impl_->state.load()));
        return false;
    }
    impl_->reauth_requested = true;
    return true;
}

void NotificationChannel::attach(EventBus& bus) {
    detach();
    SubscriptionId id = bus.subscribe([this](const TransferEvent& event) {
        if (!is_authenticated()) {
            Logger::instance().debug("Channel offline, dropping {} event", to_string(event.kind));
            return;
        }
        send(event.to_message());
    });
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->bus = &bus;
    impl_->bus_subscription = id;
}

void NotificationChannel::detach() {
    EventBus* bus = nullptr;
    SubscriptionId id = 0;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        bus = impl_->bus;
        id = impl_->bus_subscription;
        impl_->bus = nullptr;
        impl_->bus_subscription = 0;
    }
    // Outside our mutex: the bus waits for a handler that may be inside send()
    if (bus) {
        bus->unsubscribe(id);
    }
}

ChannelState NotificationChannel::state() const {
    return impl_->state.load();
}

uint32_t NotificationChannel::reconnect_attempts() const {
    return impl_->attempts.load();
}

std::chrono::milliseconds NotificationChannel::reconnect_delay(uint32_t attempt) const {
    return impl_->reconnect_policy.delay(attempt == 0 ? 0 : attempt - 1);
}

} // namespace transferd
