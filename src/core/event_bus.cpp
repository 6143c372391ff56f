#include "transferd/core/event_bus.h"
#include "transferd/base/logger.h"
#include <vector>
#include <nlohmann/json.hpp>

namespace transferd {

std::string to_string(TransferEventKind kind) {
    switch (kind) {
        case TransferEventKind::Added: return "added";
        case TransferEventKind::Queued: return "queued";
        case TransferEventKind::Started: return "started";
        case TransferEventKind::Progress: return "progress";
        case TransferEventKind::Paused: return "paused";
        case TransferEventKind::Completed: return "completed";
        case TransferEventKind::Failed: return "failed";
        case TransferEventKind::Canceled: return "canceled";
        case TransferEventKind::Cleared: return "cleared";
    }
    return "unknown";
}

nlohmann::json TransferEvent::to_message() const {
    nlohmann::json data;
    if (kind == TransferEventKind::Cleared) {
        data = {{"count", count}};
    } else {
        data = transfer;
    }
    return {
        {"type", "download"},
        {"event", to_string(kind)},
        {"data", std::move(data)},
    };
}

EventBus::EventBus() {
    dispatch_thread_ = std::thread([this]() { dispatch_loop(); });
}

EventBus::~EventBus() {
    shutdown();
}

SubscriptionId EventBus::subscribe(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    handlers_.emplace(id, std::move(handler));
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    std::unique_lock<std::mutex> lock(mutex_);
    handlers_.erase(id);

    // A handler snapshot may still hold the callback; wait it out unless we are that handler
    if (std::this_thread::get_id() != dispatch_thread_.get_id()) {
        idle_cv_.wait(lock, [this]() { return !dispatching_; });
    }
}

void EventBus::publish(TransferEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            Logger::instance().debug("Event bus stopped, dropping {} event", to_string(event.kind));
            return;
        }
        queue_.push_back(std::move(event));
    }
    queue_cv_.notify_one();
}

void EventBus::drain() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return queue_.empty() && !dispatching_; });
}

void EventBus::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (dispatch_thread_.joinable()) {
        dispatch_thread_.join();
    }
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}

void EventBus::dispatch_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            // stopping with nothing left to deliver
            break;
        }

        TransferEvent event = std::move(queue_.front());
        queue_.pop_front();
        std::vector<EventHandler> handlers;
        handlers.reserve(handlers_.size());
        for (const auto& [id, handler] : handlers_) {
            handlers.push_back(handler);
        }
        dispatching_ = true;
        lock.unlock();

        for (const auto& handler : handlers) {
            try {
                handler(event);
            } catch (const std::exception& e) {
                Logger::instance().error("Event handler failed on {} event: {}", to_string(event.kind), e.what());
            }
        }

        lock.lock();
        dispatching_ = false;
        idle_cv_.notify_all();
    }
    dispatching_ = false;
    idle_cv_.notify_all();
}

} // namespace transferd
