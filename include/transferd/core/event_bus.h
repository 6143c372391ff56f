#ifndef TRANSFERD_CORE_EVENT_BUS_H
#define TRANSFERD_CORE_EVENT_BUS_H

#include "transferd/core/transfer.h"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <nlohmann/json_fwd.hpp>

namespace transferd {

enum class TransferEventKind {
    Added,
    Queued,
    Started,
    Progress,
    Paused,
    Completed,
    Failed,
    Canceled,
    Cleared
};

std::string to_string(TransferEventKind kind);

struct TransferEvent {
    TransferEventKind kind = TransferEventKind::Progress;
    Transfer transfer;       // snapshot at publish time; empty for Cleared
    uint64_t count = 0;      // Cleared only

    // {"type":"download","event":<kind>,"data":{...}}
    nlohmann::json to_message() const;
};

using EventHandler = std::function<void(const TransferEvent&)>;
using SubscriptionId = uint64_t;

// Ordered in-process publish/subscribe. Events are delivered by a single
// dispatch thread in publish order.
class EventBus {
public:
    EventBus();
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionId subscribe(EventHandler handler);

    // Once this returns the handler is no longer running or going to run
    void unsubscribe(SubscriptionId id);

    // Never blocks on handlers
    void publish(TransferEvent event);

    // Block until every event published so far has been delivered
    void drain();

    // Deliver what is queued, then stop the dispatch thread
    void shutdown();

    size_t subscriber_count() const;

private:
    void dispatch_loop();

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<TransferEvent> queue_;
    std::map<SubscriptionId, EventHandler> handlers_;
    SubscriptionId next_id_ = 1;
    bool dispatching_ = false;
    bool stopping_ = false;
    std::thread dispatch_thread_;
};

} // namespace transferd

#endif // TRANSFERD_CORE_EVENT_BUS_H
