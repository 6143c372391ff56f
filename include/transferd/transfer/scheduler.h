#ifndef TRANSFERD_TRANSFER_SCHEDULER_H
#define TRANSFERD_TRANSFER_SCHEDULER_H

#include "transferd/base/config.h"
#include "transferd/core/event_bus.h"
#include "transferd/core/transfer.h"
#include "transferd/storage/transfer_store.h"
#include "transferd/transfer/placement_notifier.h"
#include "transferd/transfer/worker.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace transferd {

// Owns every transfer state transition and the concurrency bound.
// Commands throw TransferdError (InvalidRequest, InvalidState, NotFound, StorageError).
class Scheduler {
public:
    struct Options {
        uint32_t max_concurrent = 3;

        static Options from_config(const TransferConfig& config);
    };

    // Invoked when a transfer fails with AuthenticationFailed
    using AuthEscalationHook = std::function<void(const Transfer&)>;

    Scheduler(Options options,
              std::shared_ptr<TransferStore> store,
              std::shared_ptr<TransferWorker> worker,
              EventBus& bus,
              std::shared_ptr<PlacementNotifier> notifier = nullptr);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Run the restart sweep, load the store and admit queued transfers
    void start();

    // Stop every worker and wait for the threads. Persisted statuses are left
    // as they are so the next start() recovers them.
    void stop();

    bool is_running() const;

    Transfer enqueue(const TransferRequest& request);
    Transfer pause(const std::string& id);
    Transfer resume(const std::string& id);

    // Idempotent: an unknown id is a no-op
    void cancel(const std::string& id);

    // Returns the number of records removed
    size_t clear_completed();

    // Newest first
    std::vector<Transfer> list(const TransferFilter& filter = {}) const;
    std::optional<Transfer> get(const std::string& id) const;

    // n >= 1; lowering never preempts running transfers
    void set_max_concurrent(uint32_t n);
    uint32_t max_concurrent() const;

    // Number of transfers currently downloading
    uint32_t active_count() const;

    void set_auth_escalation_hook(AuthEscalationHook hook);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace transferd

#endif // TRANSFERD_TRANSFER_SCHEDULER_H
