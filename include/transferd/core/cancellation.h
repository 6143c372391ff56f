#ifndef TRANSFERD_CORE_CANCELLATION_H
#define TRANSFERD_CORE_CANCELLATION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace transferd {

// Cooperative cancellation signal handed to a worker at spawn time
class CancellationToken {
public:
    void cancel();
    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    // Sleep up to `duration`; returns true if cancelled before or during the wait
    bool wait_for(std::chrono::milliseconds duration);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

} // namespace transferd

#endif // TRANSFERD_CORE_CANCELLATION_H
