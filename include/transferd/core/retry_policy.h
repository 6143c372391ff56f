#ifndef TRANSFERD_CORE_RETRY_POLICY_H
#define TRANSFERD_CORE_RETRY_POLICY_H

#include "transferd/base/config.h"
#include "transferd/base/error_code.h"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace transferd {

// Failure classes shared by transfer requests and channel reconnects
enum class FailureKind {
    Validation,        // bad input, never retried
    TransientNetwork,  // connect/read/write failure, timeout, truncated body
    ServerError,       // 5xx
    ClientError,       // other 4xx, including 408 and 429
    AuthRequired       // 401/407, escalates to a fresh auth handshake
};

std::string to_string(FailureKind kind);

// Map an HTTP status code (>= 400) onto a failure kind
FailureKind classify_http_status(int status_code);

// Error code surfaced to callers for a failure kind
ErrorCode error_code_for(FailureKind kind);

class RetryPolicy {
public:
    struct Options {
        std::chrono::milliseconds base_delay{1000};
        double factor = 2.0;
        std::chrono::milliseconds max_delay{60000};
        double jitter_ratio = 0.2;
    };

    RetryPolicy();
    explicit RetryPolicy(Options options);

    static RetryPolicy from_config(const RetryConfig& config);

    // attempt = retries already performed (0 after the first failure)
    static bool is_retryable(FailureKind kind);
    static bool should_retry(FailureKind kind, uint32_t attempt, uint32_t max_attempts);

    // min(max_delay, base * factor^attempt); non-decreasing in attempt
    std::chrono::milliseconds delay(uint32_t attempt) const;

    // delay(attempt) plus up to jitter_ratio * delay(attempt) of random slack
    std::chrono::milliseconds jittered_delay(uint32_t attempt) const;

    const Options& options() const { return options_; }

private:
    Options options_;
    mutable std::mutex rng_mutex_;
    mutable std::mt19937_64 rng_;
};

} // namespace transferd

#endif // TRANSFERD_CORE_RETRY_POLICY_H
