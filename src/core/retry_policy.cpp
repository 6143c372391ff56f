#include "transferd/core/retry_policy.h"
#include <algorithm>
#include <cmath>

namespace transferd {

std::string to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::Validation: return "validation";
        case FailureKind::TransientNetwork: return "transient-network";
        case FailureKind::ServerError: return "server-error";
        case FailureKind::ClientError: return "client-error";
        case FailureKind::AuthRequired: return "auth-required";
    }
    return "unknown";
}

FailureKind classify_http_status(int status_code) {
    if (status_code == 401 || status_code == 407) {
        return FailureKind::AuthRequired;
    }
    if (status_code >= 500 && status_code < 600) {
        return FailureKind::ServerError;
    }
    return FailureKind::ClientError;
}

ErrorCode error_code_for(FailureKind kind) {
    switch (kind) {
        case FailureKind::Validation: return ErrorCode::InvalidRequest;
        case FailureKind::TransientNetwork:
        case FailureKind::ServerError: return ErrorCode::TransientNetworkError;
        case FailureKind::AuthRequired: return ErrorCode::AuthenticationFailed;
        case FailureKind::ClientError: return ErrorCode::PermanentTransferError;
    }
    return ErrorCode::PermanentTransferError;
}

RetryPolicy::RetryPolicy() : RetryPolicy(Options{}) {}

RetryPolicy::RetryPolicy(Options options)
    : options_(options), rng_(std::random_device{}()) {
    if (options_.factor < 1.0) {
        options_.factor = 1.0;
    }
    if (options_.max_delay < options_.base_delay) {
        options_.max_delay = options_.base_delay;
    }
    options_.jitter_ratio = std::clamp(options_.jitter_ratio, 0.0, 1.0);
}

RetryPolicy RetryPolicy::from_config(const RetryConfig& config) {
    Options options;
    options.base_delay = std::chrono::milliseconds(config.base_delay_ms);
    options.factor = config.factor;
    options.max_delay = std::chrono::milliseconds(config.max_delay_ms);
    options.jitter_ratio = config.jitter_ratio;
    return RetryPolicy(options);
}

bool RetryPolicy::is_retryable(FailureKind kind) {
    return kind == FailureKind::TransientNetwork || kind == FailureKind::ServerError;
}

bool RetryPolicy::should_retry(FailureKind kind, uint32_t attempt, uint32_t max_attempts) {
    return is_retryable(kind) && attempt < max_attempts;
}

std::chrono::milliseconds RetryPolicy::delay(uint32_t attempt) const {
    const double base = static_cast<double>(options_.base_delay.count());
    const double cap = static_cast<double>(options_.max_delay.count());

    // pow overflows to inf for large attempts; the cap handles it
    double value = base * std::pow(options_.factor, static_cast<double>(attempt));
    if (!std::isfinite(value) || value > cap) {
        value = cap;
    }
    return std::chrono::milliseconds(static_cast<int64_t>(value));
}

std::chrono::milliseconds RetryPolicy::jittered_delay(uint32_t attempt) const {
    auto base = delay(attempt);
    auto slack = static_cast<int64_t>(static_cast<double>(base.count()) * options_.jitter_ratio);
    if (slack <= 0) {
        return base;
    }
    std::uniform_int_distribution<int64_t> dist(0, slack);
    std::lock_guard<std::mutex> lock(rng_mutex_);
    return base + std::chrono::milliseconds(dist(rng_));
}

} // namespace transferd
